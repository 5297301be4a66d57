// ==============================================================================
// capture.cpp - Потоковый разбор HAR: log.entries -> RawExchange
// ==============================================================================
//
// RapidJSON iterative (pull) SAX: каждый вызов IterativeParseNext обрабатывает
// один токен. EntryHandler ищет массив log.entries и собирает из его
// элементов по одному Value за раз.
//
// ==============================================================================

#include <harvest/capture.hpp>
#include <harvest/platform.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>
#include <rapidjson/reader.h>

namespace harvest::io {

// ============================================================================
// URL и кодировки
// ============================================================================

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z')
        return c - 'A';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 26;
    if (c >= '0' && c <= '9')
        return c - '0' + 52;
    if (c == '+')
        return 62;
    if (c == '/')
        return 63;
    return -1;
}

}  // namespace

std::optional<Url> parse_url(std::string_view text) {
    auto scheme_end = text.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::nullopt;
    }

    Url url;
    url.scheme = to_lower(text.substr(0, scheme_end));
    for (char c : url.scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return std::nullopt;
        }
    }

    std::string_view rest = text.substr(scheme_end + 3);
    auto fragment = rest.find('#');
    if (fragment != std::string_view::npos) {
        rest = rest.substr(0, fragment);
    }

    auto authority_end = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, authority_end);
    std::string_view tail =
        authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

    // userinfo@host:port
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        url.host = to_lower(authority.substr(0, close + 1));
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return std::nullopt;
            }
            url.port = std::string(authority.substr(close + 2));
        }
    } else {
        auto colon = authority.rfind(':');
        url.host = to_lower(authority.substr(0, colon));
        if (colon != std::string_view::npos) {
            url.port = std::string(authority.substr(colon + 1));
        }
    }

    if (url.host.empty()) {
        return std::nullopt;
    }
    for (char c : url.port) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    auto question = tail.find('?');
    url.path = std::string(tail.substr(0, question));
    if (question != std::string_view::npos) {
        url.query = std::string(tail.substr(question + 1));
    }
    if (url.path.empty()) {
        url.path = "/";
    }
    return url;
}

std::string percent_decode(std::string_view text, bool plus_as_space) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) {
            out += ' ';
            continue;
        }
        out += c;
    }
    return out;
}

HeaderList parse_query(std::string_view query) {
    HeaderList params;
    while (!query.empty()) {
        auto amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            std::string name = percent_decode(pair.substr(0, eq), true);
            std::string value = eq == std::string_view::npos
                                    ? std::string()
                                    : percent_decode(pair.substr(eq + 1), true);
            params.emplace_back(std::move(name), std::move(value));
        }
        if (amp == std::string_view::npos) {
            break;
        }
        query.remove_prefix(amp + 1);
    }
    return params;
}

std::optional<std::string> base64_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size() / 4 * 3);

    std::uint32_t buffer = 0;
    int bits = 0;
    std::size_t padding = 0;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            return std::nullopt;  // данные после '='
        }
        int v = base64_value(c);
        if (v < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((buffer >> bits) & 0xFF);
        }
    }
    if (padding > 2 || bits >= 6) {
        return std::nullopt;
    }
    return out;
}

const std::string* find_header(const HeaderList& headers, std::string_view name) {
    for (const auto& [key, value] : headers) {
        if (key.size() == name.size() &&
            std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) ==
                       std::tolower(static_cast<unsigned char>(b));
            })) {
            return &value;
        }
    }
    return nullptr;
}

// ============================================================================
// Время
// ============================================================================

namespace {

bool read_digits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    out = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        out = out * 10 + (c - '0');
    }
    return true;
}

/// Дни от 1970-01-01 по григорианскому календарю
std::int64_t days_from_civil(std::int64_t y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civil_from_days(std::int64_t z, std::int64_t& y, int& m, int& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const std::int64_t doe = z - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = yoe + era * 400 + (m <= 2 ? 1 : 0);
}

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

}  // namespace

std::optional<std::int64_t> timestamp_millis(std::string_view text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_digits(text, 0, 4, year) || text.size() < 19 || text[4] != '-' ||
        !read_digits(text, 5, 2, month) || text[7] != '-' || !read_digits(text, 8, 2, day) ||
        (text[10] != 'T' && text[10] != 't' && text[10] != ' ') ||
        !read_digits(text, 11, 2, hour) || text[13] != ':' ||
        !read_digits(text, 14, 2, minute) || text[16] != ':' ||
        !read_digits(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    int millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        const std::size_t start = ++pos;
        int scale = 100;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            millis += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        if (pos == start) {
            return std::nullopt;
        }
    }

    int offset_minutes = 0;
    if (pos < text.size()) {
        const char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            int oh = 0;
            int om = 0;
            if (!read_digits(text, pos + 1, 2, oh)) {
                return std::nullopt;
            }
            pos += 3;
            if (pos < text.size() && text[pos] == ':') {
                ++pos;
            }
            if (!read_digits(text, pos, 2, om)) {
                return std::nullopt;
            }
            pos += 2;
            offset_minutes = (zone == '-' ? -1 : 1) * (oh * 60 + om);
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const std::int64_t seconds = days_from_civil(year, month, day) * 86400 + hour * 3600 +
                                 minute * 60 + second -
                                 static_cast<std::int64_t>(offset_minutes) * 60;
    return seconds * 1000 + millis;
}

std::string format_timestamp(std::int64_t millis) {
    const std::int64_t seconds = floor_div(millis, 1000);
    const int ms = static_cast<int>(millis - seconds * 1000);
    const std::int64_t days = floor_div(seconds, 86400);
    const std::int64_t rem = seconds - days * 86400;

    std::int64_t year = 0;
    int month = 0;
    int day = 0;
    civil_from_days(days, year, month, day);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04lld-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  static_cast<long long>(year), month, day, static_cast<int>(rem / 3600),
                  static_cast<int>(rem % 3600 / 60), static_cast<int>(rem % 60), ms);
    return buf;
}

rule::ExchangeAttributes attributes(const RawExchange& exchange) {
    rule::ExchangeAttributes attrs;
    attrs.method = exchange.method;
    attrs.host = exchange.host;
    attrs.url = exchange.url;
    if (!exchange.response_body.content_type.empty()) {
        attrs.content_type = exchange.response_body.content_type;
    } else if (!exchange.request_body.content_type.empty()) {
        attrs.content_type = exchange.request_body.content_type;
    } else if (const auto* ct = find_header(exchange.request_headers, "content-type")) {
        attrs.content_type = *ct;
    }
    attrs.headers = exchange.request_headers;
    return attrs;
}

// ============================================================================
// HAR entry -> RawExchange
// ============================================================================

namespace {

HeaderList read_pairs(const Value* array) {
    HeaderList pairs;
    if (array == nullptr || !array->is_array()) {
        return pairs;
    }
    for (const auto& item : array->as_array()) {
        auto name = item.get_string_field("name");
        if (!name.has_value()) {
            continue;
        }
        pairs.emplace_back(*name, item.get_string_field("value").value_or(""));
    }
    return pairs;
}

/// Тело из content/postData: text + encoding
bool read_body(const Value* content, Body& body, std::string& error) {
    if (content == nullptr || !content->is_object()) {
        return true;
    }
    body.content_type = content->get_string_field("mimeType").value_or("");

    auto text = content->get_string_field("text");
    if (text.has_value()) {
        if (content->get_string_field("encoding").value_or("") == "base64") {
            auto decoded = base64_decode(*text);
            if (!decoded.has_value()) {
                error = "body is not valid base64";
                return false;
            }
            body.bytes = std::move(*decoded);
        } else {
            body.bytes = std::move(*text);
        }
        return true;
    }

    // postData.params без text: восстанавливаем form-urlencoded
    for (const auto& [name, value] : read_pairs(content->get("params"))) {
        if (!body.bytes.empty()) {
            body.bytes += '&';
        }
        body.bytes += name + "=" + value;
    }
    return true;
}

}  // namespace

std::optional<RawExchange> exchange_from_entry(const Value& entry, std::uint64_t index,
                                               std::string& error) {
    if (!entry.is_object()) {
        error = "entry is not an object";
        return std::nullopt;
    }
    const Value* request = entry.get("request");
    const Value* response = entry.get("response");
    if (request == nullptr || !request->is_object()) {
        error = "entry has no request";
        return std::nullopt;
    }

    RawExchange ex;
    ex.index = index;

    auto method = request->get_string_field("method");
    if (!method.has_value() || method->empty()) {
        error = "request.method is missing";
        return std::nullopt;
    }
    ex.method = *method;
    std::transform(ex.method.begin(), ex.method.end(), ex.method.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    auto url_text = request->get_string_field("url");
    if (!url_text.has_value()) {
        error = "request.url is missing";
        return std::nullopt;
    }
    auto url = parse_url(*url_text);
    if (!url.has_value()) {
        error = "request.url is not an absolute URL: " + *url_text;
        return std::nullopt;
    }

    const Value* status = entry.find("response.status");
    if (status == nullptr || !status->is_number()) {
        error = "response.status is missing";
        return std::nullopt;
    }
    // HTTP статус: целое 100..599
    const double code = status->as_number();
    if (!status->is_integral() || code < 100 || code > 599) {
        error = "response.status is not a valid HTTP status: " + status->to_display_string();
        return std::nullopt;
    }
    ex.status = static_cast<int>(code);

    ex.url = *url_text;
    ex.scheme = url->scheme;
    ex.host = url->host;
    ex.path = url->path;

    const Value* query_string = request->get("queryString");
    if (query_string != nullptr && query_string->is_array()) {
        ex.query = read_pairs(query_string);
    } else {
        ex.query = parse_query(url->query);
    }

    ex.request_headers = read_pairs(request->get("headers"));
    ex.response_headers = read_pairs(response->get("headers"));

    if (!read_body(request->get("postData"), ex.request_body, error)) {
        error = "request " + error;
        return std::nullopt;
    }
    if (!read_body(response->get("content"), ex.response_body, error)) {
        error = "response " + error;
        return std::nullopt;
    }
    if (ex.request_body.content_type.empty()) {
        if (const auto* ct = find_header(ex.request_headers, "content-type")) {
            ex.request_body.content_type = *ct;
        }
    }
    if (ex.response_body.content_type.empty()) {
        if (const auto* ct = find_header(ex.response_headers, "content-type")) {
            ex.response_body.content_type = *ct;
        }
    }

    // UTC фиксированной ширины: примеры упорядочиваются строковым сравнением
    const std::string started = entry.get_string_field("startedDateTime").value_or("");
    const auto started_ms = timestamp_millis(started);
    ex.timestamp = started_ms ? format_timestamp(*started_ms) : started;
    if (const Value* time = entry.get("time"); time != nullptr && time->is_number()) {
        ex.time_ms = time->as_number();
    }
    return ex;
}

// ============================================================================
// EntryHandler - SAX обработчик
// ============================================================================

namespace {

class EntryHandler : public rapidjson::BaseReaderHandler<rapidjson::UTF8<>, EntryHandler> {
public:
    enum class Phase { Seeking, InEntries, Finished };

    Phase phase() const { return phase_; }
    bool entry_ready() const { return ready_; }

    Value take_entry() {
        ready_ = false;
        return std::move(entry_);
    }

    bool Null() { return scalar(Value()); }
    bool Bool(bool b) { return scalar(Value(b)); }
    bool Int(int i) { return scalar(Value(static_cast<std::int64_t>(i))); }
    bool Uint(unsigned u) { return scalar(Value(static_cast<std::uint64_t>(u))); }
    bool Int64(std::int64_t i) { return scalar(Value(i)); }
    bool Uint64(std::uint64_t u) { return scalar(Value(u)); }
    bool Double(double d) { return scalar(Value(d)); }

    bool String(const char* str, rapidjson::SizeType length, bool) {
        return scalar(Value(std::string(str, length)));
    }

    bool Key(const char* str, rapidjson::SizeType length, bool) {
        std::string key(str, length);
        if (phase_ == Phase::InEntries && !building_.empty()) {
            building_.back().key = std::move(key);
        } else if (phase_ == Phase::Seeking && !seek_.empty()) {
            seek_.back().key = std::move(key);
        }
        return true;
    }

    bool StartObject() { return start(true); }
    bool StartArray() { return start(false); }
    bool EndObject(rapidjson::SizeType) { return end(); }
    bool EndArray(rapidjson::SizeType) { return end(); }

private:
    struct SeekFrame {
        bool object;
        std::string key;
    };

    struct BuildFrame {
        Value value;
        std::string key;
    };

    /// Стек поиска указывает на root.log.entries
    bool at_entries() const {
        return seek_.size() == 2 && seek_[0].object && seek_[0].key == "log" &&
               seek_[1].object && seek_[1].key == "entries";
    }

    bool start(bool object) {
        if (phase_ == Phase::Seeking) {
            if (!object && at_entries()) {
                phase_ = Phase::InEntries;
                return true;
            }
            seek_.push_back(SeekFrame{object, {}});
            return true;
        }
        if (phase_ == Phase::InEntries) {
            building_.push_back(BuildFrame{object ? Value::make_object() : Value::make_array(), {}});
        }
        return true;
    }

    bool end() {
        if (phase_ == Phase::Seeking) {
            if (!seek_.empty()) {
                seek_.pop_back();
            }
            return true;
        }
        if (phase_ == Phase::InEntries) {
            if (building_.empty()) {
                // конец массива entries
                phase_ = Phase::Finished;
                return true;
            }
            Value done = std::move(building_.back().value);
            building_.pop_back();
            attach(std::move(done));
        }
        return true;
    }

    bool scalar(Value v) {
        if (phase_ == Phase::InEntries) {
            attach(std::move(v));
        }
        return true;
    }

    void attach(Value v) {
        if (building_.empty()) {
            entry_ = std::move(v);
            ready_ = true;
            return;
        }
        auto& top = building_.back();
        if (top.value.is_object()) {
            top.value.set(top.key, std::move(v));
        } else {
            top.value.push_back(std::move(v));
        }
    }

    Phase phase_ = Phase::Seeking;
    std::vector<SeekFrame> seek_;
    std::vector<BuildFrame> building_;
    Value entry_;
    bool ready_ = false;
};

struct FileCloser {
    void operator()(std::FILE* f) const {
        if (f != nullptr) {
            std::fclose(f);
        }
    }
};

}  // namespace

// ============================================================================
// CaptureReader
// ============================================================================

struct CaptureReader::Impl {
    std::filesystem::path path;
    std::unique_ptr<std::FILE, FileCloser> file;
    std::vector<char> buffer = std::vector<char>(64 * 1024);
    std::unique_ptr<rapidjson::FileReadStream> stream;
    rapidjson::Reader reader;
    EntryHandler handler;
    std::optional<Error> error;
    Diagnostics diagnostics;
    std::uint64_t seen = 0;

    /// Продвинуть парсер до готовой записи (или до конца массива entries)
    bool pump() {
        while (!reader.IterativeParseComplete()) {
            if (!reader.IterativeParseNext<rapidjson::kParseDefaultFlags>(*stream, handler)) {
                break;
            }
            if (handler.entry_ready() || handler.phase() == EntryHandler::Phase::Finished) {
                break;
            }
        }
        if (reader.HasParseError()) {
            error = Error::make(ErrorKind::MalformedCapture,
                                std::string("invalid JSON: ") +
                                    rapidjson::GetParseError_En(reader.GetParseErrorCode()) +
                                    " at offset " + std::to_string(reader.GetErrorOffset()),
                                platform::path_to_utf8(path));
            return false;
        }
        return handler.entry_ready();
    }

    /// Читать до начала массива log.entries
    bool seek_entries() {
        while (!reader.IterativeParseComplete()) {
            if (!reader.IterativeParseNext<rapidjson::kParseDefaultFlags>(*stream, handler)) {
                break;
            }
            if (handler.phase() != EntryHandler::Phase::Seeking) {
                return true;
            }
        }
        if (reader.HasParseError()) {
            error = Error::make(ErrorKind::MalformedCapture,
                                std::string("invalid JSON: ") +
                                    rapidjson::GetParseError_En(reader.GetParseErrorCode()) +
                                    " at offset " + std::to_string(reader.GetErrorOffset()),
                                platform::path_to_utf8(path));
        } else {
            error = Error::make(ErrorKind::MalformedCapture, "capture has no log.entries array",
                                platform::path_to_utf8(path));
        }
        return false;
    }
};

CaptureReader::CaptureReader() : impl_(std::make_unique<Impl>()) {}

CaptureReader::~CaptureReader() = default;

CaptureOpenResult CaptureReader::open(const std::filesystem::path& path) {
    CaptureOpenResult result;
    std::unique_ptr<CaptureReader> reader(new CaptureReader());
    auto& impl = *reader->impl_;
    impl.path = path;

#ifdef _WIN32
    impl.file.reset(_wfopen(path.c_str(), L"rb"));
#else
    impl.file.reset(std::fopen(platform::path_to_utf8(path).c_str(), "rb"));
#endif
    if (!impl.file) {
        result.error = Error::make(ErrorKind::MalformedCapture, "cannot open capture file",
                                   platform::path_to_utf8(path));
        return result;
    }

    impl.stream = std::make_unique<rapidjson::FileReadStream>(impl.file.get(), impl.buffer.data(),
                                                              impl.buffer.size());
    impl.reader.IterativeParseInit();
    if (!impl.seek_entries()) {
        result.error = *impl.error;
        return result;
    }

    result.ok = true;
    result.reader = std::move(reader);
    return result;
}

bool CaptureReader::next(RawExchange& out) {
    auto& impl = *impl_;
    while (!impl.error.has_value() && impl.pump()) {
        Value entry = impl.handler.take_entry();
        const std::uint64_t index = impl.seen++;

        std::string message;
        auto exchange = exchange_from_entry(entry, index, message);
        if (exchange.has_value()) {
            out = std::move(*exchange);
            return true;
        }
        impl.diagnostics.push_back(
            Diagnostic{ErrorKind::PartialParseWarning, "skipped entry: " + message, index, {}});
    }
    return false;
}

const std::optional<Error>& CaptureReader::last_error() const {
    return impl_->error;
}

const Diagnostics& CaptureReader::diagnostics() const {
    return impl_->diagnostics;
}

std::uint64_t CaptureReader::entries_seen() const {
    return impl_->seen;
}

const std::filesystem::path& CaptureReader::path() const {
    return impl_->path;
}

}  // namespace harvest::io
