// ==============================================================================
// body.cpp - Сегменты путей, скаляры из текста, схемы тел (JSON/form/XML)
// ==============================================================================

#include <harvest/model.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <pugixml.hpp>

namespace harvest::model {

// ============================================================================
// Сегменты путей
// ============================================================================

std::vector<std::string> split_path(std::string_view path) {
    std::vector<std::string> segments;
    if (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    if (path.empty()) {
        return segments;
    }
    while (true) {
        auto slash = path.find('/');
        segments.emplace_back(path.substr(0, slash));
        if (slash == std::string_view::npos) {
            break;
        }
        path.remove_prefix(slash + 1);
    }
    return segments;
}

namespace {

bool all_of(std::string_view s, int (*pred)(int)) {
    return std::all_of(s.begin(), s.end(),
                       [pred](char c) { return pred(static_cast<unsigned char>(c)) != 0; });
}

bool any_of(std::string_view s, int (*pred)(int)) {
    return std::any_of(s.begin(), s.end(),
                       [pred](char c) { return pred(static_cast<unsigned char>(c)) != 0; });
}

bool is_uuid(std::string_view s) {
    if (s.size() != 36) {
        return false;
    }
    for (std::size_t i = 0; i < s.size(); ++i) {
        const bool dash = (i == 8 || i == 13 || i == 18 || i == 23);
        if (dash ? s[i] != '-' : std::isxdigit(static_cast<unsigned char>(s[i])) == 0) {
            return false;
        }
    }
    return true;
}

bool is_token_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_';
}

}  // namespace

bool is_id_segment(std::string_view segment) {
    if (segment.empty()) {
        return false;
    }
    if (all_of(segment, std::isdigit)) {
        return true;
    }
    if (is_uuid(segment)) {
        return true;
    }
    // hex: объектные id, хэши
    if (segment.size() >= 16 && all_of(segment, std::isxdigit) && any_of(segment, std::isdigit)) {
        return true;
    }
    // непрозрачные токены
    return segment.size() >= 20 &&
           std::all_of(segment.begin(), segment.end(), is_token_char) &&
           any_of(segment, std::isdigit) && any_of(segment, std::isalpha);
}

std::string placeholder_name(const std::string& base, std::size_t number) {
    return number <= 1 ? base : base + std::to_string(number);
}

// ============================================================================
// Скаляры
// ============================================================================

Value scalar_from_text(const std::string& text) {
    if (text == "true") {
        return Value(true);
    }
    if (text == "false") {
        return Value(false);
    }
    if (text.empty()) {
        return Value(text);
    }

    const std::size_t digits_start = text.front() == '-' ? 1 : 0;
    const std::string_view digits = std::string_view(text).substr(digits_start);
    if (!digits.empty() && all_of(digits, std::isdigit)) {
        // "007" остаётся строкой
        if (digits.size() > 1 && digits.front() == '0') {
            return Value(text);
        }
        errno = 0;
        char* end = nullptr;
        const long long n = std::strtoll(text.c_str(), &end, 10);
        if (errno == 0 && end == text.c_str() + text.size()) {
            return Value(static_cast<std::int64_t>(n));
        }
        return Value(text);
    }

    const bool looks_numeric =
        any_of(text, std::isdigit) &&
        std::all_of(text.begin(), text.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '-' ||
                   c == '+' || c == 'e' || c == 'E';
        });
    if (looks_numeric) {
        errno = 0;
        char* end = nullptr;
        const double d = std::strtod(text.c_str(), &end);
        if (errno == 0 && end == text.c_str() + text.size()) {
            return Value(d);
        }
    }
    return Value(text);
}

// ============================================================================
// Заголовки и content type
// ============================================================================

bool is_ignored_header(std::string_view lower_name) {
    static const char* const IGNORED[] = {
        "host",           "connection",      "content-length",      "transfer-encoding",
        "keep-alive",     "upgrade",         "te",                  "trailer",
        "proxy-connection", "proxy-authorization", "accept-encoding", "content-encoding",
        "date",
    };
    if (!lower_name.empty() && lower_name.front() == ':') {
        return true;  // псевдозаголовки HTTP/2
    }
    for (const char* name : IGNORED) {
        if (lower_name == name) {
            return true;
        }
    }
    return false;
}

std::string media_type(std::string_view content_type) {
    auto semicolon = content_type.find(';');
    std::string_view base = content_type.substr(0, semicolon);
    auto start = base.find_first_not_of(" \t");
    auto end = base.find_last_not_of(" \t");
    if (start == std::string_view::npos) {
        return {};
    }
    std::string out(base.substr(start, end - start + 1));
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// ============================================================================
// XML -> Value
// ============================================================================
//
// Атрибуты: "@name", текст рядом с элементами: "$text",
// повторяющиеся элементы собираются в массив.
//

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

Value xml_element_to_value(const pugi::xml_node& node) {
    bool has_elements = false;
    std::string text;
    for (const auto& child : node.children()) {
        if (child.type() == pugi::node_element) {
            has_elements = true;
        } else if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) {
            text += trim(child.value());
        }
    }

    if (!has_elements && !node.first_attribute()) {
        return scalar_from_text(text);
    }

    Value::Object obj;
    for (const auto& attr : node.attributes()) {
        obj[std::string("@") + attr.name()] = scalar_from_text(attr.value());
    }

    std::map<std::string, Value::Array> children;
    for (const auto& child : node.children()) {
        if (child.type() == pugi::node_element) {
            children[child.name()].push_back(xml_element_to_value(child));
        }
    }
    for (auto& [name, values] : children) {
        if (values.size() == 1) {
            obj[name] = std::move(values.front());
        } else {
            obj[name] = Value(std::move(values));
        }
    }

    if (!text.empty()) {
        obj["$text"] = Value(text);
    }
    return Value(std::move(obj));
}

}  // namespace

std::optional<Value> xml_to_value(std::string_view text) {
    pugi::xml_document doc;
    auto parsed = doc.load_buffer(text.data(), text.size());
    if (!parsed) {
        return std::nullopt;
    }
    auto root = doc.document_element();
    if (!root) {
        return std::nullopt;
    }
    Value::Object obj;
    obj[root.name()] = xml_element_to_value(root);
    return Value(std::move(obj));
}

// ============================================================================
// multipart/form-data
// ============================================================================

namespace {

/// Значение параметра key из "a; key=value" или key="value" (пусто если нет)
std::string header_param(std::string_view header, std::string_view key) {
    std::string lower(header);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const std::string needle = std::string(key) + "=";
    std::size_t pos = 0;
    while ((pos = lower.find(needle, pos)) != std::string::npos) {
        // "name=" не должен совпасть внутри "filename="
        if (pos == 0 || lower[pos - 1] == ' ' || lower[pos - 1] == ';' ||
            lower[pos - 1] == '\t') {
            break;
        }
        pos += needle.size();
    }
    if (pos == std::string::npos) {
        return {};
    }
    std::size_t start = pos + needle.size();
    if (start < header.size() && header[start] == '"') {
        auto end = header.find('"', start + 1);
        return std::string(header.substr(start + 1, end == std::string_view::npos
                                                        ? std::string_view::npos
                                                        : end - start - 1));
    }
    auto end = header.find_first_of("; \t\r\n", start);
    return std::string(header.substr(start, end == std::string_view::npos
                                                ? std::string_view::npos
                                                : end - start));
}

std::optional<std::string> text_example(const std::string& bytes) {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto c = static_cast<unsigned char>(bytes[i]);
        std::size_t extra = 0;
        if (c < 0x80) {
            extra = 0;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
        } else {
            return std::nullopt;
        }
        if (i + extra >= bytes.size()) {
            return std::nullopt;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(bytes[i + k]) & 0xC0) != 0x80) {
                return std::nullopt;
            }
        }
        i += extra + 1;
    }
    return bytes;
}

}  // namespace

std::optional<Value> multipart_to_value(const io::Body& body) {
    Value::Object obj;
    const std::string boundary = header_param(body.content_type, "boundary");
    const std::string delimiter = "--" + boundary;

    if (boundary.empty() || body.bytes.find(delimiter) == std::string::npos) {
        // postData.params без text восстановлены как name=value&...
        if (body.bytes.find('=') == std::string::npos) {
            return std::nullopt;
        }
        for (const auto& [name, value] : io::parse_query(body.bytes)) {
            obj.emplace(name, scalar_from_text(value));
        }
        return Value(std::move(obj));
    }

    const std::string_view bytes(body.bytes);
    std::size_t pos = bytes.find(delimiter);
    while (pos != std::string_view::npos) {
        pos += delimiter.size();
        if (bytes.substr(pos, 2) == "--") {
            break;
        }
        const std::size_t next = bytes.find(delimiter, pos);
        if (next == std::string_view::npos) {
            break;
        }
        std::string_view part = bytes.substr(pos, next - pos);
        pos = next;

        std::size_t header_end = part.find("\r\n\r\n");
        std::size_t separator = 4;
        if (header_end == std::string_view::npos) {
            header_end = part.find("\n\n");
            separator = 2;
        }
        if (header_end == std::string_view::npos) {
            continue;
        }
        const std::string_view headers = part.substr(0, header_end);
        std::string_view content = part.substr(header_end + separator);
        if (content.size() >= 2 && content.substr(content.size() - 2) == "\r\n") {
            content.remove_suffix(2);
        } else if (!content.empty() && content.back() == '\n') {
            content.remove_suffix(1);
        }

        const std::string name = header_param(headers, "name");
        if (name.empty()) {
            continue;
        }
        const std::string filename = header_param(headers, "filename");
        if (!filename.empty()) {
            obj.emplace(name, Value(filename));
        } else {
            obj.emplace(name, scalar_from_text(std::string(content)));
        }
    }

    if (obj.empty()) {
        return std::nullopt;
    }
    return Value(std::move(obj));
}

// ============================================================================
// Схема тела
// ============================================================================

Schema body_schema(const io::Body& body, const std::string& timestamp, std::uint64_t ordinal) {
    const std::string mime = media_type(body.content_type);

    const bool json_mime = mime.find("json") != std::string::npos;
    bool json_like = json_mime;
    if (mime.empty()) {
        auto first = body.bytes.find_first_not_of(" \t\r\n");
        json_like = first != std::string::npos &&
                    (body.bytes[first] == '{' || body.bytes[first] == '[');
    }
    if (json_like) {
        if (auto value = Value::parse_json(body.bytes)) {
            return infer(*value, timestamp, ordinal);
        }
        return opaque(text_example(body.bytes), timestamp, ordinal);
    }

    if (mime == "application/x-www-form-urlencoded") {
        Value::Object obj;
        for (const auto& [name, value] : io::parse_query(body.bytes)) {
            obj.emplace(name, scalar_from_text(value));
        }
        return infer(Value(std::move(obj)), timestamp, ordinal);
    }

    if (mime == "multipart/form-data") {
        if (auto value = multipart_to_value(body)) {
            return infer(*value, timestamp, ordinal);
        }
    }

    if (mime.find("xml") != std::string::npos) {
        if (auto value = xml_to_value(body.bytes)) {
            return infer(*value, timestamp, ordinal);
        }
    }
    return opaque(text_example(body.bytes), timestamp, ordinal);
}

}  // namespace harvest::model
