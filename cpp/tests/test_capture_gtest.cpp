// ==============================================================================
// test_capture_gtest.cpp - Unit тесты для разбора файлов захвата harvest::io
// ==============================================================================
//
// CaptureReader (HAR 1.2), пропуск повреждённых записей, ошибки контейнера,
// URL / query / percent-decoding / base64.
//
// ==============================================================================

#include <harvest/capture.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace io = harvest::io;
using harvest::ErrorKind;
using harvest::Value;

#ifndef CMAKE_SOURCE_DIR
#define CMAKE_SOURCE_DIR "."
#endif

namespace {

std::filesystem::path fixtures_path() {
    return std::filesystem::path(CMAKE_SOURCE_DIR) / "tests" / "fixtures" / "captures";
}

std::vector<io::RawExchange> read_all(io::CaptureReader& reader) {
    std::vector<io::RawExchange> out;
    io::RawExchange ex;
    while (reader.next(ex)) {
        out.push_back(ex);
    }
    return out;
}

}  // namespace

// ============================================================================
// CaptureReader
// ============================================================================

TEST(CaptureReader, Users_AllValidEntries) {
    auto opened = io::CaptureReader::open(fixtures_path() / "users.har");
    ASSERT_TRUE(opened) << opened.error.format();

    auto exchanges = read_all(*opened.reader);

    EXPECT_EQ(exchanges.size(), 6u);
    EXPECT_EQ(opened.reader->entries_seen(), 7u);
    EXPECT_FALSE(opened.reader->last_error().has_value());

    ASSERT_EQ(opened.reader->diagnostics().size(), 1u);
    const auto& diag = opened.reader->diagnostics()[0];
    EXPECT_EQ(diag.kind, ErrorKind::PartialParseWarning);
    ASSERT_TRUE(diag.entry.has_value());
    EXPECT_EQ(*diag.entry, 5u);
}

TEST(CaptureReader, Users_FirstExchangeFields) {
    auto opened = io::CaptureReader::open(fixtures_path() / "users.har");
    ASSERT_TRUE(opened);

    io::RawExchange ex;
    ASSERT_TRUE(opened.reader->next(ex));

    EXPECT_EQ(ex.index, 0u);
    EXPECT_EQ(ex.method, "GET");
    EXPECT_EQ(ex.scheme, "https");
    EXPECT_EQ(ex.host, "api.example.com");
    EXPECT_EQ(ex.path, "/users/1");
    EXPECT_EQ(ex.status, 200);
    EXPECT_EQ(ex.timestamp, "2024-03-01T10:00:00.000Z");
    EXPECT_DOUBLE_EQ(ex.time_ms, 41.5);
    EXPECT_EQ(ex.request_headers.size(), 3u);
    EXPECT_EQ(ex.response_body.content_type, "application/json; charset=utf-8");

    auto body = Value::parse_json(ex.response_body.bytes);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(body->get_string_field("name"), "Ann");
}

TEST(CaptureReader, Users_MethodUppercasedAndBase64Decoded) {
    auto opened = io::CaptureReader::open(fixtures_path() / "users.har");
    ASSERT_TRUE(opened);
    auto exchanges = read_all(*opened.reader);
    ASSERT_EQ(exchanges.size(), 6u);

    const auto& post = exchanges[3];
    EXPECT_EQ(post.method, "POST");
    EXPECT_EQ(post.status, 201);
    EXPECT_EQ(post.request_body.content_type, "application/json");
    EXPECT_EQ(post.response_body.bytes, R"({"id": 3, "name": "Cy"})");
}

TEST(CaptureReader, Users_QueryFromQueryString) {
    auto opened = io::CaptureReader::open(fixtures_path() / "users.har");
    ASSERT_TRUE(opened);
    auto exchanges = read_all(*opened.reader);
    ASSERT_EQ(exchanges.size(), 6u);

    const auto& list = exchanges[5];
    EXPECT_EQ(list.index, 6u);
    EXPECT_EQ(list.path, "/users");
    ASSERT_EQ(list.query.size(), 2u);
    EXPECT_EQ(list.query[0].first, "page");
    EXPECT_EQ(list.query[0].second, "2");
    EXPECT_EQ(list.query[1].first, "limit");
}

TEST(CaptureReader, Slugs_InvalidBase64Skipped) {
    auto opened = io::CaptureReader::open(fixtures_path() / "slugs.har");
    ASSERT_TRUE(opened);

    auto exchanges = read_all(*opened.reader);

    EXPECT_EQ(exchanges.size(), 6u);
    ASSERT_EQ(opened.reader->diagnostics().size(), 1u);
    EXPECT_EQ(*opened.reader->diagnostics()[0].entry, 6u);
}

TEST(CaptureReader, Slugs_FormParamsRebuilt) {
    auto opened = io::CaptureReader::open(fixtures_path() / "slugs.har");
    ASSERT_TRUE(opened);
    auto exchanges = read_all(*opened.reader);
    ASSERT_GE(exchanges.size(), 4u);

    const auto& login = exchanges[3];
    EXPECT_EQ(login.method, "POST");
    EXPECT_EQ(login.request_body.content_type, "application/x-www-form-urlencoded");
    EXPECT_NE(login.request_body.bytes.find("user="), std::string::npos);
}

TEST(CaptureReader, NotHar_MalformedCapture) {
    auto opened = io::CaptureReader::open(fixtures_path() / "not_har.json");

    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.error.kind, ErrorKind::MalformedCapture);
    EXPECT_EQ(opened.reader, nullptr);
}

TEST(CaptureReader, MissingFile_MalformedCapture) {
    auto opened = io::CaptureReader::open(fixtures_path() / "nope.har");

    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.error.kind, ErrorKind::MalformedCapture);
}

TEST(CaptureReader, Truncated_LastErrorAfterValidEntries) {
    auto opened = io::CaptureReader::open(fixtures_path() / "truncated.har");
    ASSERT_TRUE(opened) << opened.error.format();

    auto exchanges = read_all(*opened.reader);

    ASSERT_EQ(exchanges.size(), 1u);
    EXPECT_EQ(exchanges[0].path, "/a");
    ASSERT_TRUE(opened.reader->last_error().has_value());
    EXPECT_EQ(opened.reader->last_error()->kind, ErrorKind::MalformedCapture);
}

// ============================================================================
// Атрибуты для движка правил
// ============================================================================

TEST(CaptureAttributes, ResponseContentTypePreferred) {
    io::RawExchange ex;
    ex.method = "POST";
    ex.host = "api.example.com";
    ex.url = "https://api.example.com/users";
    ex.request_body.content_type = "application/json";
    ex.response_body.content_type = "text/html";
    ex.request_headers = {{"Accept", "*/*"}};

    auto attrs = io::attributes(ex);

    EXPECT_EQ(attrs.content_type, "text/html");
    EXPECT_EQ(attrs.method, "POST");
    EXPECT_EQ(attrs.headers.size(), 1u);
}

TEST(CaptureAttributes, FallsBackToRequestContentType) {
    io::RawExchange ex;
    ex.request_headers = {{"content-type", "application/xml"}};

    EXPECT_EQ(io::attributes(ex).content_type, "application/xml");
}

// ============================================================================
// HAR запись
// ============================================================================

TEST(CaptureEntry, MissingStatus_Rejected) {
    auto entry = Value::parse_json(
        R"({"request": {"method": "GET", "url": "https://a.test/"}, "response": {}})");
    ASSERT_TRUE(entry.has_value());

    std::string error;
    auto ex = io::exchange_from_entry(*entry, 0, error);

    EXPECT_FALSE(ex.has_value());
    EXPECT_FALSE(error.empty());
}

TEST(CaptureEntry, InvalidStatus_Rejected) {
    for (const char* status : {"1e300", "200.5", "99", "600", "-200"}) {
        auto entry = Value::parse_json(
            std::string(R"({"request": {"method": "GET", "url": "https://a.test/"},
                            "response": {"status": )") +
            status + "}}");
        ASSERT_TRUE(entry.has_value()) << status;

        std::string error;
        auto ex = io::exchange_from_entry(*entry, 0, error);

        EXPECT_FALSE(ex.has_value()) << status;
        EXPECT_NE(error.find("response.status"), std::string::npos) << status;
    }
}

TEST(CaptureEntry, TimestampNormalizedToUtc) {
    auto entry = Value::parse_json(
        R"({"startedDateTime": "2024-05-02T12:00:00.5+02:00",
            "request": {"method": "GET", "url": "https://a.test/"},
            "response": {"status": 200}})");
    ASSERT_TRUE(entry.has_value());

    std::string error;
    auto ex = io::exchange_from_entry(*entry, 0, error);

    ASSERT_TRUE(ex.has_value()) << error;
    EXPECT_EQ(ex->timestamp, "2024-05-02T10:00:00.500Z");
}

TEST(CaptureEntry, RelativeUrl_Rejected) {
    auto entry = Value::parse_json(
        R"({"request": {"method": "GET", "url": "/users"}, "response": {"status": 200}})");
    ASSERT_TRUE(entry.has_value());

    std::string error;
    EXPECT_FALSE(io::exchange_from_entry(*entry, 0, error).has_value());
}

TEST(CaptureEntry, QueryFromUrlWithoutQueryString) {
    auto entry = Value::parse_json(
        R"({"request": {"method": "GET", "url": "https://a.test/s?q=a%20b&x"},
            "response": {"status": 200}})");
    ASSERT_TRUE(entry.has_value());

    std::string error;
    auto ex = io::exchange_from_entry(*entry, 3, error);

    ASSERT_TRUE(ex.has_value()) << error;
    EXPECT_EQ(ex->index, 3u);
    ASSERT_EQ(ex->query.size(), 2u);
    EXPECT_EQ(ex->query[0].second, "a b");
    EXPECT_EQ(ex->query[1].first, "x");
    EXPECT_EQ(ex->query[1].second, "");
}

// ============================================================================
// URL и кодировки
// ============================================================================

TEST(CaptureUrl, ParseUrl_Full) {
    auto url = io::parse_url("HTTPS://user:pw@API.Example.com:8443/v1/items?a=1#frag");

    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "https");
    EXPECT_EQ(url->host, "api.example.com");
    EXPECT_EQ(url->port, "8443");
    EXPECT_EQ(url->path, "/v1/items");
    EXPECT_EQ(url->query, "a=1");
}

TEST(CaptureUrl, ParseUrl_EmptyPathIsRoot) {
    auto url = io::parse_url("http://example.com?x=1");

    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->path, "/");
    EXPECT_EQ(url->query, "x=1");
}

TEST(CaptureUrl, ParseUrl_Ipv6) {
    auto url = io::parse_url("http://[::1]:8080/health");

    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "[::1]");
    EXPECT_EQ(url->port, "8080");
}

TEST(CaptureUrl, ParseUrl_Invalid) {
    EXPECT_FALSE(io::parse_url("/relative/path").has_value());
    EXPECT_FALSE(io::parse_url("https:///nohost").has_value());
    EXPECT_FALSE(io::parse_url("https://host:port/").has_value());
}

TEST(CaptureUrl, PercentDecode) {
    EXPECT_EQ(io::percent_decode("a%20b", false), "a b");
    EXPECT_EQ(io::percent_decode("a+b", false), "a+b");
    EXPECT_EQ(io::percent_decode("a+b", true), "a b");
    // неверные последовательности остаются как есть
    EXPECT_EQ(io::percent_decode("100%", false), "100%");
    EXPECT_EQ(io::percent_decode("%zz", false), "%zz");
    EXPECT_EQ(io::percent_decode("%4", false), "%4");
}

TEST(CaptureUrl, ParseQuery) {
    auto params = io::parse_query("a=1&&b=x%2By&c");

    ASSERT_EQ(params.size(), 3u);
    EXPECT_EQ(params[0].first, "a");
    EXPECT_EQ(params[1].second, "x+y");
    EXPECT_EQ(params[2].first, "c");
    EXPECT_EQ(params[2].second, "");
}

TEST(CaptureTime, TimestampMillis) {
    EXPECT_EQ(io::timestamp_millis("1970-01-01T00:00:00Z"), std::optional<std::int64_t>(0));
    EXPECT_EQ(io::timestamp_millis("1970-01-01T00:00:01.250Z"),
              std::optional<std::int64_t>(1250));
    EXPECT_EQ(io::timestamp_millis("1970-01-01T01:00:00+01:00"), std::optional<std::int64_t>(0));
    EXPECT_EQ(io::timestamp_millis("1970-01-01T00:00:00-0130"),
              std::optional<std::int64_t>(5400000));
    EXPECT_EQ(io::timestamp_millis("2024-02-29T00:00:00"),
              std::optional<std::int64_t>(1709164800000));

    EXPECT_FALSE(io::timestamp_millis("").has_value());
    EXPECT_FALSE(io::timestamp_millis("yesterday").has_value());
    EXPECT_FALSE(io::timestamp_millis("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(io::timestamp_millis("2024-05-02T10:00:00Q").has_value());
}

TEST(CaptureTime, FormatTimestamp) {
    EXPECT_EQ(io::format_timestamp(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(io::format_timestamp(1709164800123), "2024-02-29T00:00:00.123Z");
    EXPECT_EQ(io::format_timestamp(-1), "1969-12-31T23:59:59.999Z");
}

TEST(CaptureUrl, Base64Decode) {
    EXPECT_EQ(io::base64_decode("aGVsbG8="), std::optional<std::string>("hello"));
    EXPECT_EQ(io::base64_decode("aGVs\nbG8="), std::optional<std::string>("hello"));
    EXPECT_EQ(io::base64_decode(""), std::optional<std::string>(""));
    EXPECT_FALSE(io::base64_decode("not*base64").has_value());
    EXPECT_FALSE(io::base64_decode("aGVsbG8=x").has_value());
}

TEST(CaptureUrl, FindHeader_CaseInsensitive) {
    io::HeaderList headers = {{"Content-Type", "text/plain"}, {"content-type", "second"}};

    const auto* value = io::find_header(headers, "CONTENT-TYPE");

    ASSERT_NE(value, nullptr);
    EXPECT_EQ(*value, "text/plain");
    EXPECT_EQ(io::find_header(headers, "accept"), nullptr);
}
