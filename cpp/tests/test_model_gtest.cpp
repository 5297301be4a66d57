// ==============================================================================
// test_model_gtest.cpp - Unit тесты для построения каталога harvest::model
// ==============================================================================
//
// Шаблонизация путей, правило вариативности, группировка в порядке
// первого появления, детерминизм, слияние каталогов, JSON каталога.
//
// ==============================================================================

#include <harvest/capture.hpp>
#include <harvest/model.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <vector>

namespace io = harvest::io;
namespace model = harvest::model;
using harvest::CancelToken;
using harvest::ErrorKind;
using harvest::Value;

#ifndef CMAKE_SOURCE_DIR
#define CMAKE_SOURCE_DIR "."
#endif

namespace {

std::filesystem::path fixtures_path() {
    return std::filesystem::path(CMAKE_SOURCE_DIR) / "tests" / "fixtures" / "captures";
}

std::vector<io::RawExchange> load_exchanges(const char* name) {
    std::vector<io::RawExchange> out;
    auto opened = io::CaptureReader::open(fixtures_path() / name);
    EXPECT_TRUE(opened) << opened.error.format();
    if (!opened) {
        return out;
    }
    io::RawExchange ex;
    while (opened.reader->next(ex)) {
        out.push_back(ex);
    }
    return out;
}

model::Catalogue build_all(const std::vector<io::RawExchange>& exchanges,
                           const model::BuildOptions& options = {}) {
    auto result = model::build(exchanges, nullptr, options);
    EXPECT_TRUE(result) << result.error.format();
    return result.catalogue;
}

io::RawExchange make_exchange(std::uint64_t index, const std::string& method,
                              const std::string& path, int status = 200) {
    io::RawExchange ex;
    ex.index = index;
    ex.method = method;
    ex.scheme = "https";
    ex.host = "api.example.com";
    ex.path = path;
    ex.url = "https://api.example.com" + path;
    ex.status = status;
    ex.timestamp = "2024-03-01T10:00:0" + std::to_string(index % 10) + ".000Z";
    return ex;
}

std::vector<std::string> keys(const model::Catalogue& catalogue) {
    std::vector<std::string> out;
    for (const auto& api : catalogue.apis) {
        out.push_back(api.key());
    }
    return out;
}

}  // namespace

// ============================================================================
// Сегменты и скаляры
// ============================================================================

TEST(ModelPaths, SplitPath) {
    EXPECT_TRUE(model::split_path("/").empty());
    EXPECT_TRUE(model::split_path("").empty());
    EXPECT_EQ(model::split_path("/users/42"), (std::vector<std::string>{"users", "42"}));
    EXPECT_EQ(model::split_path("/a//b/"), (std::vector<std::string>{"a", "", "b", ""}));
}

TEST(ModelPaths, IsIdSegment) {
    EXPECT_TRUE(model::is_id_segment("42"));
    EXPECT_TRUE(model::is_id_segment("550e8400-e29b-41d4-a716-446655440000"));
    EXPECT_TRUE(model::is_id_segment("507f1f77bcf86cd799439011"));
    EXPECT_TRUE(model::is_id_segment("tok_1a2b3c4d5e6f7g8h9i0j"));

    EXPECT_FALSE(model::is_id_segment(""));
    EXPECT_FALSE(model::is_id_segment("users"));
    EXPECT_FALSE(model::is_id_segment("v2"));
    EXPECT_FALSE(model::is_id_segment("deadbeef"));
    EXPECT_FALSE(model::is_id_segment("app.css"));
}

TEST(ModelPaths, PlaceholderName) {
    EXPECT_EQ(model::placeholder_name("id", 1), "id");
    EXPECT_EQ(model::placeholder_name("id", 2), "id2");
    EXPECT_EQ(model::placeholder_name("param", 3), "param3");
}

TEST(ModelScalars, ScalarFromText) {
    EXPECT_EQ(model::scalar_from_text("true"), Value(true));
    EXPECT_EQ(model::scalar_from_text("42"), Value(static_cast<std::int64_t>(42)));
    EXPECT_EQ(model::scalar_from_text("-7"), Value(static_cast<std::int64_t>(-7)));
    EXPECT_EQ(model::scalar_from_text("2.5"), Value(2.5));
    EXPECT_EQ(model::scalar_from_text("007"), Value("007"));
    EXPECT_EQ(model::scalar_from_text("1.2.3"), Value("1.2.3"));
    EXPECT_EQ(model::scalar_from_text("abc"), Value("abc"));
    EXPECT_EQ(model::scalar_from_text(""), Value(""));
}

TEST(ModelScalars, MediaType) {
    EXPECT_EQ(model::media_type("Application/JSON; charset=utf-8"), "application/json");
    EXPECT_EQ(model::media_type("  text/html "), "text/html");
    EXPECT_EQ(model::media_type(""), "");
}

TEST(ModelScalars, IgnoredHeaders) {
    EXPECT_TRUE(model::is_ignored_header("host"));
    EXPECT_TRUE(model::is_ignored_header("date"));
    EXPECT_TRUE(model::is_ignored_header(":authority"));
    EXPECT_FALSE(model::is_ignored_header("content-type"));
    EXPECT_FALSE(model::is_ignored_header("x-request-id"));
}

TEST(ModelScalars, MostFrequent_TieLowestKey) {
    EXPECT_EQ(model::most_frequent({{"b", 2}, {"a", 2}, {"c", 1}}), "a");
    EXPECT_EQ(model::most_frequent({}), "");
}

// ============================================================================
// Тела
// ============================================================================

TEST(ModelBodies, XmlToValue) {
    auto v = model::xml_to_value(
        R"(<feed version="2"><entry>a</entry><entry>b</entry><title>t</title></feed>)");

    ASSERT_TRUE(v.has_value());
    const Value* feed = v->get("feed");
    ASSERT_NE(feed, nullptr);
    EXPECT_EQ(feed->get("@version")->as_number(), 2.0);
    ASSERT_NE(feed->get("entry"), nullptr);
    EXPECT_EQ(feed->get("entry")->array_size(), 2u);
    EXPECT_EQ(feed->get_string_field("title"), "t");
}

TEST(ModelBodies, XmlToValue_Invalid) {
    EXPECT_FALSE(model::xml_to_value("<open>").has_value());
}

TEST(ModelBodies, Multipart_Parts) {
    io::Body body{"--b1\r\n"
                  "Content-Disposition: form-data; name=\"title\"\r\n\r\n"
                  "cat\r\n"
                  "--b1\r\n"
                  "Content-Disposition: form-data; name=\"photo\"; filename=\"cat.png\"\r\n"
                  "Content-Type: image/png\r\n\r\n"
                  "\x89PNG\r\n"
                  "--b1--\r\n",
                  "multipart/form-data; boundary=\"b1\""};

    auto value = model::multipart_to_value(body);

    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->get_string_field("title"), "cat");
    EXPECT_EQ(value->get_string_field("photo"), "cat.png");
    EXPECT_EQ(model::body_schema(body, "t", 0).types, model::TYPE_OBJECT);
}

TEST(ModelBodies, Multipart_RebuiltFromParams) {
    io::Body body{"user=ann&age=7", "multipart/form-data; boundary=zz"};

    auto value = model::multipart_to_value(body);

    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->get_string_field("user"), "ann");
    EXPECT_EQ(value->get("age")->as_number(), 7.0);
}

TEST(ModelBodies, Opaque_KeepsText) {
    io::Body text{"hello", "text/plain"};
    io::Body binary{std::string("\x89PNG\x00\xff", 6), "image/png"};

    auto t = model::body_schema(text, "t", 4);
    auto b = model::body_schema(binary, "t", 5);

    EXPECT_EQ(t.types, model::TYPE_OPAQUE);
    ASSERT_TRUE(t.example.has_value());
    EXPECT_EQ(t.example->value, Value("hello"));
    ASSERT_TRUE(b.example.has_value());
    EXPECT_TRUE(b.example->value.is_null());
}

TEST(ModelBodies, BodySchema_Kinds) {
    io::Body json{R"({"a": 1})", "application/json"};
    io::Body sniffed{R"([1, 2])", ""};
    io::Body form{"user=ann&remember=true", "application/x-www-form-urlencoded"};
    io::Body binary{"\x89PNG", "image/png"};
    io::Body broken{"{not json", "application/json"};

    EXPECT_EQ(model::body_schema(json, "t", 0).types, model::TYPE_OBJECT);
    EXPECT_EQ(model::body_schema(sniffed, "t", 0).types, model::TYPE_ARRAY);

    auto f = model::body_schema(form, "t", 0);
    EXPECT_EQ(f.types, model::TYPE_OBJECT);
    EXPECT_EQ(f.fields.at("remember").schema->types, model::TYPE_BOOLEAN);

    EXPECT_EQ(model::body_schema(binary, "t", 0).types, model::TYPE_OPAQUE);
    EXPECT_EQ(model::body_schema(broken, "t", 0).types, model::TYPE_OPAQUE);
}

// ============================================================================
// ModelBuilder
// ============================================================================

TEST(ModelBuilder, Users_GroupsInFirstSeenOrder) {
    auto catalogue = build_all(load_exchanges("users.har"));

    EXPECT_EQ(keys(catalogue),
              (std::vector<std::string>{"GET /users/{id}", "GET /static/app.css", "POST /users",
                                        "GET /collect", "GET /users"}));
    EXPECT_EQ(catalogue.exchanges, 6u);
    EXPECT_EQ(catalogue.method_stats.at("GET"), 5u);
    EXPECT_EQ(catalogue.host_stats.at("api.example.com"), 4u);
}

TEST(ModelBuilder, Users_IdTemplate) {
    auto catalogue = build_all(load_exchanges("users.har"));
    const auto* api = catalogue.find("GET /users/{id}");
    ASSERT_NE(api, nullptr);

    EXPECT_EQ(api->sample_count, 2u);
    EXPECT_EQ(api->description, "Auto-generated from 2 captured exchange(s)");
    EXPECT_EQ(api->host(), "api.example.com");
    EXPECT_EQ(api->scheme(), "https");

    const auto& params = api->request.path_params;
    ASSERT_TRUE(params.required("id"));
    const auto& id = *params.fields.at("id").schema;
    EXPECT_EQ(id.type_name(), "integer");
    ASSERT_TRUE(id.example.has_value());
    EXPECT_EQ(id.example->value, Value(static_cast<std::int64_t>(2)));

    // тело: email стал nullable, но остался обязательным
    const auto& body = api->response.body;
    EXPECT_TRUE(body.required("email"));
    EXPECT_EQ(body.fields.at("email").schema->type_name(), "null|string");
    EXPECT_EQ(api->response.status_code, 200);
    EXPECT_EQ(api->response.content_types.at("application/json"), 2u);

    // x-trace встречен один раз из двух, date игнорируется
    EXPECT_TRUE(api->response.headers.required("content-type"));
    EXPECT_FALSE(api->response.headers.required("x-trace"));
    EXPECT_EQ(api->response.headers.fields.count("date"), 0u);
    EXPECT_EQ(api->request.headers.fields.count("host"), 0u);
}

TEST(ModelBuilder, Users_QueryAndRequestBody) {
    auto catalogue = build_all(load_exchanges("users.har"));

    const auto* list = catalogue.find("GET /users");
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(list->request.query.fields.at("page").schema->type_name(), "integer");
    EXPECT_EQ(list->response.body.types, model::TYPE_ARRAY);

    const auto* create = catalogue.find("POST /users");
    ASSERT_NE(create, nullptr);
    EXPECT_EQ(create->response.status_code, 201);
    EXPECT_TRUE(create->request.body.required("admin"));
    EXPECT_EQ(create->request.content_types.at("application/json"), 1u);
    EXPECT_EQ(create->response.body.fields.at("id").schema->type_name(), "integer");
}

TEST(ModelBuilder, Slugs_VarianceMakesParameter) {
    auto catalogue = build_all(load_exchanges("slugs.har"));

    EXPECT_EQ(keys(catalogue),
              (std::vector<std::string>{"GET /orders/{id}/items", "POST /login", "GET /feed.xml",
                                        "GET /logo.png"}));

    const auto* orders = catalogue.find("GET /orders/{id}/items");
    ASSERT_NE(orders, nullptr);
    EXPECT_EQ(orders->sample_count, 3u);
    EXPECT_EQ(orders->request.path_params.fields.at("id").schema->type_name(), "string");
    EXPECT_EQ(orders->response.body.fields.at("count").schema->type_name(), "number");
    EXPECT_TRUE(catalogue.diagnostics.empty());
}

TEST(ModelBuilder, Slugs_VarianceDisabled) {
    model::BuildOptions options;
    options.variance_threshold = 0;

    auto catalogue = build_all(load_exchanges("slugs.har"), options);

    EXPECT_EQ(catalogue.apis.size(), 6u);
    EXPECT_NE(catalogue.find("GET /orders/alpha/items"), nullptr);
}

TEST(ModelBuilder, Slugs_FormAndXmlBodies) {
    auto catalogue = build_all(load_exchanges("slugs.har"));

    const auto* login = catalogue.find("POST /login");
    ASSERT_NE(login, nullptr);
    EXPECT_TRUE(login->request.body.required("user"));

    const auto* feed = catalogue.find("GET /feed.xml");
    ASSERT_NE(feed, nullptr);
    EXPECT_TRUE(feed->response.body.required("feed"));

    const auto* logo = catalogue.find("GET /logo.png");
    ASSERT_NE(logo, nullptr);
    EXPECT_EQ(logo->response.body.types, model::TYPE_OPAQUE);
}

TEST(ModelBuilder, CustomPlaceholder_MultipleParams) {
    model::BuildOptions options;
    options.placeholder = "param";
    std::vector<io::RawExchange> exchanges = {make_exchange(0, "GET", "/users/1/posts/10"),
                                              make_exchange(1, "GET", "/users/2/posts/20")};

    auto catalogue = build_all(exchanges, options);

    ASSERT_EQ(catalogue.apis.size(), 1u);
    EXPECT_EQ(catalogue.apis[0].path_template, "/users/{param}/posts/{param2}");
    EXPECT_TRUE(catalogue.apis[0].request.path_params.required("param2"));
}

TEST(ModelBuilder, RootPath) {
    auto catalogue = build_all({make_exchange(0, "GET", "/")});

    ASSERT_EQ(catalogue.apis.size(), 1u);
    EXPECT_EQ(catalogue.apis[0].path_template, "/");
    EXPECT_TRUE(catalogue.apis[0].request.path_params.fields.empty());
}

TEST(ModelBuilder, PrimaryStatus_MostFrequent) {
    auto catalogue = build_all({make_exchange(0, "GET", "/items/1", 404),
                                make_exchange(1, "GET", "/items/2", 200),
                                make_exchange(2, "GET", "/items/3", 200)});

    ASSERT_EQ(catalogue.apis.size(), 1u);
    EXPECT_EQ(catalogue.apis[0].response.status_code, 200);
    EXPECT_EQ(catalogue.apis[0].response.statuses.size(), 2u);
}

TEST(ModelBuilder, NoExchanges_EmptyCatalogue) {
    auto result = model::build({}, nullptr);

    ASSERT_TRUE(result);
    EXPECT_TRUE(result.catalogue.apis.empty());
    EXPECT_EQ(result.catalogue.exchanges, 0u);
    EXPECT_EQ(model::catalogue_to_json(result.catalogue).array_size(), 0u);
}

TEST(ModelBuilder, IncludePredicate) {
    auto exchanges = load_exchanges("users.har");

    auto result = model::build(exchanges, [](const io::RawExchange& ex) {
        return ex.host == "api.example.com";
    });

    ASSERT_TRUE(result);
    EXPECT_EQ(keys(result.catalogue),
              (std::vector<std::string>{"GET /users/{id}", "POST /users", "GET /users"}));
}

TEST(ModelBuilder, Cancelled) {
    CancelToken token;
    token.cancel();

    auto result = model::build(load_exchanges("users.har"), nullptr, {}, &token);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::Cancelled);
    EXPECT_TRUE(result.catalogue.apis.empty());
}

TEST(ModelBuilder, Deterministic) {
    auto exchanges = load_exchanges("users.har");

    auto a = build_all(exchanges);
    auto b = build_all(exchanges);

    EXPECT_EQ(model::catalogue_to_json(a).to_json_string(),
              model::catalogue_to_json(b).to_json_string());
}

// ============================================================================
// Слияние каталогов
// ============================================================================

TEST(ModelMerge, SplitBuildEqualsWholeBuild) {
    auto exchanges = load_exchanges("users.har");
    ASSERT_EQ(exchanges.size(), 6u);
    std::vector<io::RawExchange> first(exchanges.begin(), exchanges.begin() + 1);
    std::vector<io::RawExchange> second(exchanges.begin() + 1, exchanges.end());

    auto whole = build_all(exchanges);
    auto merged = model::merge_catalogues(build_all(first), build_all(second));

    EXPECT_EQ(keys(merged), keys(whole));
    EXPECT_EQ(merged.exchanges, whole.exchanges);
    EXPECT_EQ(merged.host_stats, whole.host_stats);
    EXPECT_EQ(model::catalogue_to_json(merged).to_json_string(),
              model::catalogue_to_json(whole).to_json_string());
}

TEST(ModelMerge, Associative) {
    auto exchanges = load_exchanges("users.har");
    ASSERT_EQ(exchanges.size(), 6u);
    std::vector<io::RawExchange> a(exchanges.begin(), exchanges.begin() + 2);
    std::vector<io::RawExchange> b(exchanges.begin() + 2, exchanges.begin() + 4);
    std::vector<io::RawExchange> c(exchanges.begin() + 4, exchanges.end());

    auto ca = build_all(a);
    auto cb = build_all(b);
    auto cc = build_all(c);

    auto left = model::merge_catalogues(model::merge_catalogues(ca, cb), cc);
    auto right = model::merge_catalogues(ca, model::merge_catalogues(cb, cc));

    EXPECT_EQ(model::catalogue_to_json(left).to_json_string(),
              model::catalogue_to_json(right).to_json_string());
}

TEST(ModelMerge, SameGroupCountsSummed) {
    auto first = build_all({make_exchange(0, "GET", "/users/1")});
    auto second = build_all({make_exchange(1, "GET", "/users/2", 404)});

    auto merged = model::merge_catalogues(first, second);

    ASSERT_EQ(merged.apis.size(), 1u);
    EXPECT_EQ(merged.apis[0].sample_count, 2u);
    EXPECT_EQ(merged.apis[0].response.statuses.size(), 2u);
    EXPECT_EQ(merged.apis[0].description, model::describe(2));
}

TEST(ModelMerge, VarianceReappliedAcrossBatches) {
    std::vector<io::RawExchange> first = {make_exchange(0, "GET", "/items/alpha"),
                                          make_exchange(1, "GET", "/items/beta")};
    std::vector<io::RawExchange> second = {make_exchange(2, "GET", "/items/gamma")};
    std::vector<io::RawExchange> all = first;
    all.insert(all.end(), second.begin(), second.end());

    auto a = build_all(first);
    ASSERT_EQ(keys(a), (std::vector<std::string>{"GET /items/alpha", "GET /items/beta"}));

    auto merged = model::merge_catalogues(a, build_all(second));
    auto whole = build_all(all);

    EXPECT_EQ(keys(merged), (std::vector<std::string>{"GET /items/{id}"}));
    EXPECT_EQ(merged.apis[0].sample_count, 3u);
    EXPECT_EQ(model::catalogue_to_json(merged).to_json_string(),
              model::catalogue_to_json(whole).to_json_string());
}

TEST(ModelMerge, SlugsSplitEqualsWholeBuild) {
    auto exchanges = load_exchanges("slugs.har");
    ASSERT_GE(exchanges.size(), 3u);
    auto whole = build_all(exchanges);

    // каждая точка разбиения отделяет часть литералов /orders/*/items
    for (std::size_t split = 1; split < exchanges.size(); ++split) {
        std::vector<io::RawExchange> first(exchanges.begin(), exchanges.begin() + split);
        std::vector<io::RawExchange> second(exchanges.begin() + split, exchanges.end());

        auto merged = model::merge_catalogues(build_all(first), build_all(second));

        EXPECT_EQ(keys(merged), keys(whole)) << "split at " << split;
        EXPECT_EQ(merged.exchanges, whole.exchanges);
        EXPECT_EQ(model::catalogue_to_json(merged).to_json_string(),
                  model::catalogue_to_json(whole).to_json_string())
            << "split at " << split;
    }
}

TEST(ModelMerge, EmptyCatalogueIsIdentity) {
    auto catalogue = build_all(load_exchanges("slugs.har"));

    auto left = model::merge_catalogues(model::Catalogue{}, catalogue);
    auto right = model::merge_catalogues(catalogue, model::Catalogue{});

    EXPECT_EQ(model::catalogue_to_json(left).to_json_string(),
              model::catalogue_to_json(catalogue).to_json_string());
    EXPECT_EQ(model::catalogue_to_json(right).to_json_string(),
              model::catalogue_to_json(catalogue).to_json_string());
}

TEST(ModelMerge, LoadedCatalogue_MatchedByTemplate) {
    auto built = build_all({make_exchange(0, "GET", "/users/1")});
    auto loaded = model::catalogue_from_json(model::catalogue_to_json(built));
    ASSERT_TRUE(loaded) << loaded.error.format();
    EXPECT_TRUE(loaded.catalogue.groups.empty());

    auto merged = model::merge_catalogues(loaded.catalogue,
                                          build_all({make_exchange(1, "GET", "/users/2")}));

    ASSERT_EQ(keys(merged), (std::vector<std::string>{"GET /users/{id}"}));
    EXPECT_EQ(merged.apis[0].sample_count, 2u);
}

// ============================================================================
// JSON каталога
// ============================================================================

TEST(ModelJson, ApiToValue_Keys) {
    auto catalogue = build_all(load_exchanges("users.har"));

    Value v = model::api_to_value(catalogue.apis[0]);

    EXPECT_EQ(v.get_string_field("method"), "GET");
    EXPECT_EQ(v.get_string_field("pathTemplate"), "/users/{id}");
    EXPECT_EQ(v.get_string_field("host"), "api.example.com");
    ASSERT_NE(v.find("request.pathParams"), nullptr);
    ASSERT_NE(v.find("response.statusCode"), nullptr);
    EXPECT_EQ(v.find("response.statusCode")->as_number(), 200.0);
    EXPECT_EQ(v.find("response.contentType")->as_string(), "application/json");
}

TEST(ModelJson, TextRoundTrip) {
    auto catalogue = build_all(load_exchanges("slugs.har"));
    const std::string text = model::catalogue_to_json(catalogue).to_pretty_json_string();

    auto parsed = Value::parse_json(text);
    ASSERT_TRUE(parsed.has_value());
    auto back = model::catalogue_from_json(*parsed);

    ASSERT_TRUE(back) << back.error.format();
    EXPECT_EQ(keys(back.catalogue), keys(catalogue));
    EXPECT_EQ(back.catalogue.exchanges, catalogue.exchanges);
    EXPECT_EQ(model::catalogue_to_json(back.catalogue).to_pretty_json_string(), text);
}

TEST(ModelJson, NotArray_Error) {
    auto back = model::catalogue_from_json(Value::make_object());

    ASSERT_FALSE(back);
    EXPECT_EQ(back.error.kind, ErrorKind::IoError);
}

TEST(ModelJson, MissingRequest_Error) {
    auto json = Value::parse_json(R"([{"method": "GET", "pathTemplate": "/"}])");
    ASSERT_TRUE(json.has_value());

    auto back = model::catalogue_from_json(*json);

    ASSERT_FALSE(back);
    EXPECT_NE(back.error.message.find("catalogue[0]"), std::string::npos);
}

TEST(ModelJson, LoadCatalogue_MissingFile) {
    auto back = model::load_catalogue(fixtures_path() / "missing.json");

    ASSERT_FALSE(back);
    EXPECT_EQ(back.error.kind, ErrorKind::IoError);
}
