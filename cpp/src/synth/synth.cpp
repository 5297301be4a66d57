// ==============================================================================
// synth.cpp - Синтез TestCase из ApiDefinition
// ==============================================================================
//
// Запрос собирается из примеров, сохранённых в схемах (самый свежий обмен):
// path-параметры подставляются в шаблон, заголовки/query/тело берутся из
// корневого примера соответствующей схемы. Ожидаемый ответ:
//   status_code, json_schema (если тело структурное), header_present для
//   заголовков, встреченных во всех ответах, content_type.
//
// ==============================================================================

#include <harvest/synth.hpp>

#include <cctype>
#include <set>

namespace harvest::synth {

std::string to_string(AssertionKind kind) {
    switch (kind) {
    case AssertionKind::StatusCode:
        return "status_code";
    case AssertionKind::JsonSchema:
        return "json_schema";
    case AssertionKind::HeaderPresent:
        return "header_present";
    case AssertionKind::ContentType:
        return "content_type";
    }
    return "unknown";
}

std::string slug(const std::string& method, const std::string& path_template) {
    std::string out;
    bool pending = false;
    auto append = [&](const std::string& text) {
        for (char c : text) {
            const auto uc = static_cast<unsigned char>(c);
            if (std::isalnum(uc) != 0) {
                if (pending && !out.empty()) {
                    out += '_';
                }
                pending = false;
                out += static_cast<char>(std::tolower(uc));
            } else {
                pending = true;
            }
        }
        pending = true;
    };
    append(method);
    const std::size_t method_size = out.size();
    append(path_template);
    if (out.size() == method_size) {
        out += "_root";
    }
    return out;
}

namespace {

/// Текст значения для пути и query: строки как есть, остальное в JSON
std::string text_of(const Value& v) {
    if (v.is_string()) {
        return v.as_string();
    }
    return v.to_json_string();
}

std::string percent_encode(const std::string& text) {
    static const char* const HEX = "0123456789ABCDEF";
    std::string out;
    for (char c : text) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
            out += c;
        } else {
            out += '%';
            out += HEX[uc >> 4];
            out += HEX[uc & 0x0F];
        }
    }
    return out;
}

/// Корневой пример схемы-объекта; иначе объект из примеров полей
Value example_object(const model::Schema& schema) {
    if (schema.example && schema.example->value.is_object()) {
        return schema.example->value;
    }
    Value out = Value::make_object();
    for (const auto& [name, field] : schema.fields) {
        if (field.schema && field.schema->example) {
            out.set(name, field.schema->example->value);
        }
    }
    return out;
}

std::string first_literal_segment(const std::string& path_template) {
    for (const auto& segment : model::split_path(path_template)) {
        if (!segment.empty() && segment.front() != '{') {
            return segment;
        }
    }
    return {};
}

}  // namespace

std::string instantiate_path(const model::ApiDefinition& api) {
    const std::string& tpl = api.path_template;
    std::string out;
    std::size_t pos = 0;
    while (pos < tpl.size()) {
        const auto open = tpl.find('{', pos);
        if (open == std::string::npos) {
            out.append(tpl, pos, std::string::npos);
            break;
        }
        const auto close = tpl.find('}', open);
        if (close == std::string::npos) {
            out.append(tpl, pos, std::string::npos);
            break;
        }
        out.append(tpl, pos, open - pos);
        const std::string name = tpl.substr(open + 1, close - open - 1);
        auto field = api.request.path_params.fields.find(name);
        if (field != api.request.path_params.fields.end() && field->second.schema &&
            field->second.schema->example) {
            out += text_of(field->second.schema->example->value);
        } else {
            out.append(tpl, open, close - open + 1);
        }
        pos = close + 1;
    }
    return out;
}

TestCase make_test_case(const model::ApiDefinition& api) {
    TestCase tc;
    tc.id = "tc_" + slug(api.method, api.path_template);
    tc.api_ref = api.key();
    tc.name = api.key();
    tc.description = api.description.empty() ? model::describe(api.sample_count)
                                              : api.description;

    // Запрос
    TestRequest& req = tc.request;
    req.method = api.method;
    req.path = instantiate_path(api);
    req.headers = example_object(api.request.headers);
    req.query = example_object(api.request.query);
    // пример самой свежей выборки, в том числе текст непрозрачного тела
    if (!api.request.body.empty() && api.request.body.example) {
        req.body = api.request.body.example->value;
    }

    std::string query_string;
    if (const auto* params = req.query.get_object()) {
        for (const auto& [name, value] : *params) {
            query_string += query_string.empty() ? "?" : "&";
            query_string += percent_encode(name) + "=" + percent_encode(text_of(value));
        }
    }
    const std::string scheme = api.scheme().empty() ? "https" : api.scheme();
    req.url = scheme + "://" + api.host() + req.path + query_string;

    // Ожидаемый ответ
    ExpectedResponse& exp = tc.expected;
    exp.status_code = api.response.status_code;
    exp.assertions.push_back(Assertion{AssertionKind::StatusCode, {},
                                       Value(static_cast<std::int64_t>(exp.status_code))});

    // JSON Schema проверяет только структурные альтернативы тела
    model::Schema body = api.response.body;
    body.types &= ~static_cast<std::uint32_t>(model::TYPE_OPAQUE);
    if (!body.empty()) {
        exp.assertions.push_back(
            Assertion{AssertionKind::JsonSchema, {}, model::to_json_schema(body)});
    }

    for (const auto& [name, field] : api.response.headers.fields) {
        (void)field;
        if (api.response.headers.required(name)) {
            exp.assertions.push_back(Assertion{AssertionKind::HeaderPresent, name, Value()});
        }
    }

    const std::string content_type = model::most_frequent(api.response.content_types);
    if (!content_type.empty()) {
        exp.assertions.push_back(Assertion{AssertionKind::ContentType, {}, Value(content_type)});
    }

    // Теги
    std::string method_tag = api.method;
    for (char& c : method_tag) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    tc.tags.push_back(method_tag);
    const std::string resource = first_literal_segment(api.path_template);
    if (!resource.empty() && resource != method_tag && resource != "generated") {
        tc.tags.push_back(resource);
    }
    tc.tags.emplace_back("generated");
    return tc;
}

SynthResult synthesize(const std::vector<model::ApiDefinition>& apis, const CancelToken* cancel) {
    SynthResult result;
    std::set<std::string> ids;
    for (const auto& api : apis) {
        if (is_cancelled(cancel)) {
            result.error = Error::make(ErrorKind::Cancelled, "test synthesis cancelled");
            result.cases.clear();
            return result;
        }
        TestCase tc = make_test_case(api);
        if (!ids.insert(tc.id).second) {
            const std::string base = tc.id;
            for (std::size_t n = 2;; ++n) {
                tc.id = base + "_" + std::to_string(n);
                if (ids.insert(tc.id).second) {
                    break;
                }
            }
        }
        result.cases.push_back(std::move(tc));
    }
    result.ok = true;
    return result;
}

// ============================================================================
// JSON
// ============================================================================

namespace {

Value assertion_value(const Assertion& a) {
    Value out = Value::make_object();
    out.set("type", Value(to_string(a.kind)));
    switch (a.kind) {
    case AssertionKind::StatusCode:
    case AssertionKind::ContentType:
        out.set("expected", a.expected);
        break;
    case AssertionKind::JsonSchema:
        out.set("schema", a.expected);
        break;
    case AssertionKind::HeaderPresent:
        out.set("header", Value(a.target));
        break;
    }
    return out;
}

}  // namespace

Value to_value(const TestCase& tc) {
    Value request = Value::make_object();
    request.set("method", Value(tc.request.method));
    request.set("path", Value(tc.request.path));
    request.set("url", Value(tc.request.url));
    request.set("headers", tc.request.headers);
    request.set("query", tc.request.query);
    request.set("body", tc.request.body);

    Value assertions = Value::make_array();
    for (const auto& a : tc.expected.assertions) {
        assertions.push_back(assertion_value(a));
    }
    Value expected = Value::make_object();
    expected.set("statusCode", Value(static_cast<std::int64_t>(tc.expected.status_code)));
    expected.set("assertions", std::move(assertions));

    Value tags = Value::make_array();
    for (const auto& tag : tc.tags) {
        tags.push_back(Value(tag));
    }

    Value out = Value::make_object();
    out.set("id", Value(tc.id));
    out.set("apiDefinitionRef", Value(tc.api_ref));
    out.set("name", Value(tc.name));
    out.set("description", Value(tc.description));
    out.set("type", Value(tc.type));
    out.set("status", Value(tc.status));
    out.set("request", std::move(request));
    out.set("expectedResponse", std::move(expected));
    out.set("tags", std::move(tags));
    return out;
}

Value testcases_to_json(const std::vector<TestCase>& cases) {
    Value out = Value::make_array();
    for (const auto& tc : cases) {
        out.push_back(to_value(tc));
    }
    return out;
}

}  // namespace harvest::synth
