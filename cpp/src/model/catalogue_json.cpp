// ==============================================================================
// catalogue_json.cpp - JSON представление каталога ApiDefinition
// ==============================================================================
//
// Формат элемента:
//   {method, pathTemplate, host, description, sampleCount, hosts, schemes,
//    request: {headers, queryParams, pathParams, bodySchema, contentType, contentTypes},
//    response: {statusCode, statuses, headers, bodySchema, contentType, contentTypes}}
//
// Схемы хранятся во внутреннем представлении (to_value) вместе со счётчиками.
//
// ==============================================================================

#include <harvest/model.hpp>
#include <harvest/platform.hpp>

#include <stdexcept>

namespace harvest::model {

namespace {

Value counts_value(const Counts& counts) {
    Value out = Value::make_object();
    for (const auto& [key, count] : counts) {
        out.set(key, Value(static_cast<std::uint64_t>(count)));
    }
    return out;
}

/// Ошибка формы каталога; ловится в catalogue_from_json
struct ShapeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

std::uint64_t read_count(const Value& v, const std::string& where) {
    if (v.is_uint()) {
        return v.as_uint();
    }
    if (v.is_int() && v.as_int() >= 0) {
        return static_cast<std::uint64_t>(v.as_int());
    }
    throw ShapeError(where + " must be a non-negative integer");
}

Counts read_counts(const Value* v, const std::string& where) {
    Counts counts;
    if (v == nullptr) {
        return counts;
    }
    if (!v->is_object()) {
        throw ShapeError(where + " must be an object");
    }
    for (const auto& [key, count] : v->as_object()) {
        counts[key] = read_count(count, where + "." + key);
    }
    return counts;
}

Schema read_schema(const Value* v, const std::string& where) {
    if (v == nullptr) {
        return Schema{};
    }
    auto parsed = schema_from_value(*v);
    if (!parsed) {
        throw ShapeError(where + ": " + parsed.error);
    }
    return std::move(parsed.schema);
}

const Value& require_object(const Value& parent, const std::string& key,
                            const std::string& where) {
    const Value* v = parent.get(key);
    if (v == nullptr || !v->is_object()) {
        throw ShapeError(where + " requires object field '" + key + "'");
    }
    return *v;
}

std::string require_string(const Value& parent, const std::string& key,
                           const std::string& where) {
    auto s = parent.get_string_field(key);
    if (!s.has_value()) {
        throw ShapeError(where + " requires string field '" + key + "'");
    }
    return *s;
}

ApiDefinition api_from_value(const Value& v, const std::string& where) {
    if (!v.is_object()) {
        throw ShapeError(where + " must be an object");
    }

    ApiDefinition api;
    api.method = require_string(v, "method", where);
    api.path_template = require_string(v, "pathTemplate", where);
    api.description = v.get_string_field("description").value_or(describe(0));
    if (const Value* n = v.get("sampleCount")) {
        api.sample_count = read_count(*n, where + ".sampleCount");
    }
    api.hosts = read_counts(v.get("hosts"), where + ".hosts");
    api.schemes = read_counts(v.get("schemes"), where + ".schemes");
    if (api.hosts.empty()) {
        if (auto host = v.get_string_field("host")) {
            api.hosts[*host] = api.sample_count;
        }
    }

    const Value& request = require_object(v, "request", where);
    api.request.headers = read_schema(request.get("headers"), where + ".request.headers");
    api.request.query = read_schema(request.get("queryParams"), where + ".request.queryParams");
    api.request.path_params =
        read_schema(request.get("pathParams"), where + ".request.pathParams");
    api.request.body = read_schema(request.get("bodySchema"), where + ".request.bodySchema");
    api.request.content_types =
        read_counts(request.get("contentTypes"), where + ".request.contentTypes");

    const Value& response = require_object(v, "response", where);
    api.response.headers = read_schema(response.get("headers"), where + ".response.headers");
    api.response.body = read_schema(response.get("bodySchema"), where + ".response.bodySchema");
    api.response.content_types =
        read_counts(response.get("contentTypes"), where + ".response.contentTypes");

    for (const auto& [status, count] :
         read_counts(response.get("statuses"), where + ".response.statuses")) {
        try {
            api.response.statuses[std::stoi(status)] = count;
        } catch (const std::exception&) {
            throw ShapeError(where + ".response.statuses: invalid status '" + status + "'");
        }
    }
    if (const Value* code = response.get("statusCode")) {
        if (!code->is_integral()) {
            throw ShapeError(where + ".response.statusCode must be an integer");
        }
        api.response.status_code = static_cast<int>(code->as_number());
    }
    return api;
}

}  // namespace

Value api_to_value(const ApiDefinition& api) {
    Value out = Value::make_object();
    out.set("method", Value(api.method));
    out.set("pathTemplate", Value(api.path_template));
    out.set("host", Value(api.host()));
    out.set("description", Value(api.description));
    out.set("sampleCount", Value(static_cast<std::uint64_t>(api.sample_count)));
    out.set("hosts", counts_value(api.hosts));
    out.set("schemes", counts_value(api.schemes));

    Value request = Value::make_object();
    request.set("headers", to_value(api.request.headers));
    request.set("queryParams", to_value(api.request.query));
    request.set("pathParams", to_value(api.request.path_params));
    request.set("bodySchema", to_value(api.request.body));
    request.set("contentType", Value(most_frequent(api.request.content_types)));
    request.set("contentTypes", counts_value(api.request.content_types));
    out.set("request", std::move(request));

    Value response = Value::make_object();
    response.set("statusCode", Value(static_cast<std::int64_t>(api.response.status_code)));
    Value statuses = Value::make_object();
    for (const auto& [status, count] : api.response.statuses) {
        statuses.set(std::to_string(status), Value(static_cast<std::uint64_t>(count)));
    }
    response.set("statuses", std::move(statuses));
    response.set("headers", to_value(api.response.headers));
    response.set("bodySchema", to_value(api.response.body));
    response.set("contentType", Value(most_frequent(api.response.content_types)));
    response.set("contentTypes", counts_value(api.response.content_types));
    out.set("response", std::move(response));
    return out;
}

Value catalogue_to_json(const Catalogue& catalogue) {
    Value out = Value::make_array();
    for (const auto& api : catalogue.apis) {
        out.push_back(api_to_value(api));
    }
    return out;
}

CatalogueResult catalogue_from_json(const Value& json) {
    CatalogueResult result;
    if (!json.is_array()) {
        result.error = Error::make(ErrorKind::IoError, "catalogue must be a JSON array");
        return result;
    }

    try {
        std::size_t i = 0;
        for (const auto& item : json.as_array()) {
            ApiDefinition api = api_from_value(item, "catalogue[" + std::to_string(i++) + "]");
            result.catalogue.exchanges += api.sample_count;
            for (const auto& [host, count] : api.hosts) {
                result.catalogue.host_stats[host] += count;
            }
            result.catalogue.method_stats[api.method] += api.sample_count;
            result.catalogue.apis.push_back(std::move(api));
        }
    } catch (const ShapeError& e) {
        result.error = Error::make(ErrorKind::IoError, e.what());
        return result;
    }

    result.ok = true;
    return result;
}

CatalogueResult load_catalogue(const std::filesystem::path& path) {
    CatalogueResult result;
    auto text = platform::read_file(path);
    if (!text.has_value()) {
        result.error = Error::make(ErrorKind::IoError, "cannot read catalogue",
                                   platform::path_to_utf8(path));
        return result;
    }
    auto json = Value::parse_json(*text);
    if (!json.has_value()) {
        result.error = Error::make(ErrorKind::IoError, "catalogue is not valid JSON",
                                   platform::path_to_utf8(path));
        return result;
    }
    result = catalogue_from_json(*json);
    if (!result && result.error.subject.empty()) {
        result.error.subject = platform::path_to_utf8(path);
    }
    return result;
}

}  // namespace harvest::model
