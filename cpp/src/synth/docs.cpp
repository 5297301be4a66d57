// ==============================================================================
// docs.cpp - Markdown и OpenAPI 3.0 документация по каталогу
// ==============================================================================

#include <harvest/synth.hpp>

#include <cctype>
#include <sstream>

namespace harvest::synth {

namespace {

const char* const DOC_TITLE = "API Documentation";

std::string yes_no(bool v) {
    return v ? "yes" : "no";
}

std::string example_text(const model::Schema& schema) {
    if (!schema.example || schema.example->value.is_null()) {
        return {};
    }
    return "`" + schema.example->value.to_display_string(60) + "`";
}

/// Таблица полей схемы-объекта: | Name | Type | Required | Example |
void write_fields(std::ostringstream& md, const std::string& title,
                  const model::Schema& schema) {
    if (schema.fields.empty()) {
        return;
    }
    md << "### " << title << "\n\n";
    md << "| Name | Type | Required | Example |\n";
    md << "|------|------|----------|---------|\n";
    for (const auto& [name, field] : schema.fields) {
        const model::Schema empty;
        const model::Schema& s = field.schema ? *field.schema : empty;
        md << "| " << name << " | " << s.type_name() << " | " << yes_no(schema.required(name))
           << " | " << example_text(s) << " |\n";
    }
    md << "\n";
}

void write_body(std::ostringstream& md, const std::string& title, const model::Schema& body,
                const model::Counts& content_types) {
    if (body.empty()) {
        return;
    }
    md << "### " << title << "\n\n";
    const std::string ct = model::most_frequent(content_types);
    if (!ct.empty()) {
        md << "Content type: `" << ct << "`\n\n";
    }
    md << "```json\n" << model::to_json_schema(body).to_pretty_json_string() << "\n```\n\n";
}

std::string lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

}  // namespace

std::string render_markdown(const std::vector<model::ApiDefinition>& apis) {
    std::ostringstream md;
    md << "# " << DOC_TITLE << "\n\n";
    md << "Generated from " << apis.size() << " API definition(s).\n\n";

    if (!apis.empty()) {
        md << "| Method | Path | Samples | Status |\n";
        md << "|--------|------|---------|--------|\n";
        for (const auto& api : apis) {
            md << "| " << api.method << " | `" << api.path_template << "` | " << api.sample_count
               << " | " << api.response.status_code << " |\n";
        }
        md << "\n";
    }

    for (const auto& api : apis) {
        md << "## " << api.key() << "\n\n";
        md << api.description << "\n\n";
        if (!api.host().empty()) {
            md << "- Host: `" << api.host() << "`\n";
        }
        md << "- Samples: " << api.sample_count << "\n";
        md << "- Test case: `tc_" << slug(api.method, api.path_template) << "`\n\n";

        write_fields(md, "Path parameters", api.request.path_params);
        write_fields(md, "Query parameters", api.request.query);
        write_fields(md, "Request headers", api.request.headers);
        write_body(md, "Request body", api.request.body, api.request.content_types);

        md << "### Response\n\n";
        md << "Status: " << api.response.status_code;
        if (api.response.statuses.size() > 1) {
            md << " (observed:";
            for (const auto& [status, count] : api.response.statuses) {
                md << " " << status << " x" << count;
            }
            md << ")";
        }
        md << "\n\n";
        write_fields(md, "Response headers", api.response.headers);
        write_body(md, "Response body", api.response.body, api.response.content_types);
    }
    return md.str();
}

// ============================================================================
// OpenAPI
// ============================================================================

namespace {

Value parameters(const model::Schema& schema, const char* in, bool required_only,
                 bool always_required) {
    Value out = Value::make_array();
    for (const auto& [name, field] : schema.fields) {
        const bool required = always_required || schema.required(name);
        if (required_only && !required) {
            continue;
        }
        Value p = Value::make_object();
        p.set("name", Value(name));
        p.set("in", Value(in));
        p.set("required", Value(required));
        p.set("schema", field.schema
                            ? model::to_json_schema(*field.schema, model::SchemaDialect::OpenApi)
                            : Value::make_object());
        out.push_back(std::move(p));
    }
    return out;
}

Value content(const model::Schema& body, const model::Counts& content_types) {
    std::string ct = model::most_frequent(content_types);
    if (ct.empty()) {
        ct = body.has(model::TYPE_OPAQUE) ? "application/octet-stream" : "application/json";
    }
    Value media = Value::make_object();
    media.set("schema", model::to_json_schema(body, model::SchemaDialect::OpenApi));
    Value out = Value::make_object();
    out.set(ct, std::move(media));
    return out;
}

Value operation(const model::ApiDefinition& api) {
    Value op = Value::make_object();
    op.set("operationId", Value(slug(api.method, api.path_template)));
    op.set("summary", Value(api.description));

    Value params = Value::make_array();
    auto append = [&params](const Value& part) {
        for (const auto& p : part.as_array()) {
            params.push_back(p);
        }
    };
    append(parameters(api.request.path_params, "path", false, true));
    append(parameters(api.request.query, "query", false, false));
    // заголовки запроса: только встреченные во всех обменах
    append(parameters(api.request.headers, "header", true, false));
    if (params.array_size() > 0) {
        op.set("parameters", std::move(params));
    }

    if (!api.request.body.empty()) {
        Value body = Value::make_object();
        body.set("required", Value(true));
        body.set("content", content(api.request.body, api.request.content_types));
        op.set("requestBody", std::move(body));
    }

    Value responses = Value::make_object();
    for (const auto& [status, count] : api.response.statuses) {
        Value r = Value::make_object();
        r.set("description", Value("Observed " + std::to_string(count) + " time(s)"));
        if (status == api.response.status_code && !api.response.body.empty()) {
            r.set("content", content(api.response.body, api.response.content_types));
        }
        responses.set(std::to_string(status), std::move(r));
    }
    if (api.response.statuses.empty()) {
        Value r = Value::make_object();
        r.set("description", Value("No response observed"));
        responses.set("default", std::move(r));
    }
    op.set("responses", std::move(responses));
    return op;
}

}  // namespace

Value render_openapi(const std::vector<model::ApiDefinition>& apis) {
    Value info = Value::make_object();
    info.set("title", Value(DOC_TITLE));
    info.set("version", Value("1.0.0"));
    info.set("description", Value("Automatically generated API documentation"));

    Value servers = Value::make_array();
    std::vector<std::string> seen;
    Value paths = Value::make_object();
    for (const auto& api : apis) {
        if (!api.host().empty()) {
            const std::string scheme = api.scheme().empty() ? "https" : api.scheme();
            const std::string url = scheme + "://" + api.host();
            bool known = false;
            for (const auto& s : seen) {
                known = known || s == url;
            }
            if (!known) {
                seen.push_back(url);
                Value server = Value::make_object();
                server.set("url", Value(url));
                servers.push_back(std::move(server));
            }
        }

        Value item = paths.get(api.path_template) != nullptr ? *paths.get(api.path_template)
                                                             : Value::make_object();
        item.set(lower(api.method), operation(api));
        paths.set(api.path_template, std::move(item));
    }

    Value doc = Value::make_object();
    doc.set("openapi", Value("3.0.0"));
    doc.set("info", std::move(info));
    if (servers.array_size() > 0) {
        doc.set("servers", std::move(servers));
    }
    doc.set("paths", std::move(paths));
    return doc;
}

}  // namespace harvest::synth
