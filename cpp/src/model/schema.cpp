// ==============================================================================
// schema.cpp - Вывод и объединение структурных схем
// ==============================================================================

#include <harvest/capture.hpp>
#include <harvest/schema.hpp>

#include <stdexcept>

namespace harvest::model {

namespace {

struct TypeName {
    std::uint32_t bit;
    const char* name;
};

constexpr TypeName TYPE_NAMES[] = {
    {TYPE_NULL, "null"},     {TYPE_BOOLEAN, "boolean"}, {TYPE_INTEGER, "integer"},
    {TYPE_NUMBER, "number"}, {TYPE_STRING, "string"},   {TYPE_ARRAY, "array"},
    {TYPE_OBJECT, "object"}, {TYPE_OPAQUE, "opaque"},
};

/// integer поглощается number
std::uint32_t fold(std::uint32_t types) {
    if ((types & TYPE_NUMBER) != 0) {
        types &= ~static_cast<std::uint32_t>(TYPE_INTEGER);
    }
    return types;
}

/// Типы, участвующие в конфликте (null означает nullable, не конфликт)
std::uint32_t conflict_bits(std::uint32_t types) {
    return fold(types) & ~static_cast<std::uint32_t>(TYPE_NULL);
}

int bit_count(std::uint32_t bits) {
    int n = 0;
    while (bits != 0) {
        bits &= bits - 1;
        ++n;
    }
    return n;
}

std::string child_location(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "." + name;
}

Value uint_value(std::uint64_t n) {
    return Value(static_cast<std::uint64_t>(n));
}

std::uint64_t read_uint(const Value* v) {
    if (v == nullptr || !v->is_integral()) {
        return 0;
    }
    if (v->is_uint()) {
        return v->as_uint();
    }
    return v->as_int() < 0 ? 0 : static_cast<std::uint64_t>(v->as_int());
}

Schema infer_node(const Value& value, const std::string& timestamp, std::uint64_t ordinal,
                  bool root) {
    Schema s;
    if (value.is_null()) {
        s.types = TYPE_NULL;
    } else if (value.is_bool()) {
        s.types = TYPE_BOOLEAN;
    } else if (value.is_integral()) {
        s.types = TYPE_INTEGER;
    } else if (value.is_double()) {
        s.types = TYPE_NUMBER;
    } else if (value.is_string()) {
        s.types = TYPE_STRING;
    } else if (value.is_array()) {
        s.types = TYPE_ARRAY;
        for (const auto& item : value.as_array()) {
            Schema item_schema = infer_node(item, timestamp, ordinal, false);
            if (!s.items) {
                s.items = std::make_unique<Schema>(std::move(item_schema));
            } else {
                join_into(*s.items, item_schema);
            }
        }
    } else {
        s.types = TYPE_OBJECT;
        s.observed = 1;
        for (const auto& [name, field] : value.as_object()) {
            s.fields.emplace(name, Field(infer_node(field, timestamp, ordinal, false), 1));
        }
    }

    const bool scalar = !value.is_array() && !value.is_object();
    if (scalar || root) {
        s.example = Example{value, timestamp, ordinal};
    }
    return s;
}

}  // namespace

// ============================================================================
// Типы
// ============================================================================

std::string type_names(std::uint32_t types) {
    std::string out;
    for (const auto& t : TYPE_NAMES) {
        if ((types & t.bit) != 0) {
            if (!out.empty()) {
                out += '|';
            }
            out += t.name;
        }
    }
    return out;
}

std::uint32_t parse_type_names(const std::string& text) {
    std::uint32_t types = TYPE_NONE;
    std::size_t start = 0;
    while (start < text.size()) {
        auto bar = text.find('|', start);
        std::string name = text.substr(start, bar == std::string::npos ? std::string::npos
                                                                       : bar - start);
        bool known = false;
        for (const auto& t : TYPE_NAMES) {
            if (name == t.name) {
                types |= t.bit;
                known = true;
                break;
            }
        }
        if (!known) {
            throw std::invalid_argument("unknown schema type '" + name + "'");
        }
        if (bar == std::string::npos) {
            break;
        }
        start = bar + 1;
    }
    return types;
}

bool Example::newer_than(const Example& other) const {
    const auto mine = io::timestamp_millis(timestamp);
    const auto theirs = io::timestamp_millis(other.timestamp);
    if (mine && theirs) {
        if (*mine != *theirs) {
            return *mine > *theirs;
        }
    } else if (timestamp != other.timestamp) {
        return timestamp > other.timestamp;
    }
    return ordinal > other.ordinal;
}

// ============================================================================
// Field / Schema
// ============================================================================

Field::Field() = default;

Field::Field(Schema s, std::uint64_t present_count)
    : schema(std::make_unique<Schema>(std::move(s))), present(present_count) {}

Field::Field(const Field& other)
    : schema(other.schema ? std::make_unique<Schema>(*other.schema) : nullptr),
      present(other.present) {}

Field& Field::operator=(const Field& other) {
    if (this != &other) {
        schema = other.schema ? std::make_unique<Schema>(*other.schema) : nullptr;
        present = other.present;
    }
    return *this;
}

Field::Field(Field&&) noexcept = default;
Field& Field::operator=(Field&&) noexcept = default;
Field::~Field() = default;

Schema::Schema(const Schema& other)
    : types(other.types),
      fields(other.fields),
      observed(other.observed),
      items(other.items ? std::make_unique<Schema>(*other.items) : nullptr),
      example(other.example) {}

Schema& Schema::operator=(const Schema& other) {
    if (this != &other) {
        Schema copy(other);
        *this = std::move(copy);
    }
    return *this;
}

bool Schema::required(const std::string& name) const {
    auto it = fields.find(name);
    return it != fields.end() && observed > 0 && it->second.present == observed;
}

bool Schema::is_union() const {
    return bit_count(conflict_bits(types)) > 1;
}

std::string Schema::type_name() const {
    std::string name = type_names(fold(types));
    return name.empty() ? "any" : name;
}

bool operator==(const Schema& a, const Schema& b) {
    if (a.types != b.types || a.observed != b.observed || a.fields.size() != b.fields.size()) {
        return false;
    }
    for (const auto& [name, field] : a.fields) {
        auto it = b.fields.find(name);
        if (it == b.fields.end() || it->second.present != field.present) {
            return false;
        }
        const bool a_has = field.schema != nullptr;
        const bool b_has = it->second.schema != nullptr;
        if (a_has != b_has || (a_has && *field.schema != *it->second.schema)) {
            return false;
        }
    }
    if ((a.items == nullptr) != (b.items == nullptr)) {
        return false;
    }
    if (a.items && *a.items != *b.items) {
        return false;
    }
    if (a.example.has_value() != b.example.has_value()) {
        return false;
    }
    if (a.example) {
        return a.example->value == b.example->value &&
               a.example->timestamp == b.example->timestamp &&
               a.example->ordinal == b.example->ordinal;
    }
    return true;
}

// ============================================================================
// Вывод и объединение
// ============================================================================

Schema infer(const Value& value, const std::string& timestamp, std::uint64_t ordinal) {
    return infer_node(value, timestamp, ordinal, true);
}

Schema opaque(std::optional<std::string> text, const std::string& timestamp,
              std::uint64_t ordinal) {
    Schema s;
    s.types = TYPE_OPAQUE;
    s.example = Example{text ? Value(std::move(*text)) : Value(), timestamp, ordinal};
    return s;
}

void join_into(Schema& a, const Schema& b, Diagnostics* diagnostics,
               const std::string& location) {
    const std::uint32_t before = conflict_bits(a.types);
    a.types |= b.types;
    const std::uint32_t after = conflict_bits(a.types);
    if (diagnostics != nullptr && before != 0 && after != before && bit_count(after) > 1) {
        diagnostics->push_back(Diagnostic{ErrorKind::SchemaConflict,
                                          "conflicting types widened to " + a.type_name(),
                                          std::nullopt, location});
    }

    a.observed += b.observed;
    for (const auto& [name, field] : b.fields) {
        auto it = a.fields.find(name);
        if (it == a.fields.end()) {
            a.fields.emplace(name, field);
            continue;
        }
        if (!it->second.schema) {
            it->second.schema = std::make_unique<Schema>();
        }
        if (field.schema) {
            join_into(*it->second.schema, *field.schema, diagnostics,
                      child_location(location, name));
        }
        it->second.present += field.present;
    }

    if (b.items) {
        if (!a.items) {
            a.items = std::make_unique<Schema>(*b.items);
        } else {
            join_into(*a.items, *b.items, diagnostics, location + "[]");
        }
    }

    if (b.example && (!a.example || b.example->newer_than(*a.example))) {
        a.example = b.example;
    }
}

Schema join(const Schema& a, const Schema& b, Diagnostics* diagnostics,
            const std::string& location) {
    Schema result(a);
    join_into(result, b, diagnostics, location);
    return result;
}

// ============================================================================
// JSON Schema
// ============================================================================

Value to_json_schema(const Schema& schema, SchemaDialect dialect) {
    Value out = Value::make_object();
    const std::uint32_t types = fold(schema.types);
    if (types == TYPE_NONE) {
        return out;
    }

    if (types == TYPE_OPAQUE) {
        out.set("type", Value("string"));
        out.set("format", Value("binary"));
        return out;
    }

    std::vector<std::string> names;
    for (const auto& t : TYPE_NAMES) {
        if ((types & t.bit) == 0) {
            continue;
        }
        if (dialect == SchemaDialect::OpenApi && t.bit == TYPE_NULL) {
            out.set("nullable", Value(true));
            continue;
        }
        std::string name = t.bit == TYPE_OPAQUE ? "string" : t.name;
        bool seen = false;
        for (const auto& n : names) {
            seen = seen || n == name;
        }
        if (!seen) {
            names.push_back(name);
        }
    }

    if (names.size() == 1) {
        out.set("type", Value(names.front()));
    } else if (dialect == SchemaDialect::OpenApi) {
        Value one_of = Value::make_array();
        for (const auto& n : names) {
            Value alt = Value::make_object();
            alt.set("type", Value(n));
            one_of.push_back(std::move(alt));
        }
        out.set("oneOf", std::move(one_of));
    } else if (!names.empty()) {
        Value list = Value::make_array();
        for (const auto& n : names) {
            list.push_back(Value(n));
        }
        out.set("type", std::move(list));
    }

    if (schema.has(TYPE_OBJECT)) {
        Value properties = Value::make_object();
        Value required = Value::make_array();
        for (const auto& [name, field] : schema.fields) {
            properties.set(name, field.schema ? to_json_schema(*field.schema, dialect)
                                              : Value::make_object());
            if (schema.required(name)) {
                required.push_back(Value(name));
            }
        }
        out.set("properties", std::move(properties));
        if (required.array_size() > 0) {
            out.set("required", std::move(required));
        }
    }

    if (schema.has(TYPE_ARRAY)) {
        out.set("items", schema.items ? to_json_schema(*schema.items, dialect)
                                      : Value::make_object());
    }

    const bool scalar = !schema.has(TYPE_OBJECT | TYPE_ARRAY | TYPE_OPAQUE);
    if (scalar && schema.example) {
        if (dialect == SchemaDialect::OpenApi) {
            out.set("example", schema.example->value);
        } else {
            Value examples = Value::make_array();
            examples.push_back(schema.example->value);
            out.set("examples", std::move(examples));
        }
    }
    return out;
}

// ============================================================================
// Внутреннее представление
// ============================================================================

Value to_value(const Schema& schema) {
    Value out = Value::make_object();
    out.set("types", Value(type_names(schema.types)));

    if (schema.has(TYPE_OBJECT) || !schema.fields.empty()) {
        out.set("observed", uint_value(schema.observed));
        Value fields = Value::make_object();
        for (const auto& [name, field] : schema.fields) {
            Value f = Value::make_object();
            f.set("present", uint_value(field.present));
            f.set("schema", field.schema ? to_value(*field.schema) : Value::make_object());
            fields.set(name, std::move(f));
        }
        out.set("fields", std::move(fields));
    }

    if (schema.items) {
        out.set("items", to_value(*schema.items));
    }

    if (schema.example) {
        Value ex = Value::make_object();
        ex.set("value", schema.example->value);
        ex.set("timestamp", Value(schema.example->timestamp));
        ex.set("ordinal", uint_value(schema.example->ordinal));
        out.set("example", std::move(ex));
    }
    return out;
}

SchemaResult schema_from_value(const Value& value) {
    SchemaResult result;
    if (!value.is_object()) {
        result.error = "schema must be an object";
        return result;
    }

    try {
        result.schema.types = parse_type_names(value.get_string_field("types").value_or(""));
    } catch (const std::invalid_argument& e) {
        result.error = e.what();
        return result;
    }
    result.schema.observed = read_uint(value.get("observed"));

    if (const Value* fields = value.get("fields")) {
        if (!fields->is_object()) {
            result.error = "schema fields must be an object";
            return result;
        }
        for (const auto& [name, f] : fields->as_object()) {
            const Value* nested = f.get("schema");
            if (nested == nullptr) {
                result.error = "field '" + name + "' has no schema";
                return result;
            }
            auto parsed = schema_from_value(*nested);
            if (!parsed) {
                result.error = name + ": " + parsed.error;
                return result;
            }
            result.schema.fields.emplace(
                name, Field(std::move(parsed.schema), read_uint(f.get("present"))));
        }
    }

    if (const Value* items = value.get("items")) {
        auto parsed = schema_from_value(*items);
        if (!parsed) {
            result.error = "items: " + parsed.error;
            return result;
        }
        result.schema.items = std::make_unique<Schema>(std::move(parsed.schema));
    }

    if (const Value* ex = value.get("example")) {
        Example example;
        if (const Value* v = ex->get("value")) {
            example.value = *v;
        }
        example.timestamp = ex->get_string_field("timestamp").value_or("");
        example.ordinal = read_uint(ex->get("ordinal"));
        result.schema.example = std::move(example);
    }

    result.ok = true;
    return result;
}

}  // namespace harvest::model
