// ==============================================================================
// value.cpp - Реализация Value (каноническая модель JSON-подобных данных)
// ==============================================================================

#include <cmath>
#include <harvest/value.hpp>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/writer.h>
#include <stdexcept>

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace harvest {

const char* Value::type_name() const {
    if (is_null())
        return "null";
    if (is_bool())
        return "boolean";
    if (is_integral())
        return "integer";
    if (is_double())
        return "number";
    if (is_string())
        return "string";
    if (is_array())
        return "array";
    return "object";
}

double Value::as_number() const {
    if (is_int())
        return static_cast<double>(as_int());
    if (is_uint())
        return static_cast<double>(as_uint());
    if (is_double())
        return as_double();
    return 0.0;
}

// ----------------------------------------------------------------------------
// Изменение (copy-on-write для разделяемых массивов/объектов)
// ----------------------------------------------------------------------------

Value::Array* Value::get_array_mut() {
    auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
    if (ptr == nullptr) {
        return nullptr;
    }
    if (ptr->use_count() > 1) {
        *ptr = std::make_shared<Array>(**ptr);
    }
    return ptr->get();
}

Value::Object* Value::get_object_mut() {
    auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
    if (ptr == nullptr) {
        return nullptr;
    }
    if (ptr->use_count() > 1) {
        *ptr = std::make_shared<Object>(**ptr);
    }
    return ptr->get();
}

void Value::push_back(Value v) {
    if (auto* arr = get_array_mut()) {
        arr->push_back(std::move(v));
    }
}

void Value::set(const std::string& key, Value v) {
    if (auto* obj = get_object_mut()) {
        (*obj)[key] = std::move(v);
    }
}

const Value* Value::find(std::string_view dotted_path) const {
    const Value* current = this;
    while (current != nullptr && !dotted_path.empty()) {
        auto dot = dotted_path.find('.');
        std::string key(dotted_path.substr(0, dot));
        current = current->get(key);
        if (dot == std::string_view::npos) {
            break;
        }
        dotted_path.remove_prefix(dot + 1);
    }
    return current;
}

std::optional<std::string> Value::get_string_field(const std::string& key) const {
    const Value* v = get(key);
    if (v == nullptr || !v->is_string()) {
        return std::nullopt;
    }
    return v->as_string();
}

// ----------------------------------------------------------------------------
// Сравнение
// ----------------------------------------------------------------------------

bool Value::operator==(const Value& other) const {
    if (is_number() && other.is_number()) {
        if (is_double() || other.is_double()) {
            return as_number() == other.as_number();
        }
        if (is_int() && other.is_int()) {
            return as_int() == other.as_int();
        }
        if (is_uint() && other.is_uint()) {
            return as_uint() == other.as_uint();
        }
        // Int64 vs UInt64: равны только неотрицательные значения
        const Int64 i = is_int() ? as_int() : other.as_int();
        const UInt64 u = is_uint() ? as_uint() : other.as_uint();
        return i >= 0 && static_cast<UInt64>(i) == u;
    }
    if (data_.index() != other.data_.index()) {
        return false;
    }
    if (is_null())
        return true;
    if (is_bool())
        return as_bool() == other.as_bool();
    if (is_string())
        return as_string() == other.as_string();
    if (is_array())
        return as_array() == other.as_array();
    return as_object() == other.as_object();
}

// ----------------------------------------------------------------------------
// Value::from_rapidjson - порядок приоритета UInt → Int → Float
// ----------------------------------------------------------------------------

Value Value::from_rapidjson(const rapidjson::Value& json) {
    if (json.IsNull()) {
        return Value();
    }

    if (json.IsBool()) {
        return Value(json.GetBool());
    }

    if (json.IsNumber()) {
        if (json.IsUint64()) {
            return Value(json.GetUint64());
        }
        if (json.IsInt64()) {
            return Value(json.GetInt64());
        }
        return Value(json.GetDouble());
    }

    if (json.IsString()) {
        return Value(std::string(json.GetString(), json.GetStringLength()));
    }

    if (json.IsArray()) {
        Array arr;
        arr.reserve(json.Size());
        for (rapidjson::SizeType i = 0; i < json.Size(); ++i) {
            arr.push_back(from_rapidjson(json[i]));
        }
        return Value(std::move(arr));
    }

    if (json.IsObject()) {
        Object obj;
        for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it) {
            std::string key(it->name.GetString(), it->name.GetStringLength());
            obj[key] = from_rapidjson(it->value);
        }
        return Value(std::move(obj));
    }

    return Value();
}

// ----------------------------------------------------------------------------
// Value::to_rapidjson
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    if (is_null()) {
        out.SetNull();
        return;
    }

    if (is_bool()) {
        out.SetBool(as_bool());
        return;
    }

    if (is_int()) {
        out.SetInt64(as_int());
        return;
    }

    if (is_uint()) {
        out.SetUint64(as_uint());
        return;
    }

    if (is_double()) {
        double d = as_double();
        if (!std::isfinite(d)) {
            throw std::runtime_error("could not convert float to JSON: non-finite value");
        }
        out.SetDouble(d);
        return;
    }

    if (is_string()) {
        const auto& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
        return;
    }

    if (is_array()) {
        out.SetArray();
        const auto& arr = as_array();
        out.Reserve(static_cast<rapidjson::SizeType>(arr.size()), alloc);
        for (const auto& elem : arr) {
            rapidjson::Value v;
            elem.to_rapidjson(v, alloc);
            out.PushBack(v, alloc);
        }
        return;
    }

    out.SetObject();
    for (const auto& [key, val] : as_object()) {
        rapidjson::Value k;
        k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
        rapidjson::Value v;
        val.to_rapidjson(v, alloc);
        out.AddMember(k, v, alloc);
    }
}

// ----------------------------------------------------------------------------
// Текстовые конверсии
// ----------------------------------------------------------------------------

std::optional<Value> Value::parse_json(std::string_view text) {
    rapidjson::Document doc;
    doc.Parse(text.data(), text.size());
    if (doc.HasParseError()) {
        return std::nullopt;
    }
    return from_rapidjson(doc);
}

std::string Value::to_json_string() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string Value::to_pretty_json_string() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string Value::to_display_string(std::size_t limit) const {
    std::string text = is_string() ? as_string() : to_json_string();
    for (char& c : text) {
        if (c == '\n' || c == '\r' || c == '\t' || c == '|') {
            c = ' ';
        }
    }
    if (limit > 3 && text.size() > limit) {
        text.resize(limit - 3);
        text += "...";
    }
    return text;
}

}  // namespace harvest

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif
