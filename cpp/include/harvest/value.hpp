// ==============================================================================
// harvest/value.hpp - Каноническая модель JSON-подобных данных (Value)
// ==============================================================================
//
// Назначение:
// - Представление тел запросов/ответов и записей HAR для pipeline
// - Конверсия из/в RapidJSON Value
// - Явная типизация чисел: UInt64 → Int64 → Double
// - Object упорядочен по ключу: сериализация детерминирована
//
// ==============================================================================

#ifndef HARVEST_VALUE_HPP
#define HARVEST_VALUE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace harvest {

class Value;

/// Тип для массива значений
using ValueArray = std::vector<Value>;

/// Тип для объекта (упорядоченный map string -> Value)
using ValueObject = std::map<std::string, Value>;

/// Каноническое представление JSON-подобного значения
class Value {
public:
    struct Null {};
    using Bool = bool;
    using Int64 = std::int64_t;
    using UInt64 = std::uint64_t;
    using Double = double;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;

private:
    std::variant<Null, Bool, Int64, UInt64, Double, String, std::shared_ptr<Array>,
                 std::shared_ptr<Object>>
        data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    Value() : data_(Null{}) {}
    explicit Value(bool v) : data_(v) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(std::uint64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}
    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    static Value make_array() { return Value(Array{}); }
    static Value make_object() { return Value(Object{}); }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_uint() const { return std::holds_alternative<UInt64>(data_); }
    bool is_double() const { return std::holds_alternative<Double>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }

    bool is_number() const { return is_int() || is_uint() || is_double(); }

    /// Целое число (Int64 или UInt64)
    bool is_integral() const { return is_int() || is_uint(); }

    /// Имя типа: null, boolean, integer, number, string, array, object
    const char* type_name() const;

    // -------------------------------------------------------------------------
    // Доступ к значению (undefined behavior если тип не совпадает)
    // -------------------------------------------------------------------------

    Bool as_bool() const { return std::get<Bool>(data_); }
    Int64 as_int() const { return std::get<Int64>(data_); }
    UInt64 as_uint() const { return std::get<UInt64>(data_); }
    Double as_double() const { return std::get<Double>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }

    /// Любое число как double
    double as_number() const;

    // -------------------------------------------------------------------------
    // Безопасный доступ (nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const String* get_string() const {
        return std::holds_alternative<String>(data_) ? &std::get<String>(data_) : nullptr;
    }

    const Array* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с массивом
    // -------------------------------------------------------------------------

    /// Добавить элемент (только если is_array()). Массив копируется при
    /// совместном владении, поэтому копии Value не видят изменений.
    void push_back(Value v);

    std::size_t array_size() const {
        if (const auto* arr = get_array()) {
            return arr->size();
        }
        return 0;
    }

    // -------------------------------------------------------------------------
    // Операции с объектом
    // -------------------------------------------------------------------------

    /// Установить поле объекта (только если is_object())
    void set(const std::string& key, Value v);

    /// Поле объекта по ключу (nullptr если нет или не объект)
    const Value* get(const std::string& key) const {
        if (const auto* obj = get_object()) {
            auto it = obj->find(key);
            if (it != obj->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    /// Вложенное поле по пути "a.b.c"
    const Value* find(std::string_view dotted_path) const;

    /// Строковое поле объекта или nullopt
    std::optional<std::string> get_string_field(const std::string& key) const;

    std::size_t object_size() const {
        if (const auto* obj = get_object()) {
            return obj->size();
        }
        return 0;
    }

    /// Глубокое сравнение (числа сравниваются с учётом представления)
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    // -------------------------------------------------------------------------
    // Конверсия RapidJSON / текст
    // -------------------------------------------------------------------------

    /// Конвертировать из RapidJSON Value (Number: UInt → Int → Float)
    static Value from_rapidjson(const rapidjson::Value& json);

    /// Конвертировать в RapidJSON Value
    /// @throw std::runtime_error для нечисловых double (NaN/Inf)
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    /// Разобрать JSON текст (nullopt при ошибке разбора)
    static std::optional<Value> parse_json(std::string_view text);

    /// Компактная JSON строка
    std::string to_json_string() const;

    /// JSON с отступом в 2 пробела (артефакты на диске)
    std::string to_pretty_json_string() const;

    /// Короткое текстовое представление для таблиц и документации
    std::string to_display_string(std::size_t limit = 80) const;

private:
    Array* get_array_mut();
    Object* get_object_mut();
};

}  // namespace harvest

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // HARVEST_VALUE_HPP
