// ==============================================================================
// harvest/schema.hpp - Структурная схема наблюдаемых данных
// ==============================================================================
//
// Назначение:
// - Schema: tagged union по множеству наблюдаемых типов (битовая маска)
// - infer(): схема одного значения
// - join(): объединение схем, коммутативно и ассоциативно
// - Учёт наблюдений: обязательное поле присутствует во всех объектах
// - Пример значения с наибольшим (timestamp, ordinal)
// - JSON Schema и внутреннее JSON представление (без потерь)
//
// Правила объединения:
// - integer ∪ number = number (без конфликта)
// - любые другие несовпадающие типы: union + SchemaConflict
// - object: объединение полей, present/observed считаются по выборкам
// - array: items = join всех элементов
//
// ==============================================================================

#ifndef HARVEST_SCHEMA_HPP
#define HARVEST_SCHEMA_HPP

#include <harvest/error.hpp>
#include <harvest/value.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace harvest::model {

/// Наблюдаемые типы (битовая маска)
enum TypeBits : std::uint32_t {
    TYPE_NONE = 0,
    TYPE_NULL = 1u << 0,
    TYPE_BOOLEAN = 1u << 1,
    TYPE_INTEGER = 1u << 2,
    TYPE_NUMBER = 1u << 3,
    TYPE_STRING = 1u << 4,
    TYPE_ARRAY = 1u << 5,
    TYPE_OBJECT = 1u << 6,
    TYPE_OPAQUE = 1u << 7  // непрозрачное тело (не JSON/form/XML)
};

/// Имена типов маски через '|': "integer|string"
std::string type_names(std::uint32_t types);

/// Разобрать "integer|string" (std::invalid_argument для неизвестного имени)
std::uint32_t parse_type_names(const std::string& text);

/// Пример значения с ключом упорядочения для детерминированного выбора
struct Example {
    Value value;
    std::string timestamp;
    std::uint64_t ordinal = 0;

    /// (timestamp, ordinal) больше, чем у other. ISO 8601 сравниваются как
    /// моменты времени, прочие строки лексикографически.
    bool newer_than(const Example& other) const;
};

struct Schema;

/// Поле объекта. Копирование глубокое.
struct Field {
    std::unique_ptr<Schema> schema;
    std::uint64_t present = 0;  // в скольких объектах поле встречено

    Field();
    explicit Field(Schema s, std::uint64_t present_count = 1);
    Field(const Field& other);
    Field& operator=(const Field& other);
    Field(Field&&) noexcept;
    Field& operator=(Field&&) noexcept;
    ~Field();
};

struct Schema {
    std::uint32_t types = TYPE_NONE;

    // TYPE_OBJECT: поля (упорядочены по имени) и число наблюдённых объектов
    std::map<std::string, Field> fields;
    std::uint64_t observed = 0;

    // TYPE_ARRAY: схема элементов (nullptr если массивы были пусты)
    std::unique_ptr<Schema> items;

    std::optional<Example> example;

    Schema() = default;
    Schema(const Schema& other);
    Schema& operator=(const Schema& other);
    Schema(Schema&&) = default;
    Schema& operator=(Schema&&) = default;

    bool empty() const { return types == TYPE_NONE; }
    bool has(std::uint32_t bits) const { return (types & bits) != 0; }

    /// Поле обязательно, если встречено во всех наблюдённых объектах
    bool required(const std::string& name) const;

    /// Несколько несовместимых типов (integer+number не считается)
    bool is_union() const;

    /// Имя для документации: "integer", "string|null", ...
    std::string type_name() const;
};

/// Глубокое сравнение (для тестов детерминизма)
bool operator==(const Schema& a, const Schema& b);
inline bool operator!=(const Schema& a, const Schema& b) { return !(a == b); }

/// Схема одного значения; example задаётся для скаляров и корня
Schema infer(const Value& value, const std::string& timestamp = {}, std::uint64_t ordinal = 0);

/// Схема непрозрачного тела. Пример: исходный текст (null если текста нет)
Schema opaque(std::optional<std::string> text = std::nullopt, const std::string& timestamp = {},
              std::uint64_t ordinal = 0);

/// Объединить b в a. Конфликты типов дописываются в diagnostics (если не nullptr)
/// с путём location.
void join_into(Schema& a, const Schema& b, Diagnostics* diagnostics = nullptr,
               const std::string& location = {});

/// Чистое объединение
Schema join(const Schema& a, const Schema& b, Diagnostics* diagnostics = nullptr,
            const std::string& location = {});

enum class SchemaDialect {
    JsonSchema,  // draft-07: "type": [..], "examples"
    OpenApi      // OpenAPI 3.0: nullable, oneOf, "example"
};

/// JSON Schema для утверждений тестов и OpenAPI документа
Value to_json_schema(const Schema& schema, SchemaDialect dialect = SchemaDialect::JsonSchema);

/// Внутреннее представление без потерь (счётчики, пример)
Value to_value(const Schema& schema);

struct SchemaResult {
    bool ok = false;
    Schema schema;
    std::string error;

    explicit operator bool() const { return ok; }
};

SchemaResult schema_from_value(const Value& value);

}  // namespace harvest::model

#endif  // HARVEST_SCHEMA_HPP
