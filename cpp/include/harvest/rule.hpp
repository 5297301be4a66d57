// ==============================================================================
// harvest/rule.hpp - Модель правил фильтрации трафика
// ==============================================================================
//
// Назначение:
// - FilterRule: запрещающее правило по url/host/content-type/method/header
// - HostRule: разрешающее правило по домену (с поддоменами или без)
// - Preset: именованный версионированный набор FilterRule
// - Валидация правил (компиляция паттернов, синтаксис доменов)
// - JSON представление записей (обмен с панелью управления)
// - Встроенные пресеты
//
// ==============================================================================

#ifndef HARVEST_RULE_HPP
#define HARVEST_RULE_HPP

#include <harvest/error.hpp>
#include <harvest/value.hpp>

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace harvest::rule {

// ============================================================================
// Enums
// ============================================================================

/// Атрибут обмена, к которому применяется паттерн FilterRule
enum class FilterType {
    Url,          // полный URL запроса
    Host,         // host (без порта)
    ContentType,  // content-type ответа, иначе запроса
    Method,       // HTTP метод
    Header        // каждая строка "Name: value" заголовков запроса
};

/// "url", "host", "content-type", "method", "header"
std::string to_string(FilterType t);

/// Разобрать FilterType из строки ("content_type" принимается как алиас)
/// @throw std::invalid_argument если строка не распознана
FilterType parse_filter_type(std::string_view s);

// ============================================================================
// Записи правил
// ============================================================================

struct FilterRule {
    std::string id;
    std::string pattern;
    FilterType type = FilterType::Url;
    bool enabled = true;
    std::optional<std::string> description;
};

struct HostRule {
    std::string id;
    std::string host;
    bool enabled = true;
    std::optional<std::string> description;
    bool include_subdomains = false;
};

/// Текущая версия формата пресетов
constexpr int PRESET_FORMAT_VERSION = 1;

/// Именованный набор правил, применяемый атомарно
struct Preset {
    std::string id;
    std::string name;
    std::string description;
    int version = PRESET_FORMAT_VERSION;
    std::vector<FilterRule> rules;
};

/// Копия обеих коллекций правил на момент чтения хранилища
struct RuleSet {
    std::vector<FilterRule> filters;
    std::vector<HostRule> hosts;
    std::uint64_t revision = 0;
};

// ============================================================================
// Атрибуты обмена
// ============================================================================

/// Фиксированный набор атрибутов обмена, по которым работают правила
struct ExchangeAttributes {
    std::string method;
    std::string host;
    std::string url;
    std::string content_type;
    std::vector<std::pair<std::string, std::string>> headers;

    /// Значение атрибута для типа правила (для Header — пусто, см. headers)
    const std::string& attribute(FilterType type) const;
};

// ============================================================================
// Валидация
// ============================================================================

struct ValidationResult {
    bool ok = true;
    Error error;

    explicit operator bool() const { return ok; }

    static ValidationResult failure(ErrorKind kind, std::string message, std::string subject) {
        return ValidationResult{false, Error::make(kind, std::move(message), std::move(subject))};
    }
};

/// Скомпилировать паттерн (ECMAScript, регистрозависимый)
/// @throw std::regex_error если паттерн невалиден
std::regex compile_pattern(const std::string& pattern);

/// InvalidPattern если паттерн не компилируется
ValidationResult validate_pattern(const std::string& pattern);

ValidationResult validate(const FilterRule& r);
ValidationResult validate(const HostRule& r);

/// Версия формата, непустой id, валидность каждого правила и уникальность id
ValidationResult validate(const Preset& p);

/// Синтаксис домена: метки [a-zA-Z0-9][-a-zA-Z0-9]* через точку
bool is_valid_host(std::string_view host);

/// Нижний регистр, без порта и без завершающей точки
std::string normalize_host(std::string_view host);

/// Совпадение host с правилом: точное или *.host при include_subdomains
bool host_matches(const HostRule& r, std::string_view host);

// ============================================================================
// JSON представление
// ============================================================================

struct FilterRuleResult {
    bool ok = false;
    FilterRule rule;
    Error error;
    explicit operator bool() const { return ok; }
};

struct HostRuleResult {
    bool ok = false;
    HostRule rule;
    Error error;
    explicit operator bool() const { return ok; }
};

struct PresetResult {
    bool ok = false;
    Preset preset;
    Error error;
    explicit operator bool() const { return ok; }
};

/// {id, pattern, type, enabled, description?}
Value to_value(const FilterRule& r);

/// {id, host, enabled, description?, includeSubdomains}
Value to_value(const HostRule& r);

/// {id, name, description, version, rules: [...]}
Value to_value(const Preset& p);

/// Разбор записи (без проверки паттерна — её делает хранилище)
FilterRuleResult filter_rule_from_value(const Value& v);
HostRuleResult host_rule_from_value(const Value& v);
PresetResult preset_from_value(const Value& v);

// ============================================================================
// Встроенные пресеты
// ============================================================================

/// static-files, static-content, cdn-hosts, analytics, common-static,
/// non-api-content, chrome-style, common-noise
const std::vector<Preset>& builtin_presets();

}  // namespace harvest::rule

#endif  // HARVEST_RULE_HPP
