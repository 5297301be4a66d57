// ==============================================================================
// rule.cpp - Модель правил фильтрации: валидация и JSON представление
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <harvest/rule.hpp>
#include <stdexcept>
#include <unordered_set>

namespace harvest::rule {

// ============================================================================
// FilterType string conversion
// ============================================================================

std::string to_string(FilterType t) {
    switch (t) {
    case FilterType::Url:
        return "url";
    case FilterType::Host:
        return "host";
    case FilterType::ContentType:
        return "content-type";
    case FilterType::Method:
        return "method";
    case FilterType::Header:
        return "header";
    }
    return "unknown";
}

FilterType parse_filter_type(std::string_view s) {
    if (s == "url")
        return FilterType::Url;
    if (s == "host")
        return FilterType::Host;
    if (s == "content-type" || s == "content_type")
        return FilterType::ContentType;
    if (s == "method")
        return FilterType::Method;
    if (s == "header")
        return FilterType::Header;
    throw std::invalid_argument("unknown filter type '" + std::string(s) +
                                "', must be: url, host, content-type, method or header");
}

const std::string& ExchangeAttributes::attribute(FilterType type) const {
    static const std::string empty;
    switch (type) {
    case FilterType::Url:
        return url;
    case FilterType::Host:
        return host;
    case FilterType::ContentType:
        return content_type;
    case FilterType::Method:
        return method;
    case FilterType::Header:
        break;
    }
    return empty;
}

// ============================================================================
// Валидация
// ============================================================================

std::regex compile_pattern(const std::string& pattern) {
    return std::regex(pattern, std::regex::ECMAScript);
}

ValidationResult validate_pattern(const std::string& pattern) {
    try {
        compile_pattern(pattern);
    } catch (const std::regex_error& e) {
        return ValidationResult::failure(ErrorKind::InvalidPattern,
                                         std::string("invalid pattern '") + pattern + "' - " +
                                             e.what(),
                                         pattern);
    }
    return {};
}

ValidationResult validate(const FilterRule& r) {
    if (r.pattern.empty()) {
        return ValidationResult::failure(ErrorKind::InvalidPattern, "pattern must not be empty",
                                         r.id);
    }
    auto result = validate_pattern(r.pattern);
    if (!result) {
        result.error.subject = r.id.empty() ? r.pattern : r.id;
    }
    return result;
}

bool is_valid_host(std::string_view host) {
    // ^[a-zA-Z0-9][-a-zA-Z0-9]*(\.[a-zA-Z0-9][-a-zA-Z0-9]*)*$
    if (host.empty()) {
        return false;
    }
    bool label_start = true;
    for (char c : host) {
        const auto uc = static_cast<unsigned char>(c);
        if (label_start) {
            if (!std::isalnum(uc)) {
                return false;
            }
            label_start = false;
        } else if (c == '.') {
            label_start = true;
        } else if (!std::isalnum(uc) && c != '-') {
            return false;
        }
    }
    return !label_start;
}

ValidationResult validate(const HostRule& r) {
    if (!is_valid_host(r.host)) {
        return ValidationResult::failure(ErrorKind::InvalidRule,
                                         "invalid host format '" + r.host + "'",
                                         r.id.empty() ? r.host : r.id);
    }
    return {};
}

ValidationResult validate(const Preset& p) {
    if (p.id.empty()) {
        return ValidationResult::failure(ErrorKind::InvalidRule, "preset id must not be empty",
                                         p.name);
    }
    if (p.version != PRESET_FORMAT_VERSION) {
        return ValidationResult::failure(ErrorKind::InvalidRule,
                                         "unsupported preset version " +
                                             std::to_string(p.version) + ", expected " +
                                             std::to_string(PRESET_FORMAT_VERSION),
                                         p.id);
    }
    std::unordered_set<std::string> ids;
    for (const auto& r : p.rules) {
        if (r.id.empty()) {
            return ValidationResult::failure(ErrorKind::InvalidRule,
                                             "preset rule without id", p.id);
        }
        if (!ids.insert(r.id).second) {
            return ValidationResult::failure(ErrorKind::InvalidRule,
                                             "duplicate rule id '" + r.id + "' in preset", p.id);
        }
        auto result = validate(r);
        if (!result) {
            return result;
        }
    }
    return {};
}

// ============================================================================
// Host matching
// ============================================================================

std::string normalize_host(std::string_view host) {
    std::string out;
    if (!host.empty() && host.front() == '[') {
        // IPv6 literal: [::1]:8080
        auto close = host.find(']');
        out = std::string(host.substr(0, close == std::string_view::npos ? host.size() : close + 1));
    } else {
        auto colon = host.rfind(':');
        out = std::string(host.substr(0, colon));
    }
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!out.empty() && out.back() == '.') {
        out.pop_back();
    }
    return out;
}

bool host_matches(const HostRule& r, std::string_view host) {
    const std::string candidate = normalize_host(host);
    const std::string target = normalize_host(r.host);
    if (candidate == target) {
        return true;
    }
    if (!r.include_subdomains || candidate.size() <= target.size() + 1) {
        return false;
    }
    const std::size_t offset = candidate.size() - target.size();
    return candidate[offset - 1] == '.' && candidate.compare(offset, target.size(), target) == 0;
}

// ============================================================================
// JSON представление
// ============================================================================

Value to_value(const FilterRule& r) {
    Value v = Value::make_object();
    v.set("id", Value(r.id));
    v.set("pattern", Value(r.pattern));
    v.set("type", Value(to_string(r.type)));
    v.set("enabled", Value(r.enabled));
    if (r.description.has_value()) {
        v.set("description", Value(*r.description));
    }
    return v;
}

Value to_value(const HostRule& r) {
    Value v = Value::make_object();
    v.set("id", Value(r.id));
    v.set("host", Value(r.host));
    v.set("enabled", Value(r.enabled));
    if (r.description.has_value()) {
        v.set("description", Value(*r.description));
    }
    v.set("includeSubdomains", Value(r.include_subdomains));
    return v;
}

Value to_value(const Preset& p) {
    Value v = Value::make_object();
    v.set("id", Value(p.id));
    v.set("name", Value(p.name));
    v.set("description", Value(p.description));
    v.set("version", Value(static_cast<std::int64_t>(p.version)));
    Value rules = Value::make_array();
    for (const auto& r : p.rules) {
        rules.push_back(to_value(r));
    }
    v.set("rules", std::move(rules));
    return v;
}

namespace {

Error shape_error(const std::string& message) {
    return Error::make(ErrorKind::InvalidRule, message);
}

/// Необязательное bool поле; nullopt + ошибка если тип неверный
bool read_bool(const Value& v, const std::string& key, bool fallback, std::string& error) {
    const Value* field = v.get(key);
    if (field == nullptr || field->is_null()) {
        return fallback;
    }
    if (!field->is_bool()) {
        error = "field '" + key + "' must be a boolean";
        return fallback;
    }
    return field->as_bool();
}

std::optional<std::string> read_optional_string(const Value& v, const std::string& key) {
    return v.get_string_field(key);
}

}  // namespace

FilterRuleResult filter_rule_from_value(const Value& v) {
    FilterRuleResult result;
    if (!v.is_object()) {
        result.error = shape_error("filter rule must be an object");
        return result;
    }

    auto pattern = v.get_string_field("pattern");
    if (!pattern.has_value()) {
        result.error = shape_error("filter rule requires string field 'pattern'");
        return result;
    }
    result.rule.pattern = *pattern;
    result.rule.id = v.get_string_field("id").value_or("");

    auto type = v.get_string_field("type").value_or("url");
    try {
        result.rule.type = parse_filter_type(type);
    } catch (const std::invalid_argument& e) {
        result.error = Error::make(ErrorKind::InvalidRule, e.what(), result.rule.id);
        return result;
    }

    std::string error;
    result.rule.enabled = read_bool(v, "enabled", true, error);
    if (!error.empty()) {
        result.error = Error::make(ErrorKind::InvalidRule, error, result.rule.id);
        return result;
    }
    result.rule.description = read_optional_string(v, "description");
    result.ok = true;
    return result;
}

HostRuleResult host_rule_from_value(const Value& v) {
    HostRuleResult result;
    if (!v.is_object()) {
        result.error = shape_error("host rule must be an object");
        return result;
    }

    auto host = v.get_string_field("host");
    if (!host.has_value()) {
        result.error = shape_error("host rule requires string field 'host'");
        return result;
    }
    result.rule.host = *host;
    result.rule.id = v.get_string_field("id").value_or("");

    std::string error;
    result.rule.enabled = read_bool(v, "enabled", true, error);
    // includeSubdomains (панель) или include_subdomains (файл хранилища)
    const char* subdomain_key = v.get("includeSubdomains") ? "includeSubdomains"
                                                           : "include_subdomains";
    result.rule.include_subdomains = read_bool(v, subdomain_key, false, error);
    if (!error.empty()) {
        result.error = Error::make(ErrorKind::InvalidRule, error, result.rule.id);
        return result;
    }
    result.rule.description = read_optional_string(v, "description");
    result.ok = true;
    return result;
}

PresetResult preset_from_value(const Value& v) {
    PresetResult result;
    if (!v.is_object()) {
        result.error = shape_error("preset must be an object");
        return result;
    }

    auto id = v.get_string_field("id");
    if (!id.has_value()) {
        result.error = shape_error("preset requires string field 'id'");
        return result;
    }
    result.preset.id = *id;
    result.preset.name = v.get_string_field("name").value_or(*id);
    result.preset.description = v.get_string_field("description").value_or("");

    if (const Value* version = v.get("version")) {
        if (!version->is_integral()) {
            result.error = Error::make(ErrorKind::InvalidRule, "preset version must be an integer",
                                       *id);
            return result;
        }
        result.preset.version = static_cast<int>(version->as_number());
    }

    const Value* rules = v.get("rules");
    if (rules == nullptr || !rules->is_array()) {
        result.error = Error::make(ErrorKind::InvalidRule, "preset requires array field 'rules'",
                                   *id);
        return result;
    }
    for (const auto& item : rules->as_array()) {
        auto parsed = filter_rule_from_value(item);
        if (!parsed) {
            result.error = parsed.error;
            result.error.subject = *id;
            return result;
        }
        result.preset.rules.push_back(std::move(parsed.rule));
    }

    auto valid = validate(result.preset);
    if (!valid) {
        result.error = valid.error;
        return result;
    }
    result.ok = true;
    return result;
}

}  // namespace harvest::rule
