// ==============================================================================
// store.cpp - Хранилище правил: изменения, пресеты, YAML персистентность
// ==============================================================================

#include <harvest/platform.hpp>
#include <harvest/store.hpp>

#include <algorithm>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

namespace harvest::rule {

namespace {

template <typename Rule>
auto find_by_id(std::vector<Rule>& rules, const std::string& id) {
    return std::find_if(rules.begin(), rules.end(),
                        [&](const Rule& r) { return r.id == id; });
}

template <typename Rule>
auto find_by_id(const std::vector<Rule>& rules, const std::string& id) {
    return std::find_if(rules.begin(), rules.end(),
                        [&](const Rule& r) { return r.id == id; });
}

bool is_builtin_preset(const std::string& id) {
    const auto& builtins = builtin_presets();
    return std::any_of(builtins.begin(), builtins.end(),
                       [&](const Preset& p) { return p.id == id; });
}

/// Хост уже занят другой записью (сравнение без учёта регистра и порта)
bool host_taken(const std::vector<HostRule>& hosts, const std::string& host,
                const std::string& except_id) {
    const std::string normalized = normalize_host(host);
    return std::any_of(hosts.begin(), hosts.end(), [&](const HostRule& h) {
        return h.id != except_id && normalize_host(h.host) == normalized;
    });
}

// ----------------------------------------------------------------------------
// YAML -> записи
// ----------------------------------------------------------------------------

std::string required_string(const YAML::Node& node, const char* key, const char* what) {
    if (!node[key]) {
        throw std::invalid_argument(std::string(what) + " missing '" + key + "' field");
    }
    return node[key].as<std::string>();
}

std::optional<std::string> optional_string(const YAML::Node& node, const char* key) {
    if (!node[key] || node[key].IsNull()) {
        return std::nullopt;
    }
    return node[key].as<std::string>();
}

FilterRule parse_filter(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw std::invalid_argument("filter rule must be a mapping");
    }
    FilterRule r;
    r.id = required_string(node, "id", "filter rule");
    r.pattern = required_string(node, "pattern", "filter rule");
    r.type = parse_filter_type(node["type"].as<std::string>("url"));
    r.enabled = node["enabled"].as<bool>(true);
    r.description = optional_string(node, "description");
    return r;
}

HostRule parse_host(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw std::invalid_argument("host rule must be a mapping");
    }
    HostRule r;
    r.id = required_string(node, "id", "host rule");
    r.host = required_string(node, "host", "host rule");
    r.enabled = node["enabled"].as<bool>(true);
    r.description = optional_string(node, "description");
    r.include_subdomains = node["include_subdomains"].as<bool>(false);
    return r;
}

Preset parse_preset(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw std::invalid_argument("preset must be a mapping");
    }
    Preset p;
    p.id = required_string(node, "id", "preset");
    p.name = node["name"].as<std::string>(p.id);
    p.description = node["description"].as<std::string>("");
    p.version = node["version"].as<int>(PRESET_FORMAT_VERSION);
    if (!node["rules"] || !node["rules"].IsSequence()) {
        throw std::invalid_argument("preset '" + p.id + "' requires sequence field 'rules'");
    }
    for (const auto& rule_node : node["rules"]) {
        p.rules.push_back(parse_filter(rule_node));
    }
    return p;
}

// ----------------------------------------------------------------------------
// Записи -> YAML
// ----------------------------------------------------------------------------

void emit_filter(YAML::Emitter& out, const FilterRule& r) {
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << r.id;
    out << YAML::Key << "pattern" << YAML::Value << YAML::SingleQuoted << r.pattern;
    out << YAML::Key << "type" << YAML::Value << to_string(r.type);
    out << YAML::Key << "enabled" << YAML::Value << r.enabled;
    if (r.description.has_value()) {
        out << YAML::Key << "description" << YAML::Value << *r.description;
    }
    out << YAML::EndMap;
}

void emit_host(YAML::Emitter& out, const HostRule& r) {
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << r.id;
    out << YAML::Key << "host" << YAML::Value << r.host;
    out << YAML::Key << "enabled" << YAML::Value << r.enabled;
    if (r.description.has_value()) {
        out << YAML::Key << "description" << YAML::Value << *r.description;
    }
    out << YAML::Key << "include_subdomains" << YAML::Value << r.include_subdomains;
    out << YAML::EndMap;
}

void emit_preset(YAML::Emitter& out, const Preset& p) {
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << p.id;
    out << YAML::Key << "name" << YAML::Value << p.name;
    out << YAML::Key << "description" << YAML::Value << p.description;
    out << YAML::Key << "version" << YAML::Value << p.version;
    out << YAML::Key << "rules" << YAML::Value << YAML::BeginSeq;
    for (const auto& r : p.rules) {
        emit_filter(out, r);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
}

}  // namespace

// ============================================================================
// Чтение
// ============================================================================

std::vector<FilterRule> RuleStore::filters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filters_;
}

std::vector<HostRule> RuleStore::hosts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hosts_;
}

std::vector<Preset> RuleStore::presets() const {
    std::vector<Preset> result = builtin_presets();
    std::lock_guard<std::mutex> lock(mutex_);
    result.insert(result.end(), presets_.begin(), presets_.end());
    return result;
}

RuleSet RuleStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return RuleSet{filters_, hosts_, revision_};
}

std::uint64_t RuleStore::revision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

std::optional<FilterRule> RuleStore::find_filter(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_by_id(filters_, id);
    if (it == filters_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<HostRule> RuleStore::find_host(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_by_id(hosts_, id);
    if (it == hosts_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<Preset> RuleStore::find_preset(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Preset* p = find_preset_locked(id);
    if (p == nullptr) {
        return std::nullopt;
    }
    return *p;
}

const Preset* RuleStore::find_preset_locked(const std::string& id) const {
    for (const auto& p : builtin_presets()) {
        if (p.id == id) {
            return &p;
        }
    }
    auto it = find_by_id(presets_, id);
    return it == presets_.end() ? nullptr : &*it;
}

bool RuleStore::filter_exists(const std::string& id) const {
    return find_by_id(filters_, id) != filters_.end();
}

bool RuleStore::host_exists(const std::string& id) const {
    return find_by_id(hosts_, id) != hosts_.end();
}

std::string RuleStore::next_id(const char* prefix) {
    std::string id;
    do {
        id = std::string(prefix) + "-" + std::to_string(++id_counter_);
    } while (filter_exists(id) || host_exists(id));
    return id;
}

// ============================================================================
// FilterRule
// ============================================================================

StoreResult RuleStore::add_filter(FilterRule r) {
    auto valid = validate(r);
    if (!valid) {
        return StoreResult::failure(valid.error);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (r.id.empty()) {
        r.id = next_id("filter");
    } else if (filter_exists(r.id)) {
        return StoreResult::failure(ErrorKind::InvalidRule, "duplicate filter rule id", r.id);
    }
    filters_.push_back(r);
    ++revision_;
    return StoreResult::success(r.id);
}

StoreResult RuleStore::update_filter(const std::string& id, FilterRule r) {
    r.id = id;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_by_id(filters_, id);
    if (it == filters_.end()) {
        return StoreResult::failure(ErrorKind::NotFound, "filter rule not found", id);
    }
    auto valid = validate(r);
    if (!valid) {
        return StoreResult::failure(valid.error);
    }
    *it = std::move(r);
    ++revision_;
    return StoreResult::success(id);
}

StoreResult RuleStore::delete_filter(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_by_id(filters_, id);
    if (it == filters_.end()) {
        return StoreResult::failure(ErrorKind::NotFound, "filter rule not found", id);
    }
    filters_.erase(it);
    ++revision_;
    return StoreResult::success(id);
}

StoreResult RuleStore::toggle_filter(const std::string& id, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_by_id(filters_, id);
    if (it == filters_.end()) {
        return StoreResult::failure(ErrorKind::NotFound, "filter rule not found", id);
    }
    it->enabled = enabled;
    ++revision_;
    return StoreResult::success(id);
}

// ============================================================================
// HostRule
// ============================================================================

StoreResult RuleStore::add_host(HostRule r) {
    auto valid = validate(r);
    if (!valid) {
        return StoreResult::failure(valid.error);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (r.id.empty()) {
        r.id = next_id("host");
    } else if (host_exists(r.id)) {
        return StoreResult::failure(ErrorKind::InvalidRule, "duplicate host rule id", r.id);
    }
    if (host_taken(hosts_, r.host, r.id)) {
        return StoreResult::failure(ErrorKind::InvalidRule, "host already exists", r.host);
    }
    hosts_.push_back(r);
    ++revision_;
    return StoreResult::success(r.id);
}

StoreResult RuleStore::update_host(const std::string& id, HostRule r) {
    r.id = id;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_by_id(hosts_, id);
    if (it == hosts_.end()) {
        return StoreResult::failure(ErrorKind::NotFound, "host rule not found", id);
    }
    auto valid = validate(r);
    if (!valid) {
        return StoreResult::failure(valid.error);
    }
    if (host_taken(hosts_, r.host, id)) {
        return StoreResult::failure(ErrorKind::InvalidRule, "host already exists", r.host);
    }
    *it = std::move(r);
    ++revision_;
    return StoreResult::success(id);
}

StoreResult RuleStore::delete_host(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_by_id(hosts_, id);
    if (it == hosts_.end()) {
        return StoreResult::failure(ErrorKind::NotFound, "host rule not found", id);
    }
    hosts_.erase(it);
    ++revision_;
    return StoreResult::success(id);
}

StoreResult RuleStore::toggle_host(const std::string& id, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_by_id(hosts_, id);
    if (it == hosts_.end()) {
        return StoreResult::failure(ErrorKind::NotFound, "host rule not found", id);
    }
    it->enabled = enabled;
    ++revision_;
    return StoreResult::success(id);
}

// ============================================================================
// Пресеты
// ============================================================================

StoreResult RuleStore::register_preset(Preset p) {
    auto valid = validate(p);
    if (!valid) {
        return StoreResult::failure(valid.error);
    }
    if (is_builtin_preset(p.id)) {
        return StoreResult::failure(ErrorKind::InvalidRule, "preset id is reserved", p.id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_by_id(presets_, p.id);
    std::string id = p.id;
    if (it != presets_.end()) {
        *it = std::move(p);
    } else {
        presets_.push_back(std::move(p));
    }
    ++revision_;
    return StoreResult::success(id);
}

PresetApplyResult RuleStore::apply_preset(const std::string& preset_id) {
    PresetApplyResult result;

    std::lock_guard<std::mutex> lock(mutex_);
    const Preset* preset = find_preset_locked(preset_id);
    if (preset == nullptr) {
        result.error = Error::make(ErrorKind::NotFound, "preset not found", preset_id);
        return result;
    }

    // Проверяем весь пресет до изменения
    auto valid = validate(*preset);
    if (!valid) {
        result.error = valid.error;
        return result;
    }

    std::vector<FilterRule> merged = filters_;
    for (const auto& rule : preset->rules) {
        auto it = find_by_id(merged, rule.id);
        if (it != merged.end()) {
            *it = rule;
            ++result.replaced;
        } else {
            merged.push_back(rule);
            ++result.added;
        }
    }

    filters_ = std::move(merged);
    ++revision_;
    result.ok = true;
    return result;
}

// ============================================================================
// Персистентность
// ============================================================================

StoreResult RuleStore::parse_contents(const std::string& text, Contents& out) {
    try {
        YAML::Node root = YAML::Load(text);
        if (root.IsNull()) {
            return StoreResult::success({});
        }
        if (!root.IsMap()) {
            return StoreResult::failure(ErrorKind::InvalidRule, "store document must be a mapping");
        }

        const int version = root["version"].as<int>(STORE_FORMAT_VERSION);
        if (version != STORE_FORMAT_VERSION) {
            return StoreResult::failure(ErrorKind::InvalidRule,
                                        "unsupported store version " + std::to_string(version));
        }

        if (root["filters"] && root["filters"].IsSequence()) {
            for (const auto& node : root["filters"]) {
                out.filters.push_back(parse_filter(node));
            }
        }
        if (root["hosts"] && root["hosts"].IsSequence()) {
            for (const auto& node : root["hosts"]) {
                out.hosts.push_back(parse_host(node));
            }
        }
        if (root["presets"] && root["presets"].IsSequence()) {
            for (const auto& node : root["presets"]) {
                out.presets.push_back(parse_preset(node));
            }
        }
    } catch (const YAML::Exception& e) {
        return StoreResult::failure(ErrorKind::InvalidRule,
                                    std::string("YAML parse error: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return StoreResult::failure(ErrorKind::InvalidRule, e.what());
    }

    // Валидация всех записей до публикации
    std::unordered_set<std::string> ids;
    for (const auto& r : out.filters) {
        auto valid = validate(r);
        if (!valid) {
            return StoreResult::failure(valid.error);
        }
        if (!ids.insert(r.id).second) {
            return StoreResult::failure(ErrorKind::InvalidRule, "duplicate filter rule id", r.id);
        }
    }
    ids.clear();
    std::vector<HostRule> seen_hosts;
    for (const auto& r : out.hosts) {
        auto valid = validate(r);
        if (!valid) {
            return StoreResult::failure(valid.error);
        }
        if (!ids.insert(r.id).second) {
            return StoreResult::failure(ErrorKind::InvalidRule, "duplicate host rule id", r.id);
        }
        if (host_taken(seen_hosts, r.host, r.id)) {
            return StoreResult::failure(ErrorKind::InvalidRule, "host already exists", r.host);
        }
        seen_hosts.push_back(r);
    }
    ids.clear();
    for (const auto& p : out.presets) {
        auto valid = validate(p);
        if (!valid) {
            return StoreResult::failure(valid.error);
        }
        if (is_builtin_preset(p.id) || !ids.insert(p.id).second) {
            return StoreResult::failure(ErrorKind::InvalidRule, "duplicate preset id", p.id);
        }
    }
    return StoreResult::success({});
}

StoreResult RuleStore::load_yaml(const std::string& text) {
    Contents contents;
    auto parsed = parse_contents(text, contents);
    if (!parsed) {
        return parsed;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    filters_ = std::move(contents.filters);
    hosts_ = std::move(contents.hosts);
    presets_ = std::move(contents.presets);
    ++revision_;
    return StoreResult::success({});
}

StoreResult RuleStore::load(const std::filesystem::path& path) {
    auto text = platform::read_file(path);
    if (!text.has_value()) {
        return StoreResult::failure(ErrorKind::IoError, "cannot read rule store",
                                    platform::path_to_utf8(path));
    }
    auto result = load_yaml(*text);
    if (!result && result.error.subject.empty()) {
        result.error.subject = platform::path_to_utf8(path);
    }
    return result;
}

std::string RuleStore::to_yaml() const {
    std::lock_guard<std::mutex> lock(mutex_);

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << STORE_FORMAT_VERSION;

    out << YAML::Key << "filters" << YAML::Value << YAML::BeginSeq;
    for (const auto& r : filters_) {
        emit_filter(out, r);
    }
    out << YAML::EndSeq;

    out << YAML::Key << "hosts" << YAML::Value << YAML::BeginSeq;
    for (const auto& r : hosts_) {
        emit_host(out, r);
    }
    out << YAML::EndSeq;

    out << YAML::Key << "presets" << YAML::Value << YAML::BeginSeq;
    for (const auto& p : presets_) {
        emit_preset(out, p);
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

StoreResult RuleStore::save(const std::filesystem::path& path) const {
    std::string error;
    if (!platform::write_file_atomic(path, to_yaml(), &error)) {
        return StoreResult::failure(ErrorKind::IoError, "cannot write rule store: " + error,
                                    platform::path_to_utf8(path));
    }
    return StoreResult::success({});
}

std::filesystem::path default_store_path() {
    if (auto env = platform::env_var("HARVEST_STORE")) {
        return platform::path_from_utf8(*env);
    }
    return std::filesystem::path("harvest.yml");
}

}  // namespace harvest::rule
