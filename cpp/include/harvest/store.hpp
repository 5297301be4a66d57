// ==============================================================================
// harvest/store.hpp - Хранилище правил (RuleStore)
// ==============================================================================
//
// Назначение:
// - Две упорядоченные коллекции: FilterRule и HostRule
// - Пресеты: встроенные + объявленные в файле хранилища
// - Валидация до изменения: неудачная операция не меняет хранилище
// - Изменения сериализуются мьютексом, чтение возвращает копию
// - Счётчик ревизий (увеличивается при каждом успешном изменении)
// - Персистентность в YAML (yaml-cpp), атомарная запись
//
// Формат файла:
//   version: 1
//   filters:
//     - {id: no-css, pattern: '\.css$', type: url, enabled: true}
//   hosts:
//     - {id: api, host: api.example.com, enabled: true, include_subdomains: true}
//   presets:
//     - {id: my-noise, name: My noise, version: 1, rules: [...]}
//
// ==============================================================================

#ifndef HARVEST_STORE_HPP
#define HARVEST_STORE_HPP

#include <harvest/error.hpp>
#include <harvest/rule.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace harvest::rule {

/// Версия формата файла хранилища
constexpr int STORE_FORMAT_VERSION = 1;

/// Результат изменения хранилища
struct StoreResult {
    bool ok = false;
    std::string id;  // id затронутой записи
    Error error;

    explicit operator bool() const { return ok; }

    static StoreResult success(std::string id) {
        StoreResult r;
        r.ok = true;
        r.id = std::move(id);
        return r;
    }

    static StoreResult failure(ErrorKind kind, std::string message, std::string subject = {}) {
        StoreResult r;
        r.error = Error::make(kind, std::move(message), std::move(subject));
        return r;
    }

    static StoreResult failure(Error error) {
        StoreResult r;
        r.error = std::move(error);
        return r;
    }
};

/// Результат применения пресета
struct PresetApplyResult {
    bool ok = false;
    std::size_t added = 0;
    std::size_t replaced = 0;
    Error error;

    explicit operator bool() const { return ok; }
};

class RuleStore {
public:
    RuleStore() = default;

    RuleStore(const RuleStore&) = delete;
    RuleStore& operator=(const RuleStore&) = delete;

    // ------------------------------------------------------------------------
    // Чтение (копии)
    // ------------------------------------------------------------------------

    std::vector<FilterRule> filters() const;
    std::vector<HostRule> hosts() const;

    /// Встроенные пресеты, затем объявленные в хранилище
    std::vector<Preset> presets() const;

    /// Обе коллекции и ревизия, прочитанные под одной блокировкой
    RuleSet snapshot() const;

    std::uint64_t revision() const;

    std::optional<FilterRule> find_filter(const std::string& id) const;
    std::optional<HostRule> find_host(const std::string& id) const;
    std::optional<Preset> find_preset(const std::string& id) const;

    // ------------------------------------------------------------------------
    // FilterRule
    // ------------------------------------------------------------------------

    /// Пустой id заменяется на "filter-N". InvalidPattern / InvalidRule (дубликат id).
    StoreResult add_filter(FilterRule r);

    /// Заменить запись с данным id (id записи сохраняется). NotFound / InvalidPattern.
    StoreResult update_filter(const std::string& id, FilterRule r);

    StoreResult delete_filter(const std::string& id);
    StoreResult toggle_filter(const std::string& id, bool enabled);

    // ------------------------------------------------------------------------
    // HostRule
    // ------------------------------------------------------------------------

    /// Пустой id заменяется на "host-N". InvalidRule: синтаксис, дубликат id или host.
    StoreResult add_host(HostRule r);
    StoreResult update_host(const std::string& id, HostRule r);
    StoreResult delete_host(const std::string& id);
    StoreResult toggle_host(const std::string& id, bool enabled);

    // ------------------------------------------------------------------------
    // Пресеты
    // ------------------------------------------------------------------------

    /// Объявить пресет (заменяет объявленный ранее с тем же id).
    /// InvalidRule если пресет невалиден или совпадает по id со встроенным.
    StoreResult register_preset(Preset p);

    /// Атомарно слить правила пресета: правила с тем же id заменяются на месте,
    /// остальные добавляются в конец. NotFound для неизвестного пресета.
    PresetApplyResult apply_preset(const std::string& preset_id);

    // ------------------------------------------------------------------------
    // Персистентность
    // ------------------------------------------------------------------------

    /// Заменить содержимое хранилища содержимым YAML документа.
    /// Любая невалидная запись отклоняет загрузку целиком.
    StoreResult load_yaml(const std::string& text);

    /// Загрузить из файла (IoError если файл не читается)
    StoreResult load(const std::filesystem::path& path);

    std::string to_yaml() const;

    /// Атомарно записать файл хранилища
    StoreResult save(const std::filesystem::path& path) const;

private:
    struct Contents {
        std::vector<FilterRule> filters;
        std::vector<HostRule> hosts;
        std::vector<Preset> presets;
    };

    static StoreResult parse_contents(const std::string& text, Contents& out);

    std::string next_id(const char* prefix);
    bool filter_exists(const std::string& id) const;
    bool host_exists(const std::string& id) const;
    const Preset* find_preset_locked(const std::string& id) const;

    mutable std::mutex mutex_;
    std::vector<FilterRule> filters_;
    std::vector<HostRule> hosts_;
    std::vector<Preset> presets_;
    std::uint64_t revision_ = 0;
    std::uint64_t id_counter_ = 0;
};

/// Путь хранилища по умолчанию: $HARVEST_STORE или "harvest.yml"
std::filesystem::path default_store_path();

}  // namespace harvest::rule

#endif  // HARVEST_STORE_HPP
