// ==============================================================================
// harvest/engine.hpp - Движок правил (RuleEngine)
// ==============================================================================
//
// Назначение:
// - Неизменяемый снимок скомпилированных правил (RuleSnapshot)
// - evaluate(): решение о включении обмена в конвейер
// - explain(): то же решение с причиной и id решающего правила
// - reload(): перечитать хранилище и атомарно опубликовать новый снимок
//
// Семантика:
// - FilterRule - запрещающий список: любое включённое совпадение исключает обмен
// - HostRule - разрешающий список: при наличии включённых правил host обязан
//   совпасть хотя бы с одним; без включённых правил проверка не выполняется
// - Запрет по FilterRule не зависит от результата проверки host
//
// Конкурентность:
// - evaluate() читает снимок через std::atomic_load и видит либо старый,
//   либо новый снимок целиком
// - reload() сериализуется мьютексом; неудачная компиляция сохраняет старый снимок
//
// ==============================================================================

#ifndef HARVEST_ENGINE_HPP
#define HARVEST_ENGINE_HPP

#include <harvest/error.hpp>
#include <harvest/rule.hpp>
#include <harvest/store.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <vector>

namespace harvest::rule {

struct CompiledFilter {
    FilterRule rule;
    std::regex regex;
};

/// Снимок правил: только включённые записи, паттерны скомпилированы
struct RuleSnapshot {
    std::vector<CompiledFilter> filters;
    std::vector<HostRule> hosts;
    std::uint64_t revision = 0;
};

enum class Reason {
    Included,        // обмен проходит
    FilterMatched,   // совпало запрещающее правило
    HostNotAllowed   // host не совпал ни с одним разрешающим правилом
};

/// "included", "filter-matched", "host-not-allowed"
std::string to_string(Reason r);

struct Verdict {
    bool included = true;
    Reason reason = Reason::Included;
    std::string rule_id;  // id решающего FilterRule (для FilterMatched)
};

struct SnapshotResult {
    bool ok = false;
    std::shared_ptr<const RuleSnapshot> snapshot;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Скомпилировать снимок из набора правил (InvalidPattern при ошибке)
SnapshotResult compile_snapshot(const RuleSet& rules);

/// Решение по снимку
Verdict evaluate(const RuleSnapshot& snapshot, const ExchangeAttributes& exchange);

struct ReloadResult {
    bool ok = false;
    std::uint64_t revision = 0;
    std::size_t filter_count = 0;
    std::size_t host_count = 0;
    Error error;

    explicit operator bool() const { return ok; }
};

class RuleEngine {
public:
    /// Движок начинает с пустого снимка; вызовите reload() после загрузки хранилища
    explicit RuleEngine(const RuleStore& store);

    RuleEngine(const RuleEngine&) = delete;
    RuleEngine& operator=(const RuleEngine&) = delete;

    ReloadResult reload();

    bool evaluate(const ExchangeAttributes& exchange) const;
    Verdict explain(const ExchangeAttributes& exchange) const;

    /// Текущий снимок (остаётся валидным после последующих reload)
    std::shared_ptr<const RuleSnapshot> snapshot() const;

private:
    const RuleStore& store_;
    std::shared_ptr<const RuleSnapshot> snapshot_;
    std::mutex reload_mutex_;
};

}  // namespace harvest::rule

#endif  // HARVEST_ENGINE_HPP
