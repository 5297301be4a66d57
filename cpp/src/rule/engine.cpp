// ==============================================================================
// engine.cpp - Движок правил: компиляция снимка, оценка, атомарная перезагрузка
// ==============================================================================

#include <harvest/engine.hpp>

#include <atomic>

namespace harvest::rule {

std::string to_string(Reason r) {
    switch (r) {
    case Reason::Included:
        return "included";
    case Reason::FilterMatched:
        return "filter-matched";
    case Reason::HostNotAllowed:
        return "host-not-allowed";
    }
    return "unknown";
}

SnapshotResult compile_snapshot(const RuleSet& rules) {
    SnapshotResult result;
    auto snapshot = std::make_shared<RuleSnapshot>();
    snapshot->revision = rules.revision;

    for (const auto& rule : rules.filters) {
        if (!rule.enabled) {
            continue;
        }
        try {
            snapshot->filters.push_back(CompiledFilter{rule, compile_pattern(rule.pattern)});
        } catch (const std::regex_error& e) {
            result.error = Error::make(ErrorKind::InvalidPattern,
                                       std::string("cannot compile pattern '") + rule.pattern +
                                           "' - " + e.what(),
                                       rule.id);
            return result;
        }
    }

    for (const auto& host : rules.hosts) {
        if (host.enabled) {
            snapshot->hosts.push_back(host);
        }
    }

    result.ok = true;
    result.snapshot = std::move(snapshot);
    return result;
}

namespace {

bool filter_matches(const CompiledFilter& filter, const ExchangeAttributes& exchange) {
    if (filter.rule.type == FilterType::Header) {
        for (const auto& [name, value] : exchange.headers) {
            if (std::regex_search(name + ": " + value, filter.regex)) {
                return true;
            }
        }
        return false;
    }
    return std::regex_search(exchange.attribute(filter.rule.type), filter.regex);
}

}  // namespace

Verdict evaluate(const RuleSnapshot& snapshot, const ExchangeAttributes& exchange) {
    Verdict verdict;

    for (const auto& filter : snapshot.filters) {
        if (filter_matches(filter, exchange)) {
            verdict.included = false;
            verdict.reason = Reason::FilterMatched;
            verdict.rule_id = filter.rule.id;
            return verdict;
        }
    }

    if (!snapshot.hosts.empty()) {
        for (const auto& host : snapshot.hosts) {
            if (host_matches(host, exchange.host)) {
                return verdict;
            }
        }
        verdict.included = false;
        verdict.reason = Reason::HostNotAllowed;
    }
    return verdict;
}

// ============================================================================
// RuleEngine
// ============================================================================

RuleEngine::RuleEngine(const RuleStore& store)
    : store_(store), snapshot_(std::make_shared<const RuleSnapshot>()) {}

ReloadResult RuleEngine::reload() {
    std::lock_guard<std::mutex> lock(reload_mutex_);

    ReloadResult result;
    auto compiled = compile_snapshot(store_.snapshot());
    if (!compiled) {
        result.error = compiled.error;
        result.revision = this->snapshot()->revision;
        return result;
    }

    result.ok = true;
    result.revision = compiled.snapshot->revision;
    result.filter_count = compiled.snapshot->filters.size();
    result.host_count = compiled.snapshot->hosts.size();
    std::atomic_store(&snapshot_, compiled.snapshot);
    return result;
}

bool RuleEngine::evaluate(const ExchangeAttributes& exchange) const {
    return explain(exchange).included;
}

Verdict RuleEngine::explain(const ExchangeAttributes& exchange) const {
    auto current = snapshot();
    return rule::evaluate(*current, exchange);
}

std::shared_ptr<const RuleSnapshot> RuleEngine::snapshot() const {
    return std::atomic_load(&snapshot_);
}

}  // namespace harvest::rule
