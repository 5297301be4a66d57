// ==============================================================================
// model.cpp - ModelBuilder: шаблонизация путей, группировка, слияние
// ==============================================================================
//
// add(): обмены с одинаковым (method, host, путь с заменёнными id-сегментами)
// сразу объединяются в PathGroup. finish(): правило вариативности помечает
// дополнительные позиции как параметры, после чего группы с одинаковым
// (method, pathTemplate) сливаются в ApiDefinition. Слияние схем
// ассоциативно, поэтому результат не зависит от порядка объединения.
// Каталог несёт группы до шаблонизации, и merge_catalogues заново
// применяет правило вариативности к их объединению.
//
// ==============================================================================

#include <harvest/model.hpp>

#include <algorithm>
#include <cctype>
#include <set>

namespace harvest::model {

std::string most_frequent(const Counts& counts) {
    std::string best;
    std::uint64_t best_count = 0;
    // map упорядочен, поэтому при равенстве остаётся наименьший ключ
    for (const auto& [key, count] : counts) {
        if (count > best_count) {
            best = key;
            best_count = count;
        }
    }
    return best;
}

std::string ApiDefinition::key() const {
    return method + " " + path_template;
}

std::string describe(std::uint64_t sample_count) {
    return "Auto-generated from " + std::to_string(sample_count) + " captured exchange(s)";
}

const ApiDefinition* Catalogue::find(const std::string& key) const {
    for (const auto& api : apis) {
        if (api.key() == key) {
            return &api;
        }
    }
    return nullptr;
}

namespace {

void add_counts(Counts& into, const Counts& from) {
    for (const auto& [key, count] : from) {
        into[key] += count;
    }
}

int primary_status(const std::map<int, std::uint64_t>& statuses) {
    int best = 0;
    std::uint64_t best_count = 0;
    for (const auto& [status, count] : statuses) {
        if (count > best_count) {
            best = status;
            best_count = count;
        }
    }
    return best;
}

/// Заголовки как объект: имя в нижнем регистре, первое вхождение
Value headers_value(const io::HeaderList& headers) {
    Value::Object obj;
    for (const auto& [name, value] : headers) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (is_ignored_header(lower)) {
            continue;
        }
        obj.emplace(std::move(lower), Value(value));
    }
    return Value(std::move(obj));
}

Value query_value(const io::HeaderList& query) {
    Value::Object obj;
    for (const auto& [name, value] : query) {
        obj.emplace(name, scalar_from_text(value));
    }
    return Value(std::move(obj));
}

/// ApiDefinition из одного обмена (path_template и path_params задаются позже)
ApiDefinition observe(const io::RawExchange& ex) {
    const std::uint64_t ordinal = ex.index;
    ApiDefinition api;
    api.method = ex.method;
    api.path_template = ex.path;  // до finish() используется только в диагностике
    api.sample_count = 1;
    api.hosts[ex.host] = 1;
    api.schemes[ex.scheme] = 1;

    api.request.headers = infer(headers_value(ex.request_headers), ex.timestamp, ordinal);
    api.request.query = infer(query_value(ex.query), ex.timestamp, ordinal);
    if (!ex.request_body.empty()) {
        api.request.body = body_schema(ex.request_body, ex.timestamp, ordinal);
        api.request.content_types[media_type(ex.request_body.content_type)] = 1;
    }

    api.response.statuses[ex.status] = 1;
    api.response.status_code = ex.status;
    api.response.headers = infer(headers_value(ex.response_headers), ex.timestamp, ordinal);
    if (!ex.response_body.empty()) {
        api.response.body = body_schema(ex.response_body, ex.timestamp, ordinal);
        api.response.content_types[media_type(ex.response_body.content_type)] = 1;
    }
    return api;
}

}  // namespace

void merge_into(ApiDefinition& a, const ApiDefinition& b, Diagnostics* diagnostics) {
    const std::string where = a.key();

    a.sample_count += b.sample_count;
    add_counts(a.hosts, b.hosts);
    add_counts(a.schemes, b.schemes);

    join_into(a.request.headers, b.request.headers, diagnostics, where + " request.headers");
    join_into(a.request.query, b.request.query, diagnostics, where + " request.query");
    join_into(a.request.path_params, b.request.path_params, diagnostics, where + " request.path");
    join_into(a.request.body, b.request.body, diagnostics, where + " request.body");
    add_counts(a.request.content_types, b.request.content_types);

    for (const auto& [status, count] : b.response.statuses) {
        a.response.statuses[status] += count;
    }
    a.response.status_code = primary_status(a.response.statuses);
    join_into(a.response.headers, b.response.headers, diagnostics, where + " response.headers");
    join_into(a.response.body, b.response.body, diagnostics, where + " response.body");
    add_counts(a.response.content_types, b.response.content_types);

    a.description = describe(a.sample_count);
}

std::string PathGroup::key() const {
    std::string out = method + "\n" + host + "\n";
    for (std::size_t i = 0; i < segments.size(); ++i) {
        out += '/';
        out += variable[i] ? std::string("\x01") : segments[i];
    }
    return out;
}

Catalogue merge_catalogues(const Catalogue& a, const Catalogue& b) {
    // пустой каталог совместим с любым
    const bool a_groups = !a.groups.empty() || a.apis.empty();
    const bool b_groups = !b.groups.empty() || b.apis.empty();
    if (a_groups && b_groups) {
        ModelBuilder builder(a.groups.empty() ? b.options : a.options);
        builder.add_catalogue(a);
        builder.add_catalogue(b);
        return builder.finish().catalogue;
    }

    Catalogue result = a;
    result.groups.clear();
    result.group_diagnostics.clear();
    for (const auto& api : b.apis) {
        auto it = std::find_if(result.apis.begin(), result.apis.end(),
                               [&](const ApiDefinition& existing) {
                                   return existing.method == api.method &&
                                          existing.path_template == api.path_template;
                               });
        if (it == result.apis.end()) {
            result.apis.push_back(api);
        } else {
            merge_into(*it, api, &result.diagnostics);
        }
    }
    add_counts(result.host_stats, b.host_stats);
    add_counts(result.method_stats, b.method_stats);
    result.exchanges += b.exchanges;
    result.diagnostics.insert(result.diagnostics.end(), b.diagnostics.begin(),
                              b.diagnostics.end());
    return result;
}

// ============================================================================
// ModelBuilder
// ============================================================================

ModelBuilder::ModelBuilder(BuildOptions options) : options_(std::move(options)) {
    if (options_.placeholder.empty()) {
        options_.placeholder = "id";
    }
}

void ModelBuilder::add(const io::RawExchange& exchange) {
    ++exchanges_;
    host_stats_[exchange.host] += 1;
    method_stats_[exchange.method] += 1;

    PathGroup group;
    group.method = exchange.method;
    group.host = exchange.host;
    group.segments = split_path(exchange.path);
    group.variable.assign(group.segments.size(), false);
    for (std::size_t i = 0; i < group.segments.size(); ++i) {
        if (!is_id_segment(group.segments[i])) {
            continue;
        }
        group.variable[i] = true;
        group.params.emplace(
            i, infer(scalar_from_text(group.segments[i]), exchange.timestamp, exchange.index));
    }
    group.latest = Example{Value(), exchange.timestamp, exchange.index};
    group.api = observe(exchange);
    absorb(group);
}

void ModelBuilder::add_catalogue(const Catalogue& catalogue) {
    for (const auto& group : catalogue.groups) {
        absorb(group);
    }
    add_counts(host_stats_, catalogue.host_stats);
    add_counts(method_stats_, catalogue.method_stats);
    exchanges_ += catalogue.exchanges;
    diagnostics_.insert(diagnostics_.end(), catalogue.group_diagnostics.begin(),
                        catalogue.group_diagnostics.end());
}

void ModelBuilder::absorb(const PathGroup& group) {
    std::string key = group.key();
    auto found = index_.find(key);
    if (found == index_.end()) {
        index_.emplace(std::move(key), groups_.size());
        groups_.push_back(group);
        return;
    }

    PathGroup& existing = groups_[found->second];
    merge_into(existing.api, group.api, &diagnostics_);
    if (group.latest.newer_than(existing.latest)) {
        existing.latest = group.latest;
    }
    for (const auto& [pos, schema] : group.params) {
        auto param = existing.params.find(pos);
        if (param == existing.params.end()) {
            existing.params.emplace(pos, schema);
        } else {
            join_into(param->second, schema);
        }
    }
}

void ModelBuilder::apply_variance() {
    if (options_.variance_threshold == 0) {
        return;
    }

    // Повторяем до неподвижной точки: новая переменная позиция может
    // объединить группы, ранее различавшиеся этим сегментом
    bool changed = true;
    while (changed) {
        changed = false;
        std::size_t max_segments = 0;
        for (const auto& g : groups_) {
            max_segments = std::max(max_segments, g.segments.size());
        }

        for (std::size_t pos = 0; pos < max_segments; ++pos) {
            // корзина: method, host, число сегментов, остальные сегменты
            std::map<std::string, std::set<std::string>> literals;
            std::map<std::string, std::vector<std::size_t>> members;
            for (std::size_t gi = 0; gi < groups_.size(); ++gi) {
                const PathGroup& g = groups_[gi];
                if (pos >= g.segments.size() || g.variable[pos]) {
                    continue;
                }
                std::string bucket = g.method + "\n" + g.host + "\n" +
                                     std::to_string(g.segments.size());
                for (std::size_t i = 0; i < g.segments.size(); ++i) {
                    bucket += '/';
                    if (i == pos) {
                        bucket += '*';
                    } else {
                        bucket += g.variable[i] ? std::string("\x01") : g.segments[i];
                    }
                }
                literals[bucket].insert(g.segments[pos]);
                members[bucket].push_back(gi);
            }

            for (const auto& [bucket, values] : literals) {
                if (values.size() < options_.variance_threshold) {
                    continue;
                }
                for (std::size_t gi : members[bucket]) {
                    PathGroup& g = groups_[gi];
                    g.variable[pos] = true;
                    Schema value = infer(scalar_from_text(g.segments[pos]), g.latest.timestamp,
                                         g.latest.ordinal);
                    g.params.emplace(pos, std::move(value));
                    changed = true;
                }
            }
        }
    }
}

BuildResult ModelBuilder::finish(const CancelToken* cancel) {
    BuildResult result;
    Catalogue& catalogue = result.catalogue;
    catalogue.groups = groups_;
    catalogue.group_diagnostics = diagnostics_;
    catalogue.options = options_;

    apply_variance();

    std::unordered_map<std::string, std::size_t> positions;

    for (auto& group : groups_) {
        if (is_cancelled(cancel)) {
            result.error = Error::make(ErrorKind::Cancelled, "model build cancelled");
            result.catalogue = Catalogue{};
            return result;
        }

        std::string path_template;
        std::size_t placeholders = 0;
        Schema path_params;
        path_params.types = TYPE_OBJECT;
        path_params.observed = group.api.sample_count;

        for (std::size_t i = 0; i < group.segments.size(); ++i) {
            path_template += '/';
            if (!group.variable[i]) {
                path_template += group.segments[i];
                continue;
            }
            const std::string name = placeholder_name(options_.placeholder, ++placeholders);
            path_template += "{" + name + "}";
            auto param = group.params.find(i);
            Schema value = param != group.params.end() ? param->second : Schema{};
            path_params.fields.emplace(name, Field(std::move(value), group.api.sample_count));
        }
        if (path_template.empty()) {
            path_template = "/";
        }

        ApiDefinition api = group.api;
        api.path_template = path_template;
        api.request.path_params = std::move(path_params);

        const std::string key = api.key();
        auto found = positions.find(key);
        if (found == positions.end()) {
            api.description = describe(api.sample_count);
            api.response.status_code = primary_status(api.response.statuses);
            positions.emplace(key, catalogue.apis.size());
            catalogue.apis.push_back(std::move(api));
        } else {
            merge_into(catalogue.apis[found->second], api, &catalogue.diagnostics);
        }
    }

    catalogue.host_stats = host_stats_;
    catalogue.method_stats = method_stats_;
    catalogue.exchanges = exchanges_;
    catalogue.diagnostics.insert(catalogue.diagnostics.begin(), diagnostics_.begin(),
                                 diagnostics_.end());
    result.ok = true;
    return result;
}

BuildResult build(const std::vector<io::RawExchange>& exchanges, const IncludePredicate& include,
                  const BuildOptions& options, const CancelToken* cancel) {
    ModelBuilder builder(options);
    for (const auto& exchange : exchanges) {
        if (is_cancelled(cancel)) {
            BuildResult result;
            result.error = Error::make(ErrorKind::Cancelled, "model build cancelled");
            return result;
        }
        if (!include || include(exchange)) {
            builder.add(exchange);
        }
    }
    return builder.finish(cancel);
}

}  // namespace harvest::model
