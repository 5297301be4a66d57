// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (harvest::cli)
// 2. Создание Writer (harvest::output)
// 3. Dispatch команды
// 4. Возврат exit code
//
// Исключения перехватываются только здесь.
//
// ==============================================================================

#include "harvest/cancel.hpp"
#include "harvest/cli.hpp"
#include "harvest/engine.hpp"
#include "harvest/model.hpp"
#include "harvest/output.hpp"
#include "harvest/pipeline.hpp"
#include "harvest/platform.hpp"
#include "harvest/rule.hpp"
#include "harvest/store.hpp"
#include "harvest/synth.hpp"

#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

constexpr const char* BANNER = R"(
    ██╗  ██╗ █████╗ ██████╗ ██╗   ██╗███████╗███████╗████████╗
    ██║  ██║██╔══██╗██╔══██╗██║   ██║██╔════╝██╔════╝╚══██╔══╝
    ███████║███████║██████╔╝██║   ██║█████╗  ███████╗   ██║
    ██╔══██║██╔══██║██╔══██╗╚██╗ ██╔╝██╔══╝  ╚════██║   ██║
    ██║  ██║██║  ██║██║  ██║ ╚████╔╝ ███████╗███████║   ██║
    ╚═╝  ╚═╝╚═╝  ╚═╝╚═╝  ╚═╝  ╚═══╝  ╚══════╝╚══════╝   ╚═╝
)";

void print_banner(harvest::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(harvest::output::Stream::Stderr, BANNER);
    writer.write_line(harvest::output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Отмена по Ctrl+C
// ----------------------------------------------------------------------------

harvest::CancelToken g_cancel;

void on_interrupt(int) {
    g_cancel.cancel();
}

// ----------------------------------------------------------------------------
// Хранилище правил
// ----------------------------------------------------------------------------

std::filesystem::path store_path(const harvest::cli::GlobalOptions& global) {
    return global.store.has_value() ? *global.store : harvest::rule::default_store_path();
}

/// Загрузить хранилище; отсутствующий файл означает пустое хранилище
bool load_store(harvest::rule::RuleStore& store, const std::filesystem::path& path,
                harvest::output::Writer& writer) {
    using namespace harvest;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        writer.debug("rule store '" + platform::path_to_utf8(path) +
                     "' does not exist, starting empty");
        return true;
    }
    auto loaded = store.load(path);
    if (!loaded) {
        writer.error(loaded.error.format());
        return false;
    }
    writer.debug("loaded rule store '" + platform::path_to_utf8(path) + "'");
    return true;
}

bool save_store(const harvest::rule::RuleStore& store, const std::filesystem::path& path,
                harvest::output::Writer& writer) {
    auto saved = store.save(path);
    if (!saved) {
        writer.error(saved.error.format());
        return false;
    }
    return true;
}

/// Загрузить хранилище и скомпилировать снимок
bool prepare_engine(harvest::rule::RuleStore& store, harvest::rule::RuleEngine& engine,
                    const harvest::cli::GlobalOptions& global, harvest::output::Writer& writer) {
    if (!load_store(store, store_path(global), writer)) {
        return false;
    }
    auto reloaded = engine.reload();
    if (!reloaded) {
        writer.error(reloaded.error.format());
        return false;
    }
    writer.info("Loaded " + std::to_string(reloaded.filter_count) + " filter rule(s) and " +
                std::to_string(reloaded.host_count) + " host rule(s)");
    return true;
}

std::string enabled_text(bool enabled) {
    return enabled ? "yes" : "no";
}

void print_filters(const std::vector<harvest::rule::FilterRule>& filters, bool json,
                   harvest::output::Writer& writer) {
    using namespace harvest;
    if (json) {
        Value out = Value::make_array();
        for (const auto& r : filters) {
            out.push_back(rule::to_value(r));
        }
        writer.write_json_pretty(out);
        return;
    }
    output::Table table;
    table.set_headers({"id", "type", "pattern", "enabled", "description"});
    for (const auto& r : filters) {
        table.add_row({r.id, rule::to_string(r.type), r.pattern, enabled_text(r.enabled),
                       r.description.value_or("")});
    }
    table.print(writer);
}

void print_hosts(const std::vector<harvest::rule::HostRule>& hosts, bool json,
                 harvest::output::Writer& writer) {
    using namespace harvest;
    if (json) {
        Value out = Value::make_array();
        for (const auto& r : hosts) {
            out.push_back(rule::to_value(r));
        }
        writer.write_json_pretty(out);
        return;
    }
    output::Table table;
    table.set_headers({"id", "host", "subdomains", "enabled", "description"});
    for (const auto& r : hosts) {
        table.add_row({r.id, r.host, enabled_text(r.include_subdomains), enabled_text(r.enabled),
                       r.description.value_or("")});
    }
    table.print(writer);
}

harvest::model::BuildOptions build_options(const harvest::cli::BuildFlags& flags) {
    harvest::model::BuildOptions options;
    if (flags.variance_threshold.has_value()) {
        options.variance_threshold = *flags.variance_threshold;
    }
    if (flags.placeholder.has_value()) {
        options.placeholder = *flags.placeholder;
    }
    return options;
}

void report_parse(const harvest::pipeline::ParseResult& parsed, harvest::output::Writer& writer) {
    const auto& stats = parsed.stats;
    writer.info("Read " + std::to_string(stats.entries) + " entries: " +
                std::to_string(stats.accepted) + " accepted, " + std::to_string(stats.excluded) +
                " excluded, " + std::to_string(stats.skipped) + " skipped");
    for (const auto& [rule_id, count] : stats.exclusions) {
        writer.debug("excluded by " + rule_id + ": " + std::to_string(count));
    }
    for (const auto& [host, count] : parsed.catalogue.host_stats) {
        writer.trace("host " + host + ": " + std::to_string(count) + " request(s)");
    }
    for (const auto& [method, count] : parsed.catalogue.method_stats) {
        writer.trace("method " + method + ": " + std::to_string(count) + " request(s)");
    }
    writer.diagnostics(parsed.diagnostics);
    writer.info("Built " + std::to_string(parsed.catalogue.apis.size()) + " API definition(s)" +
                (parsed.partial ? " (partial)" : ""));
}

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

int run_rule(const harvest::cli::RuleCommand& cmd, const harvest::cli::GlobalOptions& global,
             harvest::output::Writer& writer) {
    using namespace harvest;
    rule::RuleStore store;
    const auto path = store_path(global);
    if (!load_store(store, path, writer)) {
        return 1;
    }

    rule::StoreResult result;
    switch (cmd.action) {
    case cli::Action::List:
        print_filters(store.filters(), cmd.json, writer);
        return 0;
    case cli::Action::Add: {
        rule::FilterRule r;
        r.id = cmd.id;
        r.pattern = cmd.pattern.value_or("");
        r.type = cmd.type.value_or(rule::FilterType::Url);
        r.enabled = cmd.enabled.value_or(true);
        r.description = cmd.description;
        result = store.add_filter(std::move(r));
        break;
    }
    case cli::Action::Update: {
        auto existing = store.find_filter(cmd.id);
        if (!existing) {
            writer.error(Error::make(ErrorKind::NotFound, "filter rule not found", cmd.id).format());
            return 1;
        }
        rule::FilterRule r = *existing;
        if (cmd.pattern) {
            r.pattern = *cmd.pattern;
        }
        if (cmd.type) {
            r.type = *cmd.type;
        }
        if (cmd.description) {
            r.description = cmd.description;
        }
        if (cmd.enabled) {
            r.enabled = *cmd.enabled;
        }
        result = store.update_filter(cmd.id, std::move(r));
        break;
    }
    case cli::Action::Delete:
        result = store.delete_filter(cmd.id);
        break;
    case cli::Action::Toggle: {
        auto existing = store.find_filter(cmd.id);
        const bool enabled = cmd.enabled.value_or(existing ? !existing->enabled : true);
        result = store.toggle_filter(cmd.id, enabled);
        break;
    }
    }

    if (!result) {
        writer.error(result.error.format());
        return 1;
    }
    if (!save_store(store, path, writer)) {
        return 1;
    }
    writer.info("Filter rule '" + result.id + "' saved to " + platform::path_to_utf8(path));
    return 0;
}

int run_host(const harvest::cli::HostCommand& cmd, const harvest::cli::GlobalOptions& global,
             harvest::output::Writer& writer) {
    using namespace harvest;
    rule::RuleStore store;
    const auto path = store_path(global);
    if (!load_store(store, path, writer)) {
        return 1;
    }

    rule::StoreResult result;
    switch (cmd.action) {
    case cli::Action::List:
        print_hosts(store.hosts(), cmd.json, writer);
        return 0;
    case cli::Action::Add: {
        rule::HostRule r;
        r.id = cmd.id;
        r.host = cmd.host.value_or("");
        r.enabled = cmd.enabled.value_or(true);
        r.description = cmd.description;
        r.include_subdomains = cmd.include_subdomains.value_or(false);
        result = store.add_host(std::move(r));
        break;
    }
    case cli::Action::Update: {
        auto existing = store.find_host(cmd.id);
        if (!existing) {
            writer.error(Error::make(ErrorKind::NotFound, "host rule not found", cmd.id).format());
            return 1;
        }
        rule::HostRule r = *existing;
        if (cmd.host) {
            r.host = *cmd.host;
        }
        if (cmd.description) {
            r.description = cmd.description;
        }
        if (cmd.include_subdomains) {
            r.include_subdomains = *cmd.include_subdomains;
        }
        if (cmd.enabled) {
            r.enabled = *cmd.enabled;
        }
        result = store.update_host(cmd.id, std::move(r));
        break;
    }
    case cli::Action::Delete:
        result = store.delete_host(cmd.id);
        break;
    case cli::Action::Toggle: {
        auto existing = store.find_host(cmd.id);
        const bool enabled = cmd.enabled.value_or(existing ? !existing->enabled : true);
        result = store.toggle_host(cmd.id, enabled);
        break;
    }
    }

    if (!result) {
        writer.error(result.error.format());
        return 1;
    }
    if (!save_store(store, path, writer)) {
        return 1;
    }
    writer.info("Host rule '" + result.id + "' saved to " + platform::path_to_utf8(path));
    return 0;
}

int run_preset(const harvest::cli::PresetCommand& cmd, const harvest::cli::GlobalOptions& global,
               harvest::output::Writer& writer) {
    using namespace harvest;
    rule::RuleStore store;
    const auto path = store_path(global);
    if (!load_store(store, path, writer)) {
        return 1;
    }

    if (cmd.action == cli::PresetAction::List) {
        const auto presets = store.presets();
        if (cmd.json) {
            Value out = Value::make_array();
            for (const auto& p : presets) {
                out.push_back(rule::to_value(p));
            }
            writer.write_json_pretty(out);
            return 0;
        }
        output::Table table;
        table.set_headers({"id", "name", "rules", "description"});
        for (const auto& p : presets) {
            table.add_row({p.id, p.name, std::to_string(p.rules.size()), p.description});
        }
        table.print(writer);
        return 0;
    }

    auto applied = store.apply_preset(cmd.id);
    if (!applied) {
        writer.error(applied.error.format());
        return 1;
    }
    if (!save_store(store, path, writer)) {
        return 1;
    }
    writer.info("Applied preset '" + cmd.id + "': " + std::to_string(applied.added) + " added, " +
                std::to_string(applied.replaced) + " replaced");
    return 0;
}

int run_reload(const harvest::cli::GlobalOptions& global, harvest::output::Writer& writer) {
    using namespace harvest;
    rule::RuleStore store;
    if (!load_store(store, store_path(global), writer)) {
        return 1;
    }
    rule::RuleEngine engine(store);
    auto reloaded = engine.reload();
    if (!reloaded) {
        writer.error(reloaded.error.format());
        return 1;
    }
    writer.info("Rule snapshot compiled: " + std::to_string(reloaded.filter_count) +
                " filter rule(s), " + std::to_string(reloaded.host_count) +
                " host rule(s), revision " + std::to_string(reloaded.revision));
    return 0;
}

int run_parse(const harvest::cli::ParseCommand& cmd, const harvest::cli::GlobalOptions& global,
              harvest::output::Writer& writer) {
    using namespace harvest;
    rule::RuleStore store;
    rule::RuleEngine engine(store);
    if (!prepare_engine(store, engine, global, writer)) {
        return 1;
    }

    writer.info("Parsing capture " + platform::path_to_utf8(cmd.capture));
    auto parsed = pipeline::parse_capture(cmd.capture, engine, build_options(cmd.build), &g_cancel);
    if (!parsed) {
        writer.error(parsed.error.format());
        return 1;
    }
    report_parse(parsed, writer);

    const Value catalogue = model::catalogue_to_json(parsed.catalogue);
    if (!cmd.output.has_value()) {
        writer.write_json_pretty(catalogue);
        return 0;
    }
    const std::string json = catalogue.to_pretty_json_string();
    std::string error;
    if (!platform::write_file_atomic(*cmd.output, json + "\n", &error)) {
        writer.error(Error::make(ErrorKind::IoError, error, platform::path_to_utf8(*cmd.output))
                         .format());
        return 1;
    }
    writer.info("Catalogue written to " + platform::path_to_utf8(*cmd.output));
    return 0;
}

int run_generate(const harvest::cli::GenerateCommand& cmd, harvest::output::Writer& writer) {
    using namespace harvest;
    auto loaded = model::load_catalogue(cmd.catalogue);
    if (!loaded) {
        writer.error(loaded.error.format());
        return 1;
    }
    writer.info("Loaded " + std::to_string(loaded.catalogue.apis.size()) +
                " API definition(s) from " + platform::path_to_utf8(cmd.catalogue));

    auto generated = pipeline::generate_tests(loaded.catalogue, &g_cancel);
    if (!generated) {
        writer.error(generated.error.format());
        return 1;
    }

    std::vector<pipeline::Artifact> artifacts;
    artifacts.push_back(
        {cmd.output, synth::testcases_to_json(generated.cases).to_pretty_json_string() + "\n"});
    if (cmd.doc) {
        artifacts.push_back({*cmd.doc, generated.markdown});
    }
    if (cmd.openapi) {
        artifacts.push_back({*cmd.openapi, generated.openapi.to_pretty_json_string() + "\n"});
    }
    auto published = pipeline::publish(artifacts, &g_cancel);
    if (!published) {
        writer.error(published.error.format());
        return 1;
    }
    for (const auto& p : published.written) {
        writer.debug("wrote " + platform::path_to_utf8(p));
    }
    writer.green_line("Generated " + std::to_string(generated.cases.size()) + " test case(s)");
    return 0;
}

int run_run(const harvest::cli::RunCommand& cmd, const harvest::cli::GlobalOptions& global,
            harvest::output::Writer& writer) {
    using namespace harvest;
    rule::RuleStore store;
    rule::RuleEngine engine(store);
    if (!prepare_engine(store, engine, global, writer)) {
        return 1;
    }

    writer.info("Parsing capture " + platform::path_to_utf8(cmd.capture));
    auto result =
        pipeline::run(cmd.capture, cmd.out_dir, engine, build_options(cmd.build), &g_cancel);
    if (result.parse) {
        report_parse(result.parse, writer);
    }
    if (!result) {
        writer.error(result.error.format());
        return 1;
    }
    for (const auto& p : result.written) {
        writer.debug("wrote " + platform::path_to_utf8(p));
    }
    writer.green_line("Generated " + std::to_string(result.test_cases) + " test case(s) in " +
                      platform::path_to_utf8(cmd.out_dir));
    return 0;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace harvest;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // Ошибка использования печатается как есть, без [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    std::signal(SIGINT, on_interrupt);

    const auto& global = parse_result.global;
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::RuleCommand>) {
                return run_rule(cmd, global, writer);
            } else if constexpr (std::is_same_v<T, cli::HostCommand>) {
                return run_host(cmd, global, writer);
            } else if constexpr (std::is_same_v<T, cli::PresetCommand>) {
                return run_preset(cmd, global, writer);
            } else if constexpr (std::is_same_v<T, cli::ReloadCommand>) {
                return run_reload(global, writer);
            } else if constexpr (std::is_same_v<T, cli::ParseCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_parse(cmd, global, writer);
            } else if constexpr (std::is_same_v<T, cli::GenerateCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_generate(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::RunCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_run(cmd, global, writer);
            } else {
                return 1;
            }
        },
        parse_result.command);
}

}  // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << harvest::output::format_error(e.what());
        return 1;
    }
}
