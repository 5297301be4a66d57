// ==============================================================================
// harvest/cli.hpp - Парсинг командной строки
// ==============================================================================
//
// Назначение:
// - Парсинг argv в вариант команды
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// Команды:
//   harvest rule   list|add|update|delete|toggle
//   harvest host   list|add|update|delete|toggle
//   harvest preset list|apply <ID>
//   harvest rules  reload
//   harvest parse    <CAPTURE> [-o <CATALOGUE>]
//   harvest generate <CATALOGUE> -o <TESTS> [--doc <MD>] [--openapi <JSON>]
//   harvest run      <CAPTURE> -d <DIR>
//
// ==============================================================================

#ifndef HARVEST_CLI_HPP
#define HARVEST_CLI_HPP

#include <harvest/rule.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace harvest::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;                      // --no-banner
    int verbose = 0;                             // -v (repeatable)
    bool quiet = false;                          // -q
    std::optional<std::filesystem::path> store;  // --store
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

enum class Action { List, Add, Update, Delete, Toggle };

/// rule - управление правилами фильтрации (deny list)
struct RuleCommand {
    Action action = Action::List;
    std::string id;                          // <ID> или --id
    std::optional<std::string> pattern;      // -p, --pattern
    std::optional<rule::FilterType> type;    // -t, --type
    std::optional<std::string> description;  // --description
    std::optional<bool> enabled;             // --enable / --disable
    bool json = false;                       // -j, --json (list)
};

/// host - управление разрешёнными хостами (allow list)
struct HostCommand {
    Action action = Action::List;
    std::string id;
    std::optional<std::string> host;             // --host
    std::optional<std::string> description;     // --description
    std::optional<bool> include_subdomains;      // --subdomains / --no-subdomains
    std::optional<bool> enabled;                 // --enable / --disable
    bool json = false;
};

enum class PresetAction { List, Apply };

/// preset - встроенные и объявленные пресеты
struct PresetCommand {
    PresetAction action = PresetAction::List;
    std::string id;
    bool json = false;
};

/// rules reload - скомпилировать снимок правил
struct ReloadCommand {};

/// Опции построения модели, общие для parse и run
struct BuildFlags {
    std::optional<std::size_t> variance_threshold;  // --variance-threshold
    std::optional<std::string> placeholder;         // --placeholder
};

/// parse - файл захвата -> каталог ApiDefinition
struct ParseCommand {
    std::filesystem::path capture;
    std::optional<std::filesystem::path> output;  // -o, --output (иначе stdout)
    BuildFlags build;
};

/// generate - каталог -> тест-кейсы и документация
struct GenerateCommand {
    std::filesystem::path catalogue;
    std::filesystem::path output;                  // -o, --output
    std::optional<std::filesystem::path> doc;      // --doc
    std::optional<std::filesystem::path> openapi;  // --openapi
};

/// run - parse + generate в одном задании
struct RunCommand {
    std::filesystem::path capture;
    std::filesystem::path out_dir;  // -d, --dir
    BuildFlags build;
};

struct HelpCommand {
    std::optional<std::string> command;
};

struct VersionCommand {};

using Command = std::variant<RuleCommand, HostCommand, PresetCommand, ReloadCommand, ParseCommand,
                             GenerateCommand, RunCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для подкоманды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// "harvest <VERSION>\n"
std::string render_version();

constexpr const char* VERSION = "0.3.0";

constexpr const char* ABOUT = "Filter captured HTTP traffic and synthesize interface tests";

}  // namespace harvest::cli

#endif  // HARVEST_CLI_HPP
