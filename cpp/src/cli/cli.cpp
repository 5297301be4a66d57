// ==============================================================================
// cli.cpp - Парсинг командной строки
// ==============================================================================
//
// Собственный парсер: глобальные опции до и после подкоманды, значения
// опций следующим аргументом. Ошибки использования возвращаются как
// CliDiagnostic с exit code 2 и текстом в стиле clap.
//
// ==============================================================================

#include "harvest/cli.hpp"

#include "harvest/platform.hpp"

#include <cstring>
#include <stdexcept>

namespace harvest::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool is_option(const char* arg) {
    return arg[0] == '-' && arg[1] != '\0';
}

// ----------------------------------------------------------------------------
// Тексты usage
// ----------------------------------------------------------------------------

constexpr const char* USAGE_MAIN = "Usage: harvest [OPTIONS] <COMMAND>";
constexpr const char* USAGE_RULE = "Usage: harvest rule <list|add|update|delete|toggle> [OPTIONS]";
constexpr const char* USAGE_HOST = "Usage: harvest host <list|add|update|delete|toggle> [OPTIONS]";
constexpr const char* USAGE_PRESET = "Usage: harvest preset <list|apply> [ID]";
constexpr const char* USAGE_RULES = "Usage: harvest rules reload";
constexpr const char* USAGE_PARSE = "Usage: harvest parse [OPTIONS] <CAPTURE>";
constexpr const char* USAGE_GENERATE = "Usage: harvest generate [OPTIONS] --output <TESTS> <CATALOGUE>";
constexpr const char* USAGE_RUN = "Usage: harvest run [OPTIONS] --dir <DIR> <CAPTURE>";

std::string usage_error(const std::string& message, const char* usage) {
    return "error: " + message + "\n\n" + usage + "\n\nFor more information, try '--help'.\n";
}

/// Разбор одной подкоманды: argv[begin..argc)
class Args {
public:
    Args(int argc, char** argv, int begin, ParseResult& result, const char* usage)
        : argc_(argc), argv_(argv), i_(begin), result_(result), usage_(usage) {}

    bool done() const { return i_ >= argc_; }
    const char* peek() const { return argv_[i_]; }
    const char* take() { return argv_[i_++]; }

    /// Значение опции opt (следующий аргумент)
    std::optional<std::string> value(const char* opt) {
        if (i_ >= argc_) {
            fail(std::string("a value is required for '") + opt + "' but none was supplied");
            return std::nullopt;
        }
        return std::string(argv_[i_++]);
    }

    /// -v, -q, --no-banner, --store после подкоманды
    bool global(const char* arg) {
        GlobalOptions& g = result_.global;
        if (str_eq(arg, "-v")) {
            ++g.verbose;
        } else if (str_eq(arg, "-vv")) {
            g.verbose += 2;
        } else if (str_eq(arg, "-q")) {
            g.quiet = true;
        } else if (str_eq(arg, "--no-banner")) {
            g.no_banner = true;
        } else if (str_eq(arg, "--store")) {
            if (auto v = value("--store")) {
                g.store = platform::path_from_utf8(*v);
            }
        } else {
            return false;
        }
        return true;
    }

    void fail(const std::string& message) {
        if (failed_) {
            return;
        }
        failed_ = true;
        result_.ok = false;
        result_.diagnostic.exit_code = 2;
        result_.diagnostic.stderr_message = usage_error(message, usage_);
    }

    void unexpected(const char* arg) { fail(std::string("unexpected argument '") + arg + "' found"); }

    void missing(const char* what) {
        fail(std::string("the following required arguments were not provided:\n  ") + what);
    }

    bool failed() const { return failed_; }

private:
    int argc_;
    char** argv_;
    int i_;
    ParseResult& result_;
    const char* usage_;
    bool failed_ = false;
};

bool help_flag(const char* arg) {
    return str_eq(arg, "-h") || str_eq(arg, "--help");
}

std::optional<Action> parse_action(const char* s) {
    if (str_eq(s, "list") || str_eq(s, "ls")) {
        return Action::List;
    }
    if (str_eq(s, "add")) {
        return Action::Add;
    }
    if (str_eq(s, "update")) {
        return Action::Update;
    }
    if (str_eq(s, "delete") || str_eq(s, "rm")) {
        return Action::Delete;
    }
    if (str_eq(s, "toggle")) {
        return Action::Toggle;
    }
    return std::nullopt;
}

bool build_flag(Args& args, const char* arg, BuildFlags& flags) {
    if (str_eq(arg, "--variance-threshold")) {
        if (auto v = args.value(arg)) {
            try {
                std::size_t pos = 0;
                const unsigned long n = std::stoul(*v, &pos);
                if (pos != v->size()) {
                    throw std::invalid_argument(*v);
                }
                flags.variance_threshold = static_cast<std::size_t>(n);
            } catch (const std::exception&) {
                args.fail("invalid value '" + *v +
                          "' for '--variance-threshold <N>': expected a non-negative integer");
            }
        }
        return true;
    }
    if (str_eq(arg, "--placeholder")) {
        if (auto v = args.value(arg)) {
            if (v->empty()) {
                args.fail("invalid value '' for '--placeholder <NAME>'");
            }
            flags.placeholder = *v;
        }
        return true;
    }
    return false;
}

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

void parse_rule(Args& args, ParseResult& result) {
    if (args.done()) {
        result.ok = true;
        result.command = HelpCommand{"rule"};
        return;
    }
    const char* verb = args.take();
    if (help_flag(verb)) {
        result.ok = true;
        result.command = HelpCommand{"rule"};
        return;
    }
    auto action = parse_action(verb);
    if (!action) {
        args.fail(std::string("unrecognized subcommand '") + verb + "'");
        return;
    }

    RuleCommand cmd;
    cmd.action = *action;
    while (!args.done() && !args.failed()) {
        const char* arg = args.take();
        if (help_flag(arg)) {
            result.ok = true;
            result.command = HelpCommand{"rule"};
            return;
        } else if (args.global(arg)) {
            continue;
        } else if (str_eq(arg, "--id")) {
            if (auto v = args.value(arg)) {
                cmd.id = *v;
            }
        } else if (str_eq(arg, "-p") || str_eq(arg, "--pattern")) {
            cmd.pattern = args.value(arg);
        } else if (str_eq(arg, "-t") || str_eq(arg, "--type")) {
            if (auto v = args.value(arg)) {
                try {
                    cmd.type = rule::parse_filter_type(*v);
                } catch (const std::invalid_argument&) {
                    args.fail("invalid value '" + *v +
                              "' for '--type <TYPE>': must be one of url, host, content-type, "
                              "method, header");
                }
            }
        } else if (str_eq(arg, "--description")) {
            cmd.description = args.value(arg);
        } else if (str_eq(arg, "--enable")) {
            cmd.enabled = true;
        } else if (str_eq(arg, "--disable")) {
            cmd.enabled = false;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (!is_option(arg) && cmd.id.empty() && cmd.action != Action::List) {
            cmd.id = arg;
        } else {
            args.unexpected(arg);
        }
    }
    if (args.failed()) {
        return;
    }

    if (cmd.action == Action::Add && !cmd.pattern.has_value()) {
        args.missing("--pattern <PATTERN>");
        return;
    }
    if ((cmd.action == Action::Update || cmd.action == Action::Delete ||
         cmd.action == Action::Toggle) &&
        cmd.id.empty()) {
        args.missing("<ID>");
        return;
    }
    result.ok = true;
    result.command = std::move(cmd);
}

void parse_host(Args& args, ParseResult& result) {
    if (args.done()) {
        result.ok = true;
        result.command = HelpCommand{"host"};
        return;
    }
    const char* verb = args.take();
    if (help_flag(verb)) {
        result.ok = true;
        result.command = HelpCommand{"host"};
        return;
    }
    auto action = parse_action(verb);
    if (!action) {
        args.fail(std::string("unrecognized subcommand '") + verb + "'");
        return;
    }

    HostCommand cmd;
    cmd.action = *action;
    while (!args.done() && !args.failed()) {
        const char* arg = args.take();
        if (help_flag(arg)) {
            result.ok = true;
            result.command = HelpCommand{"host"};
            return;
        } else if (args.global(arg)) {
            continue;
        } else if (str_eq(arg, "--id")) {
            if (auto v = args.value(arg)) {
                cmd.id = *v;
            }
        } else if (str_eq(arg, "--host")) {
            cmd.host = args.value(arg);
        } else if (str_eq(arg, "--description")) {
            cmd.description = args.value(arg);
        } else if (str_eq(arg, "-s") || str_eq(arg, "--subdomains")) {
            cmd.include_subdomains = true;
        } else if (str_eq(arg, "--no-subdomains")) {
            cmd.include_subdomains = false;
        } else if (str_eq(arg, "--enable")) {
            cmd.enabled = true;
        } else if (str_eq(arg, "--disable")) {
            cmd.enabled = false;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (!is_option(arg) && cmd.action == Action::Add && !cmd.host.has_value()) {
            // host add <HOST>
            cmd.host = std::string(arg);
        } else if (!is_option(arg) && cmd.action != Action::Add && cmd.action != Action::List &&
                   cmd.id.empty()) {
            cmd.id = arg;
        } else {
            args.unexpected(arg);
        }
    }
    if (args.failed()) {
        return;
    }

    if (cmd.action == Action::Add && !cmd.host.has_value()) {
        args.missing("<HOST>");
        return;
    }
    if ((cmd.action == Action::Update || cmd.action == Action::Delete ||
         cmd.action == Action::Toggle) &&
        cmd.id.empty()) {
        args.missing("<ID>");
        return;
    }
    result.ok = true;
    result.command = std::move(cmd);
}

void parse_preset(Args& args, ParseResult& result) {
    if (args.done()) {
        result.ok = true;
        result.command = HelpCommand{"preset"};
        return;
    }
    const char* verb = args.take();
    PresetCommand cmd;
    if (help_flag(verb)) {
        result.ok = true;
        result.command = HelpCommand{"preset"};
        return;
    } else if (str_eq(verb, "list") || str_eq(verb, "ls")) {
        cmd.action = PresetAction::List;
    } else if (str_eq(verb, "apply")) {
        cmd.action = PresetAction::Apply;
    } else {
        args.fail(std::string("unrecognized subcommand '") + verb + "'");
        return;
    }

    while (!args.done() && !args.failed()) {
        const char* arg = args.take();
        if (help_flag(arg)) {
            result.ok = true;
            result.command = HelpCommand{"preset"};
            return;
        } else if (args.global(arg)) {
            continue;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (!is_option(arg) && cmd.action == PresetAction::Apply && cmd.id.empty()) {
            cmd.id = arg;
        } else {
            args.unexpected(arg);
        }
    }
    if (args.failed()) {
        return;
    }
    if (cmd.action == PresetAction::Apply && cmd.id.empty()) {
        args.missing("<ID>");
        return;
    }
    result.ok = true;
    result.command = std::move(cmd);
}

void parse_rules(Args& args, ParseResult& result) {
    if (args.done()) {
        result.ok = true;
        result.command = HelpCommand{"rules"};
        return;
    }
    const char* verb = args.take();
    if (help_flag(verb)) {
        result.ok = true;
        result.command = HelpCommand{"rules"};
        return;
    }
    if (!str_eq(verb, "reload")) {
        args.fail(std::string("unrecognized subcommand '") + verb + "'");
        return;
    }
    while (!args.done() && !args.failed()) {
        const char* arg = args.take();
        if (!args.global(arg)) {
            args.unexpected(arg);
        }
    }
    if (args.failed()) {
        return;
    }
    result.ok = true;
    result.command = ReloadCommand{};
}

void parse_parse(Args& args, ParseResult& result) {
    ParseCommand cmd;
    bool have_capture = false;
    while (!args.done() && !args.failed()) {
        const char* arg = args.take();
        if (help_flag(arg)) {
            result.ok = true;
            result.command = HelpCommand{"parse"};
            return;
        } else if (args.global(arg) || build_flag(args, arg, cmd.build)) {
            continue;
        } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
            if (auto v = args.value(arg)) {
                cmd.output = platform::path_from_utf8(*v);
            }
        } else if (!is_option(arg) && !have_capture) {
            cmd.capture = platform::path_from_utf8(arg);
            have_capture = true;
        } else {
            args.unexpected(arg);
        }
    }
    if (args.failed()) {
        return;
    }
    if (!have_capture) {
        args.missing("<CAPTURE>");
        return;
    }
    result.ok = true;
    result.command = std::move(cmd);
}

void parse_generate(Args& args, ParseResult& result) {
    GenerateCommand cmd;
    bool have_catalogue = false;
    bool have_output = false;
    while (!args.done() && !args.failed()) {
        const char* arg = args.take();
        if (help_flag(arg)) {
            result.ok = true;
            result.command = HelpCommand{"generate"};
            return;
        } else if (args.global(arg)) {
            continue;
        } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
            if (auto v = args.value(arg)) {
                cmd.output = platform::path_from_utf8(*v);
                have_output = true;
            }
        } else if (str_eq(arg, "--doc")) {
            if (auto v = args.value(arg)) {
                cmd.doc = platform::path_from_utf8(*v);
            }
        } else if (str_eq(arg, "--openapi")) {
            if (auto v = args.value(arg)) {
                cmd.openapi = platform::path_from_utf8(*v);
            }
        } else if (!is_option(arg) && !have_catalogue) {
            cmd.catalogue = platform::path_from_utf8(arg);
            have_catalogue = true;
        } else {
            args.unexpected(arg);
        }
    }
    if (args.failed()) {
        return;
    }
    if (!have_catalogue) {
        args.missing("<CATALOGUE>");
        return;
    }
    if (!have_output) {
        args.missing("--output <TESTS>");
        return;
    }
    result.ok = true;
    result.command = std::move(cmd);
}

void parse_run(Args& args, ParseResult& result) {
    RunCommand cmd;
    bool have_capture = false;
    bool have_dir = false;
    while (!args.done() && !args.failed()) {
        const char* arg = args.take();
        if (help_flag(arg)) {
            result.ok = true;
            result.command = HelpCommand{"run"};
            return;
        } else if (args.global(arg) || build_flag(args, arg, cmd.build)) {
            continue;
        } else if (str_eq(arg, "-d") || str_eq(arg, "--dir")) {
            if (auto v = args.value(arg)) {
                cmd.out_dir = platform::path_from_utf8(*v);
                have_dir = true;
            }
        } else if (!is_option(arg) && !have_capture) {
            cmd.capture = platform::path_from_utf8(arg);
            have_capture = true;
        } else {
            args.unexpected(arg);
        }
    }
    if (args.failed()) {
        return;
    }
    if (!have_capture) {
        args.missing("<CAPTURE>");
        return;
    }
    if (!have_dir) {
        args.missing("--dir <DIR>");
        return;
    }
    result.ok = true;
    result.command = std::move(cmd);
}

}  // namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("harvest ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: harvest [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  rule      Manage URL / content-type / method / header filter rules\n"
               "  host      Manage the host allow list\n"
               "  preset    List or apply filter rule presets\n"
               "  rules     Validate the store by compiling a rule snapshot\n"
               "  parse     Parse a HAR capture into an API catalogue\n"
               "  generate  Generate test cases and documentation from a catalogue\n"
               "  run       Parse a capture and generate all artefacts into a directory\n"
               "  help      Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --store <FILE>  Rule store file (default: $HARVEST_STORE or harvest.yml)\n"
               "      --no-banner     Hide harvest's banner\n"
               "  -v...               Print verbose output\n"
               "  -q                  Suppress informational output\n"
               "  -h, --help          Print help\n"
               "  -V, --version       Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Exclude stylesheets and keep only one API host:\n"
               "        ./harvest rule add --pattern '\\.css$' --type url\n"
               "        ./harvest host add api.example.com --subdomains\n"
               "\n"
               "    Parse a capture and generate tests:\n"
               "        ./harvest run session.har -d out/\n";
    } else if (*command == "rule") {
        return "Manage URL / content-type / method / header filter rules\n"
               "\n"
               "Usage: harvest rule <list|add|update|delete|toggle> [OPTIONS]\n"
               "\n"
               "Commands:\n"
               "  list               List filter rules\n"
               "  add                Add a rule (--pattern required)\n"
               "  update <ID>        Replace fields of a rule\n"
               "  delete <ID>        Delete a rule\n"
               "  toggle <ID>        Enable or disable a rule\n"
               "\n"
               "Options:\n"
               "      --id <ID>                  Rule id (default: filter-N)\n"
               "  -p, --pattern <PATTERN>        ECMAScript regular expression\n"
               "  -t, --type <TYPE>              url, host, content-type, method or header\n"
               "      --description <TEXT>       Free-form description\n"
               "      --enable / --disable       Rule state\n"
               "  -j, --json                     Output as JSON (list)\n"
               "  -h, --help                     Print help\n";
    } else if (*command == "host") {
        return "Manage the host allow list\n"
               "\n"
               "Usage: harvest host <list|add|update|delete|toggle> [OPTIONS]\n"
               "\n"
               "Commands:\n"
               "  list               List host rules\n"
               "  add <HOST>         Allow a host\n"
               "  update <ID>        Replace fields of a host rule\n"
               "  delete <ID>        Delete a host rule\n"
               "  toggle <ID>        Enable or disable a host rule\n"
               "\n"
               "Options:\n"
               "      --id <ID>                  Rule id (default: host-N)\n"
               "      --host <HOST>              Host name\n"
               "  -s, --subdomains               Also match any subdomain\n"
               "      --no-subdomains            Exact match only\n"
               "      --description <TEXT>       Free-form description\n"
               "      --enable / --disable       Rule state\n"
               "  -j, --json                     Output as JSON (list)\n"
               "  -h, --help                     Print help\n";
    } else if (*command == "preset") {
        return "List or apply filter rule presets\n"
               "\n"
               "Usage: harvest preset <list|apply> [ID]\n"
               "\n"
               "Commands:\n"
               "  list        List built-in and store-declared presets\n"
               "  apply <ID>  Merge the preset's rules into the store\n"
               "\n"
               "Options:\n"
               "  -j, --json  Output as JSON (list)\n"
               "  -h, --help  Print help\n";
    } else if (*command == "rules") {
        return "Validate the store by compiling a rule snapshot\n"
               "\n"
               "Usage: harvest rules reload\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    } else if (*command == "parse") {
        return "Parse a HAR capture into an API catalogue\n"
               "\n"
               "Usage: harvest parse [OPTIONS] <CAPTURE>\n"
               "\n"
               "Arguments:\n"
               "  <CAPTURE>  HAR 1.2 capture file\n"
               "\n"
               "Options:\n"
               "  -o, --output <CATALOGUE>      Save the catalogue to a file (default: stdout)\n"
               "      --variance-threshold <N>  Distinct literals that make a segment a "
               "parameter (default: 3, 0 disables)\n"
               "      --placeholder <NAME>      Path placeholder name (default: id)\n"
               "  -h, --help                    Print help\n";
    } else if (*command == "generate") {
        return "Generate test cases and documentation from a catalogue\n"
               "\n"
               "Usage: harvest generate [OPTIONS] --output <TESTS> <CATALOGUE>\n"
               "\n"
               "Arguments:\n"
               "  <CATALOGUE>  Catalogue produced by 'harvest parse'\n"
               "\n"
               "Options:\n"
               "  -o, --output <TESTS>   Test case JSON file\n"
               "      --doc <MD>         Also write Markdown documentation\n"
               "      --openapi <JSON>   Also write an OpenAPI 3.0 document\n"
               "  -h, --help             Print help\n";
    } else if (*command == "run") {
        return "Parse a capture and generate all artefacts into a directory\n"
               "\n"
               "Usage: harvest run [OPTIONS] --dir <DIR> <CAPTURE>\n"
               "\n"
               "Arguments:\n"
               "  <CAPTURE>  HAR 1.2 capture file\n"
               "\n"
               "Options:\n"
               "  -d, --dir <DIR>               Output directory\n"
               "      --variance-threshold <N>  Distinct literals that make a segment a "
               "parameter (default: 3, 0 disables)\n"
               "      --placeholder <NAME>      Path placeholder name (default: id)\n"
               "  -h, --help                    Print help\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-vv")) {
            result.global.verbose += 2;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "--store")) {
            if (i + 1 >= argc) {
                result.diagnostic.stderr_message = usage_error(
                    "a value is required for '--store <FILE>' but none was supplied", USAGE_MAIN);
                return result;
            }
            result.global.store = platform::path_from_utf8(argv[++i]);
        } else if (help_flag(arg)) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (!is_option(arg)) {
            cmd_idx = i;
            break;
        } else {
            result.diagnostic.stderr_message =
                usage_error(std::string("unexpected argument '") + arg + "' found", USAGE_MAIN);
            return result;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];
    const int begin = cmd_idx + 1;

    if (str_eq(cmd, "rule")) {
        Args args(argc, argv, begin, result, USAGE_RULE);
        parse_rule(args, result);
    } else if (str_eq(cmd, "host")) {
        Args args(argc, argv, begin, result, USAGE_HOST);
        parse_host(args, result);
    } else if (str_eq(cmd, "preset")) {
        Args args(argc, argv, begin, result, USAGE_PRESET);
        parse_preset(args, result);
    } else if (str_eq(cmd, "rules")) {
        Args args(argc, argv, begin, result, USAGE_RULES);
        parse_rules(args, result);
    } else if (str_eq(cmd, "parse")) {
        Args args(argc, argv, begin, result, USAGE_PARSE);
        parse_parse(args, result);
    } else if (str_eq(cmd, "generate")) {
        Args args(argc, argv, begin, result, USAGE_GENERATE);
        parse_generate(args, result);
    } else if (str_eq(cmd, "run")) {
        Args args(argc, argv, begin, result, USAGE_RUN);
        parse_run(args, result);
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (begin < argc) {
            result.command = HelpCommand{std::string(argv[begin])};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message =
            usage_error(std::string("unrecognized subcommand '") + cmd + "'", USAGE_MAIN);
    }
    return result;
}

}  // namespace harvest::cli
