// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================
//
// Парсинг подкоманд rule / host / preset / rules / parse / generate / run,
// глобальные опции, --help / --version, ошибки использования (exit code 2).
//
// ==============================================================================

#include <harvest/cli.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace harvest::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

ParseResult parse_args(Args& args) {
    return parse(args.argc(), args.argv());
}

void expect_usage_error(Args args, const std::string& fragment) {
    ParseResult result = parse_args(args);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find(fragment), std::string::npos)
        << result.diagnostic.stderr_message;
}

// ==============================================================================
// --help / --version
// ==============================================================================

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    Args args{"harvest", "--help"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_FALSE(std::get<HelpCommand>(result.command).command.has_value());
}

TEST(CliTest, Parse_HelpSubcommand) {
    Args args{"harvest", "help", "run"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::optional<std::string>("run"));
}

TEST(CliTest, Parse_SubcommandHelpFlag) {
    Args args{"harvest", "rule", "add", "--help"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::optional<std::string>("rule"));
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    Args args{"harvest", "-V"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
}

TEST(CliTest, RenderVersion_ContainsVersion) {
    EXPECT_EQ(render_version(), std::string("harvest ") + VERSION + "\n");
}

TEST(CliTest, RenderHelp_Main_ContainsCommands) {
    const std::string help = render_help();

    for (const char* cmd : {"rule", "host", "preset", "rules", "parse", "generate", "run"}) {
        EXPECT_NE(help.find(std::string("  ") + cmd + " "), std::string::npos) << cmd;
    }
    EXPECT_NE(help.find("--store <FILE>"), std::string::npos);
}

TEST(CliTest, RenderHelp_Subcommands) {
    EXPECT_NE(render_help(std::string("run")).find("--variance-threshold"), std::string::npos);
    EXPECT_NE(render_help(std::string("generate")).find("--openapi"), std::string::npos);
    EXPECT_NE(render_help(std::string("nope")).find("unrecognized subcommand 'nope'"),
              std::string::npos);
}

// ==============================================================================
// Глобальные опции
// ==============================================================================

TEST(CliTest, Parse_GlobalOptions_BeforeCommand) {
    Args args{"harvest", "--no-banner", "-v", "-v", "--store", "team.yml", "rules", "reload"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.global.no_banner);
    EXPECT_EQ(result.global.verbose, 2);
    ASSERT_TRUE(result.global.store.has_value());
    EXPECT_EQ(result.global.store->filename(), "team.yml");
    EXPECT_TRUE(std::holds_alternative<ReloadCommand>(result.command));
}

TEST(CliTest, Parse_GlobalOptions_AfterCommand) {
    Args args{"harvest", "rule", "list", "-q", "--store", "x.yml"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.global.quiet);
    EXPECT_TRUE(result.global.store.has_value());
}

// ==============================================================================
// rule
// ==============================================================================

TEST(CliTest, Parse_RuleAdd) {
    Args args{"harvest", "rule", "add", "--id", "no-css", "-p", "\\.css$", "-t", "url",
              "--description", "stylesheets", "--disable"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<RuleCommand>(result.command);
    EXPECT_EQ(cmd.action, Action::Add);
    EXPECT_EQ(cmd.id, "no-css");
    EXPECT_EQ(cmd.pattern, std::optional<std::string>("\\.css$"));
    EXPECT_EQ(cmd.type, std::optional<rule::FilterType>(rule::FilterType::Url));
    EXPECT_EQ(cmd.description, std::optional<std::string>("stylesheets"));
    EXPECT_EQ(cmd.enabled, std::optional<bool>(false));
}

TEST(CliTest, Parse_RuleAdd_WithoutId) {
    Args args{"harvest", "rule", "add", "--pattern", "^OPTIONS$", "--type", "method"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<RuleCommand>(result.command);
    EXPECT_TRUE(cmd.id.empty());
    EXPECT_EQ(cmd.type, std::optional<rule::FilterType>(rule::FilterType::Method));
}

TEST(CliTest, Parse_RuleToggle_PositionalId) {
    Args args{"harvest", "rule", "toggle", "no-css", "--enable"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<RuleCommand>(result.command);
    EXPECT_EQ(cmd.action, Action::Toggle);
    EXPECT_EQ(cmd.id, "no-css");
    EXPECT_EQ(cmd.enabled, std::optional<bool>(true));
}

TEST(CliTest, Parse_RuleListJson) {
    Args args{"harvest", "rule", "ls", "--json"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<RuleCommand>(result.command);
    EXPECT_EQ(cmd.action, Action::List);
    EXPECT_TRUE(cmd.json);
}

TEST(CliTest, Parse_Rule_NoVerb_ShowsHelp) {
    Args args{"harvest", "rule"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::optional<std::string>("rule"));
}

TEST(CliTest, Parse_RuleAdd_MissingPattern) {
    expect_usage_error(Args{"harvest", "rule", "add", "--id", "x"}, "--pattern <PATTERN>");
}

TEST(CliTest, Parse_RuleDelete_MissingId) {
    expect_usage_error(Args{"harvest", "rule", "delete"}, "<ID>");
}

TEST(CliTest, Parse_Rule_InvalidType) {
    expect_usage_error(Args{"harvest", "rule", "add", "-p", "x", "-t", "cookie"},
                       "invalid value 'cookie' for '--type <TYPE>'");
}

TEST(CliTest, Parse_Rule_UnknownVerb) {
    expect_usage_error(Args{"harvest", "rule", "purge"}, "unrecognized subcommand 'purge'");
}

TEST(CliTest, Parse_Rule_MissingOptionValue) {
    expect_usage_error(Args{"harvest", "rule", "update", "x", "--pattern"},
                       "a value is required for '--pattern'");
}

// ==============================================================================
// host
// ==============================================================================

TEST(CliTest, Parse_HostAdd_PositionalHost) {
    Args args{"harvest", "host", "add", "api.example.com", "--subdomains", "--id", "api"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<HostCommand>(result.command);
    EXPECT_EQ(cmd.action, Action::Add);
    EXPECT_EQ(cmd.host, std::optional<std::string>("api.example.com"));
    EXPECT_EQ(cmd.include_subdomains, std::optional<bool>(true));
    EXPECT_EQ(cmd.id, "api");
}

TEST(CliTest, Parse_HostUpdate) {
    Args args{"harvest", "host", "update", "api", "--host", "v2.example.com", "--no-subdomains"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<HostCommand>(result.command);
    EXPECT_EQ(cmd.id, "api");
    EXPECT_EQ(cmd.host, std::optional<std::string>("v2.example.com"));
    EXPECT_EQ(cmd.include_subdomains, std::optional<bool>(false));
}

TEST(CliTest, Parse_HostAdd_MissingHost) {
    expect_usage_error(Args{"harvest", "host", "add"}, "<HOST>");
}

TEST(CliTest, Parse_HostList_UnexpectedArgument) {
    expect_usage_error(Args{"harvest", "host", "list", "extra"}, "unexpected argument 'extra'");
}

// ==============================================================================
// preset / rules
// ==============================================================================

TEST(CliTest, Parse_PresetApply) {
    Args args{"harvest", "preset", "apply", "common-noise"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<PresetCommand>(result.command);
    EXPECT_EQ(cmd.action, PresetAction::Apply);
    EXPECT_EQ(cmd.id, "common-noise");
}

TEST(CliTest, Parse_PresetApply_MissingId) {
    expect_usage_error(Args{"harvest", "preset", "apply"}, "<ID>");
}

TEST(CliTest, Parse_RulesReload_UnknownVerb) {
    expect_usage_error(Args{"harvest", "rules", "compile"}, "unrecognized subcommand 'compile'");
}

// ==============================================================================
// parse / generate / run
// ==============================================================================

TEST(CliTest, Parse_Parse_WithBuildFlags) {
    Args args{"harvest", "parse", "session.har", "-o", "catalogue.json",
              "--variance-threshold", "0", "--placeholder", "param"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<ParseCommand>(result.command);
    EXPECT_EQ(cmd.capture.filename(), "session.har");
    ASSERT_TRUE(cmd.output.has_value());
    EXPECT_EQ(cmd.output->filename(), "catalogue.json");
    EXPECT_EQ(cmd.build.variance_threshold, std::optional<std::size_t>(0));
    EXPECT_EQ(cmd.build.placeholder, std::optional<std::string>("param"));
}

TEST(CliTest, Parse_Parse_OutputOptional) {
    Args args{"harvest", "parse", "session.har"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok);
    EXPECT_FALSE(std::get<ParseCommand>(result.command).output.has_value());
}

TEST(CliTest, Parse_Parse_MissingCapture) {
    expect_usage_error(Args{"harvest", "parse"}, "<CAPTURE>");
}

TEST(CliTest, Parse_Parse_InvalidThreshold) {
    expect_usage_error(Args{"harvest", "parse", "a.har", "--variance-threshold", "three"},
                       "invalid value 'three' for '--variance-threshold <N>'");
}

TEST(CliTest, Parse_Parse_EmptyPlaceholder) {
    expect_usage_error(Args{"harvest", "parse", "a.har", "--placeholder", ""},
                       "'--placeholder <NAME>'");
}

TEST(CliTest, Parse_Generate) {
    Args args{"harvest", "generate", "catalogue.json", "-o", "tests.json", "--doc", "api.md",
              "--openapi", "openapi.json"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<GenerateCommand>(result.command);
    EXPECT_EQ(cmd.catalogue.filename(), "catalogue.json");
    EXPECT_EQ(cmd.output.filename(), "tests.json");
    ASSERT_TRUE(cmd.doc.has_value());
    ASSERT_TRUE(cmd.openapi.has_value());
    EXPECT_EQ(cmd.openapi->filename(), "openapi.json");
}

TEST(CliTest, Parse_Generate_MissingOutput) {
    expect_usage_error(Args{"harvest", "generate", "catalogue.json"}, "--output <TESTS>");
}

TEST(CliTest, Parse_Run) {
    Args args{"harvest", "run", "session.har", "-d", "out"};

    ParseResult result = parse_args(args);

    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<RunCommand>(result.command);
    EXPECT_EQ(cmd.capture.filename(), "session.har");
    EXPECT_EQ(cmd.out_dir.filename(), "out");
    EXPECT_FALSE(cmd.build.variance_threshold.has_value());
}

TEST(CliTest, Parse_Run_MissingDir) {
    expect_usage_error(Args{"harvest", "run", "session.har"}, "--dir <DIR>");
}

// ==============================================================================
// Ошибки парсинга
// ==============================================================================

TEST(CliTest, Parse_UnknownCommand_ReturnsError) {
    expect_usage_error(Args{"harvest", "no_such_cmd"}, "error: unrecognized subcommand");
}

TEST(CliTest, Parse_UnknownGlobalOption) {
    expect_usage_error(Args{"harvest", "--frobnicate"}, "unexpected argument '--frobnicate'");
}

TEST(CliTest, Parse_StoreWithoutValue) {
    expect_usage_error(Args{"harvest", "--store"}, "'--store <FILE>'");
}

TEST(CliTest, Parse_NoArgs_ReturnsUsageError) {
    Args args{"harvest"};

    ParseResult result = parse_args(args);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("Usage: harvest"), std::string::npos);
}

TEST(CliTest, UsageError_SuggestsHelp) {
    expect_usage_error(Args{"harvest", "run"}, "For more information, try '--help'.");
}

}  // namespace harvest::cli::test
