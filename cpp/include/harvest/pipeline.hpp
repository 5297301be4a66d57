// ==============================================================================
// harvest/pipeline.hpp - Пакетные задания: parse, generate, run
// ==============================================================================
//
// Назначение:
// - parse_capture: файл захвата -> фильтр движка правил -> каталог
// - generate_tests: каталог -> тест-кейсы и документация
// - run: parse + generate с публикацией артефактов "всё или ничего"
//
// Каждое задание независимо; общий только движок (read-only).
// Отменённое задание возвращает Cancelled и ничего не пишет на диск.
//
// ==============================================================================

#ifndef HARVEST_PIPELINE_HPP
#define HARVEST_PIPELINE_HPP

#include <harvest/cancel.hpp>
#include <harvest/engine.hpp>
#include <harvest/error.hpp>
#include <harvest/model.hpp>
#include <harvest/synth.hpp>
#include <harvest/value.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace harvest::pipeline {

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

struct ParseStats {
    std::uint64_t entries = 0;   // записей в log.entries
    std::uint64_t skipped = 0;   // некорректных записей
    std::uint64_t accepted = 0;  // прошли фильтр
    std::uint64_t excluded = 0;  // отклонены движком
    model::Counts exclusions;    // id решающего правила -> число
};

struct ParseResult {
    bool ok = false;
    model::Catalogue catalogue;
    Diagnostics diagnostics;  // пропущенные записи и конфликты схем
    bool partial = false;     // есть предупреждения
    ParseStats stats;
    Error error;

    explicit operator bool() const { return ok; }
};

ParseResult parse_capture(const std::filesystem::path& capture, const rule::RuleEngine& engine,
                          const model::BuildOptions& options = {},
                          const CancelToken* cancel = nullptr);

// ----------------------------------------------------------------------------
// generate
// ----------------------------------------------------------------------------

struct GenerateResult {
    bool ok = false;
    std::vector<synth::TestCase> cases;
    std::string markdown;
    Value openapi;
    Error error;

    explicit operator bool() const { return ok; }
};

GenerateResult generate_tests(const model::Catalogue& catalogue,
                              const CancelToken* cancel = nullptr);

// ----------------------------------------------------------------------------
// Публикация артефактов
// ----------------------------------------------------------------------------

struct Artifact {
    std::filesystem::path path;
    std::string content;
};

struct PublishResult {
    bool ok = false;
    std::vector<std::filesystem::path> written;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Записать все артефакты во временные файлы, затем переименовать.
/// Существующие targets на время замены отодвигаются в резервные копии:
/// при ошибке записи или переименования все targets остаются прежними.
PublishResult publish(const std::vector<Artifact>& artifacts,
                      const CancelToken* cancel = nullptr);

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

/// Имена артефактов в выходной директории
constexpr const char* CATALOGUE_FILE = "catalogue.json";
constexpr const char* TESTCASES_FILE = "testcases.json";
constexpr const char* MARKDOWN_FILE = "api_docs.md";
constexpr const char* OPENAPI_FILE = "openapi.json";

struct RunResult {
    bool ok = false;
    ParseResult parse;
    std::size_t test_cases = 0;
    std::vector<std::filesystem::path> written;
    Error error;

    explicit operator bool() const { return ok; }
};

RunResult run(const std::filesystem::path& capture, const std::filesystem::path& out_dir,
              const rule::RuleEngine& engine, const model::BuildOptions& options = {},
              const CancelToken* cancel = nullptr);

}  // namespace harvest::pipeline

#endif  // HARVEST_PIPELINE_HPP
