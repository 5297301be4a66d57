// ==============================================================================
// pipeline.cpp - Пакетные задания: parse, generate, run
// ==============================================================================

#include <harvest/pipeline.hpp>

#include <harvest/platform.hpp>

namespace harvest::pipeline {

ParseResult parse_capture(const std::filesystem::path& capture, const rule::RuleEngine& engine,
                          const model::BuildOptions& options, const CancelToken* cancel) {
    ParseResult result;

    auto opened = io::CaptureReader::open(capture);
    if (!opened) {
        result.error = opened.error;
        return result;
    }
    io::CaptureReader& reader = *opened.reader;

    // Один снимок на всё задание: reload во время разбора его не меняет
    const auto snapshot = engine.snapshot();
    model::ModelBuilder builder(options);

    io::RawExchange exchange;
    while (reader.next(exchange)) {
        if (is_cancelled(cancel)) {
            result.error = Error::make(ErrorKind::Cancelled, "capture parse cancelled",
                                       platform::path_to_utf8(capture));
            return result;
        }
        const rule::Verdict verdict = rule::evaluate(*snapshot, io::attributes(exchange));
        if (verdict.included) {
            ++result.stats.accepted;
            builder.add(exchange);
        } else {
            ++result.stats.excluded;
            result.stats.exclusions[verdict.rule_id.empty() ? rule::to_string(verdict.reason)
                                                            : verdict.rule_id] += 1;
        }
    }
    if (reader.last_error()) {
        result.error = *reader.last_error();
        return result;
    }

    result.stats.entries = reader.entries_seen();
    result.stats.skipped = reader.diagnostics().size();

    auto built = builder.finish(cancel);
    if (!built) {
        result.error = built.error;
        return result;
    }

    result.catalogue = std::move(built.catalogue);
    result.diagnostics = reader.diagnostics();
    result.diagnostics.insert(result.diagnostics.end(), result.catalogue.diagnostics.begin(),
                              result.catalogue.diagnostics.end());
    result.partial = has_warnings(result.diagnostics);
    result.ok = true;
    return result;
}

GenerateResult generate_tests(const model::Catalogue& catalogue, const CancelToken* cancel) {
    GenerateResult result;
    auto synthesized = synth::synthesize(catalogue.apis, cancel);
    if (!synthesized) {
        result.error = synthesized.error;
        return result;
    }
    result.cases = std::move(synthesized.cases);
    result.markdown = synth::render_markdown(catalogue.apis);
    result.openapi = synth::render_openapi(catalogue.apis);
    result.ok = true;
    return result;
}

PublishResult publish(const std::vector<Artifact>& artifacts, const CancelToken* cancel) {
    PublishResult result;
    std::vector<std::filesystem::path> staged;

    auto rollback = [&staged]() {
        for (const auto& tmp : staged) {
            platform::discard_staged(tmp);
        }
    };

    for (const auto& artifact : artifacts) {
        if (is_cancelled(cancel)) {
            rollback();
            result.error = Error::make(ErrorKind::Cancelled, "publication cancelled");
            return result;
        }
        std::string error;
        auto tmp = platform::stage_file(artifact.path, artifact.content, &error);
        if (!tmp) {
            rollback();
            result.error =
                Error::make(ErrorKind::IoError, error, platform::path_to_utf8(artifact.path));
            return result;
        }
        staged.push_back(*tmp);
    }

    // Все файлы подготовлены. Существующие targets отодвигаются в резервные
    // копии, при ошибке уже заменённые файлы возвращаются на место.
    std::vector<std::filesystem::path> backups;
    auto restore = [&](std::size_t replaced, std::string& error) {
        for (std::size_t j = replaced; j-- > 0;) {
            std::error_code ec;
            std::filesystem::remove(artifacts[j].path, ec);
            std::string restore_error;
            if (!backups[j].empty() &&
                !platform::restore_aside(backups[j], artifacts[j].path, &restore_error)) {
                error += "; " + restore_error;
            }
        }
        for (std::size_t j = replaced; j < staged.size(); ++j) {
            platform::discard_staged(staged[j]);
        }
    };

    for (std::size_t i = 0; i < artifacts.size(); ++i) {
        std::string error;
        auto backup = platform::move_aside(artifacts[i].path, &error);
        if (backup) {
            backups.push_back(*backup);
            if (platform::commit_staged(staged[i], artifacts[i].path, &error)) {
                continue;
            }
            // target i не заменён: возвращается только его копия
            std::string restore_error;
            if (!backups[i].empty() &&
                !platform::restore_aside(backups[i], artifacts[i].path, &restore_error)) {
                error += "; " + restore_error;
            }
            restore(i, error);
            result.error =
                Error::make(ErrorKind::IoError, error, platform::path_to_utf8(artifacts[i].path));
            return result;
        }
        restore(i, error);
        result.error =
            Error::make(ErrorKind::IoError, error, platform::path_to_utf8(artifacts[i].path));
        return result;
    }

    for (const auto& backup : backups) {
        if (!backup.empty()) {
            platform::discard_staged(backup);
        }
    }
    for (const auto& artifact : artifacts) {
        result.written.push_back(artifact.path);
    }
    result.ok = true;
    return result;
}

RunResult run(const std::filesystem::path& capture, const std::filesystem::path& out_dir,
              const rule::RuleEngine& engine, const model::BuildOptions& options,
              const CancelToken* cancel) {
    RunResult result;

    result.parse = parse_capture(capture, engine, options, cancel);
    if (!result.parse) {
        result.error = result.parse.error;
        return result;
    }

    auto generated = generate_tests(result.parse.catalogue, cancel);
    if (!generated) {
        result.error = generated.error;
        return result;
    }
    result.test_cases = generated.cases.size();

    std::vector<Artifact> artifacts;
    artifacts.push_back({out_dir / CATALOGUE_FILE,
                         model::catalogue_to_json(result.parse.catalogue).to_pretty_json_string()});
    artifacts.push_back(
        {out_dir / TESTCASES_FILE, synth::testcases_to_json(generated.cases).to_pretty_json_string()});
    artifacts.push_back({out_dir / MARKDOWN_FILE, generated.markdown});
    artifacts.push_back({out_dir / OPENAPI_FILE, generated.openapi.to_pretty_json_string()});

    auto published = publish(artifacts, cancel);
    if (!published) {
        result.error = published.error;
        return result;
    }
    result.written = std::move(published.written);
    result.ok = true;
    return result;
}

}  // namespace harvest::pipeline
