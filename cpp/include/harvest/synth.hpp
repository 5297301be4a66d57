// ==============================================================================
// harvest/synth.hpp - Синтез тест-кейсов и документации по каталогу
// ==============================================================================
//
// Назначение:
// - Один TestCase на ApiDefinition: запрос из записанных примеров,
//   ожидаемый ответ как набор утверждений
// - Markdown документация и OpenAPI 3.0 документ
//
// Все функции чистые: одинаковый каталог даёт побайтно одинаковый вывод.
//
// ==============================================================================

#ifndef HARVEST_SYNTH_HPP
#define HARVEST_SYNTH_HPP

#include <harvest/cancel.hpp>
#include <harvest/error.hpp>
#include <harvest/model.hpp>
#include <harvest/value.hpp>

#include <string>
#include <vector>

namespace harvest::synth {

enum class AssertionKind {
    StatusCode,     // статус ответа равен expected
    JsonSchema,     // тело ответа соответствует JSON Schema
    HeaderPresent,  // заголовок ответа присутствует
    ContentType     // media type ответа равен expected
};

/// "status_code", "json_schema", "header_present", "content_type"
std::string to_string(AssertionKind kind);

struct Assertion {
    AssertionKind kind = AssertionKind::StatusCode;
    std::string target;  // имя заголовка для HeaderPresent
    Value expected;      // статус, схема или media type
};

struct TestRequest {
    std::string method;
    std::string path;  // шаблон с подставленными примерами
    std::string url;
    Value headers = Value::make_object();
    Value query = Value::make_object();
    Value body;  // null если тела нет; текст для непрозрачного тела
};

struct ExpectedResponse {
    int status_code = 0;
    std::vector<Assertion> assertions;
};

struct TestCase {
    std::string id;       // "tc_get_users_id"
    std::string api_ref;  // "GET /users/{id}"
    std::string name;
    std::string description;
    std::string type = "functional";
    std::string status = "draft";
    TestRequest request;
    ExpectedResponse expected;
    std::vector<std::string> tags;
};

/// "GET", "/users/{id}" -> "get_users_id"
std::string slug(const std::string& method, const std::string& path_template);

/// Подставить примеры path-параметров в шаблон (плейсхолдер без примера остаётся)
std::string instantiate_path(const model::ApiDefinition& api);

/// Тест-кейс для одного определения
TestCase make_test_case(const model::ApiDefinition& api);

struct SynthResult {
    bool ok = false;
    std::vector<TestCase> cases;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Тест-кейсы в порядке каталога; id уникальны (суффикс _2, _3 при совпадении)
SynthResult synthesize(const std::vector<model::ApiDefinition>& apis,
                       const CancelToken* cancel = nullptr);

Value to_value(const TestCase& tc);

/// JSON массив тест-кейсов
Value testcases_to_json(const std::vector<TestCase>& cases);

// ----------------------------------------------------------------------------
// Документация
// ----------------------------------------------------------------------------

/// Markdown документ по каталогу
std::string render_markdown(const std::vector<model::ApiDefinition>& apis);

/// OpenAPI 3.0.0 документ по каталогу
Value render_openapi(const std::vector<model::ApiDefinition>& apis);

}  // namespace harvest::synth

#endif  // HARVEST_SYNTH_HPP
