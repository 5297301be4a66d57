// ==============================================================================
// harvest/model.hpp - Построение каталога ApiDefinition
// ==============================================================================
//
// Назначение:
// - Шаблонизация путей: /users/42 -> /users/{id}
// - Группировка обменов по (method, pathTemplate) в порядке первого появления
// - Объединение схем заголовков, query, path-параметров и тел
// - Слияние каталогов (эквивалентно построению по объединённому входу)
// - JSON представление каталога без потерь
//
// Использование:
// @code
//   ModelBuilder builder(options);
//   while (reader->next(ex)) {
//       if (engine.evaluate(io::attributes(ex))) builder.add(ex);
//   }
//   auto result = builder.finish(&cancel);
// @endcode
//
// ==============================================================================

#ifndef HARVEST_MODEL_HPP
#define HARVEST_MODEL_HPP

#include <harvest/cancel.hpp>
#include <harvest/capture.hpp>
#include <harvest/error.hpp>
#include <harvest/schema.hpp>
#include <harvest/value.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace harvest::model {

/// Счётчики наблюдений по строковому ключу
using Counts = std::map<std::string, std::uint64_t>;

/// Самое частое значение (при равенстве наименьшее); пусто если counts пуст
std::string most_frequent(const Counts& counts);

struct BuildOptions {
    /// Сколько различных литералов в позиции делают её параметром (0 отключает)
    std::size_t variance_threshold = 3;

    /// Имя плейсхолдера: {id}, {id2}, ...
    std::string placeholder = "id";
};

// ----------------------------------------------------------------------------
// ApiDefinition
// ----------------------------------------------------------------------------

struct RequestModel {
    Schema headers;      // object: имя в нижнем регистре -> string
    Schema query;        // object: имя -> скаляр
    Schema path_params;  // object: плейсхолдер -> скаляр
    Schema body;
    Counts content_types;
};

struct ResponseModel {
    int status_code = 0;  // самый частый статус (при равенстве наименьший)
    std::map<int, std::uint64_t> statuses;
    Schema headers;
    Schema body;
    Counts content_types;
};

struct ApiDefinition {
    std::string method;
    std::string path_template;
    std::string description;
    std::uint64_t sample_count = 0;
    Counts hosts;
    Counts schemes;
    RequestModel request;
    ResponseModel response;

    /// "GET /users/{id}"
    std::string key() const;

    std::string host() const { return most_frequent(hosts); }
    std::string scheme() const { return most_frequent(schemes); }
};

/// "Auto-generated from N captured exchange(s)"
std::string describe(std::uint64_t sample_count);

/// Слить b в a (та же группа). Конфликты схем -> diagnostics
void merge_into(ApiDefinition& a, const ApiDefinition& b, Diagnostics* diagnostics = nullptr);

/// Обмены с одинаковым (method, host, путь после замены id-сегментов)
/// до применения правила вариативности
struct PathGroup {
    std::string method;
    std::string host;
    std::vector<std::string> segments;
    std::vector<bool> variable;
    std::map<std::size_t, Schema> params;  // позиция -> схема значений
    Example latest;
    ApiDefinition api;

    /// Ключ группировки: method, host и сегменты с маркером на месте id
    std::string key() const;
};

struct Catalogue {
    std::vector<ApiDefinition> apis;
    Counts host_stats;    // принятые обмены по host
    Counts method_stats;  // принятые обмены по методу
    std::uint64_t exchanges = 0;
    Diagnostics diagnostics;

    // Состояние построения для merge_catalogues: группы до шаблонизации,
    // диагностики add() и параметры. Не сериализуется, поэтому у каталога
    // из JSON groups пуст.
    std::vector<PathGroup> groups;
    Diagnostics group_diagnostics;
    BuildOptions options;

    const ApiDefinition* find(const std::string& key) const;
};

/// Слить два каталога. Если оба несут группы, правило вариативности
/// применяется заново к их объединению, и результат совпадает с построением
/// по объединённому входу. Иначе группы сопоставляются по (method, pathTemplate),
/// новые добавляются в конец.
Catalogue merge_catalogues(const Catalogue& a, const Catalogue& b);

// ----------------------------------------------------------------------------
// Пути, значения и тела
// ----------------------------------------------------------------------------

/// "/a/b" -> ["a", "b"]; "/" -> []
std::vector<std::string> split_path(std::string_view path);

/// Сегмент похож на идентификатор: число, UUID, длинный hex или токен
bool is_id_segment(std::string_view segment);

/// Имя плейсхолдера по номеру: 1 -> "id", 2 -> "id2"
std::string placeholder_name(const std::string& base, std::size_t number);

/// Скаляр из текста: boolean, integer, number, иначе string
Value scalar_from_text(const std::string& text);

/// Заголовок транспортного уровня (не попадает в модель)
bool is_ignored_header(std::string_view lower_name);

/// "Application/JSON; charset=utf-8" -> "application/json"
std::string media_type(std::string_view content_type);

/// XML документ -> {root: {...}} (nullopt если не разбирается)
std::optional<Value> xml_to_value(std::string_view text);

/// multipart/form-data -> {name: value}; файловые части дают имя файла.
/// Тело, восстановленное из postData.params, читается как name=value&...
std::optional<Value> multipart_to_value(const io::Body& body);

/// Схема тела: JSON, form-urlencoded, multipart, XML, иначе opaque с текстом
Schema body_schema(const io::Body& body, const std::string& timestamp, std::uint64_t ordinal);

// ----------------------------------------------------------------------------
// ModelBuilder
// ----------------------------------------------------------------------------

struct BuildResult {
    bool ok = false;
    Catalogue catalogue;
    Error error;

    explicit operator bool() const { return ok; }
};

class ModelBuilder {
public:
    explicit ModelBuilder(BuildOptions options = {});

    /// Добавить принятый обмен
    void add(const io::RawExchange& exchange);

    /// Добавить группы и счётчики ранее построенного каталога
    void add_catalogue(const Catalogue& catalogue);

    /// Шаблонизация, группировка и выдача каталога. Cancelled при отмене.
    BuildResult finish(const CancelToken* cancel = nullptr);

    std::uint64_t exchange_count() const { return exchanges_; }

private:
    void absorb(const PathGroup& group);
    void apply_variance();

    BuildOptions options_;
    std::vector<PathGroup> groups_;
    std::unordered_map<std::string, std::size_t> index_;
    Counts host_stats_;
    Counts method_stats_;
    std::uint64_t exchanges_ = 0;
    Diagnostics diagnostics_;
};

using IncludePredicate = std::function<bool(const io::RawExchange&)>;

/// Построить каталог по обменам, прошедшим предикат
BuildResult build(const std::vector<io::RawExchange>& exchanges, const IncludePredicate& include,
                  const BuildOptions& options = {}, const CancelToken* cancel = nullptr);

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

Value api_to_value(const ApiDefinition& api);

/// JSON массив ApiDefinition
Value catalogue_to_json(const Catalogue& catalogue);

struct CatalogueResult {
    bool ok = false;
    Catalogue catalogue;
    Error error;

    explicit operator bool() const { return ok; }
};

CatalogueResult catalogue_from_json(const Value& json);

/// Прочитать каталог из файла (IoError если файл не читается или не является каталогом)
CatalogueResult load_catalogue(const std::filesystem::path& path);

}  // namespace harvest::model

#endif  // HARVEST_MODEL_HPP
