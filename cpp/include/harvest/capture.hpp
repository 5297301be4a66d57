// ==============================================================================
// harvest/capture.hpp - Разбор файлов захвата (HAR 1.2)
// ==============================================================================
//
// Назначение:
// - RawExchange: неизменяемая запись одного HTTP обмена
// - CaptureReader: потоковый (pull) разбор log.entries через RapidJSON
//   iterative SAX; в памяти одновременно только одна запись
// - Повреждённые записи пропускаются с диагностикой PartialParseWarning
// - Файл без log.entries, не JSON или нечитаемый: MalformedCapture
// - URL, query string, percent-decoding, base64
//
// Использование:
// @code
//   auto result = CaptureReader::open(path);
//   if (!result) {
//       writer.error(result.error.format());
//       return;
//   }
//   RawExchange ex;
//   while (result.reader->next(ex)) {
//       // обработка обмена
//   }
//   if (result.reader->last_error()) { ... }
// @endcode
//
// ==============================================================================

#ifndef HARVEST_CAPTURE_HPP
#define HARVEST_CAPTURE_HPP

#include <harvest/error.hpp>
#include <harvest/rule.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace harvest::io {

/// Упорядоченный список пар name/value (заголовки, query)
using HeaderList = std::vector<std::pair<std::string, std::string>>;

// ----------------------------------------------------------------------------
// URL
// ----------------------------------------------------------------------------

struct Url {
    std::string scheme;  // нижний регистр
    std::string host;    // без порта
    std::string port;    // пусто если не указан
    std::string path;    // "/" если пуст
    std::string query;   // без '?', не декодирован
};

/// Разобрать абсолютный URL (scheme://host[:port]/path?query#fragment)
std::optional<Url> parse_url(std::string_view text);

/// Декодировать %XX (и '+' как пробел для form-urlencoded).
/// Неверные последовательности остаются как есть.
std::string percent_decode(std::string_view text, bool plus_as_space);

/// "a=1&b=2" -> [(a,1),(b,2)] с декодированием
HeaderList parse_query(std::string_view query);

/// Стандартный base64 (пробельные символы игнорируются)
std::optional<std::string> base64_decode(std::string_view text);

/// ISO 8601 ("2024-05-02T10:00:00.5+02:00") -> миллисекунды от эпохи UTC.
/// Без зоны время считается UTC. nullopt если формат не распознан.
std::optional<std::int64_t> timestamp_millis(std::string_view text);

/// Миллисекунды от эпохи -> "YYYY-MM-DDTHH:MM:SS.mmmZ" (фиксированная ширина,
/// строковое сравнение совпадает с хронологическим)
std::string format_timestamp(std::int64_t millis);

/// Значение заголовка без учёта регистра имени (первое вхождение)
const std::string* find_header(const HeaderList& headers, std::string_view name);

// ----------------------------------------------------------------------------
// RawExchange
// ----------------------------------------------------------------------------

struct Body {
    std::string bytes;
    std::string content_type;  // заявленный mime type (может быть пуст)

    bool empty() const { return bytes.empty(); }
};

/// Один обмен запрос/ответ из файла захвата
struct RawExchange {
    std::uint64_t index = 0;  // позиция в log.entries
    std::string method;
    std::string url;
    std::string scheme;
    std::string host;
    std::string path;
    HeaderList query;
    HeaderList request_headers;
    HeaderList response_headers;
    int status = 0;
    Body request_body;
    Body response_body;
    std::string timestamp;  // startedDateTime, приведённый к UTC format_timestamp()
    double time_ms = 0.0;
};

/// Атрибуты для движка правил.
/// content_type: mime type ответа, если он есть, иначе Content-Type запроса
rule::ExchangeAttributes attributes(const RawExchange& exchange);

// ----------------------------------------------------------------------------
// CaptureReader
// ----------------------------------------------------------------------------

struct CaptureOpenResult {
    bool ok = false;
    std::unique_ptr<class CaptureReader> reader;
    Error error;

    explicit operator bool() const { return ok; }
};

class CaptureReader {
public:
    ~CaptureReader();

    CaptureReader(const CaptureReader&) = delete;
    CaptureReader& operator=(const CaptureReader&) = delete;

    /// Открыть файл и найти массив log.entries.
    /// Повторное открытие начинает чтение с начала.
    static CaptureOpenResult open(const std::filesystem::path& path);

    /// Следующий корректный обмен. false: записи закончились или
    /// поток повреждён (см. last_error)
    bool next(RawExchange& out);

    /// Ошибка структуры файла, обнаруженная во время чтения
    const std::optional<Error>& last_error() const;

    /// Пропущенные записи
    const Diagnostics& diagnostics() const;

    /// Сколько записей просмотрено (включая пропущенные)
    std::uint64_t entries_seen() const;

    const std::filesystem::path& path() const;

private:
    CaptureReader();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Разобрать одну запись HAR (объект из log.entries).
/// nullopt + сообщение в error если обязательные поля отсутствуют.
std::optional<RawExchange> exchange_from_entry(const Value& entry, std::uint64_t index,
                                               std::string& error);

}  // namespace harvest::io

#endif  // HARVEST_CAPTURE_HPP
