// ==============================================================================
// harvest/error.hpp - Таксономия ошибок и диагностика
// ==============================================================================
//
// Назначение:
// - ErrorKind: структурные ошибки (прерывают операцию) и предупреждения
// - Error: ошибка операции с путём/идентификатором
// - Diagnostic: нефатальная проблема, прикреплённая к результату
//
// Структурные ошибки (InvalidPattern, NotFound, MalformedCapture, InvalidRule,
// IoError, Cancelled) возвращаются в поле error результата. Предупреждения
// (SchemaConflict, PartialParseWarning) накапливаются в diagnostics.
//
// ==============================================================================

#ifndef HARVEST_ERROR_HPP
#define HARVEST_ERROR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace harvest {

enum class ErrorKind {
    None,
    InvalidPattern,       // паттерн правила не компилируется
    NotFound,             // неизвестный id правила/хоста/пресета
    MalformedCapture,     // файл захвата не читается на уровне контейнера
    SchemaConflict,       // несовместимые типы поля (расширены до union)
    PartialParseWarning,  // часть записей пропущена
    InvalidRule,          // неверный тип, хост, дубликат id, версия пресета
    IoError,              // ошибка чтения/записи хранилища или артефакта
    Cancelled             // задание отменено
};

/// Строковое имя вида ошибки ("InvalidPattern", ...)
const char* error_kind_to_string(ErrorKind kind);

/// Является ли вид ошибки предупреждением (не прерывает операцию)
bool is_warning(ErrorKind kind);

/// Ошибка операции
struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::string subject;  // id правила, путь к файлу, ...

    /// Формат: "<Kind>: <message> [<subject>]"
    std::string format() const;

    static Error make(ErrorKind kind, std::string message, std::string subject = {}) {
        return Error{kind, std::move(message), std::move(subject)};
    }
};

/// Нефатальная проблема при разборе/моделировании
struct Diagnostic {
    ErrorKind kind = ErrorKind::PartialParseWarning;
    std::string message;
    std::optional<std::uint64_t> entry;  // индекс записи в файле захвата
    std::string location;                // "GET /users/{id}" или путь к полю

    std::string format() const;
};

using Diagnostics = std::vector<Diagnostic>;

/// Есть ли среди диагностик предупреждения (результат помечается partial)
bool has_warnings(const Diagnostics& diagnostics);

}  // namespace harvest

#endif  // HARVEST_ERROR_HPP
