// ==============================================================================
// harvest/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Временные файлы и атомарная публикация артефактов
// - Переменные окружения
//
// Вся платформенная специфика изолирована здесь.
//
// ==============================================================================

#ifndef HARVEST_PLATFORM_HPP
#define HARVEST_PLATFORM_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace harvest::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Построить path из UTF-8 строки (argv, YAML, JSON)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути для вывода
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

/// Записать content во временный файл рядом с target (директория создаётся).
/// @return путь временного файла или nullopt при ошибке
std::optional<std::filesystem::path> stage_file(const std::filesystem::path& target,
                                               std::string_view content,
                                               std::string* error = nullptr);

/// Переименовать подготовленный файл в target (при ошибке он удаляется)
bool commit_staged(const std::filesystem::path& staged, const std::filesystem::path& target,
                   std::string* error = nullptr);

void discard_staged(const std::filesystem::path& staged);

/// Переименовать существующий обычный файл target в резервную копию рядом с ним.
/// @return путь копии; пустой путь если target не существует или не файл;
///         nullopt при ошибке
std::optional<std::filesystem::path> move_aside(const std::filesystem::path& target,
                                                std::string* error = nullptr);

/// Вернуть резервную копию на место target
bool restore_aside(const std::filesystem::path& backup, const std::filesystem::path& target,
                   std::string* error = nullptr);

/// Записать содержимое во временный файл рядом с target и переименовать его в target.
/// Читатель target видит либо старое, либо полностью новое содержимое.
/// @return false при ошибке ввода-вывода (target не тронут)
bool write_file_atomic(const std::filesystem::path& target, std::string_view content,
                       std::string* error = nullptr);

/// Прочитать файл целиком
std::optional<std::string> read_file(const std::filesystem::path& path);

/// Значение переменной окружения (nullopt если не задана или пуста)
std::optional<std::string> env_var(const char* name);

}  // namespace harvest::platform

#endif  // HARVEST_PLATFORM_HPP
