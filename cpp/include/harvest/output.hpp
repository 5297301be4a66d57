// ==============================================================================
// harvest/output.hpp - Пользовательский вывод и журналирование
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами: [+] info, [!] warn, [x] error, [*] debug, [~] trace
// - Цветной вывод (ANSI escape codes) только на TTY
// - JSON вывод (Value сериализуется через RapidJSON)
// - Таблицы для листингов правил и каталогов
// - Вывод в файл (--output)
//
// Библиотечные модули не печатают: они возвращают Diagnostics, которые
// приложение передаёт сюда.
//
// ==============================================================================

#ifndef HARVEST_OUTPUT_HPP
#define HARVEST_OUTPUT_HPP

#include <harvest/error.hpp>
#include <harvest/value.hpp>

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace harvest::output {

enum class Stream { Stdout, Stderr };

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;      // -q: подавить informational stderr
    int verbose = 0;         // -v: уровень подробности (0..2+)
    bool no_banner = false;  // --no-banner

    // Путь для вывода stdout (--output)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    /// Вывести предупреждения из диагностик. При verbose == 0 печатаются
    /// первые `limit` записей и итоговый счётчик.
    void diagnostics(const Diagnostics& items, std::size_t limit = 10);

    /// Записать зелёную строку в stdout
    void green_line(std::string_view message);

    /// Записать pretty JSON (с отступами) в stdout
    void write_json_pretty(const Value& value);

    void flush();

    const OutputConfig& config() const { return config_; }

    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);
    void write_colored(Stream s, std::string_view message, Color color);
    bool open_output_file();
    void close_output_file();
    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц (Unicode box-drawing)
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);
    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу через Writer в stdout
    void print(Writer& w) const;

    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    std::string format_line(char position) const;
    std::string format_row(const std::vector<std::string>& cells) const;
    std::vector<size_t> column_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// "[x] <message>\n"
std::string format_error(std::string_view message);

std::string ansi_color_code(Color color);
std::string ansi_reset_code();

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

/// Ширина строки в символах терминала (UTF-8 continuation bytes не считаются)
size_t display_width(std::string_view text);

}  // namespace harvest::output

#endif  // HARVEST_OUTPUT_HPP
