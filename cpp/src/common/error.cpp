// ==============================================================================
// error.cpp - Таксономия ошибок и диагностика
// ==============================================================================

#include <algorithm>
#include <harvest/error.hpp>
#include <sstream>

namespace harvest {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::InvalidPattern:
        return "InvalidPattern";
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::MalformedCapture:
        return "MalformedCapture";
    case ErrorKind::SchemaConflict:
        return "SchemaConflict";
    case ErrorKind::PartialParseWarning:
        return "PartialParseWarning";
    case ErrorKind::InvalidRule:
        return "InvalidRule";
    case ErrorKind::IoError:
        return "IoError";
    case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

bool is_warning(ErrorKind kind) {
    return kind == ErrorKind::SchemaConflict || kind == ErrorKind::PartialParseWarning;
}

std::string Error::format() const {
    std::ostringstream oss;
    oss << error_kind_to_string(kind) << ": " << message;
    if (!subject.empty()) {
        oss << " [" << subject << "]";
    }
    return oss.str();
}

std::string Diagnostic::format() const {
    std::ostringstream oss;
    oss << error_kind_to_string(kind);
    if (entry.has_value()) {
        oss << " (entry " << *entry << ")";
    }
    if (!location.empty()) {
        oss << " " << location;
    }
    oss << ": " << message;
    return oss.str();
}

bool has_warnings(const Diagnostics& diagnostics) {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
                       [](const Diagnostic& d) { return is_warning(d.kind); });
}

}  // namespace harvest
