#include "aether_error.h"

#include <spdlog/fmt/fmt.h>

namespace Aether {

namespace Code {

Error::Error(const Selection& selection, ErrorCode code, const std::string& message) alloc_except
    : selection(selection), code(code), message(message) {}

size_t Error::line() const noexcept {
    return selection.left.line;
}

size_t Error::column() const noexcept {
    return selection.left.column;
}

bool Error::operator==(const Error& other) const noexcept {
    return selection == other.selection && code == other.code && message == other.message;
}

void ErrorStream::reset() noexcept {
    errors.clear();
    warnings.clear();
}

bool ErrorStream::noErrors() const noexcept {
    return errors.empty();
}

void ErrorStream::fail(const Selection& selection, ErrorCode code, const std::string& message) alloc_except {
    errors.push_back(Error(selection, code, message));
}

void ErrorStream::warn(WarningLevel warning_level, const Selection& selection, ErrorCode code, const std::string& message) alloc_except {
    assert(warning_level < NUM_WARNING_LEVELS);

    switch (warning_level) {
        case ERROR: errors.push_back(Error(selection, code, message)); break;
        case WARN: warnings.push_back(Error(selection, code, message)); break;
        default: break;
    }
}

const std::vector<Error>& ErrorStream::getErrors() const noexcept {
    return errors;
}

const std::vector<Error>& ErrorStream::getWarnings() const noexcept {
    return warnings;
}

namespace Messages {

std::string unexpectedToken(const Marker& pos, std::string_view expected, std::string_view found) alloc_except {
    return fmt::format("Parse error at line {}, column {}: Expected {}, found {}", pos.line, pos.column, expected, found);
}

std::string unexpectedEndOfInput(const Marker& pos) alloc_except {
    return fmt::format("Parse error at line {}, column {}: Unexpected end of file", pos.line, pos.column);
}

std::string invalidNumber(std::string_view literal) alloc_except {
    return fmt::format("Parse error: Invalid number: {}", literal);
}

std::string invalidExpression(const Marker& pos, std::string_view reason) alloc_except {
    return fmt::format("Parse error at line {}, column {}: Invalid expression - {}", pos.line, pos.column, reason);
}

std::string invalidStatement(const Marker& pos, std::string_view reason) alloc_except {
    return fmt::format("Parse error at line {}, column {}: Invalid statement - {}", pos.line, pos.column, reason);
}

std::string invalidIdentifier(const Marker& pos, std::string_view name, std::string_view reason) alloc_except {
    return fmt::format("Parse error at line {}, column {}: Invalid identifier '{}' - {}", pos.line, pos.column, name, reason);
}

std::string namingConvention(std::string_view name, std::string_view suggestion) alloc_except {
    return fmt::format("Name '{}' should use UPPER_SNAKE_CASE format\nSuggestion: {}", name, suggestion);
}

}

}

}
