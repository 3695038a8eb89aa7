#ifndef AETHER_ERROR_H
#define AETHER_ERROR_H

#include "aether_selection.h"
#include "aether_settings.h"
#include <string>
#include <string_view>
#include <vector>

namespace Aether {

namespace Code {

enum ErrorCode {
    UNEXPECTED_TOKEN,
    UNEXPECTED_END_OF_INPUT,
    INVALID_NUMBER,
    INVALID_EXPRESSION,
    INVALID_STATEMENT,
    INVALID_IDENTIFIER,
    NAMING_CONVENTION,
    NUM_ERROR_CODES
};

struct Error {
    Selection selection;
    ErrorCode code = NUM_ERROR_CODES;
    std::string message;

    Error() noexcept = default;
    Error(const Selection& selection, ErrorCode code, const std::string& message) alloc_except;
    size_t line() const noexcept;
    size_t column() const noexcept;
    bool operator==(const Error& other) const noexcept;
};

class ErrorStream {
private:
    std::vector<Error> errors;
    std::vector<Error> warnings;

public:
    void reset() noexcept;
    bool noErrors() const noexcept;
    void fail(const Selection& selection, ErrorCode code, const std::string& message) alloc_except;
    void warn(WarningLevel warning_level, const Selection& selection, ErrorCode code, const std::string& message) alloc_except;
    const std::vector<Error>& getErrors() const noexcept;
    const std::vector<Error>& getWarnings() const noexcept;
};

namespace Messages {
std::string unexpectedToken(const Marker& pos, std::string_view expected, std::string_view found) alloc_except;
std::string unexpectedEndOfInput(const Marker& pos) alloc_except;
std::string invalidNumber(std::string_view literal) alloc_except;
std::string invalidExpression(const Marker& pos, std::string_view reason) alloc_except;
std::string invalidStatement(const Marker& pos, std::string_view reason) alloc_except;
std::string invalidIdentifier(const Marker& pos, std::string_view name, std::string_view reason) alloc_except;
std::string namingConvention(std::string_view name, std::string_view suggestion) alloc_except;
}

}

}

#endif // AETHER_ERROR_H
