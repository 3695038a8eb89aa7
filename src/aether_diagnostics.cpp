#include "aether_diagnostics.h"

#include "aether_document.h"
#include "aether_error.h"
#include "aether_scanner.h"
#include "aether_unicode.h"
#include <aether_logging.h>

namespace Aether {

namespace Code {

const char* severityName(DiagnosticSeverity severity) noexcept {
    switch(severity){
        case SEVERITY_ERROR: return "error";
        case SEVERITY_WARNING: return "warning";
        case SEVERITY_INFORMATION: return "info";
        case SEVERITY_HINT: return "hint";
        default: return "unknown";
    }
}

static bool contains(std::string_view str, std::string_view sub) noexcept {
    return str.find(sub) != std::string_view::npos;
}

std::vector<Diagnostic> DiagnosticEngine::analyze(const ParsedDocument& doc, std::string_view text, const Settings& settings) alloc_except {
    std::vector<Diagnostic> diagnostics;

    for(const Error& err : doc.errors()){
        Diagnostic diagnostic;
        const Position start = Position::fromMarker(err.selection.left);
        diagnostic.range = Range(start, Position(start.line, start.character + estimateErrorLength(err.message)));
        diagnostic.severity = SEVERITY_ERROR;
        diagnostic.code = errorCode(err.message);
        diagnostic.source = PARSER_SOURCE;
        diagnostic.message = err.message;
        diagnostics.push_back(std::move(diagnostic));
    }

    //Lint only code which parses
    if(doc.errors().empty()){
        std::vector<Diagnostic> lint = checkNamingConvention(text, settings);
        diagnostics.insert(diagnostics.end(), lint.begin(), lint.end());
    }

    logger->debug("DiagnosticEngine::analyze produced {} diagnostics", diagnostics.size());

    return diagnostics;
}

//The lint holds names to ASCII, stricter than the parser which accepts any uppercase letter
static bool isAsciiUpperSnakeCase(std::string_view name) noexcept {
    if(name.empty() || isNumeric(name.front())) return false;
    for(char ch : name)
        if(!isAsciiUpper(static_cast<unsigned char>(ch)) && !isNumeric(static_cast<unsigned char>(ch)) && ch != '_') return false;

    return true;
}

std::vector<Diagnostic> DiagnosticEngine::checkNamingConvention(std::string_view text, const Settings& settings) alloc_except {
    ErrorStream error_stream;
    const WarningLevel level = settings.warningLevel<WARN_NAMING_CONVENTION>();

    Scanner scanner(text);
    AetherTokenType prev_type = NEWLINE;
    for(Token token = scanner.next(); token.type != ENDOFFILE; token = scanner.next()){
        const bool is_definition = prev_type == SET || prev_type == FUNC || prev_type == GENERATOR || prev_type == LAZY;
        if(token.type == IDENTIFIER && is_definition && !isAsciiUpperSnakeCase(token.text))
            error_stream.warn(level, token.sel, NAMING_CONVENTION,
                              Messages::namingConvention(token.text, suggestUpperSnakeCase(token.text)));

        prev_type = token.type;
    }

    std::vector<Diagnostic> diagnostics;
    auto append = [&diagnostics](const Error& err, DiagnosticSeverity severity){
        Diagnostic diagnostic;
        diagnostic.range = Range::fromSelection(err.selection);
        diagnostic.severity = severity;
        diagnostic.code = NAMING_CODE;
        diagnostic.source = LINT_SOURCE;
        diagnostic.message = err.message;
        diagnostics.push_back(std::move(diagnostic));
    };
    for(const Error& err : error_stream.getErrors()) append(err, SEVERITY_ERROR);
    for(const Error& err : error_stream.getWarnings()) append(err, SEVERITY_WARNING);

    return diagnostics;
}

std::string DiagnosticEngine::errorCode(std::string_view message) alloc_except {
    if(contains(message, "UPPER_SNAKE_CASE")) return "E001";
    else if(contains(message, "Unexpected token")) return "E002";
    else if(contains(message, "Expected")) return "E003";
    else if(contains(message, "Invalid expression")) return "E004";
    else return "E000";
}

size_t DiagnosticEngine::estimateErrorLength(std::string_view message) noexcept {
    if(contains(message, "identifier")) return 10;
    else if(contains(message, "Expected")) return 5;
    else if(contains(message, "UPPER_SNAKE_CASE")) return 15;
    else return 8;
}

std::string DiagnosticEngine::suggestUpperSnakeCase(std::string_view name) alloc_except {
    std::string suggestion(name);
    for(char& ch : suggestion)
        if(isAsciiLower(static_cast<unsigned char>(ch))) ch = static_cast<char>(ch - 'a' + 'A');

    return suggestion;
}

}

}
