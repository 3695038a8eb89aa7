#ifndef AETHER_DIAGNOSTICS_H
#define AETHER_DIAGNOSTICS_H

#include <aether_common.h>
#include "aether_editor_types.h"
#include "aether_settings.h"
#include <string>
#include <string_view>
#include <vector>

namespace Aether {

namespace Code {

enum DiagnosticSeverity {
    SEVERITY_ERROR = 1,
    SEVERITY_WARNING,
    SEVERITY_INFORMATION,
    SEVERITY_HINT,
};

const char* severityName(DiagnosticSeverity severity) noexcept;

struct Diagnostic {
    Range range;
    DiagnosticSeverity severity = SEVERITY_ERROR;
    std::string code;
    std::string source;
    std::string message;
};

class DiagnosticEngine {
public:
    static std::vector<Diagnostic> analyze(const ParsedDocument& doc, std::string_view text, const Settings& settings) alloc_except;
    static std::vector<Diagnostic> checkNamingConvention(std::string_view text, const Settings& settings) alloc_except;
    static std::string errorCode(std::string_view message) alloc_except;
    static size_t estimateErrorLength(std::string_view message) noexcept;
    static std::string suggestUpperSnakeCase(std::string_view name) alloc_except;

    static constexpr std::string_view PARSER_SOURCE = "aether-parser";
    static constexpr std::string_view LINT_SOURCE = "aether-lint";
    static constexpr std::string_view NAMING_CODE = "W001";
};

}

}

#endif // AETHER_DIAGNOSTICS_H
