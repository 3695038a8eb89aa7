#include <aether_diagnostics.h>
#include <aether_document.h>
#include "report.h"

using namespace Aether;
using namespace Code;

static bool testDiagnostic(
        const Diagnostic& diagnostic, const Range& range, DiagnosticSeverity severity,
        std::string_view code, std::string_view source, int line){
    if(diagnostic.range == range && diagnostic.severity == severity && diagnostic.code == code && diagnostic.source == source)
        return true;

    std::cout << "Line " << line << ", diagnostic mismatch: "
              << diagnostic.range.start.line << ':' << diagnostic.range.start.character << '-'
              << diagnostic.range.end.line << ':' << diagnostic.range.end.character << ' '
              << severityName(diagnostic.severity) << '[' << diagnostic.code << "] "
              << diagnostic.source << ": " << diagnostic.message << std::endl;

    return false;
}

inline bool testDiagnostics(){
    bool passing = true;

    passing &= DiagnosticEngine::errorCode("Invalid identifier 'x' - must be UPPER_SNAKE_CASE") == "E001";
    passing &= DiagnosticEngine::errorCode("Invalid expression - Unexpected token in expression") == "E002";
    passing &= DiagnosticEngine::errorCode("Expected ')', found EOF") == "E003";
    passing &= DiagnosticEngine::errorCode("Invalid expression - nothing here") == "E004";
    passing &= DiagnosticEngine::errorCode("Unexpected end of file") == "E000";

    passing &= DiagnosticEngine::estimateErrorLength("Invalid identifier 'x'") == 10;
    passing &= DiagnosticEngine::estimateErrorLength("Expected ']'") == 5;
    passing &= DiagnosticEngine::estimateErrorLength("Name should use UPPER_SNAKE_CASE format") == 15;
    passing &= DiagnosticEngine::estimateErrorLength("Unexpected end of file") == 8;

    passing &= DiagnosticEngine::suggestUpperSnakeCase("myVar_2") == "MYVAR_2";

    if(!passing) std::cout << "Line " << __LINE__ << ", diagnostic classification mismatch" << std::endl;

    Settings settings;

    //Parse errors
    {
        const std::string text = "Set myVar 1";
        const ParsedDocument doc = ParsedDocument::parse(text);
        const std::vector<Diagnostic> diagnostics = DiagnosticEngine::analyze(doc, text, settings);
        if(diagnostics.size() == 1){
            passing &= testDiagnostic(diagnostics.front(), Range(Position(0, 4), Position(0, 14)),
                                      SEVERITY_ERROR, "E001", DiagnosticEngine::PARSER_SOURCE, __LINE__);
            passing &= diagnostics.front().message == doc.errors().front().message;
        }else{
            std::cout << "Line " << __LINE__ << ", expected a single diagnostic, got " << diagnostics.size() << std::endl;
            passing = false;
        }
    }

    {
        const std::string text = "Set X 1\nSet Y )";
        const ParsedDocument doc = ParsedDocument::parse(text);
        const std::vector<Diagnostic> diagnostics = DiagnosticEngine::analyze(doc, text, settings);
        passing &= diagnostics.size() == 1 &&
                   testDiagnostic(diagnostics.front(), Range(Position(1, 6), Position(1, 14)),
                                  SEVERITY_ERROR, "E002", DiagnosticEngine::PARSER_SOURCE, __LINE__);
    }

    //Clean code
    {
        const std::string text = "Set MY_VAR 1\nFunc ADD(a, b) { Return a + b }\nPRINTLN(ADD(MY_VAR, 2))";
        const ParsedDocument doc = ParsedDocument::parse(text);
        passing &= doc.succeeded() && DiagnosticEngine::analyze(doc, text, settings).empty();
    }

    //Non-ASCII uppercase parses, but the lint asks for ASCII
    {
        const std::string text = "Set ÄB 1";
        const ParsedDocument doc = ParsedDocument::parse(text);
        const std::vector<Diagnostic> diagnostics = DiagnosticEngine::analyze(doc, text, settings);
        passing &= doc.succeeded() && diagnostics.size() == 1 &&
                   testDiagnostic(diagnostics.front(), Range(Position(0, 4), Position(0, 6)),
                                  SEVERITY_WARNING, DiagnosticEngine::NAMING_CODE, DiagnosticEngine::LINT_SOURCE, __LINE__);
    }

    //Naming lint
    {
        std::vector<Diagnostic> lint = DiagnosticEngine::checkNamingConvention("Set myVar 1", settings);
        if(lint.size() == 1){
            passing &= testDiagnostic(lint.front(), Range(Position(0, 4), Position(0, 9)),
                                      SEVERITY_WARNING, DiagnosticEngine::NAMING_CODE, DiagnosticEngine::LINT_SOURCE, __LINE__);
            passing &= lint.front().message == "Name 'myVar' should use UPPER_SNAKE_CASE format\nSuggestion: MYVAR";
        }else{
            std::cout << "Line " << __LINE__ << ", expected one naming warning, got " << lint.size() << std::endl;
            passing = false;
        }

        lint = DiagnosticEngine::checkNamingConvention("Set X 1\nFunc addTwo(a) { Return a }\nLazy L (X)\nGenerator gen() { Yield 1 }", settings);
        passing &= lint.size() == 2 &&
                   testDiagnostic(lint.front(), Range(Position(1, 5), Position(1, 11)),
                                  SEVERITY_WARNING, DiagnosticEngine::NAMING_CODE, DiagnosticEngine::LINT_SOURCE, __LINE__);

        //Binders and uses are not declarations
        passing &= DiagnosticEngine::checkNamingConvention("PRINTLN(myVar)\nFor item In LIST { }", settings).empty();

        settings.setWarningLevel<WARN_NAMING_CONVENTION>(ERROR);
        lint = DiagnosticEngine::checkNamingConvention("Set myVar 1", settings);
        passing &= lint.size() == 1 && lint.front().severity == SEVERITY_ERROR;

        settings.setWarningLevel<WARN_NAMING_CONVENTION>(NO_WARNING);
        passing &= DiagnosticEngine::checkNamingConvention("Set myVar 1", settings).empty();
    }

    passing &= std::string(severityName(SEVERITY_WARNING)) == "warning";

    report("Diagnostics", passing);
    return passing;
}
