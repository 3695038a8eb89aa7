#include "aether_document.h"

#include "aether_parser.h"
#include "aether_scanner.h"
#include "aether_symbol_extract_pass.h"
#include <aether_logging.h>

namespace Aether {

ParsedDocument ParsedDocument::parse(std::string_view text) alloc_except {
    logger->debug("ParsedDocument::parse({} bytes)", text.size());

    ParsedDocument doc;
    doc.source = std::string(text);

    Code::Scanner scanner(doc.source);
    Code::ErrorStream error_stream;
    Code::Parser parser(scanner, error_stream);
    parser.parseAll();

    doc.parse_tree = std::move(parser.parse_tree);
    doc.parse_errors = error_stream.getErrors();

    if(doc.parse_errors.empty()){
        Code::SymbolExtractPass pass(doc.parse_tree, doc.symbol_table, doc.source);
        pass.extract();
        logger->debug("Parse succeeded: {} variables, {} functions",
                      doc.symbol_table.variables.size(), doc.symbol_table.functions.size());
    }else{
        const Code::Error& err = doc.parse_errors.front();
        logger->debug("Parse failed at {}:{}: {}", err.line(), err.column(), cStr(err.message));
    }

    return doc;
}

const std::string& ParsedDocument::text() const noexcept {
    return source;
}

const Code::ParseTree& ParsedDocument::ast() const noexcept {
    return parse_tree;
}

const Code::SymbolTable& ParsedDocument::symbols() const noexcept {
    return symbol_table;
}

const std::vector<Code::Error>& ParsedDocument::errors() const noexcept {
    return parse_errors;
}

bool ParsedDocument::succeeded() const noexcept {
    return parse_errors.empty();
}

}
