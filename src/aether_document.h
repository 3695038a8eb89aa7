#ifndef AETHER_DOCUMENT_H
#define AETHER_DOCUMENT_H

#include <aether_common.h>
#include "aether_error.h"
#include "aether_parse_tree.h"
#include "aether_symbol_table.h"
#include <string>
#include <string_view>
#include <vector>

namespace Aether {

//The result of parsing a full text; never modified after parse() returns
class ParsedDocument {
public:
    static ParsedDocument parse(std::string_view text) alloc_except;

    const std::string& text() const noexcept;
    const Code::ParseTree& ast() const noexcept;
    const Code::SymbolTable& symbols() const noexcept;
    const std::vector<Code::Error>& errors() const noexcept;
    bool succeeded() const noexcept;

private:
    ParsedDocument() noexcept = default;

    std::string source;
    Code::ParseTree parse_tree;
    Code::SymbolTable symbol_table;
    std::vector<Code::Error> parse_errors;
};

}

#endif // AETHER_DOCUMENT_H
