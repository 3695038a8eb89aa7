#ifndef AETHER_SYMBOL_EXTRACT_PASS_H
#define AETHER_SYMBOL_EXTRACT_PASS_H

#include <aether_common.h>
#include "aether_parse_tree.h"
#include "aether_symbol_table.h"
#include <string>
#include <string_view>
#include <vector>

namespace Aether {

namespace Code {

//Indexes every declaration of a successfully parsed tree, including those in nested bodies
class SymbolExtractPass {
public:
    SymbolExtractPass(const ParseTree& parse_tree, SymbolTable& symbol_table, std::string_view text) alloc_except;
    void extract() alloc_except;

    static std::string documentationAbove(const std::vector<std::string_view>& lines, size_t line) alloc_except;
    static std::vector<std::string_view> splitLines(std::string_view text) alloc_except;

private:
    const ParseTree& parse_tree;
    SymbolTable& symbol_table;
    std::vector<std::string_view> lines;

    void resolveStmt(ParseNode pn) alloc_except;
    void resolveExpr(ParseNode pn) alloc_except;
    void resolveBlock(ParseNode pn) alloc_except;
    void resolveVariable(ParseNode pn, std::string_view detail_prefix) alloc_except;
    void resolveDefinition(ParseNode pn, std::string_view detail_prefix) alloc_except;
    void resolveSwitch(ParseNode pn) alloc_except;
    void resolveConditional(ParseNode pn) alloc_except;
};

}

}

#endif // AETHER_SYMBOL_EXTRACT_PASS_H
