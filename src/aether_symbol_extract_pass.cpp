#include "aether_symbol_extract_pass.h"

#include <algorithm>
#include <cassert>

namespace Aether {

namespace Code {

SymbolExtractPass::SymbolExtractPass(const ParseTree& parse_tree, SymbolTable& symbol_table, std::string_view text) alloc_except
    : parse_tree(parse_tree), symbol_table(symbol_table), lines(splitLines(text)) {}

void SymbolExtractPass::extract() alloc_except {
    symbol_table.clear();
    if(parse_tree.root == NONE) return;

    resolveBlock(parse_tree.root);
}

void SymbolExtractPass::resolveStmt(ParseNode pn) alloc_except {
    switch (parse_tree.getOp(pn)) {
        case OP_SET: resolveVariable(pn, "Variable"); break;
        case OP_LAZY: resolveVariable(pn, "Lazy"); break;
        case OP_FUNC: resolveDefinition(pn, "Function"); break;
        case OP_GENERATOR: resolveDefinition(pn, "Generator"); break;
        case OP_SET_INDEX:
            resolveExpr(parse_tree.arg<1>(pn));
            resolveExpr(parse_tree.arg<2>(pn));
            break;
        case OP_WHILE:
            resolveExpr(parse_tree.arg<0>(pn));
            resolveBlock(parse_tree.body(pn));
            break;
        case OP_FOR:
            resolveExpr(parse_tree.arg<1>(pn));
            resolveBlock(parse_tree.body(pn));
            break;
        case OP_FOR_INDEXED:
            resolveExpr(parse_tree.arg<2>(pn));
            resolveBlock(parse_tree.body(pn));
            break;
        case OP_SWITCH: resolveSwitch(pn); break;
        case OP_RETURN:
        case OP_YIELD:
        case OP_THROW:
        case OP_EXPR_STMT:
            resolveExpr(parse_tree.child(pn));
            break;
        default: break;
    }
}

void SymbolExtractPass::resolveExpr(ParseNode pn) alloc_except {
    if(pn == NONE) return;

    switch (parse_tree.getOp(pn)) {
        case OP_LAMBDA: resolveBlock(parse_tree.body(pn)); break;
        case OP_IF: resolveConditional(pn); break;
        default:
            for(size_t i = 0; i < parse_tree.getNumArgs(pn); i++)
                resolveExpr(parse_tree.arg(pn, i));
    }
}

void SymbolExtractPass::resolveBlock(ParseNode pn) alloc_except {
    assert(parse_tree.getOp(pn) == OP_BLOCK);
    for(size_t i = 0; i < parse_tree.getNumArgs(pn); i++)
        resolveStmt(parse_tree.arg(pn, i));
}

void SymbolExtractPass::resolveVariable(ParseNode pn, std::string_view detail_prefix) alloc_except {
    ParseNode name = parse_tree.arg<0>(pn);
    const std::string& id = parse_tree.getString(name);

    symbol_table.addVariable(
        id,
        Range::fromSelection(parse_tree.getSelection(pn)),
        Range::fromSelection(parse_tree.getSelection(name)),
        std::string(detail_prefix) + ": " + id);
    symbol_table.variables.back().documentation = documentationAbove(lines, parse_tree.getLeft(pn).line);

    resolveExpr(parse_tree.arg<1>(pn));
}

void SymbolExtractPass::resolveDefinition(ParseNode pn, std::string_view detail_prefix) alloc_except {
    ParseNode name = parse_tree.arg<0>(pn);
    const std::string& id = parse_tree.getString(name);

    ParseNode param_list = parse_tree.paramList(pn);
    std::vector<std::string> params;
    std::string param_str;
    for(size_t i = 0; i < parse_tree.getNumArgs(param_list); i++){
        params.push_back(parse_tree.getString(parse_tree.arg(param_list, i)));
        if(i > 0) param_str += ", ";
        param_str += params.back();
    }

    symbol_table.addFunction(
        id,
        Range::fromSelection(parse_tree.getSelection(pn)),
        Range::fromSelection(parse_tree.getSelection(name)),
        params,
        std::string(detail_prefix) + ": " + id + '(' + param_str + ") { ... }");

    resolveBlock(parse_tree.body(pn));
}

void SymbolExtractPass::resolveSwitch(ParseNode pn) alloc_except {
    resolveExpr(parse_tree.arg<0>(pn));

    for(size_t i = 1; i < parse_tree.getNumArgs(pn); i++){
        ParseNode codepath = parse_tree.arg(pn, i);
        switch (parse_tree.getOp(codepath)) {
            case OP_CASE:
                resolveExpr(parse_tree.arg<0>(codepath));
                resolveBlock(parse_tree.arg<1>(codepath));
                break;
            case OP_DEFAULT: resolveBlock(parse_tree.child(codepath)); break;
            default: assert(false);
        }
    }
}

void SymbolExtractPass::resolveConditional(ParseNode pn) alloc_except {
    resolveExpr(parse_tree.arg<0>(pn));
    resolveBlock(parse_tree.arg<1>(pn));

    ParseNode elifs = parse_tree.arg<2>(pn);
    for(size_t i = 0; i < parse_tree.getNumArgs(elifs); i++){
        ParseNode elif = parse_tree.arg(elifs, i);
        resolveExpr(parse_tree.arg<0>(elif));
        resolveBlock(parse_tree.arg<1>(elif));
    }

    ParseNode else_block = parse_tree.arg<3>(pn);
    if(else_block != NONE) resolveBlock(else_block);
}

static std::string_view trim(std::string_view str) noexcept {
    const size_t first = str.find_first_not_of(" \t\r");
    if(first == std::string_view::npos) return std::string_view();
    const size_t last = str.find_last_not_of(" \t\r");

    return str.substr(first, last-first+1);
}

static bool startsWith(std::string_view str, std::string_view prefix) noexcept {
    return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}

static bool endsWith(std::string_view str, std::string_view suffix) noexcept {
    return str.size() >= suffix.size() && str.substr(str.size()-suffix.size()) == suffix;
}

//Strips the "* " decoration commonly used inside block comments
static std::string_view blockCommentLine(std::string_view line) noexcept {
    line = trim(line);
    if(startsWith(line, "*") && !startsWith(line, "*/")) line = trim(line.substr(1));

    return line;
}

std::vector<std::string_view> SymbolExtractPass::splitLines(std::string_view text) alloc_except {
    std::vector<std::string_view> split;

    size_t start = 0;
    for(;;){
        const size_t end = text.find('\n', start);
        if(end == std::string_view::npos){
            split.push_back(text.substr(start));
            return split;
        }
        split.push_back(text.substr(start, end-start));
        start = end+1;
    }
}

std::string SymbolExtractPass::documentationAbove(const std::vector<std::string_view>& lines, size_t line) alloc_except {
    //Collected bottom-up, reversed at the end
    std::vector<std::string_view> collected;

    size_t i = std::min(line > 0 ? line-1 : 0, lines.size());
    while(i > 0){
        const std::string_view text = trim(lines[--i]);

        if(text.empty()){
            continue;
        }else if(startsWith(text, "//")){
            collected.push_back(trim(text.substr(2)));
        }else if(startsWith(text, "/*") && endsWith(text, "*/") && text.size() >= 4){
            collected.push_back(trim(text.substr(2, text.size()-4)));
        }else if(endsWith(text, "*/") && text.find("/*") == std::string_view::npos){
            std::vector<std::string_view> block;
            block.push_back(blockCommentLine(text.substr(0, text.size()-2)));
            size_t j = i;
            bool found_open = false;
            while(j > 0){
                const std::string_view block_line = trim(lines[--j]);
                const size_t open = block_line.find("/*");
                if(open != std::string_view::npos){
                    std::string_view first_line = block_line.substr(open+2);
                    while(!first_line.empty() && first_line.front() == '*') first_line.remove_prefix(1);
                    block.push_back(trim(first_line));
                    found_open = true;
                    break;
                }
                block.push_back(blockCommentLine(block_line));
            }

            if(found_open)
                for(std::string_view block_line : block)
                    if(!block_line.empty()) collected.push_back(block_line);

            break;
        }else{
            break;
        }
    }

    std::string doc;
    for(auto it = collected.rbegin(); it != collected.rend(); it++){
        if(!doc.empty()) doc += '\n';
        doc += *it;
    }

    return doc;
}

}

}
