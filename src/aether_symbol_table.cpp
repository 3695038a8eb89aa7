#include "aether_symbol_table.h"

#include "aether_builtins.h"
#include "aether_scanner.h"
#include "aether_unicode.h"
#include <aether_logging.h>
#include <algorithm>

namespace Aether {

namespace Code {

void SymbolTable::clear() noexcept {
    variables.clear();
    functions.clear();
}

bool SymbolTable::empty() const noexcept {
    return variables.empty() && functions.empty();
}

size_t SymbolTable::size() const noexcept {
    return variables.size() + functions.size();
}

void SymbolTable::addVariable(const std::string& name, const Range& range, const Range& name_range, const std::string& detail) alloc_except {
    SymbolInfo info;
    info.name = name;
    info.kind = SYMBOL_VARIABLE;
    info.range = range;
    info.selection_range = name_range;
    info.detail = detail;
    variables.push_back(std::move(info));
}

void SymbolTable::addFunction(
        const std::string& name, const Range& range, const Range& name_range,
        const std::vector<std::string>& params, const std::string& detail) alloc_except {
    std::string param_str;
    for(const std::string& param : params){
        if(!param_str.empty()) param_str += ", ";
        param_str += param;
    }

    SymbolInfo info;
    info.name = name;
    info.kind = SYMBOL_FUNCTION;
    info.range = range;
    info.selection_range = name_range;
    info.documentation = "Function: " + name + '(' + param_str + ')';
    info.detail = detail;
    functions.push_back(std::move(info));
}

const SymbolInfo* SymbolTable::find(std::string_view name) const noexcept {
    for(const SymbolInfo& var : variables)
        if(var.name == name) return &var;
    for(const SymbolInfo& fn : functions)
        if(fn.name == name) return &fn;

    return nullptr;
}

const SymbolInfo* SymbolTable::findAtPosition(const Position& pos) const noexcept {
    //A cursor on a name beats a cursor somewhere inside a declaration
    for(const SymbolInfo& var : variables)
        if(var.selection_range.contains(pos)) return &var;
    for(const SymbolInfo& fn : functions)
        if(fn.selection_range.contains(pos)) return &fn;

    const SymbolInfo* innermost = nullptr;
    auto consider = [&innermost, &pos](const SymbolInfo& info){
        if(info.range.contains(pos) && (innermost == nullptr || innermost->range.containsRange(info.range)))
            innermost = &info;
    };
    for(const SymbolInfo& var : variables) consider(var);
    for(const SymbolInfo& fn : functions) consider(fn);

    return innermost;
}

std::optional<Location> SymbolTable::findDefinition(const Position& pos, std::string_view uri) const alloc_except {
    const SymbolInfo* symbol = findAtPosition(pos);
    if(symbol == nullptr) return std::nullopt;

    logger->debug("Definition of {} at {}:{}", cStr(symbol->name), symbol->range.start.line, symbol->range.start.character);

    return Location{std::string(uri), symbol->range};
}

std::vector<DocumentSymbol> SymbolTable::toDocumentSymbols(std::string_view uri) const alloc_except {
    std::vector<DocumentSymbol> symbols;
    symbols.reserve(size());

    for(const SymbolInfo& var : variables)
        symbols.push_back(DocumentSymbol{var.name, var.kind, Location{std::string(uri), var.range}});
    for(const SymbolInfo& fn : functions)
        symbols.push_back(DocumentSymbol{fn.name, fn.kind, Location{std::string(uri), fn.range}});

    return symbols;
}

std::optional<WorkspaceEdit> SymbolTable::renameSymbol(const Position&, std::string_view, std::string_view) const noexcept {
    //EVENTUALLY: collect usages during extraction so a rename can produce edits
    return std::nullopt;
}

static bool startsWith(std::string_view candidate, std::string_view typed) noexcept {
    return candidate.size() >= typed.size() && candidate.substr(0, typed.size()) == typed;
}

std::vector<std::string> SymbolTable::getSuggestions(std::string_view typed) const alloc_except {
    AETHER_UNORDERED_SET<std::string> suggestions;

    //Add matching user symbols
    for(const SymbolInfo& var : variables)
        if(startsWith(var.name, typed)) suggestions.insert(var.name);
    for(const SymbolInfo& fn : functions)
        if(startsWith(fn.name, typed)) suggestions.insert(fn.name);

    std::vector<std::string> sorted;
    sorted.insert(sorted.end(), suggestions.cbegin(), suggestions.cend());
    std::sort(sorted.begin(), sorted.end());

    //Add matching keywords
    size_t sorted_size_prior = sorted.size();
    for(const auto& entry : Scanner::keywords){
        const auto& keyword = entry.first;
        if(startsWith(keyword, typed)) sorted.push_back(std::string(keyword));
    }
    std::sort(sorted.begin()+sorted_size_prior, sorted.end());

    //Add matching builtins
    sorted_size_prior = sorted.size();
    for(const Builtin& builtin : builtins())
        if(startsWith(builtin.name, typed) && suggestions.find(std::string(builtin.name)) == suggestions.end())
            sorted.push_back(std::string(builtin.name));
    std::sort(sorted.begin()+sorted_size_prior, sorted.end());

    return sorted;
}

std::optional<std::string> wordAt(std::string_view text, const Position& pos) alloc_except {
    size_t line_start = 0;
    for(size_t i = 0; i < pos.line; i++){
        line_start = text.find('\n', line_start);
        if(line_start == std::string_view::npos) return std::nullopt;
        line_start++;
    }

    size_t line_end = text.find('\n', line_start);
    if(line_end == std::string_view::npos) line_end = text.size();
    const std::u32string line = toCodepoints(text.substr(line_start, line_end - line_start));
    if(pos.character > line.size()) return std::nullopt;

    size_t start = pos.character;
    while(start > 0 && isAlphaNumeric(line[start-1])) start--;
    size_t end = pos.character;
    while(end < line.size() && isAlphaNumeric(line[end])) end++;

    if(start == end) return std::nullopt;

    return toUtf8(std::u32string_view(line).substr(start, end - start));
}

}

}
