#ifndef AETHER_SYMBOL_TABLE_H
#define AETHER_SYMBOL_TABLE_H

#include <aether_common.h>
#include "aether_editor_types.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Aether {

namespace Code {

struct SymbolInfo {
    std::string name;
    SymbolKind kind = SYMBOL_VARIABLE;
    Range range; //Whole declaration
    Range selection_range; //Just the name
    std::string documentation;
    std::optional<std::string> detail;
};

class SymbolTable {
public:
    std::vector<SymbolInfo> variables;
    std::vector<SymbolInfo> functions;

    void clear() noexcept;
    bool empty() const noexcept;
    size_t size() const noexcept;
    void addVariable(const std::string& name, const Range& range, const Range& name_range, const std::string& detail) alloc_except;
    void addFunction(
        const std::string& name, const Range& range, const Range& name_range,
        const std::vector<std::string>& params, const std::string& detail) alloc_except;
    const SymbolInfo* find(std::string_view name) const noexcept;
    const SymbolInfo* findAtPosition(const Position& pos) const noexcept;
    std::optional<Location> findDefinition(const Position& pos, std::string_view uri) const alloc_except;
    std::vector<DocumentSymbol> toDocumentSymbols(std::string_view uri) const alloc_except;
    std::optional<WorkspaceEdit> renameSymbol(const Position& pos, std::string_view new_name, std::string_view uri) const noexcept;
    std::vector<std::string> getSuggestions(std::string_view typed) const alloc_except;
};

std::optional<std::string> wordAt(std::string_view text, const Position& pos) alloc_except;

}

}

#endif // AETHER_SYMBOL_TABLE_H
