#ifndef AETHER_EDITOR_TYPES_H
#define AETHER_EDITOR_TYPES_H

#include <aether_common.h>
#include "aether_selection.h"
#include <string>
#include <vector>

namespace Aether {

namespace Code {

//Editor coordinates are 0-based; the column counts codepoints
struct Position {
    size_t line = 0;
    size_t character = 0;

    Position() noexcept = default;
    Position(size_t line, size_t character) noexcept
        : line(line), character(character) {}
    static Position fromMarker(const Marker& m) noexcept;
    bool operator==(const Position& other) const noexcept;
    bool operator!=(const Position& other) const noexcept;
    bool operator<(const Position& other) const noexcept;
    bool operator<=(const Position& other) const noexcept;
};

//Both ends inclusive, as editors hit-test a cursor sitting just past a word
struct Range {
    Position start;
    Position end;

    Range() noexcept = default;
    Range(const Position& start, const Position& end) noexcept
        : start(start), end(end) {}
    static Range fromSelection(const Selection& sel) noexcept;
    bool contains(const Position& pos) const noexcept;
    bool containsRange(const Range& other) const noexcept;
    bool operator==(const Range& other) const noexcept;
    bool operator!=(const Range& other) const noexcept;
};

struct Location {
    std::string uri;
    Range range;
};

struct TextEdit {
    Range range;
    std::string new_text;
};

struct WorkspaceEdit {
    AETHER_UNORDERED_MAP<std::string, std::vector<TextEdit>> changes;
};

enum SymbolKind {
    SYMBOL_VARIABLE,
    SYMBOL_FUNCTION,
};

const char* symbolKindName(SymbolKind kind) noexcept;

struct DocumentSymbol {
    std::string name;
    SymbolKind kind;
    Location location;
};

}

}

#endif // AETHER_EDITOR_TYPES_H
