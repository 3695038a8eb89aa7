#include "aether_editor_types.h"

namespace Aether {

namespace Code {

Position Position::fromMarker(const Marker& m) noexcept {
    return Position(m.line > 0 ? m.line-1 : 0, m.column > 0 ? m.column-1 : 0);
}

bool Position::operator==(const Position& other) const noexcept {
    return line == other.line && character == other.character;
}

bool Position::operator!=(const Position& other) const noexcept {
    return !(*this == other);
}

bool Position::operator<(const Position& other) const noexcept {
    return line < other.line || (line == other.line && character < other.character);
}

bool Position::operator<=(const Position& other) const noexcept {
    return !(other < *this);
}

Range Range::fromSelection(const Selection& sel) noexcept {
    return Range(Position::fromMarker(sel.left), Position::fromMarker(sel.right));
}

bool Range::contains(const Position& pos) const noexcept {
    return start <= pos && pos <= end;
}

bool Range::containsRange(const Range& other) const noexcept {
    return start <= other.start && other.end <= end;
}

bool Range::operator==(const Range& other) const noexcept {
    return start == other.start && end == other.end;
}

bool Range::operator!=(const Range& other) const noexcept {
    return !(*this == other);
}

const char* symbolKindName(SymbolKind kind) noexcept {
    switch(kind){
        case SYMBOL_VARIABLE: return "variable";
        case SYMBOL_FUNCTION: return "function";
        default: return "unknown";
    }
}

}

}
