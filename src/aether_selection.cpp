#include "aether_selection.h"

#include "aether_unicode.h"

namespace Aether {

bool Marker::operator==(const Marker& other) const noexcept {
    return offset == other.offset;
}

bool Marker::operator!=(const Marker& other) const noexcept {
    return offset != other.offset;
}

bool Marker::operator<(const Marker& other) const noexcept {
    return offset < other.offset;
}

bool Marker::operator<=(const Marker& other) const noexcept {
    return offset <= other.offset;
}

Selection::Selection(const Marker& left, const Marker& right) noexcept
    : left(left), right(right) {}

bool Selection::operator==(const Selection& other) const noexcept {
    return left == other.left && right == other.right;
}

bool Selection::operator!=(const Selection& other) const noexcept {
    return !(*this == other);
}

bool Selection::isEmpty() const noexcept {
    return left == right;
}

bool Selection::contains(size_t line, size_t column) const noexcept {
    if(line < left.line || line > right.line) return false;
    if(line == left.line && column < left.column) return false;
    if(line == right.line && column >= right.column) return false;

    return true;
}

bool Selection::containsSelection(const Selection& other) const noexcept {
    return left <= other.left && other.right <= right;
}

size_t Selection::numCodepoints() const noexcept {
    return right.offset - left.offset;
}

std::string Selection::str(std::u32string_view source) const alloc_except {
    if(left.offset >= source.size()) return std::string();
    return toUtf8(source.substr(left.offset, numCodepoints()));
}

std::string Selection::toString() const alloc_except {
    return std::to_string(left.line) + ':' + std::to_string(left.column) + '-' +
           std::to_string(right.line) + ':' + std::to_string(right.column);
}

}
