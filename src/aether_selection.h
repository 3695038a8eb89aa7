#ifndef AETHER_SELECTION_H
#define AETHER_SELECTION_H

#include <aether_common.h>
#include <string>
#include <string_view>

namespace Aether {

//A position in the source. Offset counts codepoints; line and column are 1-based.
struct Marker {
    size_t offset = 0;
    size_t line = 1;
    size_t column = 1;

    Marker() noexcept = default;
    Marker(size_t offset, size_t line, size_t column) noexcept
        : offset(offset), line(line), column(column) {}
    bool operator==(const Marker& other) const noexcept;
    bool operator!=(const Marker& other) const noexcept;
    bool operator<(const Marker& other) const noexcept;
    bool operator<=(const Marker& other) const noexcept;
};

//Half-open range [left, right)
class Selection {
public:
    Selection() noexcept = default;
    Selection(const Marker& left, const Marker& right) noexcept;
    bool operator==(const Selection& other) const noexcept;
    bool operator!=(const Selection& other) const noexcept;
    bool isEmpty() const noexcept;
    bool contains(size_t line, size_t column) const noexcept;
    bool containsSelection(const Selection& other) const noexcept;
    size_t numCodepoints() const noexcept;
    std::string str(std::u32string_view source) const alloc_except;
    std::string toString() const alloc_except;

    Marker left;
    Marker right;
};

}

#endif // AETHER_SELECTION_H
