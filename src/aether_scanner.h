#ifndef AETHER_SCANNER_H
#define AETHER_SCANNER_H

#include <aether_common.h>
#include "aether_token.h"
#include <string>
#include <string_view>
#include <vector>

namespace Aether {

namespace Code {

class Scanner {
public:
    Scanner(std::string_view text) alloc_except;
    Token next() alloc_except;
    void scanAll() alloc_except;
    void reset() noexcept;
    size_t line() const noexcept;
    size_t column() const noexcept;
    bool whitespaceBefore() const noexcept;
    Marker cursor() const noexcept;
    const std::u32string& source() const noexcept;

    std::vector<Token> tokens;
    static AETHER_STATIC_MAP<std::string_view, AetherTokenType> keywords;

private:
    bool skipWhitespace() noexcept;
    char32_t peekChar(size_t ahead = 0) const noexcept;
    char32_t advanceChar() noexcept;
    bool atEnd() const noexcept;
    Token createToken(AetherTokenType type) const noexcept;
    Token illegal(char32_t ch) const alloc_except;
    Token lineComment() alloc_except;
    Token blockComment() alloc_except;
    Token scanString() alloc_except;
    Token scanTripleQuotedString() alloc_except;
    Token scanNumber() alloc_except;
    Token scanIdentifier() alloc_except;
    Token twoCharOperator(char32_t second, AetherTokenType matched, AetherTokenType single) noexcept;
    static std::string processEscapes(std::u32string_view raw) alloc_except;

    std::u32string src;
    size_t index = 0;
    size_t curr_line = 1;
    size_t curr_column = 1;
    Marker start;
    bool whitespace_before = false;
    Token last;
};

}

}

#endif // AETHER_SCANNER_H
