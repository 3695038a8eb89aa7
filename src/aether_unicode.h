#ifndef AETHER_UNICODE_H
#define AETHER_UNICODE_H

#include "aether_common.h"
#include <aether_unicode_tables.h>
#include <cinttypes>
#include <string>
#include <string_view>

namespace Aether {

inline constexpr uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

inline constexpr size_t codepointSize(uint8_t ch) noexcept {
    if(ch >> 7 == 0) return 1;
    if((ch & (1 << 6)) == 0) return 1; //Stray continuation byte
    if((ch & (1 << 5)) == 0) return 2;
    if((ch & (1 << 4)) == 0) return 3;
    return 4;
}

inline constexpr bool isContinuationCharacter(char ch) noexcept {
    return static_cast<uint8_t>(ch) >> 6 == 2;
}

inline constexpr bool isAscii(char32_t ch) noexcept {
    return ch < 0x80;
}

inline constexpr bool isNumeric(char32_t ch) noexcept {
    return (ch >= '0') & (ch <= '9');
}

inline constexpr bool isAsciiUpper(char32_t ch) noexcept {
    return (ch >= 'A') & (ch <= 'Z');
}

inline constexpr bool isAsciiLower(char32_t ch) noexcept {
    return (ch >= 'a') & (ch <= 'z');
}

template<size_t N>
inline constexpr bool inRanges(const CodepointRange (&ranges)[N], char32_t ch) noexcept {
    size_t lo = 0;
    size_t hi = N;
    while(lo < hi){
        const size_t mid = (lo + hi) / 2;
        if(ch < ranges[mid].first) hi = mid;
        else if(ch > ranges[mid].last) lo = mid + 1;
        else return true;
    }

    return false;
}

inline constexpr bool isLetter(char32_t ch) noexcept {
    if(isAscii(ch)) return isAsciiLower(ch) | isAsciiUpper(ch);
    return inRanges(ALPHABETIC_RANGES, ch);
}

inline constexpr bool isUpper(char32_t ch) noexcept {
    if(isAscii(ch)) return isAsciiUpper(ch);
    return inRanges(UPPERCASE_RANGES, ch);
}

//Any numeric character, where isNumeric only accepts the ASCII digits which start a number literal
inline constexpr bool isUnicodeNumeric(char32_t ch) noexcept {
    if(isAscii(ch)) return isNumeric(ch);
    return inRanges(NUMERIC_RANGES, ch);
}

inline constexpr bool isAlpha(char32_t ch) noexcept {
    return isLetter(ch) | (ch == '_');
}

inline constexpr bool isAlphaNumeric(char32_t ch) noexcept {
    return isAlpha(ch) | isUnicodeNumeric(ch);
}

template<uint8_t N>
inline constexpr uint32_t firstBits(uint8_t ch) noexcept {
    return ch & ((1 << N) - 1);
}

//Reads the codepoint at index, advancing index. Ill-formed sequences decode to U+FFFD.
inline char32_t decodeCodepoint(std::string_view str, size_t& index) noexcept {
    const uint8_t first = static_cast<uint8_t>(str[index]);
    const size_t sze = codepointSize(first);

    if(sze == 1){
        index++;
        return isContinuationCharacter(static_cast<char>(first)) ? REPLACEMENT_CHARACTER : first;
    }else if(index + sze > str.size()){
        index++;
        return REPLACEMENT_CHARACTER;
    }

    for(size_t i = 1; i < sze; i++){
        if(!isContinuationCharacter(str[index+i])){
            index++;
            return REPLACEMENT_CHARACTER;
        }
    }

    char32_t code;
    switch(sze){
        case 2:
            code = (firstBits<5>(first) << 6) | firstBits<6>(str[index+1]);
            break;
        case 3:
            code = (firstBits<4>(first) << 12) | (firstBits<6>(str[index+1]) << 6) | firstBits<6>(str[index+2]);
            break;
        default:
            code = (firstBits<3>(first) << 18) | (firstBits<6>(str[index+1]) << 12) |
                   (firstBits<6>(str[index+2]) << 6) | firstBits<6>(str[index+3]);
    }
    index += sze;

    return code;
}

inline std::u32string toCodepoints(std::string_view str) alloc_except {
    std::u32string out;
    out.reserve(str.size());
    size_t index = 0;
    while(index < str.size()) out += decodeCodepoint(str, index);

    return out;
}

inline void appendUtf8(std::string& str, char32_t code) alloc_except {
    if(code < 0x80){
        str += static_cast<char>(code);
    }else if(code < 0x800){
        str += static_cast<char>(0xC0 | (code >> 6));
        str += static_cast<char>(0x80 | (code & 0x3F));
    }else if(code < 0x10000){
        str += static_cast<char>(0xE0 | (code >> 12));
        str += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        str += static_cast<char>(0x80 | (code & 0x3F));
    }else{
        str += static_cast<char>(0xF0 | (code >> 18));
        str += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
        str += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        str += static_cast<char>(0x80 | (code & 0x3F));
    }
}

inline std::string toUtf8(std::u32string_view str) alloc_except {
    std::string out;
    out.reserve(str.size());
    for(char32_t code : str) appendUtf8(out, code);

    return out;
}

inline bool isIllFormedUtf8(std::string_view str) noexcept {
    size_t index = 0;
    while(index < str.size()){
        const size_t start = index;
        if(decodeCodepoint(str, index) == REPLACEMENT_CHARACTER && index - start == 1) return true;
    }

    return false;
}

}

#endif // AETHER_UNICODE_H
