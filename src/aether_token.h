#ifndef AETHER_TOKEN_H
#define AETHER_TOKEN_H

#include "aether_selection.h"
#include <string>

namespace Aether {

namespace Code {

enum AetherTokenType {
    //Keywords
    SET,
    FUNC,
    RETURN,
    IF,
    ELIF,
    ELSE,
    WHILE,
    FOR,
    IN,
    BREAK,
    CONTINUE,
    GENERATOR,
    YIELD,
    LAZY,
    FORCE,
    SWITCH,
    CASE,
    DEFAULT,
    IMPORT,
    EXPORT,
    FROM,
    AS,
    LAMBDA,
    THROW,
    TRY,
    CATCH,

    //Literals
    NUMBER,
    BIGINTEGER,
    STRING,
    BOOLEAN,
    NULLLITERAL,
    IDENTIFIER,

    //Operators
    PLUS,
    MINUS,
    MULTIPLY,
    DIVIDE,
    MODULO,
    ASSIGN,
    EQUAL,
    NOTEQUAL,
    GREATER,
    GREATEREQUAL,
    LESS,
    LESSEQUAL,
    AND,
    OR,
    NOT,
    ARROW,

    //Delimiters
    LEFTPAREN,
    RIGHTPAREN,
    LEFTBRACKET,
    RIGHTBRACKET,
    LEFTBRACE,
    RIGHTBRACE,
    COMMA,
    COLON,
    SEMICOLON,
    NEWLINE,

    ENDOFFILE,
    ILLEGAL,

    NUM_TOKEN_TYPES
};

const char* tokenName(AetherTokenType type) noexcept;

struct Token {
    Selection sel;
    AetherTokenType type = ENDOFFILE;
    std::string text; //Name, string contents, big integer digits or illegal character
    double number = 0;
    bool whitespace_before = false;

    Token() noexcept = default;
    Token(const Selection& sel, AetherTokenType type, bool whitespace_before) noexcept
        : sel(sel), type(type), whitespace_before(whitespace_before) {}

    bool boolean() const noexcept { return number != 0; }
    bool operator==(const Token& other) const noexcept;
    bool operator!=(const Token& other) const noexcept;
    std::string debugString() const alloc_except;
};

}

}

#endif // AETHER_TOKEN_H
