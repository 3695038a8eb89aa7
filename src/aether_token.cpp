#include "aether_token.h"

#include <spdlog/fmt/fmt.h>

namespace Aether {

namespace Code {

static constexpr const char* token_names[NUM_TOKEN_TYPES] = {
    "Set",
    "Func",
    "Return",
    "If",
    "Elif",
    "Else",
    "While",
    "For",
    "In",
    "Break",
    "Continue",
    "Generator",
    "Yield",
    "Lazy",
    "Force",
    "Switch",
    "Case",
    "Default",
    "Import",
    "Export",
    "From",
    "As",
    "Lambda",
    "Throw",
    "Try",
    "Catch",
    "Number",
    "BigInteger",
    "String",
    "Boolean",
    "Null",
    "Identifier",
    "Plus",
    "Minus",
    "Multiply",
    "Divide",
    "Modulo",
    "Assign",
    "Equal",
    "NotEqual",
    "Greater",
    "GreaterEqual",
    "Less",
    "LessEqual",
    "And",
    "Or",
    "Not",
    "Arrow",
    "LeftParen",
    "RightParen",
    "LeftBracket",
    "RightBracket",
    "LeftBrace",
    "RightBrace",
    "Comma",
    "Colon",
    "Semicolon",
    "Newline",
    "EOF",
    "Illegal",
};

const char* tokenName(AetherTokenType type) noexcept {
    return type < NUM_TOKEN_TYPES ? token_names[type] : "Unknown";
}

bool Token::operator==(const Token& other) const noexcept {
    if(type != other.type) return false;

    switch(type){
        case NUMBER:
        case BOOLEAN:
            return number == other.number;
        case BIGINTEGER:
        case STRING:
        case IDENTIFIER:
        case ILLEGAL:
            return text == other.text;
        default:
            return true;
    }
}

bool Token::operator!=(const Token& other) const noexcept {
    return !(*this == other);
}

std::string Token::debugString() const alloc_except {
    switch(type){
        case NUMBER: return fmt::format("Number({})", number);
        case BIGINTEGER: return fmt::format("BigInteger(\"{}\")", text);
        case STRING: return fmt::format("String(\"{}\")", text);
        case BOOLEAN: return fmt::format("Boolean({})", boolean());
        case IDENTIFIER: return fmt::format("Identifier(\"{}\")", text);
        case ILLEGAL: return fmt::format("Illegal('{}')", text);
        default: return tokenName(type);
    }
}

}

}
