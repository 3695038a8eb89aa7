#include "aether_scanner.h"

#include "aether_unicode.h"
#include <cstdlib>

namespace Aether {

namespace Code {

static constexpr size_t MAX_DOUBLE_DIGITS = 15;

Scanner::Scanner(std::string_view text) alloc_except
    : src(toCodepoints(text)) {}

Token Scanner::next() alloc_except {
    whitespace_before = skipWhitespace();
    start = cursor();

    if(atEnd() || peekChar() == '\0') return last = createToken(ENDOFFILE);

    const char32_t ch = advanceChar();

    switch(ch){
        case '\n': return last = createToken(NEWLINE);
        case '+': return last = createToken(PLUS);
        case '*': return last = createToken(MULTIPLY);
        case '%': return last = createToken(MODULO);
        case '(': return last = createToken(LEFTPAREN);
        case ')': return last = createToken(RIGHTPAREN);
        case '[': return last = createToken(LEFTBRACKET);
        case ']': return last = createToken(RIGHTBRACKET);
        case '{': return last = createToken(LEFTBRACE);
        case '}': return last = createToken(RIGHTBRACE);
        case ',': return last = createToken(COMMA);
        case ':': return last = createToken(COLON);
        case ';': return last = createToken(SEMICOLON);
        case '-': return last = twoCharOperator('>', ARROW, MINUS);
        case '=': return last = twoCharOperator('=', EQUAL, ASSIGN);
        case '!': return last = twoCharOperator('=', NOTEQUAL, NOT);
        case '<': return last = twoCharOperator('=', LESSEQUAL, LESS);
        case '>': return last = twoCharOperator('=', GREATEREQUAL, GREATER);
        case '&': return last = twoCharOperator('&', AND, ILLEGAL);
        case '|': return last = twoCharOperator('|', OR, ILLEGAL);
        case '"': return last = scanString();
        case '/':
            if(peekChar() == '/') return lineComment();
            else if(peekChar() == '*') return blockComment();
            else return last = createToken(DIVIDE);
        default:
            if(isNumeric(ch)) return last = scanNumber();
            else if(isAlpha(ch)) return last = scanIdentifier();
            else return last = illegal(ch);
    }
}

void Scanner::scanAll() alloc_except {
    reset();

    do{
        tokens.push_back(next());
    } while(tokens.back().type != ENDOFFILE);
}

void Scanner::reset() noexcept {
    tokens.clear();
    index = 0;
    curr_line = 1;
    curr_column = 1;
    start = Marker();
    whitespace_before = false;
    last = Token();
}

size_t Scanner::line() const noexcept {
    return last.sel.left.line;
}

size_t Scanner::column() const noexcept {
    return last.sel.left.column;
}

bool Scanner::whitespaceBefore() const noexcept {
    return last.whitespace_before;
}

Marker Scanner::cursor() const noexcept {
    return Marker(index, curr_line, curr_column);
}

const std::u32string& Scanner::source() const noexcept {
    return src;
}

bool Scanner::skipWhitespace() noexcept {
    bool skipped = false;
    while(!atEnd()){
        const char32_t ch = src[index];
        if(ch != ' ' && ch != '\t' && ch != '\r') break;
        advanceChar();
        skipped = true;
    }

    return skipped;
}

char32_t Scanner::peekChar(size_t ahead) const noexcept {
    return index + ahead < src.size() ? src[index + ahead] : '\0';
}

char32_t Scanner::advanceChar() noexcept {
    const char32_t ch = src[index++];
    if(ch == '\n'){
        curr_line++;
        curr_column = 1;
    }else{
        curr_column++;
    }

    return ch;
}

bool Scanner::atEnd() const noexcept {
    return index >= src.size();
}

Token Scanner::createToken(AetherTokenType type) const noexcept {
    return Token(Selection(start, cursor()), type, whitespace_before);
}

Token Scanner::illegal(char32_t ch) const alloc_except {
    Token token = createToken(ILLEGAL);
    appendUtf8(token.text, ch);

    return token;
}

Token Scanner::lineComment() alloc_except {
    while(!atEnd() && peekChar() != '\n') advanceChar();

    return next();
}

Token Scanner::blockComment() alloc_except {
    advanceChar();
    while(!atEnd()){
        if(peekChar() == '*' && peekChar(1) == '/'){
            advanceChar();
            advanceChar();
            break;
        }
        advanceChar();
    }

    return next();
}

Token Scanner::scanString() alloc_except {
    if(peekChar() == '"' && peekChar(1) == '"'){
        advanceChar();
        advanceChar();
        return scanTripleQuotedString();
    }

    const size_t body_start = index;
    for(;;){
        if(atEnd()) return illegal('"');

        const char32_t ch = advanceChar();
        if(ch == '"') break;
        else if(ch == '\\' && !atEnd()) advanceChar();
    }

    Token token = createToken(STRING);
    token.text = processEscapes(std::u32string_view(src).substr(body_start, index - 1 - body_start));

    return token;
}

Token Scanner::scanTripleQuotedString() alloc_except {
    const size_t body_start = index;
    for(;;){
        if(atEnd()) return illegal('"');
        if(peekChar() == '"' && peekChar(1) == '"' && peekChar(2) == '"') break;
        advanceChar();
    }

    const size_t body_end = index;
    advanceChar();
    advanceChar();
    advanceChar();

    Token token = createToken(STRING);
    token.text = processEscapes(std::u32string_view(src).substr(body_start, body_end - body_start));

    return token;
}

Token Scanner::scanNumber() alloc_except {
    bool has_decimal = false;
    for(;;){
        if(isNumeric(peekChar())){
            advanceChar();
        }else if(peekChar() == '.' && !has_decimal && isNumeric(peekChar(1))){
            has_decimal = true;
            advanceChar();
        }else{
            break;
        }
    }

    const std::string digits = toUtf8(std::u32string_view(src).substr(start.offset, index - start.offset));

    if(!has_decimal && digits.size() > MAX_DOUBLE_DIGITS){
        Token token = createToken(BIGINTEGER);
        token.text = digits;
        return token;
    }

    char* end = nullptr;
    const double value = std::strtod(digits.c_str(), &end);
    if(end != digits.c_str() + digits.size()){
        Token token = createToken(ILLEGAL);
        token.text = digits;
        return token;
    }

    Token token = createToken(NUMBER);
    token.number = value;

    return token;
}

AETHER_STATIC_MAP<std::string_view, AetherTokenType> Scanner::keywords {
    {"Set", SET},
    {"Func", FUNC},
    {"Return", RETURN},
    {"If", IF},
    {"Elif", ELIF},
    {"Else", ELSE},
    {"While", WHILE},
    {"For", FOR},
    {"In", IN},
    {"Break", BREAK},
    {"Continue", CONTINUE},
    {"Generator", GENERATOR},
    {"Yield", YIELD},
    {"Lazy", LAZY},
    {"Force", FORCE},
    {"Switch", SWITCH},
    {"Case", CASE},
    {"Default", DEFAULT},
    {"Import", IMPORT},
    {"Export", EXPORT},
    {"From", FROM},
    {"As", AS},
    {"Lambda", LAMBDA},
    {"Throw", THROW},
    {"Try", TRY},
    {"Catch", CATCH},
    {"True", BOOLEAN},
    {"False", BOOLEAN},
    {"Null", NULLLITERAL},
};

Token Scanner::scanIdentifier() alloc_except {
    while(isAlphaNumeric(peekChar())) advanceChar();

    std::string name = toUtf8(std::u32string_view(src).substr(start.offset, index - start.offset));

    auto lookup = keywords.find(name);
    if(lookup == keywords.end()){
        Token token = createToken(IDENTIFIER);
        token.text = std::move(name);
        return token;
    }

    Token token = createToken(lookup->second);
    if(token.type == BOOLEAN) token.number = (name == "True");

    return token;
}

Token Scanner::twoCharOperator(char32_t second, AetherTokenType matched, AetherTokenType single) noexcept {
    if(peekChar() == second){
        advanceChar();
        return createToken(matched);
    }else if(single == ILLEGAL){
        Token token = createToken(ILLEGAL);
        token.text = static_cast<char>(src[start.offset]);
        return token;
    }

    return createToken(single);
}

std::string Scanner::processEscapes(std::u32string_view raw) alloc_except {
    std::string out;
    out.reserve(raw.size());

    for(size_t i = 0; i < raw.size(); i++){
        const char32_t ch = raw[i];
        if(ch != '\\' || i+1 == raw.size()){
            appendUtf8(out, ch);
            continue;
        }

        const char32_t escaped = raw[++i];
        switch(escaped){
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case '\\': out += '\\'; break;
            case '"': out += '"'; break;
            default:
                out += '\\';
                appendUtf8(out, escaped);
        }
    }

    return out;
}

}

}
