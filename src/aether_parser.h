#ifndef AETHER_PARSER_H
#define AETHER_PARSER_H

#include "aether_error.h"
#include "aether_parse_tree.h"
#include "aether_scanner.h"
#include <string_view>
#include <vector>

namespace Aether {

namespace Code {

class Parser {
public:
    Parser(Scanner& scanner, ErrorStream& error_stream) noexcept;
    void parseAll() alloc_except;
    ParseTree parse_tree;

    static bool isDeclarationName(std::string_view name) noexcept;
    static bool isBinderName(std::string_view name) noexcept;

private:
    enum Precedence {
        PREC_LOWEST,
        PREC_OR,
        PREC_AND,
        PREC_EQUALS,
        PREC_COMPARISON,
        PREC_SUM,
        PREC_PRODUCT,
        PREC_PREFIX,
        PREC_CALL,
        PREC_INDEX,
    };

    void reset() alloc_except;
    ParseNode statement() alloc_except;
    ParseNode setStatement() alloc_except;
    ParseNode definition(Op type) alloc_except;
    ParseNode lazyStatement() alloc_except;
    ParseNode valueStatement(Op type) alloc_except;
    ParseNode whileStatement() alloc_except;
    ParseNode forStatement() alloc_except;
    ParseNode switchStatement() alloc_except;
    ParseNode caseBody(bool is_default) alloc_except;
    ParseNode importStatement() alloc_except;
    void importName(std::vector<ParseNode>& names, std::vector<ParseNode>& aliases) alloc_except;
    ParseNode exportStatement() alloc_except;
    ParseNode throwStatement() alloc_except;
    ParseNode expressionStatement() alloc_except;
    ParseNode bracedBlock() alloc_except;
    ParseNode parenCondition() alloc_except;
    ParseNode paramList() alloc_except;
    ParseNode expression(Precedence precedence = PREC_LOWEST) alloc_except;
    ParseNode prefix() alloc_except;
    ParseNode infix(ParseNode lhs) alloc_except;
    ParseNode binary(ParseNode lhs) alloc_except;
    ParseNode call(ParseNode callee) alloc_except;
    ParseNode subscript(ParseNode object) alloc_except;
    ParseNode grouping() alloc_except;
    ParseNode array() alloc_except;
    ParseNode dict() alloc_except;
    ParseNode unary(Op type) alloc_except;
    ParseNode ifExpression() alloc_except;
    ParseNode lambda() alloc_except;
    ParseNode arrowLambda() alloc_except;
    ParseNode identifier() alloc_except;
    ParseNode declarationIdentifier() alloc_except;
    ParseNode binderIdentifier() alloc_except;
    ParseNode number() alloc_except;
    ParseNode string() alloc_except;
    Precedence precedenceOf(AetherTokenType type) const noexcept;
    bool atExpressionBoundary() const noexcept;
    ParseNode error(ErrorCode code, const std::string& message) alloc_except;
    ParseNode error(ErrorCode code, const Selection& sel, const std::string& message) alloc_except;
    ParseNode expected(std::string_view description) alloc_except;
    ParseNode invalidExpression(std::string_view reason) alloc_except;
    ParseNode invalidStatement(std::string_view reason) alloc_except;
    void advance() alloc_except;
    bool match(AetherTokenType type) alloc_except;
    bool peek(AetherTokenType type) const noexcept;
    bool lookahead(AetherTokenType type) const noexcept;
    void consume(AetherTokenType type) alloc_except;
    void skipNewlines() alloc_except;
    void skipTerminator() alloc_except;
    AetherTokenType currentType() const noexcept;
    ParseNode terminalAndAdvance(Op type) alloc_except;
    const Selection& selection() const noexcept;
    const Marker& lMark() const noexcept;
    const Marker& rMark() const noexcept;
    const Marker& rMarkPrev() const noexcept;
    bool noErrors() const noexcept;

    Scanner& scanner;
    ErrorStream& error_stream;
    Token current;
    Token next;
    Token previous;
    ParseNode error_node = NONE;
};

}

}

#endif // AETHER_PARSER_H
