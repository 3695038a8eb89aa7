#include "aether_parser.h"

#include "aether_unicode.h"

namespace Aether {

namespace Code {

Parser::Parser(Scanner& scanner, ErrorStream& error_stream) noexcept
    : scanner(scanner), error_stream(error_stream) {}

void Parser::parseAll() alloc_except {
    reset();

    parse_tree.prepareNary();
    skipNewlines();
    while(!peek(ENDOFFILE) && noErrors()){
        parse_tree.addNaryChild(statement());
        skipNewlines();
    }

    //A failed parse leaves no partial tree behind
    if(!noErrors()){
        parse_tree.clear();
        return;
    }

    parse_tree.root = parse_tree.finishNary(OP_BLOCK, Selection(Marker(), rMark()));
    assert(parse_tree.inFinalState());
}

bool Parser::isDeclarationName(std::string_view name) noexcept {
    if(name.empty()) return false;

    size_t index = 0;
    if(isUnicodeNumeric(decodeCodepoint(name, index))) return false;

    index = 0;
    while(index < name.size()){
        const char32_t ch = decodeCodepoint(name, index);
        if(!isUpper(ch) && !isUnicodeNumeric(ch) && ch != '_') return false;
    }

    return true;
}

bool Parser::isBinderName(std::string_view name) noexcept {
    if(name.empty()) return false;

    size_t index = 0;
    if(isUnicodeNumeric(decodeCodepoint(name, index))) return false;

    index = 0;
    while(index < name.size())
        if(!isAlphaNumeric(decodeCodepoint(name, index))) return false;

    return true;
}

void Parser::reset() alloc_except {
    parse_tree.clear();
    scanner.reset();
    error_node = NONE;
    previous = Token();
    current = scanner.next();
    next = scanner.next();
}

ParseNode Parser::statement() alloc_except {
    ParseNode stmt;

    switch (currentType()) {
        case SET: stmt = setStatement(); break;
        case FUNC: stmt = lookahead(LEFTPAREN) ? expressionStatement() : definition(OP_FUNC); break;
        case GENERATOR: stmt = definition(OP_GENERATOR); break;
        case LAZY: stmt = lazyStatement(); break;
        case RETURN: stmt = valueStatement(OP_RETURN); break;
        case YIELD: stmt = valueStatement(OP_YIELD); break;
        case BREAK: stmt = terminalAndAdvance(OP_BREAK); break;
        case CONTINUE: stmt = terminalAndAdvance(OP_CONTINUE); break;
        case WHILE: stmt = whileStatement(); break;
        case FOR: stmt = forStatement(); break;
        case SWITCH: stmt = switchStatement(); break;
        case IMPORT: stmt = importStatement(); break;
        case EXPORT: stmt = exportStatement(); break;
        case THROW: stmt = throwStatement(); break;
        case ELIF:
        case ELSE: return invalidStatement(std::string(tokenName(currentType())) + " without a preceding If");
        case CASE:
        case DEFAULT: return invalidStatement(std::string(tokenName(currentType())) + " outside of a Switch");
        case TRY:
        case CATCH: return invalidStatement("Try/Catch blocks are not supported");
        default: stmt = expressionStatement();
    }

    if(noErrors()) skipTerminator();

    return stmt;
}

ParseNode Parser::setStatement() alloc_except {
    const Marker left = lMark();
    advance();

    ParseNode name = declarationIdentifier();
    if(!noErrors()) return name;

    //"Set ARR[0] 5" assigns an element, "Set ARR [1, 2]" assigns an array literal
    if(peek(LEFTBRACKET) && !current.whitespace_before){
        advance();
        ParseNode index = expression();
        if(!noErrors()) return index;
        if(!match(RIGHTBRACKET)) return expected("']' for index access");
        ParseNode value = expression();
        if(!noErrors()) return value;

        return parse_tree.addNode<3>(OP_SET_INDEX, Selection(left, rMarkPrev()), {name, index, value});
    }

    ParseNode value = expression();
    if(!noErrors()) return value;

    return parse_tree.addNode<2>(OP_SET, Selection(left, rMarkPrev()), {name, value});
}

ParseNode Parser::definition(Op type) alloc_except {
    const Marker left = lMark();
    advance();

    ParseNode name = declarationIdentifier();
    if(!noErrors()) return name;
    consume(LEFTPAREN);
    ParseNode params = paramList();
    consume(RIGHTPAREN);
    if(!noErrors()) return error_node;
    skipNewlines();
    ParseNode body = bracedBlock();
    if(!noErrors()) return body;

    return parse_tree.addNode<3>(type, Selection(left, rMarkPrev()), {name, params, body});
}

ParseNode Parser::lazyStatement() alloc_except {
    const Marker left = lMark();
    advance();

    ParseNode name = declarationIdentifier();
    if(!noErrors()) return name;
    ParseNode expr = parenCondition();
    if(!noErrors()) return expr;

    return parse_tree.addNode<2>(OP_LAZY, Selection(left, rMarkPrev()), {name, expr});
}

ParseNode Parser::valueStatement(Op type) alloc_except {
    const Selection keyword = selection();
    advance();

    ParseNode value;
    if(peek(NEWLINE) || peek(SEMICOLON) || peek(RIGHTBRACE) || peek(ENDOFFILE)){
        value = parse_tree.addTerminal(OP_NULL, Selection(keyword.right, keyword.right));
    }else{
        value = expression();
        if(!noErrors()) return value;
    }

    return parse_tree.addUnary(type, Selection(keyword.left, rMarkPrev()), value);
}

ParseNode Parser::whileStatement() alloc_except {
    const Marker left = lMark();
    advance();

    ParseNode condition = parenCondition();
    if(!noErrors()) return condition;
    skipNewlines();
    ParseNode body = bracedBlock();
    if(!noErrors()) return body;

    return parse_tree.addNode<2>(OP_WHILE, Selection(left, rMarkPrev()), {condition, body});
}

ParseNode Parser::forStatement() alloc_except {
    const Marker left = lMark();
    advance();

    if(!peek(IDENTIFIER)) return expected("identifier");
    ParseNode first = identifier();

    ParseNode second = NONE;
    if(match(COMMA)){
        if(!peek(IDENTIFIER)) return expected("identifier");
        second = identifier();
    }

    consume(IN);
    if(!noErrors()) return error_node;
    ParseNode iterable = expression();
    if(!noErrors()) return iterable;
    skipNewlines();
    ParseNode body = bracedBlock();
    if(!noErrors()) return body;

    const Selection sel(left, rMarkPrev());
    if(second == NONE) return parse_tree.addNode<3>(OP_FOR, sel, {first, iterable, body});
    else return parse_tree.addNode<4>(OP_FOR_INDEXED, sel, {first, second, iterable, body});
}

ParseNode Parser::switchStatement() alloc_except {
    const Marker left = lMark();
    advance();

    ParseNode switch_key = parenCondition();
    if(!noErrors()) return switch_key;
    skipNewlines();
    consume(LEFTBRACE);
    if(!noErrors()) return error_node;
    skipNewlines();

    parse_tree.prepareNary();
    parse_tree.addNaryChild(switch_key);
    while(!peek(RIGHTBRACE) && !peek(ENDOFFILE) && noErrors()){
        switch (currentType()) {
            case CASE:{
                const Marker case_left = lMark();
                advance();
                ParseNode case_key = expression();
                consume(COLON);
                skipNewlines();
                ParseNode case_codepath = caseBody(false);
                if(!noErrors()) break;
                parse_tree.addNaryChild(
                    parse_tree.addNode<2>(OP_CASE, Selection(case_left, rMarkPrev()), {case_key, case_codepath}));
                break;
            }

            case DEFAULT:{
                const Marker default_left = lMark();
                advance();
                consume(COLON);
                skipNewlines();
                ParseNode default_codepath = caseBody(true);
                if(!noErrors()) break;
                parse_tree.addNaryChild(
                    parse_tree.addUnary(OP_DEFAULT, Selection(default_left, rMarkPrev()), default_codepath));
                break;
            }

            default:
                advance();
        }

    }

    consume(RIGHTBRACE);
    if(!noErrors()){
        parse_tree.cancelNary();
        return error_node;
    }

    return parse_tree.finishNary(OP_SWITCH, Selection(left, rMarkPrev()));
}

ParseNode Parser::caseBody(bool is_default) alloc_except {
    const Marker left = lMark();

    parse_tree.prepareNary();
    while(!peek(RIGHTBRACE) && !peek(ENDOFFILE) && noErrors()){
        if(!is_default && (peek(CASE) || peek(DEFAULT))) break;
        parse_tree.addNaryChild(statement());
        skipNewlines();
    }

    const Marker right = left < rMarkPrev() ? rMarkPrev() : left;

    return parse_tree.finishNary(OP_BLOCK, Selection(left, right));
}

ParseNode Parser::importStatement() alloc_except {
    const Marker left = lMark();
    advance();

    std::vector<ParseNode> names;
    std::vector<ParseNode> aliases;

    if(match(LEFTBRACE)){
        skipNewlines();
        while(!peek(RIGHTBRACE) && !peek(ENDOFFILE) && noErrors()){
            importName(names, aliases);
            if(!match(COMMA)) break;
            skipNewlines();
        }
        if(!noErrors()) return error_node;
        consume(RIGHTBRACE);
    }else{
        importName(names, aliases);
    }

    consume(FROM);
    if(!noErrors()) return error_node;
    if(!peek(STRING)) return expected("string");
    ParseNode path = string();

    const Selection list_sel = names.empty() ?
                               Selection(left, left) :
                               Selection(parse_tree.getLeft(names.front()), parse_tree.getRight(names.back()));
    ParseNode name_list = parse_tree.addNode(OP_LIST, list_sel, names);
    ParseNode alias_list = parse_tree.addNode(OP_LIST, list_sel, aliases);

    return parse_tree.addNode<3>(OP_IMPORT, Selection(left, rMarkPrev()), {path, name_list, alias_list});
}

void Parser::importName(std::vector<ParseNode>& names, std::vector<ParseNode>& aliases) alloc_except {
    if(!peek(IDENTIFIER)){
        expected("identifier");
        return;
    }

    names.push_back(identifier());

    ParseNode alias = NONE;
    if(match(AS) && peek(IDENTIFIER)) alias = identifier();
    aliases.push_back(alias);
}

ParseNode Parser::exportStatement() alloc_except {
    const Marker left = lMark();
    advance();

    if(!peek(IDENTIFIER)) return expected("identifier");
    ParseNode name = identifier();

    return parse_tree.addUnary(OP_EXPORT, Selection(left, rMarkPrev()), name);
}

ParseNode Parser::throwStatement() alloc_except {
    const Marker left = lMark();
    advance();

    ParseNode expr = expression();
    if(!noErrors()) return expr;

    return parse_tree.addUnary(OP_THROW, Selection(left, rMarkPrev()), expr);
}

ParseNode Parser::expressionStatement() alloc_except {
    ParseNode expr = expression();
    if(!noErrors()) return expr;

    return parse_tree.addUnary(OP_EXPR_STMT, parse_tree.getSelection(expr), expr);
}

ParseNode Parser::bracedBlock() alloc_except {
    const Marker left = lMark();
    consume(LEFTBRACE);
    if(!noErrors()) return error_node;

    parse_tree.prepareNary();
    skipNewlines();
    while(!peek(RIGHTBRACE) && !peek(ENDOFFILE) && noErrors()){
        parse_tree.addNaryChild(statement());
        skipNewlines();
    }

    consume(RIGHTBRACE);
    if(!noErrors()){
        parse_tree.cancelNary();
        return error_node;
    }

    return parse_tree.finishNary(OP_BLOCK, Selection(left, rMarkPrev()));
}

ParseNode Parser::parenCondition() alloc_except {
    consume(LEFTPAREN);
    if(!noErrors()) return error_node;
    ParseNode condition = expression();
    if(!noErrors()) return condition;
    consume(RIGHTPAREN);

    return noErrors() ? condition : error_node;
}

ParseNode Parser::paramList() alloc_except {
    const Marker left = lMark();

    parse_tree.prepareNary();
    while(peek(IDENTIFIER) && noErrors()){
        parse_tree.addNaryChild(binderIdentifier());
        if(!match(COMMA)) break;
    }

    return parse_tree.finishNary(OP_LIST, Selection(left, lMark()));
}

ParseNode Parser::expression(Precedence precedence) alloc_except {
    ParseNode lhs = prefix();

    //An If which had to skip line breaks looking for Elif/Else ends every enclosing expression
    while(noErrors() && previous.type != NEWLINE && !atExpressionBoundary() && precedence < precedenceOf(currentType()))
        lhs = infix(lhs);

    return lhs;
}

ParseNode Parser::prefix() alloc_except {
    switch (currentType()) {
        case NUMBER: return number();
        case BIGINTEGER: return string();
        case STRING: return string();
        case BOOLEAN: return terminalAndAdvance(current.boolean() ? OP_TRUE : OP_FALSE);
        case NULLLITERAL: return terminalAndAdvance(OP_NULL);
        case IDENTIFIER: return identifier();
        case LEFTPAREN: return grouping();
        case LEFTBRACKET: return array();
        case LEFTBRACE: return dict();
        case MINUS: return unary(OP_UNARY_MINUS);
        case NOT: return unary(OP_LOGICAL_NOT);
        case IF: return ifExpression();
        case FUNC: return lambda();
        case LAMBDA: return arrowLambda();
        case ENDOFFILE: return error(UNEXPECTED_END_OF_INPUT, Messages::unexpectedEndOfInput(lMark()));
        case ILLEGAL:
            if(!current.text.empty() && isNumeric(current.text.front()))
                return error(INVALID_NUMBER, Messages::invalidNumber(current.text));
            return invalidExpression("Unexpected token in expression");
        default: return invalidExpression("Unexpected token in expression");
    }
}

ParseNode Parser::infix(ParseNode lhs) alloc_except {
    switch (currentType()) {
        case LEFTPAREN: return call(lhs);
        case LEFTBRACKET: return subscript(lhs);
        default: return binary(lhs);
    }
}

ParseNode Parser::binary(ParseNode lhs) alloc_except {
    Op op;
    switch (currentType()) {
        case PLUS: op = OP_ADDITION; break;
        case MINUS: op = OP_SUBTRACTION; break;
        case MULTIPLY: op = OP_MULTIPLICATION; break;
        case DIVIDE: op = OP_DIVIDE; break;
        case MODULO: op = OP_MODULUS; break;
        case EQUAL: op = OP_EQUAL; break;
        case NOTEQUAL: op = OP_NOT_EQUAL; break;
        case LESS: op = OP_LESS; break;
        case LESSEQUAL: op = OP_LESS_EQUAL; break;
        case GREATER: op = OP_GREATER; break;
        case GREATEREQUAL: op = OP_GREATER_EQUAL; break;
        case AND: op = OP_LOGICAL_AND; break;
        case OR: op = OP_LOGICAL_OR; break;
        default: return invalidExpression("Invalid binary operator");
    }

    const Precedence precedence = precedenceOf(currentType());
    advance();
    ParseNode rhs = expression(precedence);
    if(!noErrors()) return rhs;

    return parse_tree.addNode<2>(op, {lhs, rhs});
}

ParseNode Parser::call(ParseNode callee) alloc_except {
    advance();

    parse_tree.prepareNary();
    parse_tree.addNaryChild(callee);
    skipNewlines();
    while(!peek(RIGHTPAREN) && !peek(ENDOFFILE) && noErrors()){
        parse_tree.addNaryChild(expression());
        skipNewlines();
        if(!match(COMMA)) break;
        skipNewlines();
    }

    consume(RIGHTPAREN);
    if(!noErrors()){
        parse_tree.cancelNary();
        return error_node;
    }

    return parse_tree.finishNary(OP_CALL, Selection(parse_tree.getLeft(callee), rMarkPrev()));
}

ParseNode Parser::subscript(ParseNode object) alloc_except {
    advance();

    ParseNode index = expression();
    if(!noErrors()) return index;
    consume(RIGHTBRACKET);
    if(!noErrors()) return error_node;

    return parse_tree.addNode<2>(OP_SUBSCRIPT_ACCESS, Selection(parse_tree.getLeft(object), rMarkPrev()), {object, index});
}

ParseNode Parser::grouping() alloc_except {
    advance();

    ParseNode expr = expression();
    if(!noErrors()) return expr;
    if(!match(RIGHTPAREN)) return expected("RightParen");

    return expr;
}

ParseNode Parser::array() alloc_except {
    const Marker left = lMark();
    advance();

    parse_tree.prepareNary();
    skipNewlines();
    while(!peek(RIGHTBRACKET) && !peek(ENDOFFILE) && noErrors()){
        parse_tree.addNaryChild(expression());
        skipNewlines();
        if(match(COMMA)) skipNewlines();
    }

    consume(RIGHTBRACKET);
    if(!noErrors()){
        parse_tree.cancelNary();
        return error_node;
    }

    return parse_tree.finishNary(OP_ARRAY, Selection(left, rMarkPrev()));
}

ParseNode Parser::dict() alloc_except {
    const Marker left = lMark();
    advance();

    parse_tree.prepareNary();
    skipNewlines();
    while(!peek(RIGHTBRACE) && !peek(ENDOFFILE) && noErrors()){
        if(!peek(IDENTIFIER) && !peek(STRING)){
            expected("identifier or string");
            break;
        }

        ParseNode key = parse_tree.addTerminal(OP_STRING, selection(), current.text);
        advance();
        consume(COLON);
        ParseNode value = expression();
        if(!noErrors()) break;
        parse_tree.addNaryChild(parse_tree.addNode<2>(OP_DICT_ENTRY, {key, value}));

        skipNewlines();
        if(match(COMMA)) skipNewlines();
    }

    if(noErrors()) consume(RIGHTBRACE);
    if(!noErrors()){
        parse_tree.cancelNary();
        return error_node;
    }

    return parse_tree.finishNary(OP_DICT, Selection(left, rMarkPrev()));
}

ParseNode Parser::unary(Op type) alloc_except {
    const Marker left = lMark();
    advance();

    ParseNode operand = expression(PREC_PREFIX);
    if(!noErrors()) return operand;

    return parse_tree.addLeftUnary(type, left, operand);
}

ParseNode Parser::ifExpression() alloc_except {
    const Marker left = lMark();
    advance();

    ParseNode condition = parenCondition();
    if(!noErrors()) return condition;
    skipNewlines();
    ParseNode then_block = bracedBlock();
    if(!noErrors()) return then_block;
    Marker right = rMarkPrev();
    skipNewlines();

    const Marker elif_left = lMark();
    parse_tree.prepareNary();
    while(peek(ELIF) && noErrors()){
        const Marker branch_left = lMark();
        advance();
        ParseNode elif_condition = parenCondition();
        skipNewlines();
        ParseNode elif_block = bracedBlock();
        if(!noErrors()) break;
        right = rMarkPrev();
        parse_tree.addNaryChild(
            parse_tree.addNode<2>(OP_ELIF, Selection(branch_left, right), {elif_condition, elif_block}));
        skipNewlines();
    }
    ParseNode elifs = parse_tree.finishNary(OP_LIST, Selection(elif_left, elif_left < right ? right : elif_left));
    if(!noErrors()) return error_node;

    ParseNode else_block = NONE;
    if(match(ELSE)){
        skipNewlines();
        else_block = bracedBlock();
        if(!noErrors()) return else_block;
        right = rMarkPrev();
    }

    return parse_tree.addNode<4>(OP_IF, Selection(left, right), {condition, then_block, elifs, else_block});
}

ParseNode Parser::lambda() alloc_except {
    const Marker left = lMark();
    advance();

    consume(LEFTPAREN);
    if(!noErrors()) return error_node;
    ParseNode params = paramList();
    consume(RIGHTPAREN);
    if(!noErrors()) return error_node;
    skipNewlines();
    ParseNode body = bracedBlock();
    if(!noErrors()) return body;

    return parse_tree.addNode<2>(OP_LAMBDA, Selection(left, rMarkPrev()), {params, body});
}

ParseNode Parser::arrowLambda() alloc_except {
    const Marker left = lMark();
    advance();

    ParseNode params;
    if(match(LEFTPAREN)){
        params = paramList();
        consume(RIGHTPAREN);
    }else if(peek(IDENTIFIER)){
        const Selection binder_sel = selection();
        ParseNode binder = binderIdentifier();
        if(!noErrors()) return binder;
        params = parse_tree.addUnary(OP_LIST, binder_sel, binder);
    }else{
        return expected("identifier or '('");
    }

    consume(ARROW);
    if(!noErrors()) return error_node;

    ParseNode expr = expression();
    if(!noErrors()) return expr;

    //The arrow body is stored as a block holding a single return
    const Selection body_sel = parse_tree.getSelection(expr);
    ParseNode ret = parse_tree.addUnary(OP_RETURN, body_sel, expr);
    ParseNode body = parse_tree.addUnary(OP_BLOCK, body_sel, ret);

    return parse_tree.addNode<2>(OP_LAMBDA, Selection(left, rMarkPrev()), {params, body});
}

ParseNode Parser::identifier() alloc_except {
    ParseNode pn = parse_tree.addTerminal(OP_IDENTIFIER, selection(), current.text);
    advance();

    return pn;
}

ParseNode Parser::declarationIdentifier() alloc_except {
    if(!peek(IDENTIFIER)) return expected("identifier");

    const std::string& name = current.text;
    if(isNumeric(name.front()))
        return error(INVALID_IDENTIFIER, Messages::invalidIdentifier(lMark(), name, "identifiers cannot start with a digit"));
    else if(!isDeclarationName(name))
        return error(INVALID_IDENTIFIER, Messages::invalidIdentifier(lMark(), name,
            "variable and function names must be UPPER_SNAKE_CASE, e.g. MY_VAR or CALCULATE_SUM"));

    return identifier();
}

ParseNode Parser::binderIdentifier() alloc_except {
    if(!peek(IDENTIFIER)) return expected("identifier");

    const std::string& name = current.text;
    if(isNumeric(name.front()))
        return error(INVALID_IDENTIFIER, Messages::invalidIdentifier(lMark(), name, "identifiers cannot start with a digit"));
    else if(!isBinderName(name))
        return error(INVALID_IDENTIFIER, Messages::invalidIdentifier(lMark(), name,
            "parameter names may only contain letters, digits and underscores"));

    return identifier();
}

ParseNode Parser::number() alloc_except {
    ParseNode pn = parse_tree.addTerminal(OP_NUMBER, selection());
    parse_tree.setDouble(pn, current.number);
    advance();

    return pn;
}

ParseNode Parser::string() alloc_except {
    ParseNode pn = parse_tree.addTerminal(peek(BIGINTEGER) ? OP_BIG_INTEGER : OP_STRING, selection(), current.text);
    advance();

    return pn;
}

Parser::Precedence Parser::precedenceOf(AetherTokenType type) const noexcept {
    switch (type) {
        case OR: return PREC_OR;
        case AND: return PREC_AND;
        case EQUAL:
        case NOTEQUAL: return PREC_EQUALS;
        case LESS:
        case LESSEQUAL:
        case GREATER:
        case GREATEREQUAL: return PREC_COMPARISON;
        case PLUS:
        case MINUS: return PREC_SUM;
        case MULTIPLY:
        case DIVIDE:
        case MODULO: return PREC_PRODUCT;
        case LEFTPAREN: return PREC_CALL;
        case LEFTBRACKET: return PREC_INDEX;
        default: return PREC_LOWEST;
    }
}

bool Parser::atExpressionBoundary() const noexcept {
    switch (currentType()) {
        case NEWLINE:
        case SEMICOLON:
        case ENDOFFILE:
        case RIGHTPAREN:
        case RIGHTBRACKET:
        case RIGHTBRACE:
        case COMMA:
        case COLON:
            return true;
        default:
            return false;
    }
}

ParseNode Parser::error(ErrorCode code, const std::string& message) alloc_except {
    return error(code, selection(), message);
}

ParseNode Parser::error(ErrorCode code, const Selection& sel, const std::string& message) alloc_except {
    if(noErrors()){
        error_stream.fail(sel, code, message);
        error_node = parse_tree.addTerminal(OP_ERROR, sel);
    }

    return error_node;
}

ParseNode Parser::expected(std::string_view description) alloc_except {
    if(peek(ENDOFFILE)) return error(UNEXPECTED_END_OF_INPUT, Messages::unexpectedEndOfInput(lMark()));
    return error(UNEXPECTED_TOKEN, Messages::unexpectedToken(lMark(), description, current.debugString()));
}

ParseNode Parser::invalidExpression(std::string_view reason) alloc_except {
    return error(INVALID_EXPRESSION, Messages::invalidExpression(lMark(), reason));
}

ParseNode Parser::invalidStatement(std::string_view reason) alloc_except {
    return error(INVALID_STATEMENT, Messages::invalidStatement(lMark(), reason));
}

void Parser::advance() alloc_except {
    previous = std::move(current);
    current = std::move(next);
    next = scanner.next();
}

bool Parser::match(AetherTokenType type) alloc_except {
    if(current.type == type){
        advance();
        return true;
    }else{
        return false;
    }
}

bool Parser::peek(AetherTokenType type) const noexcept {
    return current.type == type;
}

bool Parser::lookahead(AetherTokenType type) const noexcept {
    return next.type == type;
}

void Parser::consume(AetherTokenType type) alloc_except {
    if(!noErrors()) return;
    if(!match(type)) expected(tokenName(type));
}

void Parser::skipNewlines() alloc_except {
    while(current.type == NEWLINE) advance();
}

void Parser::skipTerminator() alloc_except {
    if(current.type == NEWLINE || current.type == SEMICOLON) advance();
}

AetherTokenType Parser::currentType() const noexcept {
    return current.type;
}

ParseNode Parser::terminalAndAdvance(Op type) alloc_except {
    ParseNode pn = parse_tree.addTerminal(type, selection());
    advance();

    return pn;
}

const Selection& Parser::selection() const noexcept {
    return current.sel;
}

const Marker& Parser::lMark() const noexcept {
    return current.sel.left;
}

const Marker& Parser::rMark() const noexcept {
    return current.sel.right;
}

const Marker& Parser::rMarkPrev() const noexcept {
    return previous.sel.right;
}

bool Parser::noErrors() const noexcept {
    return error_stream.noErrors();
}

}

}
