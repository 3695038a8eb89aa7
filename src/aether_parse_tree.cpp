#include "aether_parse_tree.h"

#include <cstring>
#include <spdlog/fmt/fmt.h>

namespace Aether {

namespace Code {

static constexpr const char* op_names[NUM_OPS] = {
    "block",
    "list",
    "error",
    "set",
    "set_index",
    "func",
    "generator",
    "lazy",
    "return",
    "yield",
    "break",
    "continue",
    "while",
    "for",
    "for_indexed",
    "switch",
    "case",
    "default",
    "import",
    "export",
    "throw",
    "expr_stmt",
    "number",
    "big_integer",
    "string",
    "true",
    "false",
    "null",
    "identifier",
    "array",
    "dict",
    "entry",
    "add",
    "sub",
    "mul",
    "div",
    "mod",
    "eq",
    "ne",
    "lt",
    "le",
    "gt",
    "ge",
    "and",
    "or",
    "neg",
    "not",
    "call",
    "index",
    "if",
    "elif",
    "lambda",
};

const char* opName(Op op) noexcept {
    return op < NUM_OPS ? op_names[op] : "unknown";
}

void ParseTree::clear() noexcept {
    data.clear();
    strings.clear();
    nary_construction_stack.clear();
    nary_start.clear();
    root = NONE;
}

bool ParseTree::empty() const noexcept {
    return data.empty();
}

Op ParseTree::getOp(ParseNode pn) const noexcept {
    assert(pn < data.size());
    return data[pn+OP_OFFSET];
}

size_t ParseTree::getNumArgs(ParseNode pn) const noexcept {
    assert(pn < data.size());
    return data[pn+NUM_ARGS_OFFSET];
}

size_t ParseTree::getFlag(ParseNode pn) const noexcept {
    assert(pn < data.size());
    return data[pn+FLAG_OFFSET];
}

void ParseTree::setFlag(ParseNode pn, size_t flag) noexcept {
    assert(pn < data.size());
    data[pn+FLAG_OFFSET] = flag;
}

Marker ParseTree::getLeft(ParseNode pn) const noexcept {
    assert(pn < data.size());
    const size_t* m = data.data() + pn + LEFT_MARKER_OFFSET;
    return Marker(m[0], m[1], m[2]);
}

void ParseTree::setLeft(ParseNode pn, const Marker& m) noexcept {
    assert(pn < data.size());
    data[pn+LEFT_MARKER_OFFSET] = m.offset;
    data[pn+LEFT_MARKER_OFFSET+1] = m.line;
    data[pn+LEFT_MARKER_OFFSET+2] = m.column;
}

Marker ParseTree::getRight(ParseNode pn) const noexcept {
    assert(pn < data.size());
    const size_t* m = data.data() + pn + RIGHT_MARKER_OFFSET;
    return Marker(m[0], m[1], m[2]);
}

void ParseTree::setRight(ParseNode pn, const Marker& m) noexcept {
    assert(pn < data.size());
    data[pn+RIGHT_MARKER_OFFSET] = m.offset;
    data[pn+RIGHT_MARKER_OFFSET+1] = m.line;
    data[pn+RIGHT_MARKER_OFFSET+2] = m.column;
}

Selection ParseTree::getSelection(ParseNode pn) const noexcept {
    return Selection(getLeft(pn), getRight(pn));
}

void ParseTree::setSelection(ParseNode pn, const Selection& sel) noexcept {
    setLeft(pn, sel.left);
    setRight(pn, sel.right);
}

ParseNode ParseTree::arg(ParseNode pn, size_t index) const noexcept {
    assert(index < getNumArgs(pn));
    return data[pn+FIXED_FIELDS+index];
}

double ParseTree::getDouble(ParseNode pn) const noexcept {
    assert(getOp(pn) == OP_NUMBER);
    const size_t bits = getFlag(pn);
    double val;
    std::memcpy(&val, &bits, sizeof(double));

    return val;
}

void ParseTree::setDouble(ParseNode pn, double val) noexcept {
    static_assert(sizeof(double) == sizeof(size_t), "Doubles are stored in the flag field");
    size_t bits;
    std::memcpy(&bits, &val, sizeof(double));
    setFlag(pn, bits);
}

const std::string& ParseTree::getString(ParseNode pn) const noexcept {
    assert(getFlag(pn) < strings.size());
    return strings[getFlag(pn)];
}

void ParseTree::setString(ParseNode pn, const std::string& str) alloc_except {
    setFlag(pn, strings.size());
    strings.push_back(str);
}

ParseNode ParseTree::child(ParseNode pn) const noexcept {
    assert(getNumArgs(pn) == 1);
    return arg<0>(pn);
}

ParseNode ParseTree::paramList(ParseNode pn) const noexcept {
    switch(getOp(pn)){
        case OP_FUNC:
        case OP_GENERATOR: return arg<1>(pn);
        case OP_LAMBDA: return arg<0>(pn);
        default: assert(false); return NONE;
    }
}

ParseNode ParseTree::body(ParseNode pn) const noexcept {
    switch(getOp(pn)){
        case OP_FUNC:
        case OP_GENERATOR: return arg<2>(pn);
        case OP_LAMBDA:
        case OP_WHILE: return arg<1>(pn);
        case OP_FOR: return arg<2>(pn);
        case OP_FOR_INDEXED: return arg<3>(pn);
        default: assert(false); return NONE;
    }
}

ParseNode ParseTree::addNode(Op type, const Selection& sel, const std::vector<ParseNode>& children) alloc_except {
    return addNodeImpl(type, sel, children);
}

ParseNode ParseTree::addTerminal(Op type, const Selection& sel) alloc_except {
    return addNode<0>(type, sel, {});
}

ParseNode ParseTree::addTerminal(Op type, const Selection& sel, const std::string& str) alloc_except {
    ParseNode pn = addNode<0>(type, sel, {});
    setString(pn, str);

    return pn;
}

ParseNode ParseTree::addUnary(Op type, const Selection& sel, ParseNode child) alloc_except {
    return addNode<1>(type, sel, {child});
}

ParseNode ParseTree::addLeftUnary(Op type, const Marker& left, ParseNode child) alloc_except {
    return addNode<1>(type, Selection(left, getRight(child)), {child});
}

void ParseTree::prepareNary() alloc_except {
    nary_start.push_back(nary_construction_stack.size());
}

void ParseTree::addNaryChild(ParseNode pn) alloc_except {
    nary_construction_stack.push_back(pn);
}

ParseNode ParseTree::finishNary(Op type, const Selection& sel) alloc_except {
    assert(!nary_start.empty());
    const size_t N = nary_construction_stack.size()-nary_start.back();

    ParseNode pn = data.size();
    data.resize(data.size() + FIXED_FIELDS);
    data[pn+OP_OFFSET] = type;
    data[pn+NUM_ARGS_OFFSET] = N;
    data[pn+FLAG_OFFSET] = NONE;
    setSelection(pn, sel);
    data.insert(data.end(), nary_construction_stack.end()-N, nary_construction_stack.end());

    nary_construction_stack.resize(nary_start.back());
    nary_start.pop_back();

    return pn;
}

void ParseTree::cancelNary() noexcept {
    assert(!nary_start.empty());
    nary_construction_stack.resize(nary_start.back());
    nary_start.pop_back();
}

bool ParseTree::inFinalState() const noexcept {
    return nary_construction_stack.empty() && nary_start.empty();
}

std::string ParseTree::dump(ParseNode pn) const alloc_except {
    std::string out;
    dumpHelper(out, pn);

    return out;
}

std::string ParseTree::dump() const alloc_except {
    return empty() ? std::string() : dump(root);
}

void ParseTree::dumpHelper(std::string& out, ParseNode pn) const alloc_except {
    if(pn == NONE){
        out += '_';
        return;
    }

    switch(getOp(pn)){
        case OP_NUMBER: out += fmt::format("{}", getDouble(pn)); return;
        case OP_BIG_INTEGER: out += getString(pn) + 'n'; return;
        case OP_STRING: out += '"' + getString(pn) + '"'; return;
        case OP_IDENTIFIER: out += getString(pn); return;
        case OP_TRUE: out += "True"; return;
        case OP_FALSE: out += "False"; return;
        case OP_NULL: out += "Null"; return;
        default: break;
    }

    out += '(';
    out += opName(getOp(pn));
    for(size_t i = 0; i < getNumArgs(pn); i++){
        out += ' ';
        dumpHelper(out, arg(pn, i));
    }
    out += ')';
}

}

}
