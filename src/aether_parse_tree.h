#ifndef AETHER_PARSE_TREE_H
#define AETHER_PARSE_TREE_H

#include <aether_common.h>
#include "aether_parsenode_ops.h"
#include "aether_selection.h"
#include <array>
#include <cassert>
#include <string>
#include <vector>

namespace Aether {

namespace Code {

//Flat tree; each node is FIXED_FIELDS words followed by its child indices
class ParseTree {
public:
    ParseTree() noexcept = default;
    void clear() noexcept;
    bool empty() const noexcept;
    Op getOp(ParseNode pn) const noexcept;
    size_t getNumArgs(ParseNode pn) const noexcept;
    size_t getFlag(ParseNode pn) const noexcept;
    void setFlag(ParseNode pn, size_t flag) noexcept;
    Marker getLeft(ParseNode pn) const noexcept;
    void setLeft(ParseNode pn, const Marker& m) noexcept;
    Marker getRight(ParseNode pn) const noexcept;
    void setRight(ParseNode pn, const Marker& m) noexcept;
    Selection getSelection(ParseNode pn) const noexcept;
    void setSelection(ParseNode pn, const Selection& sel) noexcept;
    ParseNode arg(ParseNode pn, size_t index) const noexcept;
    template<size_t index> ParseNode arg(ParseNode pn) const noexcept;
    double getDouble(ParseNode pn) const noexcept;
    void setDouble(ParseNode pn, double val) noexcept;
    const std::string& getString(ParseNode pn) const noexcept;
    void setString(ParseNode pn, const std::string& str) alloc_except;
    ParseNode child(ParseNode pn) const noexcept;
    ParseNode paramList(ParseNode pn) const noexcept;
    ParseNode body(ParseNode pn) const noexcept;
    template<size_t N> ParseNode addNode(Op type, const Selection& sel, const std::array<ParseNode, N>& children) alloc_except;
    template<size_t N> ParseNode addNode(Op type, const std::array<ParseNode, N>& children) alloc_except;
    ParseNode addNode(Op type, const Selection& sel, const std::vector<ParseNode>& children) alloc_except;
    ParseNode addTerminal(Op type, const Selection& sel) alloc_except;
    ParseNode addTerminal(Op type, const Selection& sel, const std::string& str) alloc_except;
    ParseNode addUnary(Op type, const Selection& sel, ParseNode child) alloc_except;
    ParseNode addLeftUnary(Op type, const Marker& left, ParseNode child) alloc_except;

    void prepareNary() alloc_except;
    void addNaryChild(ParseNode pn) alloc_except;
    ParseNode finishNary(Op type, const Selection& sel) alloc_except;
    void cancelNary() noexcept;
    bool inFinalState() const noexcept;

    std::string dump(ParseNode pn) const alloc_except;
    std::string dump() const alloc_except;

    ParseNode root = NONE;

private:
    static constexpr size_t OP_OFFSET = 0;
    static constexpr size_t NUM_ARGS_OFFSET = 1;
    static constexpr size_t FLAG_OFFSET = 2;
    static constexpr size_t LEFT_MARKER_OFFSET = 3;
    static constexpr size_t RIGHT_MARKER_OFFSET = 6;
    static constexpr size_t FIXED_FIELDS = 9;

    template<typename T> ParseNode addNodeImpl(Op type, const Selection& sel, const T& children) alloc_except;
    void dumpHelper(std::string& out, ParseNode pn) const alloc_except;

    std::vector<size_t> data;
    std::vector<std::string> strings;
    std::vector<ParseNode> nary_construction_stack;
    std::vector<size_t> nary_start;
};

template<size_t index>
ParseNode ParseTree::arg(ParseNode pn) const noexcept {
    assert(index < getNumArgs(pn));
    return data[pn+FIXED_FIELDS+index];
}

template<size_t N>
ParseNode ParseTree::addNode(Op type, const Selection& sel, const std::array<ParseNode, N>& children) alloc_except {
    return addNodeImpl(type, sel, children);
}

template<size_t N>
ParseNode ParseTree::addNode(Op type, const std::array<ParseNode, N>& children) alloc_except {
    static_assert(N > 0);
    assert(children[0] != NONE && children.back() != NONE);
    return addNodeImpl(type, Selection(getLeft(children[0]), getRight(children.back())), children);
}

template<typename T>
ParseNode ParseTree::addNodeImpl(Op type, const Selection& sel, const T& children) alloc_except {
    ParseNode pn = data.size();
    data.resize(data.size() + FIXED_FIELDS);
    data[pn+OP_OFFSET] = type;
    data[pn+NUM_ARGS_OFFSET] = children.size();
    data[pn+FLAG_OFFSET] = NONE;
    setSelection(pn, sel);
    data.insert(data.end(), children.begin(), children.end());

    return pn;
}

}

}

#endif // AETHER_PARSE_TREE_H
