#ifndef AETHER_PARSENODE_OPS_H
#define AETHER_PARSENODE_OPS_H

#include <cstddef>

namespace Aether {

namespace Code {

typedef size_t Op;

enum ParseNodeOp : Op {
    OP_BLOCK,
    OP_LIST,
    OP_ERROR,

    //Statements
    OP_SET,
    OP_SET_INDEX,
    OP_FUNC,
    OP_GENERATOR,
    OP_LAZY,
    OP_RETURN,
    OP_YIELD,
    OP_BREAK,
    OP_CONTINUE,
    OP_WHILE,
    OP_FOR,
    OP_FOR_INDEXED,
    OP_SWITCH,
    OP_CASE,
    OP_DEFAULT,
    OP_IMPORT,
    OP_EXPORT,
    OP_THROW,
    OP_EXPR_STMT,

    //Expressions
    OP_NUMBER,
    OP_BIG_INTEGER,
    OP_STRING,
    OP_TRUE,
    OP_FALSE,
    OP_NULL,
    OP_IDENTIFIER,
    OP_ARRAY,
    OP_DICT,
    OP_DICT_ENTRY,
    OP_ADDITION,
    OP_SUBTRACTION,
    OP_MULTIPLICATION,
    OP_DIVIDE,
    OP_MODULUS,
    OP_EQUAL,
    OP_NOT_EQUAL,
    OP_LESS,
    OP_LESS_EQUAL,
    OP_GREATER,
    OP_GREATER_EQUAL,
    OP_LOGICAL_AND,
    OP_LOGICAL_OR,
    OP_UNARY_MINUS,
    OP_LOGICAL_NOT,
    OP_CALL,
    OP_SUBSCRIPT_ACCESS,
    OP_IF,
    OP_ELIF,
    OP_LAMBDA,

    NUM_OPS
};

const char* opName(Op op) noexcept;

}

}

#endif // AETHER_PARSENODE_OPS_H
