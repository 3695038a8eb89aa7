#include <aether_error.h>
#include <aether_parser.h>
#include <aether_scanner.h>
#include "report.h"

using namespace Aether;
using namespace Code;

static std::string parseDump(const std::string& src, ErrorStream& error_stream){
    Scanner scanner(src);
    Parser parser(scanner, error_stream);
    parser.parseAll();

    return parser.parse_tree.dump();
}

static bool testDump(const std::string& src, const std::string& expected, int line){
    ErrorStream error_stream;
    const std::string actual = parseDump(src, error_stream);

    if(!error_stream.noErrors()){
        std::cout << "Line " << line << ", unexpected parse error: " << error_stream.getErrors().front().message << std::endl;
        return false;
    }else if(actual != expected){
        std::cout << "Line " << line << ", Parser does not get expected result:\n";
        std::cout << "Expected: " << expected << '\n'
                  << "Actual:   " << actual << std::endl;
        return false;
    }

    return true;
}

static bool testParseError(const std::string& src, ErrorCode code, int line){
    ErrorStream error_stream;
    const std::string dump = parseDump(src, error_stream);

    if(error_stream.getErrors().size() != 1){
        std::cout << "Line " << line << ", expected exactly one error, got " << error_stream.getErrors().size() << std::endl;
        return false;
    }else if(error_stream.getErrors().front().code != code){
        std::cout << "Line " << line << ", wrong error code " << error_stream.getErrors().front().code
                  << ": " << error_stream.getErrors().front().message << std::endl;
        return false;
    }else if(!dump.empty()){
        std::cout << "Line " << line << ", failed parse should leave no tree: " << dump << std::endl;
        return false;
    }

    return true;
}

static bool testStatementType(const std::string& src, Op type){
    ErrorStream error_stream;
    Scanner scanner(src);
    Parser parser(scanner, error_stream);
    parser.parseAll();
    if(!error_stream.noErrors()) return false;

    const ParseTree& parse_tree = parser.parse_tree;
    ParseNode root = parse_tree.root;
    assert(parse_tree.getOp(root) == OP_BLOCK);
    ParseNode stmt = parse_tree.arg(root, 0);
    if(parse_tree.getOp(stmt) != type){
        std::cout << "Expected type " << opName(type) << ", got " << opName(parse_tree.getOp(stmt)) << std::endl;
        return false;
    }

    return true;
}

inline bool testParser(){
    bool passing = true;

    //Precedence and associativity
    passing &= testDump("5 + 3 * 2", "(block (expr_stmt (add 5 (mul 3 2))))", __LINE__);
    passing &= testDump("(5 + 3) * 2", "(block (expr_stmt (mul (add 5 3) 2)))", __LINE__);
    passing &= testDump("10 - 4 - 3", "(block (expr_stmt (sub (sub 10 4) 3)))", __LINE__);
    passing &= testDump("A || B && C == D < E + F * -G",
                        "(block (expr_stmt (or A (and B (eq C (lt D (add E (mul F (neg G)))))))))", __LINE__);
    passing &= testDump("!X != Y % 2", "(block (expr_stmt (ne (not X) (mod Y 2))))", __LINE__);
    passing &= testDump("M[1](2)", "(block (expr_stmt (call (index M 1) 2)))", __LINE__);
    passing &= testDump("F(G(1), [2, 3], Null, False)", "(block (expr_stmt (call F (call G 1) (array 2 3) Null False)))", __LINE__);

    //Set and its whitespace-sensitive index form
    passing &= testDump("Set X 1", "(block (set X 1))", __LINE__);
    passing &= testDump("Set ARR [1, 2, 3]", "(block (set ARR (array 1 2 3)))", __LINE__);
    passing &= testDump("Set ARR[0] 5", "(block (set_index ARR 0 5))", __LINE__);
    passing &= testDump("Set ARR[I + 1] ARR[I]", "(block (set_index ARR (add I 1) (index ARR I)))", __LINE__);
    passing &= testDump("Set BIG 9999999999999999", "(block (set BIG 9999999999999999n))", __LINE__);
    passing &= testDump("Set S \"hi\"; Set T True", "(block (set S \"hi\") (set T True))", __LINE__);
    passing &= testDump("Set A [\n1,\n2\n]", "(block (set A (array 1 2)))", __LINE__);
    passing &= testDump("Set D {\"name\": \"Alice\", age: 3}",
                        "(block (set D (dict (entry \"name\" \"Alice\") (entry \"age\" 3))))", __LINE__);
    passing &= testDump("Set _PRIVATE_2 1", "(block (set _PRIVATE_2 1))", __LINE__);
    passing &= testDump("Set GRÜSSE 1", "(block (set GRÜSSE 1))", __LINE__);
    passing &= testDump("Set ÄB Ω", "(block (set ÄB Ω))", __LINE__);

    //Definitions
    passing &= testDump("Func ADD(a, b) {\n    Return a + b\n}",
                        "(block (func ADD (list a b) (block (return (add a b)))))", __LINE__);
    passing &= testDump("Func F() { Return }", "(block (func F (list) (block (return Null))))", __LINE__);
    passing &= testDump("Func F(x,)\n{\n}", "(block (func F (list x) (block)))", __LINE__);
    passing &= testDump("Generator GEN() { Yield 1 }", "(block (generator GEN (list) (block (yield 1))))", __LINE__);
    passing &= testDump("Lazy VAL (1 + 2)", "(block (lazy VAL (add 1 2)))", __LINE__);

    //Lambdas
    passing &= testDump("Lambda x -> (x + 1)",
                        "(block (expr_stmt (lambda (list x) (block (return (add x 1))))))", __LINE__);
    passing &= testDump("Lambda (ACC, X) -> ACC + X",
                        "(block (expr_stmt (lambda (list ACC X) (block (return (add ACC X))))))", __LINE__);
    passing &= testDump("Func(x) { Return x }", "(block (expr_stmt (lambda (list x) (block (return x)))))", __LINE__);
    passing &= testDump("Lambda größe -> größe", "(block (expr_stmt (lambda (list größe) (block (return größe)))))", __LINE__);
    passing &= testDump("Lambda ა -> ა", "(block (expr_stmt (lambda (list ა) (block (return ა)))))", __LINE__);
    passing &= testDump("Func(ক, x²) { Return ক }", "(block (expr_stmt (lambda (list ক x²) (block (return ক)))))", __LINE__);

    //Control flow
    passing &= testDump("While (X < 10) { Set X X + 1 }", "(block (while (lt X 10) (block (set X (add X 1)))))", __LINE__);
    passing &= testDump("For X In ITEMS { }", "(block (for X ITEMS (block)))", __LINE__);
    passing &= testDump("For I, V In RANGE(0, 10) { PRINT(I, V) }",
                        "(block (for_indexed I V (call RANGE 0 10) (block (expr_stmt (call PRINT I V)))))", __LINE__);
    passing &= testDump("While (True) {\n    Break\n    Continue\n}", "(block (while True (block (break) (continue))))", __LINE__);
    passing &= testDump(
        "Switch (X) {\n"
        "    Case 1:\n"
        "        PRINT(\"one\")\n"
        "    Case 2: PRINT(\"two\"); Break\n"
        "    Default:\n"
        "        PRINT(\"other\")\n"
        "}",
        "(block (switch X"
        " (case 1 (block (expr_stmt (call PRINT \"one\"))))"
        " (case 2 (block (expr_stmt (call PRINT \"two\")) (break)))"
        " (default (block (expr_stmt (call PRINT \"other\"))))))",
        __LINE__);
    passing &= testDump(
        "If (X > 1) { PRINT(1) } Elif (X > 0) { PRINT(0) } Else { PRINT(-1) }",
        "(block (expr_stmt (if (gt X 1) (block (expr_stmt (call PRINT 1)))"
        " (list (elif (gt X 0) (block (expr_stmt (call PRINT 0)))))"
        " (block (expr_stmt (call PRINT (neg 1)))))))",
        __LINE__);
    passing &= testDump("If (X) {\n}\nElse {\n}", "(block (expr_stmt (if X (block) (list) (block))))", __LINE__);
    passing &= testDump("If (X) { }\n-5", "(block (expr_stmt (if X (block) (list) _)) (expr_stmt (neg 5)))", __LINE__);
    passing &= testDump("Set X 2 * If (A) { 1 }\n-3",
                        "(block (set X (mul 2 (if A (block (expr_stmt 1)) (list) _))) (expr_stmt (neg 3)))", __LINE__);
    passing &= testDump("Set X 2 * If (A) { 1 } + 3",
                        "(block (set X (add (mul 2 (if A (block (expr_stmt 1)) (list) _)) 3)))", __LINE__);

    //Modules and exceptions
    passing &= testDump("Import { A As B, C } From \"lib\"", "(block (import \"lib\" (list A C) (list B _)))", __LINE__);
    passing &= testDump("Import MATH From \"math\"", "(block (import \"math\" (list MATH) (list _)))", __LINE__);
    passing &= testDump("Export X", "(block (export X))", __LINE__);
    passing &= testDump("Throw \"bad\"", "(block (throw \"bad\"))", __LINE__);

    //Layout
    passing &= testDump("", "(block)", __LINE__);
    passing &= testDump("\n\n// only a comment\n", "(block)", __LINE__);
    passing &= testDump("/* header */\nSet X 1\n\n\nSet Y 2\n", "(block (set X 1) (set Y 2))", __LINE__);

    passing &= testStatementType("Set X 1", OP_SET);
    passing &= testStatementType("Set X[1] 1", OP_SET_INDEX);
    passing &= testStatementType("Set X [1]", OP_SET);
    passing &= testStatementType("F(1)", OP_EXPR_STMT);

    //Errors
    passing &= testParseError("Set x 1", INVALID_IDENTIFIER, __LINE__);
    passing &= testParseError("Set myVar 1", INVALID_IDENTIFIER, __LINE__);
    passing &= testParseError("Set GRÖßE 1", INVALID_IDENTIFIER, __LINE__);
    passing &= testParseError("Set X If (A) { 1 }\n* 3", INVALID_EXPRESSION, __LINE__);
    passing &= testParseError("Set X 2 * If (A) { 1 }\n* 3", INVALID_EXPRESSION, __LINE__);
    passing &= testParseError("PRINT(1 + If (A) { 1 }\n+ 2)", UNEXPECTED_TOKEN, __LINE__);
    passing &= testParseError("Func myFunc() { }", INVALID_IDENTIFIER, __LINE__);
    passing &= testParseError("Generator gen() { }", INVALID_IDENTIFIER, __LINE__);
    passing &= testParseError("Lazy lazy (1)", INVALID_IDENTIFIER, __LINE__);
    passing &= testParseError("Set x 1\nSet y 2", INVALID_IDENTIFIER, __LINE__);
    passing &= testParseError("Set 1X 2", UNEXPECTED_TOKEN, __LINE__);
    passing &= testParseError("Set X", UNEXPECTED_END_OF_INPUT, __LINE__);
    passing &= testParseError("5 +", UNEXPECTED_END_OF_INPUT, __LINE__);
    passing &= testParseError("Set X (1 + 2", UNEXPECTED_END_OF_INPUT, __LINE__);
    passing &= testParseError("Set X [1, 2", UNEXPECTED_END_OF_INPUT, __LINE__);
    passing &= testParseError("Func ADD(a-b) { }", UNEXPECTED_TOKEN, __LINE__);
    passing &= testParseError("Func F(1x) { }", UNEXPECTED_TOKEN, __LINE__);
    passing &= testParseError("Lambda 1 -> 2", UNEXPECTED_TOKEN, __LINE__);
    passing &= testParseError("Lambda x 2", UNEXPECTED_TOKEN, __LINE__);
    passing &= testParseError("Elif (X) { }", INVALID_STATEMENT, __LINE__);
    passing &= testParseError("Case 1:", INVALID_STATEMENT, __LINE__);
    passing &= testParseError("Try { }", INVALID_STATEMENT, __LINE__);
    passing &= testParseError(")", INVALID_EXPRESSION, __LINE__);
    passing &= testParseError("Set X &", INVALID_EXPRESSION, __LINE__);
    passing &= testParseError("Force(X)", INVALID_EXPRESSION, __LINE__);
    passing &= testParseError("For X ITEMS { }", UNEXPECTED_TOKEN, __LINE__);
    passing &= testParseError("While X { }", UNEXPECTED_TOKEN, __LINE__);
    passing &= testParseError("Import A \"lib\"", UNEXPECTED_TOKEN, __LINE__);
    passing &= testParseError("Set D {1: 2}", UNEXPECTED_TOKEN, __LINE__);
    passing &= testParseError("Func F() {\n    Set X 1\n", UNEXPECTED_END_OF_INPUT, __LINE__);

    {
        ErrorStream error_stream;
        parseDump("Set X 1\nSet x 1", error_stream);
        const Error& err = error_stream.getErrors().front();
        const std::string expected =
            "Parse error at line 2, column 5: Invalid identifier 'x' - "
            "variable and function names must be UPPER_SNAKE_CASE, e.g. MY_VAR or CALCULATE_SUM";
        if(err.message != expected || err.line() != 2 || err.column() != 5){
            std::cout << "Line " << __LINE__ << ", unexpected error: " << err.message << std::endl;
            passing = false;
        }
    }

    {
        ErrorStream error_stream;
        parseDump("Set X 1 +", error_stream);
        const Error& err = error_stream.getErrors().front();
        if(err.message != "Parse error at line 1, column 10: Unexpected end of file"){
            std::cout << "Line " << __LINE__ << ", unexpected error: " << err.message << std::endl;
            passing = false;
        }
    }

    {
        ErrorStream error_stream;
        parseDump("While (X) 5", error_stream);
        const Error& err = error_stream.getErrors().front();
        if(err.message != "Parse error at line 1, column 11: Expected LeftBrace, found Number(5)"){
            std::cout << "Line " << __LINE__ << ", unexpected error: " << err.message << std::endl;
            passing = false;
        }
    }

    passing &= Parser::isDeclarationName("MY_VAR_2");
    passing &= Parser::isDeclarationName("_");
    passing &= !Parser::isDeclarationName("2FAST");
    passing &= !Parser::isDeclarationName("My_Var");
    passing &= !Parser::isDeclarationName("");
    passing &= Parser::isDeclarationName("ÄB_2");
    passing &= !Parser::isDeclarationName("Äb");
    passing &= !Parser::isDeclarationName("٣X");
    passing &= Parser::isBinderName("value2");
    passing &= Parser::isBinderName("größe");
    passing &= !Parser::isBinderName("2x");
    passing &= !Parser::isBinderName("a-b");
    passing &= Parser::isBinderName("ক");
    passing &= Parser::isBinderName("ლ");

    report("Code parser", passing);
    return passing;
}
