#ifndef TEST_KEYWORDS_H
#define TEST_KEYWORDS_H

#include "report.h"
#include <aether_builtins.h>
#include <aether_parser.h>
#include <aether_scanner.h>

using namespace Aether;
using namespace Code;

inline bool testKeywords(){
    bool passing = true;

    std::string failing;

    for(const auto& entry : Scanner::keywords){
        Scanner scanner(entry.first);
        const Token token = scanner.next();
        const bool valid = token.type == entry.second && scanner.next().type == ENDOFFILE;
        passing &= valid;
        if(!valid) failing += std::string(entry.first) + " => " + tokenName(token.type) + '\n';
    }

    if(Scanner::keywords.size() != 29){
        printf("Expected 29 keywords, found %zu\n", Scanner::keywords.size());
        passing = false;
    }

    for(const Builtin& builtin : builtins()){
        bool valid = findBuiltin(builtin.name) == &builtin &&
                     Scanner::keywords.find(builtin.name) == Scanner::keywords.end() &&
                     Parser::isDeclarationName(builtin.name) &&
                     builtin.signature.substr(0, builtin.name.size()+1) == std::string(builtin.name) + '(' &&
                     !builtin.examples.empty();
        passing &= valid;
        if(!valid) failing += std::string(builtin.name) + " => " + std::string(builtin.signature) + '\n';
    }

    if(!failing.empty()) printf("The following entries are not valid:\n%s", failing.c_str());

    const Builtin* now = findBuiltin("NOW");
    if(now == nullptr || now->detail() != "NOW() - DateTime" ||
       now->documentation().find("Category: DateTime") == std::string::npos){
        printf("Line %d, NOW builtin mismatch\n", __LINE__);
        passing = false;
    }

    passing &= findBuiltin("NOPE") == nullptr;
    passing &= findBuiltin("println") == nullptr;

    report("Keywords and builtins", passing);
    return passing;
}

#endif // TEST_KEYWORDS_H
