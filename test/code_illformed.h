//Load every script under test/errors and test/in, checking the all-or-nothing parse contract

#include <aether_document.h>
#include "report.h"
#include <filesystem>

using std::filesystem::directory_iterator;

using namespace Aether;
using namespace Code;

inline bool testSingleErrorAndEmptyResult(const std::filesystem::path& path){
    const ParsedDocument doc = ParsedDocument::parse(readFile(path.string()));

    if(doc.errors().size() != 1){
        std::cout << path.filename() << ": expected exactly one error, got " << doc.errors().size() << std::endl;
        return false;
    }else if(!doc.ast().empty() || !doc.symbols().empty()){
        std::cout << path.filename() << ": failed parse should leave an empty tree and symbol table" << std::endl;
        return false;
    }

    return true;
}

inline bool testParsesCleanly(const std::filesystem::path& path){
    const ParsedDocument doc = ParsedDocument::parse(readFile(path.string()));

    if(!doc.errors().empty()){
        std::cout << path.filename() << ": " << doc.errors().front().message << std::endl;
        return false;
    }else if(doc.ast().root == NONE){
        std::cout << path.filename() << ": successful parse should produce a tree" << std::endl;
        return false;
    }

    return true;
}

inline bool testIllFormedPrograms(){
    bool passing = true;

    for(directory_iterator end, dir(BASE_TEST_DIR "/errors"); dir != end; dir++)
        if(std::filesystem::is_regular_file(dir->path()))
            passing &= testSingleErrorAndEmptyResult(dir->path());

    report("Ill-formed programs", passing);
    return passing;
}

inline bool testWellFormedPrograms(){
    bool passing = true;

    for(directory_iterator end, dir(BASE_TEST_DIR "/in"); dir != end; dir++)
        if(std::filesystem::is_regular_file(dir->path()))
            passing &= testParsesCleanly(dir->path());

    report("Well-formed programs", passing);
    return passing;
}
