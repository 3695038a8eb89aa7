#include <aether_diagnostics.h>
#include <aether_document.h>
#include <aether_logging.h>
#include <aether_settings.h>
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace Aether;

static void printUsage(){
    std::cout <<
        "Usage: aether-check [options] FILE...\n"
        "\n"
        "Options:\n"
        "  --symbols         Print the symbol outline of each file\n"
        "  --log DIR         Write a debug log to DIR/log.txt\n"
        "  --set NAME=LEVEL  Set a warning level, e.g. naming-convention=error\n"
        "  -h, --help        Show this message\n";
}

static bool readFile(const std::string& path, std::string& out){
    std::ifstream in(path, std::ios::binary);
    if(!in.is_open()) return false;

    std::stringstream buffer;
    buffer << in.rdbuf();
    out = buffer.str();

    return true;
}

static void printSymbols(const std::string& path, const Code::SymbolTable& symbols){
    for(const Code::DocumentSymbol& symbol : symbols.toDocumentSymbols(path)){
        const Code::Range& range = symbol.location.range;
        std::cout << fmt::format("  {} {} {}:{}-{}:{}\n",
                                 Code::symbolKindName(symbol.kind), symbol.name,
                                 range.start.line+1, range.start.character+1,
                                 range.end.line+1, range.end.character+1);
    }
}

int main(int argc, char* argv[]){
    Code::Settings settings;
    bool show_symbols = false;
    std::vector<std::string> files;

    for(int i = 1; i < argc; i++){
        const std::string_view arg = argv[i];
        if(arg == "-h" || arg == "--help"){
            printUsage();
            return 0;
        }else if(arg == "--symbols"){
            show_symbols = true;
        }else if(arg == "--log" && i+1 < argc){
            initLogging(argv[++i]);
        }else if(arg == "--set" && i+1 < argc){
            if(!settings.parseOption(argv[++i])){
                std::cerr << "aether-check: invalid setting " << argv[i] << '\n';
                return 2;
            }
        }else if(!arg.empty() && arg.front() == '-'){
            std::cerr << "aether-check: unknown option " << arg << '\n';
            printUsage();
            return 2;
        }else{
            files.push_back(std::string(arg));
        }
    }

    if(files.empty()){
        printUsage();
        return 2;
    }

    bool had_error = false;
    for(const std::string& path : files){
        std::string text;
        if(!readFile(path, text)){
            std::cerr << "aether-check: cannot open " << path << '\n';
            had_error = true;
            continue;
        }

        const ParsedDocument doc = ParsedDocument::parse(text);
        for(const Code::Diagnostic& diagnostic : Code::DiagnosticEngine::analyze(doc, text, settings)){
            std::cout << fmt::format("{}:{}:{}: {}[{}]: {}\n",
                                     path, diagnostic.range.start.line+1, diagnostic.range.start.character+1,
                                     Code::severityName(diagnostic.severity), diagnostic.code, diagnostic.message);
            had_error |= (diagnostic.severity == Code::SEVERITY_ERROR);
        }

        if(show_symbols){
            std::cout << path << ":\n";
            printSymbols(path, doc.symbols());
        }
    }

    return had_error;
}
