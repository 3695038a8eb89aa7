#ifndef AETHER_LOGGING_H
#define AETHER_LOGGING_H

#include "spdlog/spdlog.h"
#include "spdlog/sinks/basic_file_sink.h"
#include <string>
#include <string_view>

namespace Aether {
inline std::shared_ptr<spdlog::logger> logger = spdlog::default_logger();
}

namespace Aether {

//Safe to call again; the previous file logger is replaced
inline void initLogging(const std::string& log_dir = "."){
    spdlog::drop("basic_logger");
    logger = spdlog::basic_logger_mt("basic_logger", log_dir + "/log.txt");
    logger->set_level(spdlog::level::debug);
}

inline std::string cStr(std::string_view str){
    std::string out;
    out += '"';
    for(char ch : str){
        if(ch == '\n' || ch == '\r'){
            out += "\\n";
        }else{
            if(ch == '"' || ch == '\\') out += '\\';
            out += ch;
        }
    }
    out += '"';

    return out;
}

}

#endif // AETHER_LOGGING_H
