#include "Logging.hpp"
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace Chronicle {

void initLogging(plog::Severity severity){
    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender(plog::streamStdErr);
    if(plog::get()){
        plog::get()->setMaxSeverity(severity);
        return;
    }
    plog::init(severity, &consoleAppender);
    PLOGD << "plog initialized (" << plog::severityToString(severity) << " -> stderr)";
}

plog::Severity severityFromConfig(const std::string &level){
    plog::Severity s = plog::severityFromString(level.c_str());
    // plog maps unknown names to none; keep info as the fallback
    if(s == plog::none && level != "none") return plog::info;
    return s;
}

} // namespace Chronicle
