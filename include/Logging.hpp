#pragma once
#include <string>
#include <plog/Severity.h>

namespace Chronicle {

// Installs a plog console appender on stderr. Safe to call more than once;
// later calls only change the severity.
void initLogging(plog::Severity severity = plog::info);

// Maps ChronicleConfig::logLevel ("verbose", "debug", "info", ...) to plog.
plog::Severity severityFromConfig(const std::string &level);

} // namespace Chronicle
