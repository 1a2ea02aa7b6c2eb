#include "diagnostics.hpp"

#include "logger.hpp"

#include <log4cplus/logger.h>
#include <log4cplus/loggingmacros.h>

namespace rpcgate {

void LogDiagnostics::emit(const std::string& category, const std::string& message) {
    log4cplus::Logger logger = category == diag::kSecurity
                                   ? security_logger()
                                   : log4cplus::Logger::getInstance(LOG4CPLUS_STRING_TO_TSTRING("rpcgate." + category));

    if (category == diag::kHandlerError || category == diag::kDefect) {
        LOG4CPLUS_ERROR(logger, message);
    } else if (category == diag::kSecurity || category == diag::kRateLimit || category == diag::kSubscriber) {
        LOG4CPLUS_WARN(logger, message);
    } else {
        LOG4CPLUS_INFO(logger, message);
    }
}

DiagnosticsSink& default_diagnostics() {
    static LogDiagnostics sink;
    return sink;
}

} // namespace rpcgate
