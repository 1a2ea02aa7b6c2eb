#include "logger.hpp"

#include <filesystem>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>

namespace {

log4cplus::Logger named_logger(const char* name) {
	return log4cplus::Logger::getInstance(LOG4CPLUS_C_STR_TO_TSTRING(name));
}

std::filesystem::path resolve_config_path(const std::string& config_path) {
	std::filesystem::path path(config_path);
	return path.is_absolute() ? path : std::filesystem::current_path() / path;
}

} // namespace

log4cplus::Logger& core_logger() {
	static log4cplus::Logger logger = named_logger("rpcgate");
	return logger;
}

log4cplus::Logger& server_logger() {
	static log4cplus::Logger logger = named_logger("rpcgate.server");
	return logger;
}

log4cplus::Logger& client_logger() {
	static log4cplus::Logger logger = named_logger("rpcgate.client");
	return logger;
}

// Security findings also go to their own appender, see log4cplus.ini.
log4cplus::Logger& security_logger() {
	static log4cplus::Logger logger = named_logger("rpcgate.security");
	return logger;
}

void init_logging(const std::string& config_path) {
	try {
		auto resolved = resolve_config_path(config_path);
		if (std::filesystem::exists(resolved)) {
			std::filesystem::create_directories("logs");
			log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
			return;
		}
		log4cplus::helpers::LogLog::getLogLog()->warn(
			LOG4CPLUS_TEXT("Logging config not found: ") + LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
	} catch (const std::exception& exc) {
		log4cplus::helpers::LogLog::getLogLog()->error(
			LOG4CPLUS_TEXT("Failed to load logging config: ") + LOG4CPLUS_STRING_TO_TSTRING(std::string(exc.what())));
	}

	log4cplus::BasicConfigurator fallback;
	fallback.configure();
	log4cplus::Logger::getRoot().setLogLevel(log4cplus::INFO_LOG_LEVEL);
}
