/// \file  log.cpp
/// \brief Shared tunnel logger
///
/// UNCLASSIFIED
#include "log.hpp"

#include <stdexcept>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace muxtun {

static std::shared_ptr<spdlog::logger>
make_logger()
{
	std::shared_ptr<spdlog::logger> logger = spdlog::get("muxtun");
	if (!logger) {
		logger = spdlog::stderr_color_mt("muxtun");
		logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
		logger->set_level(spdlog::level::info);
	}
	return logger;
}

std::shared_ptr<spdlog::logger>
log()
{
	static const std::shared_ptr<spdlog::logger> logger = make_logger();
	return logger;
}

bool
is_log_level(const std::string &level)
{
	// from_str maps unrecognized names to "off"
	return level == "off" || spdlog::level::from_str(level) != spdlog::level::off;
}

void
set_log_level(const std::string &level)
{
	if (!is_log_level(level)) {
		throw std::invalid_argument("unknown log level '" + level + "'");
	}
	log()->set_level(spdlog::level::from_str(level));
}

}      // namespace muxtun
