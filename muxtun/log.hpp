/// \file  log.hpp
/// \brief Shared tunnel logger
///
/// UNCLASSIFIED
#ifndef MUXTUN_LOG_HEAD
#define MUXTUN_LOG_HEAD 1

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace muxtun {

/// The "muxtun" logger; created on first use with a colored stderr sink.
std::shared_ptr<spdlog::logger> log();

/// \param level one of trace, debug, info, warn, error, critical, off
/// \throw std::invalid_argument for any other name
void set_log_level(const std::string &level);

bool is_log_level(const std::string &level);

}      // namespace muxtun
#endif // MUXTUN_LOG_HEAD
