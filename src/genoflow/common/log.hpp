/**
 * @file log.hpp
 * @brief Logger construction helpers.
 */
#pragma once
#include "genoflow/common/common.hpp"
#include <spdlog/spdlog.h>

namespace genoflow
{

using LoggerPtr = std::shared_ptr<spdlog::logger>;

/**
 * @brief Build a logger writing to stderr and, optionally, to a file.
 *
 * @details
 * Components never reach for a global logger; they receive a LoggerPtr and
 * stay silent when it is null. The returned logger is not registered with
 * spdlog's global registry, so several runs can each own one.
 *
 * @param name Logger name shown in every line.
 * @param level Minimum level emitted.
 * @param log_file If non-empty, lines are also appended to this file.
 *        Parent directories are created.
 */
LoggerPtr make_logger(const std::string& name,
                      spdlog::level::level_enum level = spdlog::level::info,
                      const std::string& log_file = {});

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn"/"warning",
 *        "error", "critical", "off"), case-insensitively.
 * @return The level, or std::nullopt if unrecognized.
 */
std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

} // namespace genoflow
