#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace zonesync::common {

/// Thin wrapper over spdlog's default logger.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("{} {} IN {} -> {}", sAction, sName, sType, sTarget);
class Logger {
 public:
  /// Install the "zonesync" stdout logger at the given level, or only change
  /// the level when already installed.
  /// Throws ConfigurationError for a level name spdlog does not know.
  static void init(const std::string& sLevel);

  /// Parse a level name ("trace" .. "critical", "warning", "off").
  static spdlog::level::level_enum parseLevel(const std::string& sLevel);

  /// Get the shared spdlog logger instance, initializing at "info" on first use.
  static std::shared_ptr<spdlog::logger> get();

 private:
  static bool _bInitialized;
};

}  // namespace zonesync::common
