#pragma once

#include <string>
#include <vector>

namespace zonesync::common {

/// Environment variable loader for the zonesync driver.
/// Loads all ZONESYNC_* variables into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Backend ───────────────────────────────────────────────────────────
  std::string sProvider = "pihole";
  std::string sServer;
  std::string sPassword;  // raw secret (zeroed after handoff to the provider)
  bool bTlsInsecureSkipVerify = false;
  bool bDryRun = false;

  // ── Domain scoping ────────────────────────────────────────────────────
  std::vector<std::string> vDomainFilter;
  std::vector<std::string> vExcludeDomains;
  std::string sRegexDomainFilter;
  std::string sRegexDomainExclusion;

  // ── Runtime ───────────────────────────────────────────────────────────
  int iHttpTimeoutSeconds = 30;
  int iListThreads = 3;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for ZONESYNC_PASSWORD.
  /// Throws ConfigurationError on missing required vars or invalid constraints.
  static Config load();

  /// Split a comma-separated list, trimming blanks and dropping empty items.
  static std::vector<std::string> splitList(const std::string& sValue);

  /// Wipe the secret once the provider owns its copy.
  void cleanseSecrets();

 private:
  /// Read an optional secret; falls back to the file named by varName + "_FILE".
  static std::string loadOptionalSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Read an env var as bool (true/false/1/0/yes), with a default.
  static bool getEnvBool(const char* pVarName, bool bDefault);
};

}  // namespace zonesync::common
