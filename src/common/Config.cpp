#include "common/Config.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <openssl/crypto.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace zonesync::common {

namespace {

std::string trim(const std::string& sValue) {
  const auto nFirst = sValue.find_first_not_of(" \t\r\n");
  if (nFirst == std::string::npos) {
    return {};
  }
  const auto nLast = sValue.find_last_not_of(" \t\r\n");
  return sValue.substr(nFirst, nLast - nFirst + 1);
}

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    size_t nPos = 0;
    const int iValue = std::stoi(sValue, &nPos);
    if (nPos != sValue.size()) {
      throw std::invalid_argument(sValue);
    }
    return iValue;
  } catch (const std::logic_error&) {
    throw ConfigurationError("invalid_config",
                             std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  return sValue == "true" || sValue == "1" || sValue == "yes";
}

std::string Config::loadOptionalSecret(const char* pVarName) {
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    return {};
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw ConfigurationError(
        "invalid_config",
        std::string("Cannot open secret file specified by ") + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  // Trim trailing whitespace/newlines
  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw ConfigurationError(
        "invalid_config",
        std::string("Secret file is empty: ") + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

std::vector<std::string> Config::splitList(const std::string& sValue) {
  std::vector<std::string> vItems;
  std::istringstream iss(sValue);
  std::string sItem;
  while (std::getline(iss, sItem, ',')) {
    sItem = trim(sItem);
    if (!sItem.empty()) {
      vItems.push_back(sItem);
    }
  }
  return vItems;
}

void Config::cleanseSecrets() {
  if (!sPassword.empty()) {
    OPENSSL_cleanse(sPassword.data(), sPassword.size());
    sPassword.clear();
  }
}

Config Config::load() {
  Config cfg;

  // ── Required vars ──────────────────────────────────────────────────────
  cfg.sServer = trim(getEnv("ZONESYNC_SERVER"));
  if (cfg.sServer.empty()) {
    throw ConfigurationError("missing_server",
                             "Required environment variable ZONESYNC_SERVER is not set");
  }
  while (!cfg.sServer.empty() && cfg.sServer.back() == '/') {
    cfg.sServer.pop_back();
  }

  // ── Backend ────────────────────────────────────────────────────────────
  const std::string sProvider = getEnv("ZONESYNC_PROVIDER");
  if (!sProvider.empty()) {
    cfg.sProvider = sProvider;
  }
  cfg.sPassword = loadOptionalSecret("ZONESYNC_PASSWORD");
  cfg.bTlsInsecureSkipVerify = getEnvBool("ZONESYNC_TLS_INSECURE_SKIP_VERIFY", false);
  cfg.bDryRun = getEnvBool("ZONESYNC_DRY_RUN", false);

  // ── Domain scoping ─────────────────────────────────────────────────────
  cfg.vDomainFilter = splitList(getEnv("ZONESYNC_DOMAIN_FILTER"));
  cfg.vExcludeDomains = splitList(getEnv("ZONESYNC_EXCLUDE_DOMAINS"));
  cfg.sRegexDomainFilter = getEnv("ZONESYNC_REGEX_DOMAIN_FILTER");
  cfg.sRegexDomainExclusion = getEnv("ZONESYNC_REGEX_DOMAIN_EXCLUSION");

  // ── Runtime ────────────────────────────────────────────────────────────
  cfg.iHttpTimeoutSeconds = getEnvInt("ZONESYNC_HTTP_TIMEOUT_SECONDS", 30);
  cfg.iListThreads = getEnvInt("ZONESYNC_LIST_THREADS", 3);

  const std::string sLogLevel = getEnv("ZONESYNC_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // ── Validation ─────────────────────────────────────────────────────────

  const bool bHasList = !cfg.vDomainFilter.empty() || !cfg.vExcludeDomains.empty();
  const bool bHasRegex = !cfg.sRegexDomainFilter.empty() || !cfg.sRegexDomainExclusion.empty();
  if (bHasList && bHasRegex) {
    throw ConfigurationError(
        "invalid_filter",
        "ZONESYNC_DOMAIN_FILTER/ZONESYNC_EXCLUDE_DOMAINS cannot be combined with "
        "ZONESYNC_REGEX_DOMAIN_FILTER/ZONESYNC_REGEX_DOMAIN_EXCLUSION");
  }

  if (cfg.iHttpTimeoutSeconds < 1) {
    throw ConfigurationError("invalid_config",
                             "ZONESYNC_HTTP_TIMEOUT_SECONDS must be >= 1 (got " +
                                 std::to_string(cfg.iHttpTimeoutSeconds) + ")");
  }

  if (cfg.iListThreads < 1) {
    throw ConfigurationError("invalid_config",
                             "ZONESYNC_LIST_THREADS must be >= 1 (got " +
                                 std::to_string(cfg.iListThreads) + ")");
  }

  Logger::parseLevel(cfg.sLogLevel);

  return cfg;
}

}  // namespace zonesync::common
