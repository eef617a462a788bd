#include "providers/PiholeRecordAdapter.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <arpa/inet.h>

#include <cstdio>
#include <exception>
#include <map>
#include <optional>
#include <utility>

#include <nlohmann/json.hpp>

namespace zonesync::providers {

namespace {

bool isValidIPv4(const std::string& sAddr) {
  in_addr addr{};
  return inet_pton(AF_INET, sAddr.c_str(), &addr) == 1;
}

bool isValidIPv6(const std::string& sAddr) {
  in6_addr addr{};
  return inet_pton(AF_INET6, sAddr.c_str(), &addr) == 1;
}

/// Split on spaces and commas, dropping empty fields.
std::vector<std::string> splitFields(const std::string& sLine) {
  std::vector<std::string> vFields;
  std::string sField;
  for (char c : sLine) {
    if (c == ' ' || c == ',') {
      if (!sField.empty()) vFields.push_back(std::move(sField));
      sField.clear();
    } else {
      sField += c;
    }
  }
  if (!sField.empty()) vFields.push_back(std::move(sField));
  return vFields;
}

bool isUnescapedPathChar(unsigned char c) {
  if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
    return true;
  }
  switch (c) {
    case '-': case '.': case '_': case '~':
    case '$': case '&': case '+': case '=': case ':': case '@':
      return true;
    default:
      return false;
  }
}

}  // anonymous namespace

PiholeRecordAdapter::PiholeRecordAdapter(std::unique_ptr<http::SessionClient> upClient,
                                         bool bDryRun)
    : _upClient(std::move(upClient)), _bDryRun(bDryRun) {
  if (!_upClient) {
    throw common::ConfigurationError("invalid_config", "PiholeRecordAdapter requires a client");
  }
}

PiholeRecordAdapter::~PiholeRecordAdapter() = default;

std::string PiholeRecordAdapter::name() const { return "pihole"; }

AdapterCapabilities PiholeRecordAdapter::capabilities() const {
  AdapterCapabilities cap;
  cap.bGroupsTargetsByKey = true;
  cap.bSupportsWildcards = false;
  cap.vRecordTypes = {std::string(common::kRecordTypeA), std::string(common::kRecordTypeAAAA),
                      std::string(common::kRecordTypeCNAME)};
  return cap;
}

std::string PiholeRecordAdapter::urlForRecordType(const std::string& sRecordType) const {
  if (sRecordType == common::kRecordTypeA || sRecordType == common::kRecordTypeAAAA) {
    return _upClient->server() + kConfigDnsPath + "/hosts";
  }
  if (sRecordType == common::kRecordTypeCNAME) {
    return _upClient->server() + kConfigDnsPath + "/cnameRecords";
  }
  throw common::ProviderError("unsupported_record_type",
                              "unsupported record type: " + sRecordType);
}

std::string PiholeRecordAdapter::entryFor(const common::Endpoint& ep, const std::string& sTarget) {
  if (ep.sRecordType == common::kRecordTypeCNAME) {
    if (ep.oTtl && *ep.oTtl > 0) {
      return ep.sDnsName + "," + sTarget + "," + std::to_string(*ep.oTtl);
    }
    return ep.sDnsName + "," + sTarget;
  }
  return sTarget + " " + ep.sDnsName;
}

std::string PiholeRecordAdapter::pathEscape(const std::string& sSegment) {
  std::string sOut;
  sOut.reserve(sSegment.size());
  for (char c : sSegment) {
    const auto uc = static_cast<unsigned char>(c);
    if (isUnescapedPathChar(uc)) {
      sOut += c;
    } else {
      char vHex[4];
      std::snprintf(vHex, sizeof(vHex), "%%%02X", uc);
      sOut += vHex;
    }
  }
  return sOut;
}

std::vector<common::Endpoint> PiholeRecordAdapter::parseRecords(
    const std::vector<std::string>& vLines, const std::string& sRecordType) {
  auto spLog = common::Logger::get();
  std::vector<common::Endpoint> vEndpoints;
  std::map<std::string, size_t> mIndexByName;

  for (const auto& sLine : vLines) {
    const auto vFields = splitFields(sLine);
    if (vFields.size() < 2) {
      spLog->warn("skipping record '{}': invalid format received from Pi-hole", sLine);
      continue;
    }

    // A/AAAA lines are "<ip> <name>", CNAME lines "<name>,<target>[,<ttl>]"
    std::string sName = vFields[1];
    std::string sTarget = vFields[0];
    std::optional<int64_t> oTtl;
    if (sRecordType == common::kRecordTypeA) {
      // The hosts list mixes A and AAAA entries
      if (!isValidIPv4(sTarget)) continue;
    } else if (sRecordType == common::kRecordTypeAAAA) {
      if (!isValidIPv6(sTarget)) continue;
    } else if (sRecordType == common::kRecordTypeCNAME) {
      std::swap(sName, sTarget);
      if (vFields.size() == 3) {
        try {
          size_t nPos = 0;
          const int64_t iTtl = std::stoll(vFields[2], &nPos);
          if (nPos != vFields[2].size()) throw std::invalid_argument(vFields[2]);
          if (iTtl > 0) oTtl = iTtl;
        } catch (const std::logic_error&) {
          spLog->warn("failed to parse TTL value received from Pi-hole '{}'; using the default",
                      vFields[2]);
        }
      }
    }

    auto it = mIndexByName.find(sName);
    if (it != mIndexByName.end()) {
      auto& epExisting = vEndpoints[it->second];
      epExisting.vTargets.push_back(sTarget);
      epExisting.oTtl = oTtl;
      continue;
    }
    mIndexByName.emplace(sName, vEndpoints.size());
    vEndpoints.push_back(common::Endpoint{sName, sRecordType, {sTarget}, oTtl});
  }
  return vEndpoints;
}

std::vector<common::Endpoint> PiholeRecordAdapter::listRecords(const std::string& sRecordType,
                                                               const common::Context& ctx) {
  const std::string sUrl = urlForRecordType(sRecordType);
  common::Logger::get()->debug("Listing {} records from {}", sRecordType, sUrl);

  const std::string sBody = _upClient->execute("GET", sUrl, ctx);

  std::vector<std::string> vLines;
  try {
    const auto jBody = nlohmann::json::parse(sBody);
    const auto& jDns = jBody.at("config").at("dns");
    const char* pKey = sRecordType == common::kRecordTypeCNAME ? "cnameRecords" : "hosts";
    if (jDns.contains(pKey) && !jDns[pKey].is_null()) {
      vLines = jDns[pKey].get<std::vector<std::string>>();
    }
  } catch (const nlohmann::json::exception& ex) {
    throw common::ProviderError("invalid_response",
                                std::string("failed to unmarshal records response: ") + ex.what());
  }

  return parseRecords(vLines, sRecordType);
}

void PiholeRecordAdapter::createRecord(const common::Endpoint& ep, const common::Context& ctx) {
  apply("PUT", ep, ctx);
}

void PiholeRecordAdapter::deleteRecord(const common::Endpoint& ep, const common::Context& ctx) {
  apply("DELETE", ep, ctx);
}

void PiholeRecordAdapter::apply(const std::string& sMethod, const common::Endpoint& ep,
                                const common::Context& ctx) {
  auto spLog = common::Logger::get();
  const std::string sListUrl = urlForRecordType(ep.sRecordType);

  // Targets are independent entries: try them all, report the first failure
  std::exception_ptr epFirstFailure;
  for (const auto& sTarget : ep.vTargets) {
    if (_bDryRun) {
      spLog->info("DRY RUN: {} {} IN {} -> {}", sMethod, ep.sDnsName, ep.sRecordType, sTarget);
      continue;
    }

    spLog->info("{} {} IN {} -> {}", sMethod, ep.sDnsName, ep.sRecordType, sTarget);
    try {
      _upClient->execute(sMethod, sListUrl + "/" + pathEscape(entryFor(ep, sTarget)), ctx);
    } catch (const common::CancelledError&) {
      throw;
    } catch (const std::exception& ex) {
      spLog->error("{} {} IN {} -> {} failed: {}", sMethod, ep.sDnsName, ep.sRecordType, sTarget,
                   ex.what());
      if (!epFirstFailure) {
        epFirstFailure = std::current_exception();
      }
    }
  }

  if (epFirstFailure) {
    std::rethrow_exception(epFirstFailure);
  }
}

}  // namespace zonesync::providers
