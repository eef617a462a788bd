#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zonesync::common {

inline constexpr std::string_view kRecordTypeA = "A";
inline constexpr std::string_view kRecordTypeAAAA = "AAAA";
inline constexpr std::string_view kRecordTypeCNAME = "CNAME";
inline constexpr std::string_view kRecordTypeTXT = "TXT";

/// Canonical DNS record exchanged between the planner, providers and adapters.
/// An empty vTargets is a no-op sentinel, never a deletion.
/// Class abbreviation: ep
struct Endpoint {
  std::string sDnsName;
  std::string sRecordType;
  std::vector<std::string> vTargets;
  std::optional<int64_t> oTtl;  // unset = backend default

  bool operator==(const Endpoint&) const = default;
};

/// CNAME is the only type this system knows that must carry exactly one target.
inline bool allowsMultipleTargets(std::string_view svRecordType) {
  return svRecordType != kRecordTypeCNAME;
}

/// (DNSName, RecordType) pair correlating update pairs and grouping targets.
/// Class abbreviation: ek
struct EntryKey {
  std::string sDnsName;
  std::string sRecordType;

  auto operator<=>(const EntryKey&) const = default;

  static EntryKey of(const Endpoint& ep) { return EntryKey{ep.sDnsName, ep.sRecordType}; }
};

/// Desired-vs-observed diff handed to IProvider::applyChanges.
/// Every vUpdateOld entry pairs with the vUpdateNew entry sharing its EntryKey.
/// Class abbreviation: cs
struct ChangeSet {
  std::vector<Endpoint> vCreate;
  std::vector<Endpoint> vUpdateOld;
  std::vector<Endpoint> vUpdateNew;
  std::vector<Endpoint> vDelete;

  bool empty() const {
    return vCreate.empty() && vUpdateOld.empty() && vUpdateNew.empty() && vDelete.empty();
  }
};

/// Outcome of a successful applyChanges call.
/// Hard errors are thrown; soft errors are collected here.
/// Class abbreviation: ar
struct ApplyReport {
  int iCreated = 0;
  int iDeleted = 0;
  int iSkippedOutOfScope = 0;
  int iSuppressedNoOps = 0;
  std::vector<std::string> vSoftErrors;
};

}  // namespace zonesync::common
