#pragma once

#include <string>
#include <vector>

#include "common/Context.hpp"
#include "common/Types.hpp"

namespace zonesync::providers {

/// Backend traits the ChangeReconciler consults instead of branching on the
/// backend type.
/// Class abbreviation: cap
struct AdapterCapabilities {
  /// One physical record per EntryKey: update targets are merged and compared as sets.
  /// When false, each target is its own record and only first targets are compared.
  bool bGroupsTargetsByKey = false;
  bool bSupportsWildcards = false;
  /// Record types the backend can represent, in listing order.
  std::vector<std::string> vRecordTypes;

  bool supports(const std::string& sRecordType) const {
    for (const auto& sType : vRecordTypes) {
      if (sType == sRecordType) return true;
    }
    return false;
  }
};

/// Pure abstract interface translating canonical Endpoints to one backend's
/// native records. Scoping and shape validation happen before these calls.
class IRecordAdapter {
 public:
  virtual ~IRecordAdapter() = default;

  virtual std::string name() const = 0;
  virtual AdapterCapabilities capabilities() const = 0;

  /// All records of one type, merged by DNS name.
  virtual std::vector<common::Endpoint> listRecords(const std::string& sRecordType,
                                                    const common::Context& ctx) = 0;
  virtual void createRecord(const common::Endpoint& ep, const common::Context& ctx) = 0;
  virtual void deleteRecord(const common::Endpoint& ep, const common::Context& ctx) = 0;
};

}  // namespace zonesync::providers
