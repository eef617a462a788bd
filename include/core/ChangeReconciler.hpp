#pragma once

#include <string>
#include <vector>

#include "common/Context.hpp"
#include "common/Types.hpp"
#include "endpoint/DomainFilter.hpp"
#include "providers/IRecordAdapter.hpp"

namespace zonesync::core {

/// Turns a ChangeSet into the minimal ordered sequence of adapter calls.
///
/// Order: deletes, then deletes of replaced update records, then creates,
/// then surviving update records. Update pairs whose targets already agree
/// are dropped without a call. Holds no state between apply() calls.
/// Class abbreviation: cr
class ChangeReconciler {
 public:
  ChangeReconciler(providers::IRecordAdapter& raAdapter, const endpoint::DomainFilter& dfFilter);
  ~ChangeReconciler();

  /// Apply the change set. Soft errors are collected in the report; any
  /// other failure aborts and propagates.
  common::ApplyReport apply(const common::ChangeSet& cs, const common::Context& ctx);

  /// One UpdateNew record per EntryKey, in first-seen key order. With
  /// bGroupTargets the targets of one key are unioned, de-duplicated and
  /// sorted; otherwise the last record for the key is kept as is.
  static std::vector<common::Endpoint> mergeUpdates(const std::vector<common::Endpoint>& vUpdateNew,
                                                    bool bGroupTargets);

 private:
  enum class Action { Create, Delete };

  void step(Action action, const common::Endpoint& ep, const providers::AdapterCapabilities& cap,
            common::ApplyReport& ar, const common::Context& ctx);

  providers::IRecordAdapter& _raAdapter;
  const endpoint::DomainFilter& _dfFilter;
};

}  // namespace zonesync::core
