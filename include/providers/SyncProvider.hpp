#pragma once

#include <memory>
#include <string>
#include <vector>

#include "core/ThreadPool.hpp"
#include "endpoint/DomainFilter.hpp"
#include "providers/IProvider.hpp"
#include "providers/IRecordAdapter.hpp"

namespace zonesync::providers {

/// IProvider composed of a DomainFilter, a ChangeReconciler and one
/// backend's IRecordAdapter.
/// Class abbreviation: sp
class SyncProvider : public IProvider {
 public:
  SyncProvider(std::unique_ptr<IRecordAdapter> upAdapter, endpoint::DomainFilter dfFilter,
               int iListThreads = 3);
  ~SyncProvider() override;

  std::string name() const override;

  /// Lists every supported record type concurrently and concatenates the
  /// results in capability order. The first listing failure is rethrown once
  /// all listings have settled.
  std::vector<common::Endpoint> records(const common::Context& ctx) override;

  common::ApplyReport applyChanges(const common::ChangeSet& cs,
                                   const common::Context& ctx) override;

  const endpoint::DomainFilter& domainFilter() const { return _dfFilter; }

 private:
  std::unique_ptr<IRecordAdapter> _upAdapter;
  endpoint::DomainFilter _dfFilter;
  core::ThreadPool _tpListing;
};

}  // namespace zonesync::providers
