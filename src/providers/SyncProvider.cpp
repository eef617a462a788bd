#include "providers/SyncProvider.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/ChangeReconciler.hpp"

#include <exception>
#include <future>

namespace zonesync::providers {

SyncProvider::SyncProvider(std::unique_ptr<IRecordAdapter> upAdapter,
                           endpoint::DomainFilter dfFilter, int iListThreads)
    : _upAdapter(std::move(upAdapter)),
      _dfFilter(std::move(dfFilter)),
      _tpListing(iListThreads) {
  if (!_upAdapter) {
    throw common::ConfigurationError("invalid_config", "SyncProvider requires an adapter");
  }
}

SyncProvider::~SyncProvider() = default;

std::string SyncProvider::name() const { return _upAdapter->name(); }

std::vector<common::Endpoint> SyncProvider::records(const common::Context& ctx) {
  ctx.throwIfDone();
  const auto cap = _upAdapter->capabilities();

  std::vector<std::future<std::vector<common::Endpoint>>> vFutures;
  vFutures.reserve(cap.vRecordTypes.size());
  for (const auto& sType : cap.vRecordTypes) {
    vFutures.push_back(_tpListing.submit(
        [this, sType, &ctx]() { return _upAdapter->listRecords(sType, ctx); }));
  }

  // Wait for every listing before returning: tasks reference ctx
  std::vector<common::Endpoint> vRecords;
  std::exception_ptr epFirstFailure;
  for (auto& fut : vFutures) {
    try {
      auto vTyped = fut.get();
      vRecords.insert(vRecords.end(), std::make_move_iterator(vTyped.begin()),
                      std::make_move_iterator(vTyped.end()));
    } catch (const std::exception&) {
      if (!epFirstFailure) {
        epFirstFailure = std::current_exception();
      }
    }
  }
  if (epFirstFailure) {
    std::rethrow_exception(epFirstFailure);
  }

  std::vector<common::Endpoint> vInScope;
  vInScope.reserve(vRecords.size());
  for (auto& ep : vRecords) {
    if (_dfFilter.match(ep.sDnsName)) {
      vInScope.push_back(std::move(ep));
    }
  }
  common::Logger::get()->debug("{}: {} records listed, {} in scope", name(), vRecords.size(),
                               vInScope.size());
  return vInScope;
}

common::ApplyReport SyncProvider::applyChanges(const common::ChangeSet& cs,
                                               const common::Context& ctx) {
  core::ChangeReconciler crReconciler(*_upAdapter, _dfFilter);
  return crReconciler.apply(cs, ctx);
}

}  // namespace zonesync::providers
