#include "core/ChangeReconciler.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <algorithm>
#include <map>

namespace zonesync::core {

namespace {

const char* actionName(bool bCreate) { return bCreate ? "create" : "delete"; }

std::vector<std::string> sortedUnique(std::vector<std::string> vTargets) {
  std::sort(vTargets.begin(), vTargets.end());
  vTargets.erase(std::unique(vTargets.begin(), vTargets.end()), vTargets.end());
  return vTargets;
}

/// Grouping backends compare whole target sets; single-target backends can
/// only tell first targets apart.
bool targetsEquivalent(const common::Endpoint& epOld, const common::Endpoint& epNew,
                       bool bGroupTargets) {
  if (bGroupTargets) {
    return sortedUnique(epOld.vTargets) == sortedUnique(epNew.vTargets);
  }
  if (epOld.vTargets.empty() || epNew.vTargets.empty()) {
    return epOld.vTargets.empty() && epNew.vTargets.empty();
  }
  return epOld.vTargets.front() == epNew.vTargets.front();
}

}  // anonymous namespace

ChangeReconciler::ChangeReconciler(providers::IRecordAdapter& raAdapter,
                                   const endpoint::DomainFilter& dfFilter)
    : _raAdapter(raAdapter), _dfFilter(dfFilter) {}

ChangeReconciler::~ChangeReconciler() = default;

std::vector<common::Endpoint> ChangeReconciler::mergeUpdates(
    const std::vector<common::Endpoint>& vUpdateNew, bool bGroupTargets) {
  std::vector<common::Endpoint> vMerged;
  std::map<common::EntryKey, size_t> mIndex;
  for (const auto& ep : vUpdateNew) {
    auto [it, bInserted] = mIndex.try_emplace(common::EntryKey::of(ep), vMerged.size());
    if (bInserted) {
      vMerged.push_back(ep);
    } else if (!bGroupTargets) {
      vMerged[it->second] = ep;  // last record per key wins
    } else {
      auto& epMerged = vMerged[it->second];
      epMerged.vTargets.insert(epMerged.vTargets.end(), ep.vTargets.begin(), ep.vTargets.end());
      if (ep.oTtl) epMerged.oTtl = ep.oTtl;
    }
  }
  if (bGroupTargets) {
    for (auto& ep : vMerged) {
      ep.vTargets = sortedUnique(std::move(ep.vTargets));
    }
  }
  return vMerged;
}

common::ApplyReport ChangeReconciler::apply(const common::ChangeSet& cs,
                                            const common::Context& ctx) {
  auto spLog = common::Logger::get();
  const auto cap = _raAdapter.capabilities();
  common::ApplyReport ar;

  // Pure deletes first so that a create for the same name cannot collide
  for (const auto& ep : cs.vDelete) {
    step(Action::Delete, ep, cap, ar, ctx);
  }

  // There is no in-place update: a changed record is delete-old, create-new
  auto vUpdateNew = mergeUpdates(cs.vUpdateNew, cap.bGroupsTargetsByKey);
  std::vector<bool> vPending(vUpdateNew.size(), true);

  for (const auto& epOld : cs.vUpdateOld) {
    const auto ekOld = common::EntryKey::of(epOld);
    const auto it = std::find_if(vUpdateNew.begin(), vUpdateNew.end(), [&](const auto& ep) {
      return common::EntryKey::of(ep) == ekOld;
    });
    if (it == vUpdateNew.end()) {
      continue;
    }

    const size_t nIndex = static_cast<size_t>(it - vUpdateNew.begin());
    if (!vPending[nIndex]) {
      continue;  // key already settled as unchanged
    }
    if (targetsEquivalent(epOld, *it, cap.bGroupsTargetsByKey)) {
      spLog->debug("Unchanged: {} {}", epOld.sDnsName, epOld.sRecordType);
      vPending[nIndex] = false;
      ++ar.iSuppressedNoOps;
      continue;
    }
    step(Action::Delete, epOld, cap, ar, ctx);
  }

  for (const auto& ep : cs.vCreate) {
    step(Action::Create, ep, cap, ar, ctx);
  }
  for (size_t i = 0; i < vUpdateNew.size(); ++i) {
    if (vPending[i]) {
      step(Action::Create, vUpdateNew[i], cap, ar, ctx);
    }
  }

  spLog->info("{}: {} created, {} deleted, {} unchanged, {} out of scope, {} soft errors",
              _raAdapter.name(), ar.iCreated, ar.iDeleted, ar.iSuppressedNoOps,
              ar.iSkippedOutOfScope, ar.vSoftErrors.size());
  return ar;
}

void ChangeReconciler::step(Action action, const common::Endpoint& ep,
                            const providers::AdapterCapabilities& cap, common::ApplyReport& ar,
                            const common::Context& ctx) {
  auto spLog = common::Logger::get();
  const bool bCreate = action == Action::Create;
  ctx.throwIfDone();

  if (!_dfFilter.match(ep.sDnsName)) {
    spLog->debug("Skipping {} of {}: does not match domain filter", actionName(bCreate),
                 ep.sDnsName);
    ++ar.iSkippedOutOfScope;
    return;
  }
  if (!cap.supports(ep.sRecordType)) {
    spLog->warn("Skipping unsupported endpoint {} {} for {}", ep.sDnsName, ep.sRecordType,
                _raAdapter.name());
    return;
  }
  if (ep.vTargets.empty()) {
    spLog->info("Skipping {} of {} {}: missing targets", actionName(bCreate), ep.sDnsName,
                ep.sRecordType);
    return;
  }

  try {
    if (!cap.bSupportsWildcards && ep.sDnsName.find('*') != std::string::npos) {
      throw common::SoftError("unsupported_wildcard",
                              "UNSUPPORTED: " + _raAdapter.name() +
                                  " DNS names cannot contain wildcards: " + ep.sDnsName);
    }
    if (!common::allowsMultipleTargets(ep.sRecordType) && ep.vTargets.size() > 1) {
      throw common::SoftError("unsupported_multi_target",
                              "UNSUPPORTED: " + _raAdapter.name() + " " + ep.sRecordType +
                                  " records cannot have multiple targets: " + ep.sDnsName);
    }

    if (bCreate) {
      _raAdapter.createRecord(ep, ctx);
      ++ar.iCreated;
    } else {
      _raAdapter.deleteRecord(ep, ctx);
      ++ar.iDeleted;
    }
  } catch (const common::SoftError& ex) {
    spLog->warn("Soft error on {} of {} {}: {}", actionName(bCreate), ep.sDnsName,
                ep.sRecordType, ex.what());
    ar.vSoftErrors.emplace_back(ex.what());
  }
}

}  // namespace zonesync::core
