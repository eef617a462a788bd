#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "common/Errors.hpp"
#include "providers/IRecordAdapter.hpp"

namespace zonesync::test {

/// In-memory IRecordAdapter recording every call as
/// "<create|delete> <name> <type> <target,target...>".
class FakeRecordAdapter : public providers::IRecordAdapter {
 public:
  explicit FakeRecordAdapter(providers::AdapterCapabilities cap) : _cap(std::move(cap)) {}

  std::string name() const override { return "fake"; }
  providers::AdapterCapabilities capabilities() const override { return _cap; }

  std::vector<common::Endpoint> listRecords(const std::string& sRecordType,
                                            const common::Context& ctx) override {
    ctx.throwIfDone();
    std::lock_guard<std::mutex> lock(_mtx);
    if (_sFailListingType == sRecordType) {
      throw common::BackendError(500, "internal", "listing failed", "", 0.0);
    }
    return _mListings[sRecordType];
  }

  void createRecord(const common::Endpoint& ep, const common::Context&) override {
    record("create", ep);
  }

  void deleteRecord(const common::Endpoint& ep, const common::Context&) override {
    record("delete", ep);
  }

  void setListing(const std::string& sRecordType, std::vector<common::Endpoint> vRecords) {
    std::lock_guard<std::mutex> lock(_mtx);
    _mListings[sRecordType] = std::move(vRecords);
  }

  void failListing(const std::string& sRecordType) { _sFailListingType = sRecordType; }
  void failOn(const std::string& sDnsName) { _setFailNames.insert(sDnsName); }

  std::vector<std::string> calls() const {
    std::lock_guard<std::mutex> lock(_mtx);
    return _vCalls;
  }

  static std::string describe(const std::string& sAction, const common::Endpoint& ep) {
    std::string sTargets;
    for (const auto& sTarget : ep.vTargets) {
      if (!sTargets.empty()) sTargets += ",";
      sTargets += sTarget;
    }
    return sAction + " " + ep.sDnsName + " " + ep.sRecordType + " " + sTargets;
  }

 private:
  void record(const std::string& sAction, const common::Endpoint& ep) {
    std::lock_guard<std::mutex> lock(_mtx);
    _vCalls.push_back(describe(sAction, ep));
    if (_setFailNames.count(ep.sDnsName) > 0) {
      throw common::BackendError(500, "internal", "backend exploded", "", 0.0);
    }
  }

  providers::AdapterCapabilities _cap;
  mutable std::mutex _mtx;
  std::map<std::string, std::vector<common::Endpoint>> _mListings;
  std::string _sFailListingType;
  std::set<std::string> _setFailNames;
  std::vector<std::string> _vCalls;
};

}  // namespace zonesync::test
