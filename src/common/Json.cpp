#include "common/Json.hpp"

namespace zonesync::common {

namespace {

std::vector<Endpoint> readEndpoints(const nlohmann::json& j, const char* pKey) {
  if (!j.contains(pKey) || j[pKey].is_null()) {
    return {};
  }
  return j[pKey].get<std::vector<Endpoint>>();
}

}  // namespace

void to_json(nlohmann::json& j, const Endpoint& ep) {
  j = nlohmann::json{
      {"dnsName", ep.sDnsName},
      {"recordType", ep.sRecordType},
      {"targets", ep.vTargets},
  };
  if (ep.oTtl) {
    j["recordTTL"] = *ep.oTtl;
  }
}

void from_json(const nlohmann::json& j, Endpoint& ep) {
  ep.sDnsName = j.at("dnsName").get<std::string>();
  ep.sRecordType = j.at("recordType").get<std::string>();
  ep.vTargets = j.value("targets", std::vector<std::string>{});
  ep.oTtl.reset();
  if (j.contains("recordTTL") && !j["recordTTL"].is_null()) {
    const auto iTtl = j["recordTTL"].get<int64_t>();
    if (iTtl > 0) ep.oTtl = iTtl;
  }
}

void to_json(nlohmann::json& j, const ChangeSet& cs) {
  j = nlohmann::json{
      {"create", cs.vCreate},
      {"updateOld", cs.vUpdateOld},
      {"updateNew", cs.vUpdateNew},
      {"delete", cs.vDelete},
  };
}

void from_json(const nlohmann::json& j, ChangeSet& cs) {
  cs.vCreate = readEndpoints(j, "create");
  cs.vUpdateOld = readEndpoints(j, "updateOld");
  cs.vUpdateNew = readEndpoints(j, "updateNew");
  cs.vDelete = readEndpoints(j, "delete");
}

void to_json(nlohmann::json& j, const ApplyReport& ar) {
  j = nlohmann::json{
      {"created", ar.iCreated},
      {"deleted", ar.iDeleted},
      {"unchanged", ar.iSuppressedNoOps},
      {"outOfScope", ar.iSkippedOutOfScope},
      {"softErrors", ar.vSoftErrors},
  };
}

}  // namespace zonesync::common
