#pragma once

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace zonesync::common {

/// JSON form of the data model, as read and printed by the zonesync driver:
///   Endpoint:    {"dnsName", "recordType", "targets", "recordTTL"?}
///   ChangeSet:   {"create", "updateOld", "updateNew", "delete"} (each optional)
///   ApplyReport: {"created", "deleted", "unchanged", "outOfScope", "softErrors"}
/// from_json throws nlohmann::json::exception on missing or mistyped fields.

void to_json(nlohmann::json& j, const Endpoint& ep);
void from_json(const nlohmann::json& j, Endpoint& ep);

void to_json(nlohmann::json& j, const ChangeSet& cs);
void from_json(const nlohmann::json& j, ChangeSet& cs);

void to_json(nlohmann::json& j, const ApplyReport& ar);

}  // namespace zonesync::common
