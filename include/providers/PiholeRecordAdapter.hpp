#pragma once

#include <memory>
#include <string>
#include <vector>

#include "http/SessionClient.hpp"
#include "providers/IRecordAdapter.hpp"

namespace zonesync::providers {

/// Pi-hole v6 local DNS adapter (/api/config/dns/hosts and /cnameRecords).
///
/// Pi-hole stores one entry per target ("<ip> <name>" or
/// "<name>,<target>[,<ttl>]"), so every target is its own PUT/DELETE call.
/// Class abbreviation: pra
class PiholeRecordAdapter : public IRecordAdapter {
 public:
  static constexpr const char* kConfigDnsPath = "/api/config/dns";

  PiholeRecordAdapter(std::unique_ptr<http::SessionClient> upClient, bool bDryRun);
  ~PiholeRecordAdapter() override;

  std::string name() const override;
  AdapterCapabilities capabilities() const override;
  std::vector<common::Endpoint> listRecords(const std::string& sRecordType,
                                            const common::Context& ctx) override;
  void createRecord(const common::Endpoint& ep, const common::Context& ctx) override;
  void deleteRecord(const common::Endpoint& ep, const common::Context& ctx) override;

  /// Throws ProviderError for types Pi-hole cannot store.
  std::string urlForRecordType(const std::string& sRecordType) const;

  /// Pi-hole's entry text for one target of ep.
  static std::string entryFor(const common::Endpoint& ep, const std::string& sTarget);

  /// Percent-encode a single URL path segment.
  static std::string pathEscape(const std::string& sSegment);

  /// Parse listing lines of one record type. Malformed lines are skipped.
  static std::vector<common::Endpoint> parseRecords(const std::vector<std::string>& vLines,
                                                    const std::string& sRecordType);

 private:
  void apply(const std::string& sMethod, const common::Endpoint& ep, const common::Context& ctx);

  std::unique_ptr<http::SessionClient> _upClient;
  bool _bDryRun;
};

}  // namespace zonesync::providers
