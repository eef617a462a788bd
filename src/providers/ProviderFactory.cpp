#include "providers/ProviderFactory.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "http/CurlTransport.hpp"
#include "http/SessionClient.hpp"
#include "providers/PiholeRecordAdapter.hpp"
#include "providers/SyncProvider.hpp"

#include <chrono>

namespace zonesync::providers {

endpoint::DomainFilter ProviderFactory::buildDomainFilter(const common::Config& cfg) {
  if (!cfg.sRegexDomainFilter.empty() || !cfg.sRegexDomainExclusion.empty()) {
    if (!cfg.vDomainFilter.empty() || !cfg.vExcludeDomains.empty()) {
      throw common::ConfigurationError("invalid_filter", "cannot have both domain list and regex");
    }
    return endpoint::DomainFilter::fromRegex(cfg.sRegexDomainFilter, cfg.sRegexDomainExclusion);
  }
  return endpoint::DomainFilter(cfg.vDomainFilter, cfg.vExcludeDomains);
}

std::unique_ptr<IProvider> ProviderFactory::create(const common::Config& cfg,
                                                   const common::Context& ctx) {
  auto dfFilter = buildDomainFilter(cfg);
  common::Logger::get()->info("Domain filter: {}", dfFilter.toJson().dump());

  if (cfg.sProvider == "pihole") {
    auto upClient = std::make_unique<http::SessionClient>(
        std::make_unique<http::CurlTransport>(cfg.bTlsInsecureSkipVerify), cfg.sServer,
        cfg.sPassword, ctx, std::chrono::seconds(cfg.iHttpTimeoutSeconds));
    auto upAdapter = std::make_unique<PiholeRecordAdapter>(std::move(upClient), cfg.bDryRun);
    return std::make_unique<SyncProvider>(std::move(upAdapter), std::move(dfFilter),
                                          cfg.iListThreads);
  }

  throw common::ConfigurationError("invalid_config", "Unsupported provider type: " + cfg.sProvider);
}

}  // namespace zonesync::providers
