#pragma once

#include <memory>

#include "common/Config.hpp"
#include "common/Context.hpp"
#include "endpoint/DomainFilter.hpp"
#include "providers/IProvider.hpp"

namespace zonesync::providers {

/// Creates concrete IProvider instances from the loaded configuration.
class ProviderFactory {
 public:
  /// Throws ConfigurationError for an unknown provider type or a bad filter.
  /// May contact the backend to acquire a session token.
  static std::unique_ptr<IProvider> create(const common::Config& cfg,
                                           const common::Context& ctx);

  static endpoint::DomainFilter buildDomainFilter(const common::Config& cfg);
};

}  // namespace zonesync::providers
