#pragma once

#include <string>
#include <vector>

#include "common/Context.hpp"
#include "common/Types.hpp"

namespace zonesync::providers {

/// Pure abstract synchronization unit consumed by an external planner.
class IProvider {
 public:
  virtual ~IProvider() = default;

  virtual std::string name() const = 0;

  /// Current observed records, domain-filtered.
  virtual std::vector<common::Endpoint> records(const common::Context& ctx) = 0;

  /// Apply a diff computed against records(). Hard errors are thrown.
  virtual common::ApplyReport applyChanges(const common::ChangeSet& cs,
                                           const common::Context& ctx) = 0;
};

}  // namespace zonesync::providers
