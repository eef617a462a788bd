#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "common/Config.hpp"
#include "common/Context.hpp"
#include "common/Json.hpp"
#include "common/Logger.hpp"
#include "providers/ProviderFactory.hpp"

// Usage:
//   zonesync                 print the current in-scope records as JSON
//   zonesync <changes.json>  apply a ChangeSet and print the ApplyReport
//
// Configuration comes from ZONESYNC_* environment variables.

namespace {

zonesync::common::ChangeSet readChangeSet(const std::string& sPath) {
  std::ifstream ifs(sPath);
  if (!ifs.is_open()) {
    throw std::runtime_error("Cannot open change set file: " + sPath);
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return nlohmann::json::parse(oss.str()).get<zonesync::common::ChangeSet>();
}

}  // namespace

int main(int argc, char** argv) {
  if (argc > 2) {
    std::cerr << "usage: " << argv[0] << " [changes.json]\n";
    return EXIT_FAILURE;
  }

  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = zonesync::common::Config::load();

    zonesync::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = zonesync::common::Logger::get();
    spLog->debug("Configuration loaded (provider={}, server={}, dry_run={})", cfgApp.sProvider,
                 cfgApp.sServer, cfgApp.bDryRun);

    // ── Step 2: Build the provider (acquires a session if configured) ────
    // ZONESYNC_HTTP_TIMEOUT_SECONDS bounds each backend call, not the whole run
    zonesync::common::Context ctx;
    auto upProvider = zonesync::providers::ProviderFactory::create(cfgApp, ctx);

    // Zero the secret from Config after handoff
    cfgApp.cleanseSecrets();

    // ── Step 3: Read or apply ────────────────────────────────────────────
    if (argc == 2) {
      const auto cs = readChangeSet(argv[1]);
      const auto ar = upProvider->applyChanges(cs, ctx);
      std::cout << nlohmann::json(ar).dump(2) << "\n";
      return EXIT_SUCCESS;
    }

    const auto vRecords = upProvider->records(ctx);
    std::cout << nlohmann::json(vRecords).dump(2) << "\n";
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] zonesync failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
