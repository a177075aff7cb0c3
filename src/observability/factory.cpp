#include "aimgr/observability/factory.hpp"

#include "aimgr/common/fs.hpp"
#include "aimgr/observability/log_observer.hpp"

namespace aimgr::observability {

namespace {

bool wants_log(const std::string &backend) {
  for (const auto &part : common::split(common::to_lower(backend), ',')) {
    const std::string name = common::trim(part);
    // Unknown names fall back to log; validate_config() warns about them.
    if (!name.empty() && name != "none" && name != "noop") {
      return true;
    }
  }
  return false;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config, const bool verbose) {
  if (verbose || wants_log(config.observability.backend)) {
    return std::make_unique<LogObserver>();
  }
  return std::make_unique<NoopObserver>();
}

} // namespace aimgr::observability
