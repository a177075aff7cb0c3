#pragma once

#include "aimgr/config/schema.hpp"
#include "aimgr/observability/observer.hpp"

#include <memory>

namespace aimgr::observability {

/// Maps observability.backend to an observer. The backend may be a comma list; any
/// entry other than "none" or "noop" selects the log observer, as does `verbose`.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config,
                                                         bool verbose = false);

} // namespace aimgr::observability
