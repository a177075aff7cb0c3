#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "aimgr/config/schema.hpp"
#include "aimgr/observability/factory.hpp"
#include "aimgr/observability/global.hpp"
#include "aimgr/observability/log_observer.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <string>

namespace {

struct CounterState {
  int events = 0;
  int metrics = 0;
};

class CountingObserver final : public aimgr::observability::IObserver {
public:
  explicit CountingObserver(CounterState *state) : state_(state) {}

  void record_event(const aimgr::observability::ObserverEvent &) override { ++state_->events; }
  void record_metric(const aimgr::observability::ObserverMetric &) override {
    ++state_->metrics;
  }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  CounterState *state_ = nullptr;
};

} // namespace

void register_observability_tests(std::vector<aimgr::tests::TestCase> &tests) {
  using aimgr::tests::require;
  namespace ob = aimgr::observability;

  tests.push_back({"observability_global_noop", [] {
                     ob::set_global_observer(std::make_unique<ob::NoopObserver>());
                     require(ob::get_global_observer() != nullptr, "observer should be set");
                     require(ob::get_global_observer()->name() == "noop", "expected noop observer");

                     ob::record_import("command", "deploy", "added");
                     ob::record_metric(ob::BulkImportMetric{.added = 1});

                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_records_without_observer", [] {
                     ob::set_global_observer(nullptr);
                     ob::record_warning("unit", "nobody is listening");
                     ob::record_source_sync("src", false, "gone");
                   }});

  tests.push_back({"observability_global_forwards_to_observer", [] {
                     CounterState state;
                     ob::set_global_observer(std::make_unique<CountingObserver>(&state));
                     ob::record_event(ob::ErrorEvent{.component = "unit", .message = "boom"});
                     ob::record_error("unit", "again");
                     ob::record_metric(ob::SyncDurationMetric{.sources = 3});

                     require(state.events == 2, "events should be forwarded");
                     require(state.metrics == 1, "metric should be forwarded");

                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_factory_selects_backend", [] {
                     aimgr::config::Config config;
                     config.observability.backend = "none";
                     require(ob::create_observer(config)->name() == "noop", "none maps to noop");

                     config.observability.backend = "log";
                     require(ob::create_observer(config)->name() == "log", "log backend");

                     config.observability.backend = "none, log";
                     require(ob::create_observer(config)->name() == "log", "comma list");

                     config.observability.backend = "noop,none";
                     require(ob::create_observer(config)->name() == "noop", "all disabled");
                     require(ob::create_observer(config, true)->name() == "log",
                             "verbose forces log");

                     config.observability.backend = "statsd";
                     require(ob::create_observer(config)->name() == "log",
                             "unknown falls back to log");
                   }});

  tests.push_back({"observability_log_observer_levels", [] {
                     std::ostringstream out;
                     ob::LogObserver observer(out);
                     observer.record_event(ob::ImportEvent{.resource_type = "command",
                                                           .name = "deploy",
                                                           .outcome = "failed",
                                                           .message = "already exists"});
                     observer.record_event(
                         ob::OrphanEvent{.kind = "metadata", .resource_type = "skill",
                                         .name = "pdf", .path = "/repo/skills/pdf"});
                     observer.record_metric(ob::SyncDurationMetric{
                         .duration = std::chrono::milliseconds(12), .sources = 2, .failed = 1});
                     const auto text = out.str();
                     require(text.find("[WARN] import command/deploy outcome=failed") !=
                                 std::string::npos,
                             text);
                     require(text.find("orphaned metadata detected type=skill name=pdf") !=
                                 std::string::npos,
                             text);
                     require(text.find("metric.sync_duration_ms=12 sources=2 failed=1") !=
                                 std::string::npos,
                             text);
                   }});

  tests.push_back({"observability_capture_helper_records_events", [] {
                     aimgr::testing::ObserverCapture capture;
                     ob::record_install("claude", "skill/pdf", "install", true);
                     ob::record_orphan("file", "command", "x", "/tmp/x.md");
                     const auto installs = capture.events_of<ob::InstallEvent>();
                     require(installs.size() == 1 && installs[0].tool == "claude",
                             "install event captured");
                     require(capture.events_of<ob::OrphanEvent>().size() == 1,
                             "orphan event captured");
                   }});
}
