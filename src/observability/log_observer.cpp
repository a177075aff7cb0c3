#include "aimgr/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace aimgr::observability {

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ImportEvent>) {
          std::string line = "import " + evt.resource_type + "/" + evt.name +
                             " outcome=" + evt.outcome;
          if (!evt.message.empty()) {
            line += " message=" + evt.message;
          }
          log_line(evt.outcome == "failed" ? "WARN" : "DEBUG", line);
        } else if constexpr (std::is_same_v<T, SourceSyncEvent>) {
          std::string line = "sync source=" + evt.source +
                             " success=" + (evt.success ? std::string("true") : std::string("false"));
          if (!evt.message.empty()) {
            line += " message=" + evt.message;
          }
          log_line(evt.success ? "INFO" : "WARN", line);
        } else if constexpr (std::is_same_v<T, OrphanEvent>) {
          log_line("WARN", "orphaned " + evt.kind + " detected type=" + evt.resource_type +
                               " name=" + evt.name + " path=" + evt.path);
        } else if constexpr (std::is_same_v<T, InstallEvent>) {
          log_line("INFO", evt.action + " tool=" + evt.tool + " resource=" + evt.resource +
                               " success=" + (evt.success ? std::string("true")
                                                          : std::string("false")));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, BulkImportMetric>) {
          log_line("DEBUG", "metric.bulk_import added=" + std::to_string(m.added) +
                                " updated=" + std::to_string(m.updated) +
                                " skipped=" + std::to_string(m.skipped) +
                                " failed=" + std::to_string(m.failed) +
                                (m.dry_run ? " dry_run=true" : ""));
        } else if constexpr (std::is_same_v<T, SyncDurationMetric>) {
          log_line("DEBUG", "metric.sync_duration_ms=" + std::to_string(m.duration.count()) +
                                " sources=" + std::to_string(m.sources) +
                                " failed=" + std::to_string(m.failed));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace aimgr::observability
