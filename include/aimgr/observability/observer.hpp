#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace aimgr::observability {

struct ImportEvent {
  std::string resource_type;
  std::string name;
  std::string outcome; // added, updated, skipped, failed
  std::string message;
};

struct SourceSyncEvent {
  std::string source;
  bool success = false;
  std::string message;
};

struct OrphanEvent {
  std::string kind; // file, metadata, source
  std::string resource_type;
  std::string name;
  std::string path;
};

struct InstallEvent {
  std::string tool;
  std::string resource;
  std::string action; // install, uninstall
  bool success = false;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ImportEvent, SourceSyncEvent, OrphanEvent, InstallEvent,
                                   WarningEvent, ErrorEvent>;

struct BulkImportMetric {
  std::size_t added = 0;
  std::size_t updated = 0;
  std::size_t skipped = 0;
  std::size_t failed = 0;
  bool dry_run = false;
};

struct SyncDurationMetric {
  std::chrono::milliseconds duration{0};
  std::size_t sources = 0;
  std::size_t failed = 0;
};

using ObserverMetric = std::variant<BulkImportMetric, SyncDurationMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Installed when observability.backend is "none".
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace aimgr::observability
