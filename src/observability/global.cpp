#include "aimgr/observability/global.hpp"

#include <mutex>

namespace aimgr::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_import(const std::string &resource_type, const std::string &name,
                   const std::string &outcome, const std::string &message) {
  record_event(ImportEvent{
      .resource_type = resource_type, .name = name, .outcome = outcome, .message = message});
}

void record_source_sync(const std::string &source, const bool success,
                        const std::string &message) {
  record_event(SourceSyncEvent{.source = source, .success = success, .message = message});
}

void record_orphan(const std::string &kind, const std::string &resource_type,
                   const std::string &name, const std::string &path) {
  record_event(
      OrphanEvent{.kind = kind, .resource_type = resource_type, .name = name, .path = path});
}

void record_install(const std::string &tool, const std::string &resource,
                    const std::string &action, const bool success) {
  record_event(
      InstallEvent{.tool = tool, .resource = resource, .action = action, .success = success});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace aimgr::observability
