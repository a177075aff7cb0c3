#pragma once

#include "aimgr/observability/observer.hpp"

#include <memory>

namespace aimgr::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_import(const std::string &resource_type, const std::string &name,
                   const std::string &outcome, const std::string &message = "");
void record_source_sync(const std::string &source, bool success, const std::string &message = "");
void record_orphan(const std::string &kind, const std::string &resource_type,
                   const std::string &name, const std::string &path);
void record_install(const std::string &tool, const std::string &resource,
                    const std::string &action, bool success);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace aimgr::observability
