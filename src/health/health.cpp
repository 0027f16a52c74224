#include "sandrun/health/health.hpp"

#include "sandrun/common/fs.hpp"
#include "sandrun/common/json_util.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <sstream>

namespace sandrun::health {

namespace {

std::mutex g_mutex;
std::unordered_map<std::string, ComponentStatus> g_components;

ComponentStatus &touch(const std::string &name) {
  auto &component = g_components[name];
  component.updated_at = common::now_rfc3339();
  return component;
}

} // namespace

void mark_component_starting(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = touch(name);
  component.status = "starting";
  component.last_error.reset();
}

void mark_component_ok(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = touch(name);
  component.status = "ok";
  component.last_ok = component.updated_at;
  component.last_error.reset();
}

void mark_component_error(const std::string &name, const std::string &error) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = touch(name);
  component.status = "error";
  component.last_error = error;
}

void bump_component_restart(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  ++touch(name).restart_count;
}

void reset_component(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_components.erase(name);
}

std::optional<ComponentStatus> get_component(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  const auto it = g_components.find(name);
  if (it == g_components.end()) {
    return std::nullopt;
  }
  return it->second;
}

HealthSnapshot snapshot() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return HealthSnapshot{.components = g_components};
}

std::string overall_status() {
  const auto snap = snapshot();
  if (snap.components.empty()) {
    return "starting";
  }
  const auto has = [&snap](const std::string &status) {
    return std::any_of(snap.components.begin(), snap.components.end(),
                       [&status](const auto &entry) { return entry.second.status == status; });
  };
  if (has("error")) {
    return "error";
  }
  if (has("starting") || has("unknown")) {
    return "starting";
  }
  return "ok";
}

std::string snapshot_json() {
  const auto snap = snapshot();
  // Sorted so the state file diffs cleanly between writes.
  const std::map<std::string, ComponentStatus> ordered(snap.components.begin(),
                                                       snap.components.end());
  std::ostringstream json;
  json << "{\"status\":\"" << overall_status() << "\",\"components\":{";
  bool first = true;
  for (const auto &[name, status] : ordered) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << "\"" << common::json_escape(name) << "\":{";
    json << "\"status\":\"" << common::json_escape(status.status) << "\",";
    json << "\"restart_count\":" << status.restart_count;
    if (!status.updated_at.empty()) {
      json << ",\"updated_at\":\"" << status.updated_at << "\"";
    }
    if (status.last_ok.has_value()) {
      json << ",\"last_ok\":\"" << *status.last_ok << "\"";
    }
    if (status.last_error.has_value()) {
      json << ",\"last_error\":\"" << common::json_escape(*status.last_error) << "\"";
    }
    json << "}";
  }
  json << "}}";
  return json.str();
}

void clear() {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_components.clear();
}

} // namespace sandrun::health
