#include "toolexec/health/health.hpp"

#include "toolexec/common/fs.hpp"
#include "toolexec/common/json_util.hpp"

#include <mutex>
#include <sstream>

namespace toolexec::health {

namespace {

std::mutex g_mutex;
std::unordered_map<std::string, ComponentStatus> g_components;

ComponentStatus &ensure_component(const std::string &name) { return g_components[name]; }

} // namespace

void mark_component_starting(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = ensure_component(name);
  component.status = "starting";
  component.updated_at = common::now_rfc3339();
  component.last_error.reset();
}

void mark_component_ok(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = ensure_component(name);
  component.status = "ok";
  component.updated_at = common::now_rfc3339();
  component.last_ok = component.updated_at;
  component.last_error.reset();
}

void mark_component_error(const std::string &name, const std::string &error) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = ensure_component(name);
  component.status = "error";
  component.updated_at = common::now_rfc3339();
  component.last_error = error;
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
  std::lock_guard<std::mutex> lock(g_mutex);
  for (const auto &[name, status] : g_components) {
    if (status.status == "error") {
      return "degraded";
    }
  }
  return "healthy";
}

std::string report_json(const std::string &service) {
  const std::string status = overall_status();
  const auto snap = snapshot();
  std::ostringstream json;
  json << "{\"status\":" << common::json_quote(status)
       << ",\"service\":" << common::json_quote(service) << ",\"components\":{";
  bool first = true;
  for (const auto &[name, component] : snap.components) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << common::json_quote(name) << ":{";
    json << "\"status\":" << common::json_quote(component.status);
    if (!component.updated_at.empty()) {
      json << ",\"updated_at\":" << common::json_quote(component.updated_at);
    }
    if (component.last_ok.has_value()) {
      json << ",\"last_ok\":" << common::json_quote(*component.last_ok);
    }
    if (component.last_error.has_value()) {
      json << ",\"last_error\":" << common::json_quote(*component.last_error);
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

} // namespace toolexec::health
