#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace toolexec::health {

struct ComponentStatus {
  std::string status = "unknown";
  std::optional<std::string> last_error;
  std::string updated_at;
  std::optional<std::string> last_ok;
};

struct HealthSnapshot {
  std::unordered_map<std::string, ComponentStatus> components;
};

void mark_component_starting(const std::string &name);
void mark_component_ok(const std::string &name);
void mark_component_error(const std::string &name, const std::string &error);

[[nodiscard]] std::optional<ComponentStatus> get_component(const std::string &name);
[[nodiscard]] HealthSnapshot snapshot();

/// "healthy" when no component is in error, "degraded" otherwise.
[[nodiscard]] std::string overall_status();

/// Body of the liveness route: {"status":...,"service":...,"components":{...}}.
[[nodiscard]] std::string report_json(const std::string &service);
void clear();

} // namespace toolexec::health
