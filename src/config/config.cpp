#include "toolexec/config/config.hpp"

#include "toolexec/common/fs.hpp"
#include "toolexec/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <vector>

namespace toolexec::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".toolexec";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TOOLEXEC_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
        } else {
          out.push_back(ch);
        }
        continue;
      }
      out.push_back(ch == 'n' ? '\n' : ch);
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!is_valid_env_name(key)) {
      continue;
    }
    // Real environment wins over .env.
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  if (const char *env_file = std::getenv("TOOLEXEC_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    load_dotenv_file(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::uint16_t to_port(const std::uint64_t value, const std::uint16_t fallback) {
  if (value > std::numeric_limits<std::uint16_t>::max()) {
    return fallback;
  }
  return static_cast<std::uint16_t>(value);
}

bool is_http_url(const std::string &url) {
  return common::starts_with(url, "http://") || common::starts_with(url, "https://");
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return home.forward_error<std::filesystem::path>();
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return cfg_dir;
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (auto value = env_value("TOOLEXEC_INTERPRETER")) {
    config.execution.interpreter = *value;
  }
  if (auto value = env_value("TOOLEXEC_TIMEOUT_MS")) {
    common::TomlDocument scratch;
    scratch.values["timeout"] = *value;
    config.execution.timeout_ms = scratch.get_u64("timeout", config.execution.timeout_ms);
  }
  if (auto value = env_value("TOOLEXEC_RESIDENT_URL")) {
    config.resident.url = *value;
  }
  if (auto value = env_value("TOOLEXEC_ONDEMAND_URL")) {
    config.ondemand.url = *value;
  }

  if (auto value = env_value("TOOLEXEC_CODE_STORE_URL")) {
    config.code_store.url = *value;
  } else if (config.code_store.url.empty()) {
    if (auto supabase = env_value("SUPABASE_URL")) {
      config.code_store.url = *supabase;
    }
  }
  if (auto value = env_value("TOOLEXEC_CODE_STORE_API_KEY")) {
    config.code_store.api_key = *value;
  } else if (config.code_store.api_key.empty()) {
    if (auto supabase = env_value("SUPABASE_SERVICE_ROLE_KEY")) {
      config.code_store.api_key = *supabase;
    }
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return parsed.forward_error<Config>();
  }
  const auto &doc = parsed.value();
  Config config;

  auto &exec = config.execution;
  exec.timeout_ms = doc.get_u64("execution.timeout_ms", exec.timeout_ms);
  exec.interpreter = doc.get_string("execution.interpreter", exec.interpreter);
  exec.script_filename = doc.get_string("execution.script_filename", exec.script_filename);
  if (doc.has("execution.workspace_root")) {
    exec.workspace_root = expand_config_value(doc.get_string("execution.workspace_root"));
  }
  exec.max_output_bytes =
      static_cast<std::size_t>(doc.get_u64("execution.max_output_bytes", exec.max_output_bytes));

  config.resident.url = doc.get_string("resident.url", config.resident.url);
  config.resident.host = doc.get_string("resident.host", config.resident.host);
  config.resident.port =
      to_port(doc.get_u64("resident.port", config.resident.port), config.resident.port);
  config.resident.probe_timeout_ms =
      doc.get_u64("resident.probe_timeout_ms", config.resident.probe_timeout_ms);

  config.ondemand.url = doc.get_string("ondemand.url", config.ondemand.url);
  config.ondemand.host = doc.get_string("ondemand.host", config.ondemand.host);
  config.ondemand.port =
      to_port(doc.get_u64("ondemand.port", config.ondemand.port), config.ondemand.port);

  config.server.max_concurrent_requests = static_cast<std::uint32_t>(
      doc.get_u64("server.max_concurrent_requests", config.server.max_concurrent_requests));
  config.server.max_body_bytes = static_cast<std::size_t>(
      doc.get_u64("server.max_body_bytes", config.server.max_body_bytes));

  auto &store = config.code_store;
  store.backend = common::to_lower(doc.get_string("code_store.backend", store.backend));
  store.url = expand_config_value(doc.get_string("code_store.url", store.url));
  store.api_key = expand_config_value(doc.get_string("code_store.api_key", store.api_key));
  store.table = doc.get_string("code_store.table", store.table);
  if (doc.has("code_store.path")) {
    store.path = expand_config_value(doc.get_string("code_store.path"));
  }

  config.http.request_timeout_ms =
      doc.get_u64("http.request_timeout_ms", config.http.request_timeout_ms);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return cfg_path_result.forward_error<Config>();
  }

  const auto &path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return content.forward_error<Config>();
  }
  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }

  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Validation = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.execution.timeout_ms == 0) {
    return Validation::failure("execution.timeout_ms must be greater than 0");
  }
  if (common::trim(config.execution.interpreter).empty()) {
    return Validation::failure("execution.interpreter must not be empty");
  }
  const auto &filename = config.execution.script_filename;
  if (filename.empty() || filename.find('/') != std::string::npos || filename == "." ||
      filename == "..") {
    return Validation::failure("execution.script_filename must be a plain file name: " + filename);
  }
  if (config.execution.max_output_bytes == 0) {
    return Validation::failure("execution.max_output_bytes must be greater than 0");
  }

  if (!is_http_url(config.resident.url)) {
    return Validation::failure("resident.url must be an http(s) URL: " + config.resident.url);
  }
  if (!is_http_url(config.ondemand.url)) {
    return Validation::failure("ondemand.url must be an http(s) URL: " + config.ondemand.url);
  }
  if (config.resident.port == 0) {
    return Validation::failure("resident.port must be 1-65535");
  }
  if (config.ondemand.port == 0) {
    return Validation::failure("ondemand.port must be 1-65535");
  }
  if (config.resident.host != "127.0.0.1" && config.resident.host != "localhost" &&
      config.resident.host != "::1") {
    warnings.push_back("resident.host is not a loopback address: " + config.resident.host);
  }

  if (config.server.max_concurrent_requests == 0) {
    return Validation::failure("server.max_concurrent_requests must be greater than 0");
  }

  const auto &store = config.code_store;
  if (store.backend == "rest") {
    if (store.url.empty()) {
      warnings.push_back("code_store.url is not set; lookups will fail");
    } else if (!is_http_url(store.url)) {
      return Validation::failure("code_store.url must be an http(s) URL: " + store.url);
    }
    if (store.api_key.empty()) {
      warnings.push_back("code_store.api_key is not set");
    }
  } else if (store.backend == "sqlite" || store.backend == "dir") {
    if (store.path.empty()) {
      return Validation::failure("code_store.path is required for backend " + store.backend);
    }
  } else {
    return Validation::failure("Invalid code_store.backend: " + store.backend);
  }

  if (config.http.request_timeout_ms <= config.execution.timeout_ms) {
    warnings.push_back("http.request_timeout_ms should exceed execution.timeout_ms");
  }

  return Validation::success(std::move(warnings));
}

} // namespace toolexec::config
