#include "test_framework.hpp"

#include "toolexec/config/config.hpp"

#include <filesystem>
#include <fstream>
#include <random>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = toolexec::config::config_path_override();
    if (next.has_value()) {
      toolexec::config::set_config_path_override(*next);
    } else {
      toolexec::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      toolexec::config::set_config_path_override(*old_override);
    } else {
      toolexec::config::clear_config_path_override();
    }
  }
};

std::filesystem::path make_temp_home() {
  static std::mt19937_64 rng{std::random_device{}()};
  std::filesystem::path path = std::filesystem::temp_directory_path() /
                               ("toolexec-test-home-" + std::to_string(rng()));
  std::filesystem::create_directories(path);
  return path;
}

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

// Keeps the surrounding environment from leaking into load_config().
struct CleanEnv {
  EnvGuard interpreter{"TOOLEXEC_INTERPRETER", std::nullopt};
  EnvGuard timeout{"TOOLEXEC_TIMEOUT_MS", std::nullopt};
  EnvGuard resident{"TOOLEXEC_RESIDENT_URL", std::nullopt};
  EnvGuard ondemand{"TOOLEXEC_ONDEMAND_URL", std::nullopt};
  EnvGuard store_url{"TOOLEXEC_CODE_STORE_URL", std::nullopt};
  EnvGuard store_key{"TOOLEXEC_CODE_STORE_API_KEY", std::nullopt};
  EnvGuard supabase_url{"SUPABASE_URL", std::nullopt};
  EnvGuard supabase_key{"SUPABASE_SERVICE_ROLE_KEY", std::nullopt};
  EnvGuard env_file{"TOOLEXEC_ENV_FILE", std::nullopt};
  EnvGuard config_path{"TOOLEXEC_CONFIG_PATH", std::nullopt};
};

} // namespace

void register_config_tests(std::vector<toolexec::tests::TestCase> &tests) {
  using toolexec::tests::require;
  namespace cfg = toolexec::config;

  tests.push_back({"config_defaults_match_execution_budget", [] {
                     const cfg::Config config;
                     require(config.execution.timeout_ms == 5000, "5000 ms budget");
                     require(config.execution.interpreter == "python3", "python3 interpreter");
                     require(config.execution.script_filename == "function.py", "script name");
                     require(config.resident.url == "http://127.0.0.1:3500", "resident url");
                     require(config.server.max_concurrent_requests == 16, "concurrency ceiling");
                     require(config.code_store.table == "functions", "table");
                   }});

  tests.push_back({"config_parse_reads_every_section", [] {
                     const auto parsed = cfg::parse_config(
                         "[execution]\n"
                         "timeout_ms = 2500\n"
                         "interpreter = \"/usr/bin/python3\"\n"
                         "max_output_bytes = 4096\n"
                         "[resident]\n"
                         "url = \"http://127.0.0.1:4000\"\n"
                         "port = 4000\n"
                         "probe_timeout_ms = 750\n"
                         "[ondemand]\n"
                         "url = \"https://fn.example.com\"\n"
                         "[server]\n"
                         "max_concurrent_requests = 4\n"
                         "[code_store]\n"
                         "backend = \"SQLite\"\n"
                         "path = \"/var/lib/toolexec/code.db\"\n"
                         "[http]\n"
                         "request_timeout_ms = 9000\n"
                         "[observability]\n"
                         "backend = \"none\"\n");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.execution.timeout_ms == 2500, "timeout");
                     require(config.execution.interpreter == "/usr/bin/python3", "interpreter");
                     require(config.execution.max_output_bytes == 4096, "max output");
                     require(config.resident.port == 4000, "resident port");
                     require(config.resident.probe_timeout_ms == 750, "probe timeout");
                     require(config.ondemand.url == "https://fn.example.com", "ondemand url");
                     require(config.server.max_concurrent_requests == 4, "ceiling");
                     require(config.code_store.backend == "sqlite", "backend lowercased");
                     require(config.code_store.path == "/var/lib/toolexec/code.db", "store path");
                     require(config.http.request_timeout_ms == 9000, "http timeout");
                     require(config.observability.backend == "none", "observer backend");
                   }});

  tests.push_back({"config_parse_reports_syntax_errors", [] {
                     const auto parsed = cfg::parse_config("[execution]\nbroken line\n");
                     require(!parsed.ok(), "syntax error must fail");
                     require(parsed.error().find("line 2") != std::string::npos,
                             "error names the line");
                   }});

  tests.push_back({"config_validate_rejects_hard_errors", [] {
                     cfg::Config config;
                     config.code_store.backend = "dir";
                     config.code_store.path = "/tmp/code";
                     require(cfg::validate_config(config).ok(), "baseline is valid");

                     auto zero_timeout = config;
                     zero_timeout.execution.timeout_ms = 0;
                     require(!cfg::validate_config(zero_timeout).ok(), "zero timeout");

                     auto nested_name = config;
                     nested_name.execution.script_filename = "../escape.py";
                     require(!cfg::validate_config(nested_name).ok(), "path in script name");

                     auto bad_url = config;
                     bad_url.resident.url = "ftp://127.0.0.1";
                     require(!cfg::validate_config(bad_url).ok(), "non-http resident url");

                     auto no_path = config;
                     no_path.code_store.path.clear();
                     require(!cfg::validate_config(no_path).ok(), "dir backend needs a path");

                     auto unknown = config;
                     unknown.code_store.backend = "redis";
                     require(!cfg::validate_config(unknown).ok(), "unknown backend");

                     auto no_slots = config;
                     no_slots.server.max_concurrent_requests = 0;
                     require(!cfg::validate_config(no_slots).ok(), "zero ceiling");
                   }});

  tests.push_back({"config_validate_collects_warnings", [] {
                     cfg::Config config;
                     config.resident.host = "0.0.0.0";
                     config.http.request_timeout_ms = 1000;
                     const auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     // Non-loopback host, missing REST url, missing key, short transport timeout.
                     require(validated.value().size() == 4, "four warnings");
                   }});

  tests.push_back({"config_env_overrides_apply", [] {
                     CleanEnv clean;
                     EnvGuard interpreter("TOOLEXEC_INTERPRETER", "/bin/sh");
                     EnvGuard timeout("TOOLEXEC_TIMEOUT_MS", "1500");
                     EnvGuard supabase("SUPABASE_URL", "https://project.supabase.co");
                     EnvGuard key("SUPABASE_SERVICE_ROLE_KEY", "service-key");
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.execution.interpreter == "/bin/sh", "interpreter override");
                     require(config.execution.timeout_ms == 1500, "timeout override");
                     require(config.code_store.url == "https://project.supabase.co",
                             "store url falls back to SUPABASE_URL");
                     require(config.code_store.api_key == "service-key", "store key fallback");
                   }});

  tests.push_back({"config_explicit_store_env_beats_supabase", [] {
                     CleanEnv clean;
                     EnvGuard explicit_url("TOOLEXEC_CODE_STORE_URL", "https://store.local");
                     EnvGuard supabase("SUPABASE_URL", "https://project.supabase.co");
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.code_store.url == "https://store.local", "explicit wins");
                   }});

  tests.push_back({"config_path_override_and_load", [] {
                     CleanEnv clean;
                     const auto home = make_temp_home();
                     const auto file = home / "custom.toml";
                     write_file(file, "[execution]\ntimeout_ms = 3000\n"
                                      "[resident]\nurl = \"http://127.0.0.1:9000\"\n");
                     {
                       ConfigOverrideGuard guard(file);
                       const auto path = cfg::config_path();
                       require(path.ok() && path.value() == file, "override path used");
                       require(cfg::config_exists(), "override file exists");
                       const auto loaded = cfg::load_config();
                       require(loaded.ok(), loaded.error());
                       require(loaded.value().execution.timeout_ms == 3000, "file value loaded");
                       require(loaded.value().resident.url == "http://127.0.0.1:9000",
                               "resident url loaded");
                     }
                     std::error_code ec;
                     std::filesystem::remove_all(home, ec);
                   }});

  tests.push_back({"config_directory_override_uses_default_filename", [] {
                     CleanEnv clean;
                     const auto home = make_temp_home();
                     {
                       ConfigOverrideGuard guard(home);
                       const auto path = cfg::config_path();
                       require(path.ok() && path.value() == home / "config.toml",
                               "config.toml inside directory");
                       const auto loaded = cfg::load_config();
                       require(loaded.ok(), loaded.error());
                       require(loaded.value().execution.timeout_ms == 5000,
                               "missing file yields defaults");
                     }
                     std::error_code ec;
                     std::filesystem::remove_all(home, ec);
                   }});

  tests.push_back({"config_loads_dotenv_without_overwriting", [] {
                     CleanEnv clean;
                     const auto home = make_temp_home();
                     write_file(home / ".env", "# comment\n"
                                               "export TOOLEXEC_RESIDENT_URL=\"http://127.0.0.1:7000\"\n"
                                               "TOOLEXEC_INTERPRETER=/usr/bin/env-python\n");
                     EnvGuard interpreter("TOOLEXEC_INTERPRETER", "/bin/sh");
                     {
                       ConfigOverrideGuard guard(home);
                       const auto loaded = cfg::load_config();
                       require(loaded.ok(), loaded.error());
                       require(loaded.value().resident.url == "http://127.0.0.1:7000",
                               ".env value applied");
                       require(loaded.value().execution.interpreter == "/bin/sh",
                               "real environment wins");
                     }
                     std::error_code ec;
                     std::filesystem::remove_all(home, ec);
                   }});
}
