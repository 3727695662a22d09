#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "toolexec/cli/commands.hpp"
#include "toolexec/config/config.hpp"
#include "toolexec/observability/global.hpp"

namespace {

int run(std::vector<std::string> args) {
  args.insert(args.begin(), "toolexec");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  const int rc = toolexec::cli::run_cli(static_cast<int>(args.size()), argv.data());
  toolexec::config::clear_config_path_override();
  toolexec::observability::set_global_observer(nullptr);
  return rc;
}

std::string write_config(const toolexec::testing::TempWorkspace &ws) {
  ws.create_file("config.toml", "[execution]\n"
                                "interpreter = \"/bin/sh\"\n"
                                "script_filename = \"function.sh\"\n"
                                "timeout_ms = 2000\n"
                                "workspace_root = \"" +
                                    (ws.path() / "runs").string() +
                                    "\"\n"
                                    "[code_store]\n"
                                    "backend = \"dir\"\n"
                                    "path = \"" +
                                    (ws.path() / "code").string() +
                                    "\"\n"
                                    "[observability]\n"
                                    "backend = \"none\"\n");
  return (ws.path() / "config.toml").string();
}

} // namespace

void register_cli_tests(std::vector<toolexec::tests::TestCase> &tests) {
  using toolexec::tests::require;
  using toolexec::testing::TempWorkspace;

  tests.push_back({"cli_basic_commands", [] {
                     require(run({"version"}) == 0, "version");
                     require(run({"--help"}) == 0, "help");
                     require(run({"frobnicate"}) == 1, "unknown command");
                     require(run({"--config"}) == 1, "--config without value");
                   }});

  tests.push_back({"cli_config_path_honours_override", [] {
                     TempWorkspace ws;
                     const auto path = write_config(ws);
                     require(run({"--config=" + path, "config-path"}) == 0, "config-path");
                   }});

  tests.push_back({"cli_exec_file_runs_local_script", [] {
                     TempWorkspace ws;
                     const auto path = write_config(ws);
                     ws.create_file("ok.sh", "printf '%s' \"$1\"\n");
                     ws.create_file("bad.sh", "exit 4\n");
                     require(run({"--config", path, "exec-file", (ws.path() / "ok.sh").string(),
                                  "--input", "{\"a\":1}"}) == 0,
                             "successful script exits 0");
                     require(run({"--config", path, "exec-file", (ws.path() / "bad.sh").string()}) == 1,
                             "failing script exits 1");
                     require(run({"--config", path, "exec-file", (ws.path() / "ok.sh").string(),
                                  "--input", "{broken"}) == 1,
                             "invalid input exits 1");
                     require(run({"--config", path, "exec-file"}) == 1, "missing path");
                   }});

  tests.push_back({"cli_rejects_invalid_config", [] {
                     TempWorkspace ws;
                     ws.create_file("bad.toml", "[execution]\ntimeout_ms = 0\n");
                     require(run({"--config", (ws.path() / "bad.toml").string(), "exec-file", "x"}) == 1,
                             "validation failure exits 1");
                   }});
}
