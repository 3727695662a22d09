#include "toolexec/cli/commands.hpp"

#include "toolexec/common/fs.hpp"
#include "toolexec/config/config.hpp"
#include "toolexec/net/http_client.hpp"
#include "toolexec/observability/factory.hpp"
#include "toolexec/observability/global.hpp"
#include "toolexec/orchestrator/orchestrator.hpp"
#include "toolexec/sandbox/local_sandbox.hpp"
#include "toolexec/service/ondemand_service.hpp"
#include "toolexec/service/resident_service.hpp"
#include "toolexec/store/factory.hpp"

#include <signal.h>

#include <charconv>
#include <cstdint>
#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace toolexec::cli {

namespace {

std::string version_string() {
#ifdef TOOLEXEC_VERSION
  return std::string("toolexec ") + TOOLEXEC_VERSION;
#else
  return "toolexec 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

template <typename T> bool parse_number(const std::string &text, T &out) {
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

/// Load, validate and install the observer. Returns false after printing the error.
bool load_runtime_config(config::Config &out) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return false;
  }
  const auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    std::cerr << "invalid configuration: " << validated.error() << "\n";
    return false;
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "[WARN] " << warning << "\n";
  }
  out = std::move(loaded.value());
  observability::set_global_observer(observability::create_observer(out));
  return true;
}

/// Resolve --input / --input-file / "-" (stdin); defaults to {}.
bool take_input(std::vector<std::string> &args, std::string &input, std::string &error) {
  std::string inline_input;
  std::string input_file;
  const bool has_inline = take_option(args, "--input", "-i", inline_input);
  const bool has_file = take_option(args, "--input-file", "", input_file);
  if (has_inline && has_file) {
    error = "use either --input or --input-file";
    return false;
  }
  if (has_file) {
    auto content = input_file == "-" ? common::Result<std::string>::success(read_stdin_all())
                                     : common::read_file(common::expand_path(input_file));
    if (!content.ok()) {
      error = content.error();
      return false;
    }
    input = common::trim(content.value());
    return true;
  }
  input = has_inline ? inline_input : "{}";
  return true;
}

bool take_service_options(std::vector<std::string> &args, const std::string &default_host,
                          const std::uint16_t default_port, service::ServiceOptions &options,
                          std::string &error) {
  std::string host;
  std::string port_raw;
  (void)take_option(args, "--host", "", host);
  (void)take_option(args, "--port", "-p", port_raw);
  options.host = host.empty() ? default_host : host;
  options.port = default_port;
  if (!port_raw.empty() && !parse_number(port_raw, options.port)) {
    error = "invalid port: " + port_raw;
    return false;
  }
  return true;
}

/// Block until SIGINT/SIGTERM, or for --duration-secs when given.
int wait_for_shutdown(std::vector<std::string> &args, const bool once) {
  if (once) {
    return 0;
  }
  std::string duration_raw;
  if (take_option(args, "--duration-secs", "", duration_raw)) {
    unsigned duration = 0;
    if (!parse_number(duration_raw, duration)) {
      std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
      return 1;
    }
    std::this_thread::sleep_for(std::chrono::seconds(duration));
    return 0;
  }

  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  int received = 0;
  (void)sigwait(&signals, &received);
  return 0;
}

void block_shutdown_signals() {
  // Worker threads inherit the mask; only sigwait sees these.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  (void)pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  ::signal(SIGPIPE, SIG_IGN);
}

int run_resident(std::vector<std::string> args) {
  config::Config config;
  if (!load_runtime_config(config)) {
    return 1;
  }
  service::ServiceOptions options;
  std::string error;
  if (!take_service_options(args, config.resident.host, config.resident.port, options, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  const bool once = take_flag(args, "--once");

  block_shutdown_signals();
  service::ResidentService service(config);
  if (auto status = service.start(options); !status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  std::cout << "Resident executor listening on " << options.host << ":" << service.port()
            << " (budget " << config.execution.timeout_ms << " ms, max "
            << config.server.max_concurrent_requests << " concurrent)\n"
            << std::flush;

  const int rc = wait_for_shutdown(args, once);
  service.stop();
  return rc;
}

int run_ondemand(std::vector<std::string> args) {
  config::Config config;
  if (!load_runtime_config(config)) {
    return 1;
  }
  service::ServiceOptions options;
  std::string error;
  if (!take_service_options(args, config.ondemand.host, config.ondemand.port, options, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  const bool once = take_flag(args, "--once");

  auto code_store = store::create_code_store(config, std::make_shared<net::CurlHttpClient>());
  if (!code_store.ok()) {
    std::cerr << code_store.error() << "\n";
    return 1;
  }

  block_shutdown_signals();
  service::OnDemandService service(config, std::move(code_store.value()));
  if (auto status = service.start(options); !status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  std::cout << "On-demand handler host listening on " << options.host << ":" << service.port()
            << "\n"
            << std::flush;

  const int rc = wait_for_shutdown(args, once);
  service.stop();
  return rc;
}

int run_execute(std::vector<std::string> args) {
  config::Config config;
  if (!load_runtime_config(config)) {
    return 1;
  }
  std::string input;
  std::string error;
  if (!take_input(args, input, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  if (args.empty()) {
    std::cerr << "usage: toolexec run <id> [--input JSON | --input-file PATH]\n";
    return 1;
  }
  const std::string id = args.front();

  auto http_client = std::make_shared<net::CurlHttpClient>();
  auto code_store = store::create_code_store(config, http_client);
  if (!code_store.ok()) {
    std::cerr << code_store.error() << "\n";
    return 1;
  }

  auto orchestrator = orchestrator::ExecutionOrchestrator::from_config(
      config, http_client, std::move(code_store.value()));
  const auto result = orchestrator.execute_tool(id, input);
  std::cout << result.to_json() << "\n";
  return result.success ? 0 : 1;
}

int run_probe() {
  config::Config config;
  if (!load_runtime_config(config)) {
    return 1;
  }
  const executor::ResidentExecutor resident(config.resident.url,
                                            std::make_shared<net::CurlHttpClient>(),
                                            config.http.request_timeout_ms,
                                            config.resident.probe_timeout_ms);
  const auto probe = resident.probe();
  if (probe.healthy) {
    std::cout << "healthy " << config.resident.url << "\n";
    return 0;
  }
  std::cout << "unhealthy " << config.resident.url << ": " << probe.detail << "\n";
  return 1;
}

int run_exec_file(std::vector<std::string> args) {
  config::Config config;
  if (!load_runtime_config(config)) {
    return 1;
  }
  std::string input;
  std::string error;
  if (!take_input(args, input, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  if (args.empty()) {
    std::cerr << "usage: toolexec exec-file <script> [--input JSON | --input-file PATH]\n";
    return 1;
  }

  const auto source = common::read_file(common::expand_path(args.front()));
  if (!source.ok()) {
    std::cerr << source.error() << "\n";
    return 1;
  }
  const sandbox::LocalSandbox sandbox(config.execution);
  const auto result = sandbox.execute(source.value(), input, args.front());
  std::cout << result.to_json() << "\n";
  return result.success ? 0 : 1;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: toolexec [--config PATH] <command> [options]\n\n";
  std::cout << "Services:\n";
  std::cout << "  resident [--host H] [--port P]     Run the loopback executor (GET /health, "
               "POST /execute)\n";
  std::cout << "  ondemand [--host H] [--port P]     Run the on-demand handler host\n";
  std::cout << "           [--once] [--duration-secs N]\n\n";
  std::cout << "Execution:\n";
  std::cout << "  run <id> [--input JSON | --input-file PATH|-]\n";
  std::cout << "                                     Probe, route and execute a stored script\n";
  std::cout << "  exec-file <script> [--input JSON]  Run a local script in the sandbox\n";
  std::cout << "  probe                              Check resident executor health\n\n";
  std::cout << "Other:\n";
  std::cout << "  config-path                        Print the config file location\n";
  std::cout << "  version                            Show version\n";
  std::cout << "  help                               Show this help\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "resident") {
    return run_resident(std::move(args));
  }
  if (subcommand == "ondemand") {
    return run_ondemand(std::move(args));
  }
  if (subcommand == "run") {
    return run_execute(std::move(args));
  }
  if (subcommand == "probe") {
    return run_probe();
  }
  if (subcommand == "exec-file") {
    return run_exec_file(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace toolexec::cli
