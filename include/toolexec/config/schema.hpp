#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace toolexec::config {

struct ExecutionConfig {
  std::uint64_t timeout_ms = 5000;
  std::string interpreter = "python3";
  std::string script_filename = "function.py";
  // Empty means the system temp directory.
  std::string workspace_root;
  std::size_t max_output_bytes = 1024 * 1024;
};

struct ResidentConfig {
  std::string url = "http://127.0.0.1:3500";
  std::string host = "127.0.0.1";
  std::uint16_t port = 3500;
  std::uint64_t probe_timeout_ms = 2000;
};

struct OnDemandConfig {
  std::string url = "http://127.0.0.1:3501";
  std::string host = "127.0.0.1";
  std::uint16_t port = 3501;
};

struct ServerConfig {
  std::uint32_t max_concurrent_requests = 16;
  std::size_t max_body_bytes = 1024 * 1024;
};

struct CodeStoreConfig {
  std::string backend = "rest";
  std::string url;
  std::string api_key;
  std::string table = "functions";
  std::string path;
};

struct HttpConfig {
  std::uint64_t request_timeout_ms = 30000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ExecutionConfig execution;
  ResidentConfig resident;
  OnDemandConfig ondemand;
  ServerConfig server;
  CodeStoreConfig code_store;
  HttpConfig http;
  ObservabilityConfig observability;
};

} // namespace toolexec::config
