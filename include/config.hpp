#pragma once
#include "connector.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

struct StoreConfig {
  std::string uri = "sqlite:///mvstore.db";
  size_t bit_dimension = 128;     // D for the multi-vector store
  size_t dense_dimension = 0;     // float dim for the dense store; 0 = unused
  int max_retries = 3;
  int retry_delay_ms = 1000;
  int busy_timeout_ms = 5000;
  std::string scorer = "backend"; // "backend" | "in_process"
  std::string log_level = "info";

  RetryPolicy retry_policy() const;
  std::string database_path() const;
};

// Overlays the keys present in `j` on top of `base`. Unknown keys are ignored;
// wrong types or out-of-range values throw InvalidArgument.
StoreConfig config_from_json(const nlohmann::json& j, StoreConfig base = StoreConfig());

// Reads a JSON config file.
StoreConfig load_config(const std::string& path);

// Turns a connection string into a sqlite file path.
//   sqlite:///rel.db, sqlite:////abs/path.db, sqlite+driver://..., file:path, bare paths.
// Other schemes are rejected with InvalidArgument.
std::string normalize_uri(const std::string& uri);
