#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <re2/re2.h>
#include <fstream>

using json = nlohmann::json;

RetryPolicy StoreConfig::retry_policy() const {
  RetryPolicy p;
  p.max_retries = max_retries;
  p.retry_delay = std::chrono::milliseconds(retry_delay_ms);
  return p;
}

std::string StoreConfig::database_path() const { return normalize_uri(uri); }

namespace {

template <typename T>
T read_field(const json& j, const char* key, T fallback) {
  if (!j.contains(key)) return fallback;
  try {
    return j.at(key).get<T>();
  } catch (const json::exception& e) {
    throw InvalidArgument(std::string("config: bad value for '") + key + "': " + e.what());
  }
}

int read_int_at_least(const json& j, const char* key, int fallback, int min_value) {
  int v = read_field<int>(j, key, fallback);
  if (v < min_value) {
    throw InvalidArgument(std::string("config: '") + key + "' must be >= " + std::to_string(min_value));
  }
  return v;
}

}  // namespace

StoreConfig config_from_json(const json& j, StoreConfig base) {
  if (!j.is_object()) throw InvalidArgument("config: top level must be a JSON object");

  StoreConfig c = base;
  c.uri = read_field<std::string>(j, "uri", c.uri);
  c.bit_dimension = (size_t)read_int_at_least(j, "bit_dimension", (int)c.bit_dimension, 1);
  c.dense_dimension = (size_t)read_int_at_least(j, "dense_dimension", (int)c.dense_dimension, 0);
  c.max_retries = read_int_at_least(j, "max_retries", c.max_retries, 1);
  c.retry_delay_ms = read_int_at_least(j, "retry_delay_ms", c.retry_delay_ms, 0);
  c.busy_timeout_ms = read_int_at_least(j, "busy_timeout_ms", c.busy_timeout_ms, 0);
  c.scorer = read_field<std::string>(j, "scorer", c.scorer);
  c.log_level = read_field<std::string>(j, "log_level", c.log_level);

  if (c.scorer != "backend" && c.scorer != "in_process") {
    throw InvalidArgument("config: scorer must be 'backend' or 'in_process', got '" + c.scorer + "'");
  }
  parse_log_level(c.log_level);
  return c;
}

StoreConfig load_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw InvalidArgument("config: cannot open " + path);
  json j;
  try {
    j = json::parse(in);
  } catch (const json::parse_error& e) {
    throw InvalidArgument("config: " + path + ": " + e.what());
  }
  return config_from_json(j);
}

std::string normalize_uri(const std::string& uri) {
  static const RE2 sqlite_re(R"(sqlite(?:\+\w+)?:///?([^?]+)(?:\?.*)?)");
  static const RE2 file_re(R"(file:(?://)?([^?]+)(?:\?.*)?)");
  static const RE2 scheme_re(R"(([A-Za-z][A-Za-z0-9+.\-]*)://.*)");

  if (uri.empty()) throw InvalidArgument("config: empty connection uri");

  std::string path;
  if (RE2::FullMatch(uri, sqlite_re, &path)) return path;
  if (RE2::FullMatch(uri, file_re, &path)) return path;

  std::string scheme;
  if (RE2::FullMatch(uri, scheme_re, &scheme)) {
    throw InvalidArgument("config: unsupported backend scheme '" + scheme + "'");
  }
  if (uri == ":memory:") {
    log_warn("config", ":memory: databases are private to one connection; every call sees an empty store");
  }
  return uri;
}
