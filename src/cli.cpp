#include "cli.hpp"
#include <cstdlib>
#include <iostream>

static const char* USAGE =
"mvstore init                    [options]\n"
"mvstore ingest <chunks.jsonl>   [options] [--batch N]\n"
"mvstore query  <query.json>     [options] [-k N] [--doc ID]...\n"
"mvstore get    <doc:chunk>...   [options]\n"
"mvstore delete <doc>            [options]\n"
"options: [--db uri] [--config path] [--dim N] [--scorer backend|in_process]\n"
"         [--retries N] [--retry-delay-ms N] [--log-level debug|info|warn|error|off]\n";

static int to_int(const std::string& flag, const std::string& v) {
  try {
    size_t used = 0;
    int n = std::stoi(v, &used);
    if (used != v.size()) throw std::invalid_argument(v);
    return n;
  } catch (const std::exception&) {
    std::cerr << "Invalid number for " << flag << ": " << v << "\n";
    std::exit(1);
  }
}

Args parse_cli(int argc, char** argv) {
  Args a;
  if (argc < 2) { std::cerr << USAGE; std::exit(1); }
  a.mode = argv[1];
  if (a.mode != "init" && a.mode != "ingest" && a.mode != "query" &&
      a.mode != "get" && a.mode != "delete") {
    std::cerr << USAGE; std::exit(1);
  }

  int i = 2;
  while (i < argc) {
    std::string f = argv[i++];
    if (f.empty() || f[0] != '-') { a.positional.push_back(f); continue; }
    auto next = [&](std::string& dst) {
      if (i >= argc) { std::cerr << "Missing value after " << f << "\n"; std::exit(1); }
      dst = argv[i++];
    };
    std::string v;
    if (f == "--db") next(a.db_uri);
    else if (f == "--config") next(a.config_path);
    else if (f == "--scorer") next(a.scorer);
    else if (f == "--log-level") next(a.log_level);
    else if (f == "--doc") { next(v); a.doc_filter.push_back(v); a.has_doc_filter = true; }
    else if (f == "--dim") { next(v); a.dim = to_int(f, v); }
    else if (f == "-k") { next(v); a.k = to_int(f, v); }
    else if (f == "--retries") { next(v); a.retries = to_int(f, v); }
    else if (f == "--retry-delay-ms") { next(v); a.retry_delay_ms = to_int(f, v); }
    else if (f == "--batch") { next(v); a.batch_size = to_int(f, v); }
    else { std::cerr << "Unknown flag: " << f << "\n" << USAGE; std::exit(1); }
  }

  const bool needs_arg = a.mode != "init";
  if (needs_arg && a.positional.empty()) { std::cerr << USAGE; std::exit(1); }
  if ((a.mode == "ingest" || a.mode == "query" || a.mode == "delete") && a.positional.size() != 1) {
    std::cerr << USAGE; std::exit(1);
  }
  if (a.batch_size <= 0) a.batch_size = 64;
  return a;
}
