#pragma once
#include <string>
#include <vector>

struct Args {
  std::string mode;                      // init | ingest | query | get | delete
  std::vector<std::string> positional;   // ingest/query file, get keys, delete doc id
  std::string db_uri;                    // empty: config / default
  std::string config_path;
  std::vector<std::string> doc_filter;   // --doc, repeatable
  bool has_doc_filter = false;
  std::string scorer;
  std::string log_level;
  int dim = 0;                           // 0: config / default
  int k = 10;
  int retries = 0;
  int retry_delay_ms = -1;
  int batch_size = 64;
};

Args parse_cli(int argc, char** argv);
