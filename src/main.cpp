#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "ingest.hpp"
#include "log.hpp"
#include "multi_vector_store.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

static json to_json(const DocumentChunk& c) {
  return json{{"document_id", c.document_id},
              {"chunk_number", c.chunk_number},
              {"score", c.score},
              {"content", c.content},
              {"metadata", c.metadata}};
}

static void print_chunks(const std::vector<DocumentChunk>& chunks) {
  for (auto& c : chunks) std::cout << to_json(c).dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
}

static int run_ingest(MultiVectorStore& store, const Args& args) {
  std::ifstream in(args.positional[0]);
  if (!in) { std::cerr << "Cannot open " << args.positional[0] << "\n"; return 1; }

  IngestReport r = ingest_jsonl(in, store, store.quantizer().dim(), args.batch_size);
  std::cerr << "Stored " << r.stored << " of " << r.records << " chunks";
  if (r.rejected) std::cerr << " (" << r.rejected << " rejected)";
  std::cerr << ".\n";
  return 0;
}

static int run_query(MultiVectorStore& store, const Args& args) {
  std::ifstream in(args.positional[0]);
  if (!in) { std::cerr << "Cannot open " << args.positional[0] << "\n"; return 1; }
  FloatMatrix q = to_matrix(json::parse(in));

  DocFilter filter;
  if (args.has_doc_filter) filter = args.doc_filter;
  print_chunks(store.query_similar(q, args.k, filter));
  return 0;
}

static int run_get(MultiVectorStore& store, const Args& args) {
  std::vector<ChunkKey> keys;
  for (auto& p : args.positional) {
    try {
      keys.push_back(parse_chunk_key(p));
    } catch (const InvalidArgument& e) {
      std::cerr << e.what() << "\n";
      return 1;
    }
  }
  print_chunks(store.get_chunks_by_id(keys));
  return 0;
}

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);

  try {
    StoreConfig cfg = args.config_path.empty() ? StoreConfig() : load_config(args.config_path);
    if (!args.db_uri.empty()) cfg.uri = args.db_uri;
    if (args.dim > 0) cfg.bit_dimension = (size_t)args.dim;
    if (!args.scorer.empty()) cfg.scorer = args.scorer;
    if (!args.log_level.empty()) cfg.log_level = args.log_level;
    if (args.retries > 0) cfg.max_retries = args.retries;
    if (args.retry_delay_ms >= 0) cfg.retry_delay_ms = args.retry_delay_ms;
    set_log_level(parse_log_level(cfg.log_level));

    MultiVectorStore store(cfg);
    if (!store.initialize()) return 1;

    if (args.mode == "init") {
      std::cerr << "Store ready at " << cfg.database_path() << "\n";
      return 0;
    }
    if (args.mode == "ingest") return run_ingest(store, args);
    if (args.mode == "query") return run_query(store, args);
    if (args.mode == "get") return run_get(store, args);
    if (args.mode == "delete") return store.delete_chunks_by_document_id(args.positional[0]) ? 0 : 1;
  } catch (const std::exception& e) {
    std::cerr << "[mvstore] Fatal: " << e.what() << std::endl;
    return 1;
  }
  return 1;
}
