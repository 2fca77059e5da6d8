#include "similarity.hpp"
#include "chunk_repository.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <queue>

size_t hamming_distance(const BitVector& a, const BitVector& b) {
  if (a.dim() != b.dim()) {
    throw ShapeError("hamming: dim " + std::to_string(a.dim()) + " vs " + std::to_string(b.dim()));
  }
  const auto& wa = a.words();
  const auto& wb = b.words();
  size_t dist = 0;
  for (size_t i = 0; i < wa.size(); ++i) {
    dist += (size_t)__builtin_popcountll(wa[i] ^ wb[i]);
  }
  return dist;
}

double hamming_similarity(const BitVector& query, const BitVector& document) {
  const double bits = (double)std::max<size_t>(document.dim(), 1);
  return 1.0 - (double)hamming_distance(query, document) / bits;
}

double max_sim(const std::vector<BitVector>& query, const std::vector<BitVector>& document) {
  double total = 0.0;
  for (auto& q : query) {
    double best = 0.0;
    for (auto& d : document) {
      best = std::max(best, hamming_similarity(q, d));
    }
    total += best;
  }
  return total;
}

// ---- sqlite function ----

static void delete_vectors(void* p) {
  delete static_cast<std::vector<BitVector>*>(p);
}

static void max_sim_sql(sqlite3_context* ctx, int /*argc*/, sqlite3_value** argv) {
  if (sqlite3_value_type(argv[0]) == SQLITE_NULL || sqlite3_value_type(argv[1]) == SQLITE_NULL) {
    sqlite3_result_null(ctx);
    return;
  }
  try {
    const void* doc_blob = sqlite3_value_blob(argv[0]);
    const size_t doc_bytes = (size_t)sqlite3_value_bytes(argv[0]);
    auto document = unpack_vectors(doc_blob, doc_bytes);

    // the query argument is constant across a statement; keep it parsed between rows
    auto* query = static_cast<const std::vector<BitVector>*>(sqlite3_get_auxdata(ctx, 1));
    std::unique_ptr<std::vector<BitVector>> parsed;
    if (!query) {
      const void* q_blob = sqlite3_value_blob(argv[1]);
      const size_t q_bytes = (size_t)sqlite3_value_bytes(argv[1]);
      parsed.reset(new std::vector<BitVector>(unpack_vectors(q_blob, q_bytes)));
      query = parsed.get();
    }

    sqlite3_result_double(ctx, max_sim(*query, document));
    if (parsed) sqlite3_set_auxdata(ctx, 1, parsed.release(), &delete_vectors);
  } catch (const std::exception& e) {
    sqlite3_result_error(ctx, (std::string("max_sim: ") + e.what()).c_str(), -1);
  }
}

void install_max_sim(Connection& conn) {
  int rc = sqlite3_create_function_v2(conn.handle(), "max_sim", 2,
                                      SQLITE_UTF8 | SQLITE_DETERMINISTIC,
                                      nullptr, &max_sim_sql, nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) conn.fail(rc, "install max_sim");
}

// ---- scorers ----

std::vector<DocumentChunk> BackendScorer::rank_candidates(const std::vector<BitVector>& query, int k,
                                                          const DocFilter& filter,
                                                          const CancellationToken* cancel) {
  // sqlite reads a negative LIMIT as no limit
  if (k <= 0) throw InvalidArgument("similarity: k must be > 0, got " + std::to_string(k));
  return repo_.aggregate_max_sim(pack_vectors(query, repo_.bit_dimension()), k, filter, cancel);
}

namespace {

struct Scored {
  double score;
  int64_t id;
  DocumentChunk chunk;
};

// Higher score first; equal scores keep insertion order.
struct Better {
  bool operator()(const Scored& a, const Scored& b) const {
    return a.score > b.score || (a.score == b.score && a.id < b.id);
  }
};

}  // namespace

std::vector<DocumentChunk> InProcessScorer::rank_candidates(const std::vector<BitVector>& query, int k,
                                                            const DocFilter& filter,
                                                            const CancellationToken* cancel) {
  if (k <= 0) throw InvalidArgument("similarity: k must be > 0, got " + std::to_string(k));
  // top() is the worst of the kept candidates
  std::priority_queue<Scored, std::vector<Scored>, Better> heap;
  const size_t kk = (size_t)k;

  repo_.scan(filter, [&](CandidateRow&& row) {
    Scored s{max_sim(query, row.vectors), row.id, std::move(row.chunk)};
    if (heap.size() < kk) {
      heap.push(std::move(s));
    } else if (Better()(s, heap.top())) {
      heap.pop();
      heap.push(std::move(s));
    }
  }, cancel);

  std::vector<DocumentChunk> out(heap.size());
  for (size_t i = out.size(); i-- > 0;) {
    Scored s = heap.top();
    heap.pop();
    s.chunk.score = s.score;
    out[i] = std::move(s.chunk);
  }
  return out;
}

std::unique_ptr<Scorer> make_scorer(const std::string& name, ChunkRepository& repo) {
  if (name == "backend") return std::make_unique<BackendScorer>(repo);
  if (name == "in_process") return std::make_unique<InProcessScorer>(repo);
  throw InvalidArgument("similarity: unknown scorer '" + name + "'");
}

// ---- engine ----

SimilarityEngine::SimilarityEngine(ChunkRepository& repo, std::unique_ptr<Scorer> scorer)
  : repo_(repo), scorer_(std::move(scorer)) {
  if (!scorer_) throw InvalidArgument("similarity: scorer must not be null");
}

std::vector<DocumentChunk> SimilarityEngine::rank(const std::vector<BitVector>& query, int k,
                                                  const DocFilter& filter,
                                                  const CancellationToken* cancel) {
  if (k <= 0) throw InvalidArgument("similarity: k must be > 0, got " + std::to_string(k));
  for (auto& q : query) {
    if (q.dim() != repo_.bit_dimension()) {
      throw ShapeError("similarity: query vector dim " + std::to_string(q.dim()) +
                       " does not match store dim " + std::to_string(repo_.bit_dimension()));
    }
  }
  if (filter && filter->empty()) return {};

  auto results = scorer_->rank_candidates(query, k, filter, cancel);
  log_debug("similarity", scorer_->name() + " scorer returned " + std::to_string(results.size()) +
            " chunks for " + std::to_string(query.size()) + " query vectors");
  return results;
}
