#pragma once
#include "chunk.hpp"
#include "connector.hpp"
#include "quantizer.hpp"
#include <memory>
#include <string>
#include <vector>

class ChunkRepository;

// Number of differing bits. Throws ShapeError when dimensions differ.
size_t hamming_distance(const BitVector& a, const BitVector& b);

// 1 - hamming(query, document) / max(len(document), 1), in [0, 1].
double hamming_similarity(const BitVector& query, const BitVector& document);

// Late-interaction score: for every query vector take its best match among the
// document vectors, then sum. An empty query scores 0.0.
double max_sim(const std::vector<BitVector>& query, const std::vector<BitVector>& document);

// Registers the deterministic SQL function max_sim(document_blob, query_blob) on a
// connection. Blobs use the pack_vectors layout; NULL in gives NULL out.
void install_max_sim(Connection& conn);

// Ranks candidate chunks for a quantized query. Results are ordered by score
// descending, then by insertion order. k <= 0 is InvalidArgument.
class Scorer {
public:
  virtual ~Scorer() = default;
  virtual std::vector<DocumentChunk> rank_candidates(const std::vector<BitVector>& query,
                                                     int k,
                                                     const DocFilter& filter,
                                                     const CancellationToken* cancel) = 0;
  virtual std::string name() const = 0;
};

// Pushes scoring into sqlite through the registered max_sim function.
class BackendScorer : public Scorer {
public:
  explicit BackendScorer(ChunkRepository& repo) : repo_(repo) {}
  std::vector<DocumentChunk> rank_candidates(const std::vector<BitVector>& query, int k,
                                             const DocFilter& filter,
                                             const CancellationToken* cancel) override;
  std::string name() const override { return "backend"; }

private:
  ChunkRepository& repo_;
};

// Streams candidate rows out of sqlite and scores them here with a bounded top-k heap.
class InProcessScorer : public Scorer {
public:
  explicit InProcessScorer(ChunkRepository& repo) : repo_(repo) {}
  std::vector<DocumentChunk> rank_candidates(const std::vector<BitVector>& query, int k,
                                             const DocFilter& filter,
                                             const CancellationToken* cancel) override;
  std::string name() const override { return "in_process"; }

private:
  ChunkRepository& repo_;
};

// "backend" | "in_process"; throws InvalidArgument otherwise.
std::unique_ptr<Scorer> make_scorer(const std::string& name, ChunkRepository& repo);

class SimilarityEngine {
public:
  SimilarityEngine(ChunkRepository& repo, std::unique_ptr<Scorer> scorer);

  // Top-k chunks by MaxSim. k <= 0 is InvalidArgument, a query vector of the wrong
  // dimension is ShapeError, and an empty (non-absent) filter returns nothing.
  std::vector<DocumentChunk> rank(const std::vector<BitVector>& query, int k,
                                  const DocFilter& filter = std::nullopt,
                                  const CancellationToken* cancel = nullptr);

  const Scorer& scorer() const { return *scorer_; }

private:
  ChunkRepository& repo_;
  std::unique_ptr<Scorer> scorer_;
};
