#pragma once
#include "chunk.hpp"
#include "connector.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// A stored row as the in-process scorer sees it.
struct CandidateRow {
  int64_t id = 0;
  DocumentChunk chunk;             // embedding stays empty
  std::vector<BitVector> vectors;
};

// Owns the persisted form of multi-vector chunks in sqlite:
//   multi_vector_embeddings(id, document_id, chunk_number, content, chunk_metadata, embeddings)
// plus multi_vector_meta(key, value) recording the bit dimension.
class ChunkRepository {
public:
  // Registers the max_sim SQL function on every connection `connector` opens.
  ChunkRepository(Connector& connector, size_t bit_dimension);

  size_t bit_dimension() const { return dim_; }

  bool exists_and_matches_schema();

  // Idempotent. Creates or migrates the relation and its indexes; throws SchemaError.
  void ensure_schema();

  // Best effort, one row at a time. Chunks without vectors and duplicate natural
  // keys are logged and skipped. Vectors of the wrong dimension are ShapeError, a
  // document id that is not valid UTF-8 is InvalidArgument, and either way nothing
  // is written.
  InsertResult insert(const std::vector<QuantizedChunk>& chunks,
                      const CancellationToken* cancel = nullptr);

  // One round trip for any number of keys. Unknown keys are omitted.
  std::vector<DocumentChunk> get_by_keys(const std::vector<ChunkKey>& keys);

  // false (logged) on backend failure, never throws.
  bool delete_by_document(const std::string& document_id);

  // Candidate access for the scorers.
  void scan(const DocFilter& filter, const std::function<void(CandidateRow&&)>& visit,
            const CancellationToken* cancel = nullptr);
  std::vector<DocumentChunk> aggregate_max_sim(const std::string& packed_query, int k,
                                               const DocFilter& filter,
                                               const CancellationToken* cancel = nullptr);

private:
  Connector& connector_;
  size_t dim_;
};
