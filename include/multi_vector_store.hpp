#pragma once
#include "chunk_repository.hpp"
#include "config.hpp"
#include "connector.hpp"
#include "quantizer.hpp"
#include "similarity.hpp"
#include "vector_store.hpp"

// Multi-vector (late-interaction) store: quantizes float embeddings, persists them
// through ChunkRepository and ranks with MaxSim through SimilarityEngine.
class MultiVectorStore : public VectorStore {
public:
  explicit MultiVectorStore(const StoreConfig& config);

  bool initialize() override;

  std::pair<bool, std::vector<std::string>> store_embeddings(
      const std::vector<DocumentChunk>& chunks, const CancellationToken* cancel = nullptr) override;

  std::vector<DocumentChunk> query_similar(const FloatMatrix& query, int k,
                                           const DocFilter& doc_ids = std::nullopt,
                                           const CancellationToken* cancel = nullptr) override;

  std::vector<DocumentChunk> get_chunks_by_id(const std::vector<ChunkKey>& keys) override;

  bool delete_chunks_by_document_id(const std::string& document_id) override;

  const Quantizer& quantizer() const { return quantizer_; }
  ChunkRepository& repository() { return repo_; }
  SimilarityEngine& engine() { return engine_; }

private:
  Connector connector_;
  Quantizer quantizer_;
  ChunkRepository repo_;
  SimilarityEngine engine_;
};
