#pragma once
#include "config.hpp"
#include "connector.hpp"
#include "vector_store.hpp"
#include <memory>
#include <mutex>
#include <string>

// Single-vector store: chunk rows in sqlite (vector_embeddings), one float vector per
// chunk in an HNSW index persisted at <db>.hnsw and labelled by row id.
class DenseVectorStore : public VectorStore {
public:
  explicit DenseVectorStore(const StoreConfig& config, int M = 16, int efC = 200, int efS = 64);
  ~DenseVectorStore() override;

  bool initialize() override;

  // Each chunk's embedding must be exactly one row of dense_dimension floats.
  std::pair<bool, std::vector<std::string>> store_embeddings(
      const std::vector<DocumentChunk>& chunks, const CancellationToken* cancel = nullptr) override;

  // Nearest first; score = 1 / (1 + squared L2 distance).
  std::vector<DocumentChunk> query_similar(const FloatMatrix& query, int k,
                                           const DocFilter& doc_ids = std::nullopt,
                                           const CancellationToken* cancel = nullptr) override;

  std::vector<DocumentChunk> get_chunks_by_id(const std::vector<ChunkKey>& keys) override;

  bool delete_chunks_by_document_id(const std::string& document_id) override;

  size_t size() const;                 // live vectors in the index
  const std::string& index_path() const { return index_path_; }

private:
  void load_index();
  void save_index() const;

  Connector connector_;
  size_t dim_;
  int M_, efC_, efS_;
  std::string index_path_;
  // pimpl so hnswlib stays out of the header
  struct Impl;
  std::unique_ptr<Impl> impl_;
  mutable std::mutex mu_;
};
