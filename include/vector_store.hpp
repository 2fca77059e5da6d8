#pragma once
#include "chunk.hpp"
#include "connector.hpp"
#include <string>
#include <utility>
#include <vector>

// Common surface of the multi-vector and dense stores.
class VectorStore {
public:
  virtual ~VectorStore() = default;

  // Creates or migrates persisted state. false (logged) on failure.
  virtual bool initialize() = 0;

  // (any chunk stored, "document_id-chunk_number" keys actually stored)
  virtual std::pair<bool, std::vector<std::string>> store_embeddings(
      const std::vector<DocumentChunk>& chunks, const CancellationToken* cancel = nullptr) = 0;

  virtual std::vector<DocumentChunk> query_similar(const FloatMatrix& query, int k,
                                                   const DocFilter& doc_ids = std::nullopt,
                                                   const CancellationToken* cancel = nullptr) = 0;

  virtual std::vector<DocumentChunk> get_chunks_by_id(const std::vector<ChunkKey>& keys) = 0;

  virtual bool delete_chunks_by_document_id(const std::string& document_id) = 0;
};
