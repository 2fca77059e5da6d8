#include "multi_vector_store.hpp"
#include "errors.hpp"
#include "log.hpp"

MultiVectorStore::MultiVectorStore(const StoreConfig& config)
  : connector_(config.database_path(), config.retry_policy(), config.busy_timeout_ms),
    quantizer_(config.bit_dimension),
    repo_(connector_, config.bit_dimension),
    engine_(repo_, make_scorer(config.scorer, repo_)) {}

bool MultiVectorStore::initialize() {
  try {
    repo_.ensure_schema();
    log_info("multi_vector_store", "initialized at " + connector_.path());
    return true;
  } catch (const std::exception& e) {
    log_error("multi_vector_store", std::string("error initializing: ") + e.what());
    return false;
  }
}

std::pair<bool, std::vector<std::string>> MultiVectorStore::store_embeddings(
    const std::vector<DocumentChunk>& chunks, const CancellationToken* cancel) {
  std::vector<QuantizedChunk> quantized;
  quantized.reserve(chunks.size());
  for (auto& c : chunks) {
    if (c.chunk_number < 0) {
      throw InvalidArgument("multi_vector_store: negative chunk_number for " + c.key().str());
    }
    check_document_id(c.document_id);
    QuantizedChunk q;
    q.document_id = c.document_id;
    q.chunk_number = c.chunk_number;
    q.content = c.content;
    q.metadata = c.metadata;
    q.vectors = quantizer_.quantize(c.embedding);
    quantized.push_back(std::move(q));
  }

  InsertResult r = repo_.insert(quantized, cancel);
  return {r.success, r.stored_keys};
}

std::vector<DocumentChunk> MultiVectorStore::query_similar(const FloatMatrix& query, int k,
                                                           const DocFilter& doc_ids,
                                                           const CancellationToken* cancel) {
  return engine_.rank(quantizer_.quantize(query), k, doc_ids, cancel);
}

std::vector<DocumentChunk> MultiVectorStore::get_chunks_by_id(const std::vector<ChunkKey>& keys) {
  return repo_.get_by_keys(keys);
}

bool MultiVectorStore::delete_chunks_by_document_id(const std::string& document_id) {
  return repo_.delete_by_document(document_id);
}
