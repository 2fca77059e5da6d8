#pragma once
#include "chunk.hpp"
#include "vector_store.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <istream>
#include <string>

// Accepts one flat vector or a list of vectors.
FloatMatrix to_matrix(const nlohmann::json& j);

// One JSONL ingest record:
//   {"document_id": ..., "chunk_number": ..., "content": ..., "metadata": {...}, "embedding": [[...], ...]}
// Every embedding row must have `dim` floats (ShapeError); anything else malformed is InvalidArgument.
DocumentChunk parse_chunk_line(const std::string& line, size_t dim);

// "doc:chunk", split at the last ':'. The chunk part must be a plain non-negative integer.
ChunkKey parse_chunk_key(const std::string& text);

struct IngestReport {
  size_t records = 0;   // non-blank lines read
  size_t stored = 0;
  size_t rejected = 0;  // unparseable lines and chunks of batches the store refused
};

// Stores JSONL records in batches. Bad lines and refused batches are logged and
// counted; backend failures propagate.
IngestReport ingest_jsonl(std::istream& in, VectorStore& store, size_t dim, int batch_size);
