#pragma once
#include "metadata.hpp"
#include "quantizer.hpp"
#include <optional>
#include <string>
#include <vector>

// Natural key of a chunk.
struct ChunkKey {
  std::string document_id;
  int chunk_number = 0;

  std::string str() const { return document_id + "-" + std::to_string(chunk_number); }

  bool operator==(const ChunkKey& o) const {
    return document_id == o.document_id && chunk_number == o.chunk_number;
  }
  bool operator<(const ChunkKey& o) const {
    return document_id < o.document_id ||
           (document_id == o.document_id && chunk_number < o.chunk_number);
  }
};

// What callers hand in and get back. `embedding` is only read on ingestion;
// results always come back with it empty. `score` is 0.0 for direct lookups.
struct DocumentChunk {
  std::string document_id;
  int chunk_number = 0;
  std::string content;
  FloatMatrix embedding;
  Metadata metadata = Metadata::object();
  double score = 0.0;

  ChunkKey key() const { return ChunkKey{document_id, chunk_number}; }
};

// A chunk after quantization, as the repository persists it.
struct QuantizedChunk {
  std::string document_id;
  int chunk_number = 0;
  std::string content;
  Metadata metadata = Metadata::object();
  std::vector<BitVector> vectors;
};

struct InsertResult {
  bool success = false;
  std::vector<std::string> stored_keys;   // "document_id-chunk_number"
};

// Absent: no filter. Present but empty: matches nothing.
using DocFilter = std::optional<std::vector<std::string>>;
