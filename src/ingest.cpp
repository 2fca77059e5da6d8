#include "ingest.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

FloatMatrix to_matrix(const json& j) {
  if (!j.is_array()) throw InvalidArgument("embedding must be a JSON array");
  FloatMatrix m;
  if (j.empty()) return m;
  try {
    if (j[0].is_number()) {
      m.push_back(j.get<std::vector<float>>());
    } else {
      for (auto& row : j) m.push_back(row.get<std::vector<float>>());
    }
  } catch (const json::exception& e) {
    throw InvalidArgument(std::string("embedding: ") + e.what());
  }
  return m;
}

DocumentChunk parse_chunk_line(const std::string& line, size_t dim) {
  json j = json::parse(line, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) throw InvalidArgument("record is not a JSON object");

  DocumentChunk c;
  if (!j.contains("document_id") || !j["document_id"].is_string()) {
    throw InvalidArgument("record needs a string document_id");
  }
  c.document_id = j["document_id"].get<std::string>();
  check_document_id(c.document_id);

  if (!j.contains("chunk_number") || !j["chunk_number"].is_number_integer() ||
      j["chunk_number"].get<long long>() < 0 || j["chunk_number"].get<long long>() > std::numeric_limits<int>::max()) {
    throw InvalidArgument("record for " + c.document_id + " needs a non-negative integer chunk_number");
  }
  c.chunk_number = j["chunk_number"].get<int>();

  if (j.contains("content")) {
    if (!j["content"].is_string()) throw InvalidArgument("content of " + c.key().str() + " must be a string");
    c.content = j["content"].get<std::string>();
  }
  if (j.contains("metadata") && !j["metadata"].is_null()) {
    if (!j["metadata"].is_object()) throw InvalidArgument("metadata of " + c.key().str() + " must be an object");
    c.metadata = j["metadata"];
  }
  if (j.contains("embedding")) c.embedding = to_matrix(j["embedding"]);

  for (auto& row : c.embedding) {
    if (row.size() != dim) {
      throw ShapeError("embedding of " + c.key().str() + " has a row of " + std::to_string(row.size()) +
                       " floats, store dim is " + std::to_string(dim));
    }
  }
  return c;
}

ChunkKey parse_chunk_key(const std::string& text) {
  auto colon = text.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
    throw InvalidArgument("expected <doc:chunk>, got '" + text + "'");
  }
  const std::string number = text.substr(colon + 1);
  if (number.find_first_not_of("0123456789") != std::string::npos) {
    throw InvalidArgument("invalid chunk number in '" + text + "'");
  }

  ChunkKey k;
  k.document_id = text.substr(0, colon);
  try {
    k.chunk_number = std::stoi(number);
  } catch (const std::out_of_range&) {
    throw InvalidArgument("chunk number out of range in '" + text + "'");
  }
  return k;
}

IngestReport ingest_jsonl(std::istream& in, VectorStore& store, size_t dim, int batch_size) {
  IngestReport report;
  const size_t batch_limit = batch_size > 0 ? (size_t)batch_size : 1;
  std::vector<DocumentChunk> batch;

  auto flush = [&]() {
    if (batch.empty()) return;
    try {
      auto r = store.store_embeddings(batch);
      report.stored += r.second.size();
    } catch (const std::invalid_argument& e) {
      log_error("ingest", "batch of " + std::to_string(batch.size()) + " chunks refused: " + e.what());
      report.rejected += batch.size();
    }
    batch.clear();
  };

  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    ++report.records;
    try {
      batch.push_back(parse_chunk_line(line, dim));
    } catch (const std::invalid_argument& e) {
      log_error("ingest", "line " + std::to_string(line_no) + ": " + e.what());
      ++report.rejected;
      continue;
    }
    if (batch.size() >= batch_limit) flush();
  }
  flush();
  return report;
}
