#include "chunk_repository.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "similarity.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <set>

using json = nlohmann::json;

namespace {

const char* kTable = "multi_vector_embeddings";
const char* kMetaTable = "multi_vector_meta";
const char* kDocIndex = "idx_multi_vector_document_id";
const char* kKeyIndex = "idx_multi_vector_natural_key";

// Columns a legacy table may lack, with the type they are added as.
const std::pair<const char*, const char*> kColumns[] = {
  {"document_id", "TEXT"},
  {"chunk_number", "INTEGER"},
  {"content", "TEXT"},
  {"chunk_metadata", "TEXT"},
  {"embeddings", "BLOB"},
};

bool object_exists(Connection& conn, const char* type, const std::string& name) {
  Statement st(conn, "SELECT COUNT(*) FROM sqlite_master WHERE type = ?1 AND name = ?2");
  st.bind_text(1, type);
  st.bind_text(2, name);
  return st.step() && st.column_int(0) > 0;
}

std::set<std::string> column_names(Connection& conn, const std::string& table) {
  std::set<std::string> cols;
  Statement st(conn, "PRAGMA table_info(" + table + ")");
  while (st.step()) cols.insert(st.column_text(1));
  return cols;
}

std::optional<std::string> read_meta(Connection& conn, const std::string& key) {
  Statement st(conn, std::string("SELECT value FROM ") + kMetaTable + " WHERE key = ?1");
  st.bind_text(1, key);
  if (!st.step()) return std::nullopt;
  return st.column_text(0);
}

// Ids that could never have been stored are left out rather than mangled.
std::string doc_filter_json(const std::vector<std::string>& ids) {
  json arr = json::array();
  for (auto& id : ids) {
    if (is_storable_document_id(id)) arr.push_back(id);
  }
  return arr.dump();
}

// Reads (document_id, chunk_number, content, chunk_metadata) starting at column `c`.
DocumentChunk read_chunk(const Statement& st, int c) {
  DocumentChunk chunk;
  chunk.document_id = st.column_text(c);
  chunk.chunk_number = st.column_int(c + 1);
  chunk.content = st.column_text(c + 2);
  chunk.metadata = st.column_is_null(c + 3) ? Metadata::object() : decode_metadata(st.column_text(c + 3));
  return chunk;
}

}  // namespace

ChunkRepository::ChunkRepository(Connector& connector, size_t bit_dimension)
  : connector_(connector), dim_(bit_dimension) {
  if (dim_ == 0) throw InvalidArgument("repository: bit dimension must be > 0");
  connector_.add_initializer([](Connection& conn) { install_max_sim(conn); });
}

bool ChunkRepository::exists_and_matches_schema() {
  return connector_.with_connection([&](Connection& conn) {
    if (!object_exists(conn, "table", kTable) || !object_exists(conn, "table", kMetaTable)) return false;
    auto cols = column_names(conn, kTable);
    if (!cols.count("id")) return false;
    for (auto& c : kColumns) {
      if (!cols.count(c.first)) return false;
    }
    if (!object_exists(conn, "index", kDocIndex) || !object_exists(conn, "index", kKeyIndex)) return false;
    auto dim = read_meta(conn, "bit_dimension");
    return dim && *dim == std::to_string(dim_);
  });
}

void ChunkRepository::ensure_schema() {
  try {
    connector_.with_connection([&](Connection& conn) {
      conn.exec("PRAGMA journal_mode=WAL");

      if (object_exists(conn, "table", kTable)) {
        auto cols = column_names(conn, kTable);
        if (!cols.count("id")) {
          throw SchemaError(std::string("repository: existing ") + kTable + " has no id column");
        }
        for (auto& c : kColumns) {
          if (cols.count(c.first)) continue;
          log_info("repository", std::string("adding missing column ") + c.first + " to " + kTable);
          conn.exec(std::string("ALTER TABLE ") + kTable + " ADD COLUMN " + c.first + " " + c.second);
        }
      } else {
        conn.exec(std::string("CREATE TABLE ") + kTable + " ("
                  " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                  " document_id TEXT NOT NULL,"
                  " chunk_number INTEGER NOT NULL,"
                  " content TEXT NOT NULL,"
                  " chunk_metadata TEXT,"
                  " embeddings BLOB NOT NULL"
                  ")");
        log_info("repository", std::string("created ") + kTable);
      }

      conn.exec(std::string("CREATE TABLE IF NOT EXISTS ") + kMetaTable +
                " (key TEXT PRIMARY KEY, value TEXT NOT NULL)");
      auto recorded = read_meta(conn, "bit_dimension");
      if (!recorded) {
        Statement st(conn, std::string("INSERT INTO ") + kMetaTable + " (key, value) VALUES ('bit_dimension', ?1)");
        st.bind_text(1, std::to_string(dim_));
        st.step();
      } else if (*recorded != std::to_string(dim_)) {
        throw SchemaError("repository: store was created with bit dimension " + *recorded +
                          ", configured " + std::to_string(dim_));
      }

      // first write wins for legacy rows that share a natural key
      conn.exec(std::string("DELETE FROM ") + kTable +
                " WHERE document_id IS NOT NULL AND chunk_number IS NOT NULL AND id NOT IN ("
                "SELECT MIN(id) FROM " + kTable +
                " WHERE document_id IS NOT NULL AND chunk_number IS NOT NULL"
                " GROUP BY document_id, chunk_number)");
      if (conn.changes() > 0) {
        log_warn("repository", "collapsed " + std::to_string(conn.changes()) + " duplicate legacy rows");
      }

      conn.exec(std::string("CREATE INDEX IF NOT EXISTS ") + kDocIndex + " ON " + kTable + " (document_id)");
      conn.exec(std::string("CREATE UNIQUE INDEX IF NOT EXISTS ") + kKeyIndex + " ON " + kTable +
                " (document_id, chunk_number)");
    });
  } catch (const SchemaError&) {
    throw;
  } catch (const TransientBackendError&) {
    throw;
  } catch (const BackendError& e) {
    throw SchemaError(std::string("repository: schema setup failed: ") + e.what(), e.code());
  }
  log_info("repository", "schema ready (bit dimension " + std::to_string(dim_) + ")");
}

InsertResult ChunkRepository::insert(const std::vector<QuantizedChunk>& chunks,
                                     const CancellationToken* cancel) {
  InsertResult result;
  if (chunks.empty()) return result;

  // Validate and encode everything up front so a shape error writes nothing.
  struct Row {
    const QuantizedChunk* chunk;
    std::string metadata;
    std::string blob;
  };
  std::vector<Row> rows;
  rows.reserve(chunks.size());
  for (auto& c : chunks) {
    check_document_id(c.document_id);
    const std::string key = c.document_id + "-" + std::to_string(c.chunk_number);
    if (c.vectors.empty()) {
      log_error("repository", "Missing embeddings for chunk " + key);
      continue;
    }
    for (auto& v : c.vectors) {
      if (v.dim() != dim_) {
        throw ShapeError("repository: chunk " + key + " has a vector of dim " +
                         std::to_string(v.dim()) + ", store dim is " + std::to_string(dim_));
      }
    }
    rows.push_back(Row{&c, encode_metadata(c.metadata), pack_vectors(c.vectors, dim_)});
  }
  if (rows.empty()) return result;

  connector_.with_connection([&](Connection& conn) {
    Statement st(conn, std::string("INSERT INTO ") + kTable +
                 " (document_id, chunk_number, content, chunk_metadata, embeddings)"
                 " VALUES (?1, ?2, ?3, ?4, ?5)"
                 " ON CONFLICT(document_id, chunk_number) DO NOTHING");
    for (auto& r : rows) {
      const QuantizedChunk& c = *r.chunk;
      const std::string key = c.document_id + "-" + std::to_string(c.chunk_number);
      try {
        st.reset();
        st.bind_text(1, c.document_id);
        st.bind_int(2, c.chunk_number);
        st.bind_text(3, c.content);
        st.bind_text(4, r.metadata);
        st.bind_blob(5, r.blob);
        st.step();
        if (conn.changes() == 0) {
          log_warn("repository", "chunk " + key + " already stored, rejecting duplicate");
          continue;
        }
        result.stored_keys.push_back(key);
      } catch (const OperationCancelled&) {
        throw;
      } catch (const BackendError& e) {
        log_error("repository", "failed to store chunk " + key + ": " + e.what());
      }
    }
  }, cancel);

  log_debug("repository", std::to_string(result.stored_keys.size()) + " multi-vector chunks stored");
  result.success = !result.stored_keys.empty();
  return result;
}

std::vector<DocumentChunk> ChunkRepository::get_by_keys(const std::vector<ChunkKey>& keys) {
  if (keys.empty()) return {};

  std::set<ChunkKey> unique(keys.begin(), keys.end());
  json arr = json::array();
  for (auto& k : unique) {
    if (is_storable_document_id(k.document_id)) arr.push_back(json::array({k.document_id, k.chunk_number}));
  }
  if (arr.empty()) return {};

  log_debug("repository", "batch retrieving " + std::to_string(unique.size()) + " chunks");
  auto chunks = connector_.with_connection([&](Connection& conn) {
    Statement st(conn, std::string("SELECT document_id, chunk_number, content, chunk_metadata FROM ") + kTable +
                 " WHERE (document_id, chunk_number) IN ("
                 "SELECT json_extract(value, '$[0]'), json_extract(value, '$[1]') FROM json_each(?1))"
                 " ORDER BY id");
    st.bind_text(1, arr.dump());
    std::vector<DocumentChunk> out;
    while (st.step()) out.push_back(read_chunk(st, 0));
    return out;
  });
  log_debug("repository", "found " + std::to_string(chunks.size()) + " chunks in batch retrieval");
  return chunks;
}

bool ChunkRepository::delete_by_document(const std::string& document_id) {
  try {
    connector_.with_connection([&](Connection& conn) {
      Statement st(conn, std::string("DELETE FROM ") + kTable + " WHERE document_id = ?1");
      st.bind_text(1, document_id);
      st.step();
    });
    log_info("repository", "deleted all chunks for document " + document_id);
    return true;
  } catch (const std::exception& e) {
    log_error("repository", "error deleting chunks for document " + document_id + ": " + e.what());
    return false;
  }
}

void ChunkRepository::scan(const DocFilter& filter, const std::function<void(CandidateRow&&)>& visit,
                           const CancellationToken* cancel) {
  std::string sql = std::string("SELECT id, document_id, chunk_number, content, chunk_metadata, embeddings FROM ") +
                    kTable + " WHERE embeddings IS NOT NULL";
  if (filter) sql += " AND document_id IN (SELECT value FROM json_each(?1))";
  sql += " ORDER BY id";

  connector_.with_connection([&](Connection& conn) {
    Statement st(conn, sql);
    if (filter) st.bind_text(1, doc_filter_json(*filter));
    while (st.step()) {
      CandidateRow row;
      row.id = st.column_int64(0);
      row.chunk = read_chunk(st, 1);
      const std::string blob = st.column_blob(5);
      try {
        row.vectors = unpack_vectors(blob.data(), blob.size(), dim_);
      } catch (const ShapeError& e) {
        throw BackendError("repository: corrupt vectors in row " + std::to_string(row.id) + ": " + e.what());
      }
      visit(std::move(row));
    }
  }, cancel);
}

std::vector<DocumentChunk> ChunkRepository::aggregate_max_sim(const std::string& packed_query, int k,
                                                              const DocFilter& filter,
                                                              const CancellationToken* cancel) {
  std::string sql = std::string("SELECT document_id, chunk_number, content, chunk_metadata,"
                                " max_sim(embeddings, ?1) AS similarity FROM ") +
                    kTable + " WHERE embeddings IS NOT NULL";
  if (filter) sql += " AND document_id IN (SELECT value FROM json_each(?3))";
  sql += " ORDER BY similarity DESC, id ASC LIMIT ?2";

  return connector_.with_connection([&](Connection& conn) {
    Statement st(conn, sql);
    st.bind_blob(1, packed_query);
    st.bind_int(2, k);
    if (filter) st.bind_text(3, doc_filter_json(*filter));
    std::vector<DocumentChunk> out;
    while (st.step()) {
      DocumentChunk chunk = read_chunk(st, 0);
      chunk.score = st.column_double(4);
      out.push_back(std::move(chunk));
    }
    return out;
  }, cancel);
}
