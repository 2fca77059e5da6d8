#include "dense_vector_store.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "metadata.hpp"
#include <hnswlib/hnswlib.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <set>
#include <unordered_map>
#include <unordered_set>

using json = nlohmann::json;

namespace {

const char* kTable = "vector_embeddings";
const size_t kInitialCapacity = 1024;

class AllowedIds : public hnswlib::BaseFilterFunctor {
public:
  explicit AllowedIds(std::unordered_set<hnswlib::labeltype> ids) : ids_(std::move(ids)) {}
  bool operator()(hnswlib::labeltype id) override { return ids_.count(id) > 0; }

private:
  std::unordered_set<hnswlib::labeltype> ids_;
};

DocumentChunk read_row(const Statement& st, int c) {
  DocumentChunk chunk;
  chunk.document_id = st.column_text(c);
  chunk.chunk_number = st.column_int(c + 1);
  chunk.content = st.column_text(c + 2);
  chunk.metadata = st.column_is_null(c + 3) ? Metadata::object() : decode_metadata(st.column_text(c + 3));
  return chunk;
}

const std::vector<float>& single_row(const DocumentChunk& c, size_t dim) {
  if (c.embedding.size() != 1 || c.embedding[0].size() != dim) {
    throw ShapeError("dense_vector_store: chunk " + c.key().str() + " must carry exactly one vector of dim " +
                     std::to_string(dim));
  }
  return c.embedding[0];
}

}  // namespace

struct DenseVectorStore::Impl {
  std::unique_ptr<hnswlib::L2Space> space;
  std::unique_ptr<hnswlib::HierarchicalNSW<float>> hnsw;
};

DenseVectorStore::DenseVectorStore(const StoreConfig& config, int M, int efC, int efS)
  : connector_(config.database_path(), config.retry_policy(), config.busy_timeout_ms),
    dim_(config.dense_dimension), M_(M), efC_(efC), efS_(efS),
    index_path_(config.database_path() + ".hnsw"), impl_(new Impl) {
  if (dim_ == 0) throw InvalidArgument("dense_vector_store: dense_dimension must be > 0");
}

DenseVectorStore::~DenseVectorStore() = default;

void DenseVectorStore::load_index() {
  std::lock_guard<std::mutex> lk(mu_);
  impl_->space.reset(new hnswlib::L2Space(dim_));
  if (std::filesystem::exists(index_path_)) {
    impl_->hnsw.reset(new hnswlib::HierarchicalNSW<float>(impl_->space.get(), index_path_));
  } else {
    impl_->hnsw.reset(new hnswlib::HierarchicalNSW<float>(impl_->space.get(), kInitialCapacity, M_, efC_));
  }
  impl_->hnsw->setEf(efS_);
}

void DenseVectorStore::save_index() const {
  impl_->hnsw->saveIndex(index_path_);
}

size_t DenseVectorStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (!impl_->hnsw) return 0;
  return impl_->hnsw->getCurrentElementCount() - impl_->hnsw->getDeletedCount();
}

bool DenseVectorStore::initialize() {
  try {
    connector_.with_connection([&](Connection& conn) {
      conn.exec(std::string("CREATE TABLE IF NOT EXISTS ") + kTable + " ("
                " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                " document_id TEXT NOT NULL,"
                " chunk_number INTEGER NOT NULL,"
                " content TEXT NOT NULL,"
                " chunk_metadata TEXT"
                ")");
      conn.exec(std::string("CREATE INDEX IF NOT EXISTS idx_document_id ON ") + kTable + " (document_id)");
      conn.exec(std::string("CREATE UNIQUE INDEX IF NOT EXISTS idx_vector_natural_key ON ") + kTable +
                " (document_id, chunk_number)");
      conn.exec("CREATE TABLE IF NOT EXISTS vector_meta (key TEXT PRIMARY KEY, value TEXT NOT NULL)");

      Statement sel(conn, "SELECT value FROM vector_meta WHERE key = 'dimension'");
      if (sel.step()) {
        std::string recorded = sel.column_text(0);
        if (recorded != std::to_string(dim_)) {
          throw SchemaError("dense_vector_store: store was created with dimension " + recorded +
                            ", configured " + std::to_string(dim_));
        }
      } else {
        Statement ins(conn, "INSERT INTO vector_meta (key, value) VALUES ('dimension', ?1)");
        ins.bind_text(1, std::to_string(dim_));
        ins.step();
      }
    });
    load_index();
    log_info("dense_vector_store", "initialized with " + std::to_string(dim_) + " dimensions");
    return true;
  } catch (const std::exception& e) {
    log_error("dense_vector_store", std::string("error initializing: ") + e.what());
    return false;
  }
}

std::pair<bool, std::vector<std::string>> DenseVectorStore::store_embeddings(
    const std::vector<DocumentChunk>& chunks, const CancellationToken* cancel) {
  if (!impl_->hnsw) throw BackendError("dense_vector_store: not initialized");

  std::vector<const DocumentChunk*> rows;
  for (auto& c : chunks) {
    if (c.chunk_number < 0) {
      throw InvalidArgument("dense_vector_store: negative chunk_number for " + c.key().str());
    }
    check_document_id(c.document_id);
    if (c.embedding.empty()) {
      log_error("dense_vector_store", "Missing embedding for chunk " + c.key().str());
      continue;
    }
    single_row(c, dim_);
    encode_metadata(c.metadata);
    rows.push_back(&c);
  }

  std::vector<std::string> stored;
  if (rows.empty()) return {false, stored};

  connector_.with_connection([&](Connection& conn) {
    Statement st(conn, std::string("INSERT INTO ") + kTable +
                 " (document_id, chunk_number, content, chunk_metadata) VALUES (?1, ?2, ?3, ?4)"
                 " ON CONFLICT(document_id, chunk_number) DO NOTHING");
    for (auto* c : rows) {
      const std::string key = c->key().str();
      try {
        st.reset();
        st.bind_text(1, c->document_id);
        st.bind_int(2, c->chunk_number);
        st.bind_text(3, c->content);
        st.bind_text(4, encode_metadata(c->metadata));
        st.step();
        if (conn.changes() == 0) {
          log_warn("dense_vector_store", "chunk " + key + " already stored, rejecting duplicate");
          continue;
        }
      } catch (const OperationCancelled&) {
        throw;
      } catch (const BackendError& e) {
        log_error("dense_vector_store", "failed to store chunk " + key + ": " + e.what());
        continue;
      }

      const int64_t id = conn.last_insert_rowid();
      try {
        std::lock_guard<std::mutex> lk(mu_);
        auto& hnsw = *impl_->hnsw;
        if (hnsw.getCurrentElementCount() >= hnsw.getMaxElements()) {
          hnsw.resizeIndex(std::max<size_t>(kInitialCapacity, hnsw.getMaxElements() * 2));
        }
        hnsw.addPoint(c->embedding[0].data(), (hnswlib::labeltype)id);
        stored.push_back(key);
      } catch (const std::runtime_error& e) {
        log_error("dense_vector_store", "failed to index chunk " + key + ": " + e.what());
        Statement undo(conn, std::string("DELETE FROM ") + kTable + " WHERE id = ?1");
        undo.bind_int64(1, id);
        undo.step();
      }
    }
  }, cancel);

  {
    std::lock_guard<std::mutex> lk(mu_);
    save_index();
  }
  log_debug("dense_vector_store", std::to_string(stored.size()) + " vector embeddings added");
  return {!stored.empty(), stored};
}

std::vector<DocumentChunk> DenseVectorStore::query_similar(const FloatMatrix& query, int k,
                                                           const DocFilter& doc_ids,
                                                           const CancellationToken* cancel) {
  if (!impl_->hnsw) throw BackendError("dense_vector_store: not initialized");
  if (k <= 0) throw InvalidArgument("dense_vector_store: k must be > 0, got " + std::to_string(k));
  if (query.size() != 1 || query[0].size() != dim_) {
    throw ShapeError("dense_vector_store: query must be one vector of dim " + std::to_string(dim_));
  }
  if (doc_ids && doc_ids->empty()) return {};

  return connector_.with_connection([&](Connection& conn) {
    std::unique_ptr<AllowedIds> allowed;
    if (doc_ids) {
      json arr = json::array();
      for (auto& d : *doc_ids) {
        if (is_storable_document_id(d)) arr.push_back(d);
      }
      Statement st(conn, std::string("SELECT id FROM ") + kTable +
                   " WHERE document_id IN (SELECT value FROM json_each(?1))");
      st.bind_text(1, arr.dump());
      std::unordered_set<hnswlib::labeltype> ids;
      while (st.step()) ids.insert((hnswlib::labeltype)st.column_int64(0));
      if (ids.empty()) return std::vector<DocumentChunk>();
      allowed.reset(new AllowedIds(std::move(ids)));
    }

    std::vector<std::pair<hnswlib::labeltype, float>> hits;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto res = impl_->hnsw->searchKnn(query[0].data(), (size_t)k, allowed.get());
      while (!res.empty()) {
        hits.emplace_back(res.top().second, res.top().first);
        res.pop();
      }
    }
    // the queue pops farthest first
    std::reverse(hits.begin(), hits.end());
    if (hits.empty()) return std::vector<DocumentChunk>();

    json ids = json::array();
    for (auto& h : hits) ids.push_back((int64_t)h.first);
    Statement st(conn, std::string("SELECT id, document_id, chunk_number, content, chunk_metadata FROM ") + kTable +
                 " WHERE id IN (SELECT value FROM json_each(?1))");
    st.bind_text(1, ids.dump());
    std::unordered_map<int64_t, DocumentChunk> by_id;
    while (st.step()) by_id.emplace(st.column_int64(0), read_row(st, 1));

    std::vector<DocumentChunk> out;
    out.reserve(hits.size());
    for (auto& h : hits) {
      auto it = by_id.find((int64_t)h.first);
      if (it == by_id.end()) continue;
      DocumentChunk c = std::move(it->second);
      c.score = 1.0 / (1.0 + (double)h.second);
      out.push_back(std::move(c));
    }
    return out;
  }, cancel);
}

std::vector<DocumentChunk> DenseVectorStore::get_chunks_by_id(const std::vector<ChunkKey>& keys) {
  if (keys.empty()) return {};
  std::set<ChunkKey> unique(keys.begin(), keys.end());
  json arr = json::array();
  for (auto& k : unique) {
    if (is_storable_document_id(k.document_id)) arr.push_back(json::array({k.document_id, k.chunk_number}));
  }
  if (arr.empty()) return {};

  return connector_.with_connection([&](Connection& conn) {
    Statement st(conn, std::string("SELECT document_id, chunk_number, content, chunk_metadata FROM ") + kTable +
                 " WHERE (document_id, chunk_number) IN ("
                 "SELECT json_extract(value, '$[0]'), json_extract(value, '$[1]') FROM json_each(?1))"
                 " ORDER BY id");
    st.bind_text(1, arr.dump());
    std::vector<DocumentChunk> out;
    while (st.step()) out.push_back(read_row(st, 0));
    return out;
  });
}

bool DenseVectorStore::delete_chunks_by_document_id(const std::string& document_id) {
  try {
    if (!impl_->hnsw) throw BackendError("dense_vector_store: not initialized");
    std::vector<int64_t> ids;
    connector_.with_connection([&](Connection& conn) {
      Statement sel(conn, std::string("SELECT id FROM ") + kTable + " WHERE document_id = ?1");
      sel.bind_text(1, document_id);
      while (sel.step()) ids.push_back(sel.column_int64(0));
      Statement del(conn, std::string("DELETE FROM ") + kTable + " WHERE document_id = ?1");
      del.bind_text(1, document_id);
      del.step();
    });

    std::lock_guard<std::mutex> lk(mu_);
    for (int64_t id : ids) impl_->hnsw->markDelete((hnswlib::labeltype)id);
    save_index();
    log_info("dense_vector_store", "deleted all chunks for document " + document_id);
    return true;
  } catch (const std::exception& e) {
    log_error("dense_vector_store", "error deleting chunks for document " + document_id + ": " + e.what());
    return false;
  }
}
