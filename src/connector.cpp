#include "connector.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <sqlite3.h>
#include <exception>
#include <thread>

bool is_transient_sqlite_code(int rc) {
  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
    case SQLITE_CANTOPEN:
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_NOMEM:
    case SQLITE_PROTOCOL:
      return true;
    default:
      return false;
  }
}

static int progress_cb(void* arg) {
  auto* token = static_cast<const CancellationToken*>(arg);
  return (token && token->cancelled()) ? 1 : 0;
}

// ---- Connection ----

Connection::Connection(const std::string& path, int busy_timeout_ms) : path_(path) {
  int rc = sqlite3_open_v2(path.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string e = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    // sqlite hands back a handle even when open fails
    sqlite3_close(db_);
    db_ = nullptr;
    if (is_transient_sqlite_code(rc))
      throw TransientBackendError("sqlite open '" + path + "': " + e, rc);
    throw BackendError("sqlite open '" + path + "': " + e, rc);
  }
  sqlite3_extended_result_codes(db_, 1);
  sqlite3_busy_timeout(db_, busy_timeout_ms);
}

Connection::~Connection() {
  if (db_) {
    sqlite3_progress_handler(db_, 0, nullptr, nullptr);
    sqlite3_close_v2(db_);
  }
}

void Connection::fail(int rc, const std::string& what) const {
  std::string msg = what + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
  if ((rc & 0xFF) == SQLITE_INTERRUPT) throw OperationCancelled(msg, rc);
  if (is_transient_sqlite_code(rc)) throw TransientBackendError(msg, rc);
  throw BackendError(msg, rc);
}

void Connection::exec(const std::string& sql) {
  if (cancel_ && cancel_->cancelled()) throw OperationCancelled("sqlite exec: cancelled");
  char* err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string e = err ? err : "unknown";
    sqlite3_free(err);
    if ((rc & 0xFF) == SQLITE_INTERRUPT) throw OperationCancelled("sqlite exec: " + e, rc);
    if (is_transient_sqlite_code(rc)) throw TransientBackendError("sqlite exec: " + e, rc);
    throw BackendError("sqlite exec: " + e, rc);
  }
}

void Connection::ping() {
  Statement st(*this, "SELECT 1");
  if (!st.step() || st.column_int(0) != 1) {
    throw TransientBackendError("sqlite health check returned no row");
  }
}

int64_t Connection::last_insert_rowid() const { return (int64_t)sqlite3_last_insert_rowid(db_); }

int Connection::changes() const { return sqlite3_changes(db_); }

void Connection::set_cancellation(const CancellationToken* token) {
  cancel_ = token;
  if (token) {
    sqlite3_progress_handler(db_, 1000, progress_cb, const_cast<CancellationToken*>(token));
  } else {
    sqlite3_progress_handler(db_, 0, nullptr, nullptr);
  }
}

// ---- Statement ----

Statement::Statement(Connection& conn, const std::string& sql) : conn_(conn) {
  int rc = sqlite3_prepare_v2(conn_.handle(), sql.c_str(), -1, &st_, nullptr);
  if (rc != SQLITE_OK) {
    sqlite3_finalize(st_);
    st_ = nullptr;
    conn_.fail(rc, "sqlite prepare");
  }
}

Statement::~Statement() { sqlite3_finalize(st_); }

void Statement::bind_text(int idx, const std::string& v) {
  int rc = sqlite3_bind_text(st_, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
  if (rc != SQLITE_OK) conn_.fail(rc, "sqlite bind");
}

void Statement::bind_blob(int idx, const std::string& bytes) {
  int rc = sqlite3_bind_blob(st_, idx, bytes.data(), (int)bytes.size(), SQLITE_TRANSIENT);
  if (rc != SQLITE_OK) conn_.fail(rc, "sqlite bind");
}

void Statement::bind_int(int idx, int v) {
  int rc = sqlite3_bind_int(st_, idx, v);
  if (rc != SQLITE_OK) conn_.fail(rc, "sqlite bind");
}

void Statement::bind_int64(int idx, int64_t v) {
  int rc = sqlite3_bind_int64(st_, idx, (sqlite3_int64)v);
  if (rc != SQLITE_OK) conn_.fail(rc, "sqlite bind");
}

void Statement::bind_null(int idx) {
  int rc = sqlite3_bind_null(st_, idx);
  if (rc != SQLITE_OK) conn_.fail(rc, "sqlite bind");
}

bool Statement::step() {
  const CancellationToken* token = conn_.cancellation();
  if (token && token->cancelled()) throw OperationCancelled("sqlite step: cancelled");
  int rc = sqlite3_step(st_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  conn_.fail(rc, "sqlite step");
}

void Statement::reset() {
  sqlite3_reset(st_);
  sqlite3_clear_bindings(st_);
}

bool Statement::column_is_null(int col) const {
  return sqlite3_column_type(st_, col) == SQLITE_NULL;
}

int Statement::column_int(int col) const { return sqlite3_column_int(st_, col); }

int64_t Statement::column_int64(int col) const { return (int64_t)sqlite3_column_int64(st_, col); }

double Statement::column_double(int col) const { return sqlite3_column_double(st_, col); }

std::string Statement::column_text(int col) const {
  const unsigned char* p = sqlite3_column_text(st_, col);
  if (!p) return {};
  return std::string(reinterpret_cast<const char*>(p), (size_t)sqlite3_column_bytes(st_, col));
}

std::string Statement::column_blob(int col) const {
  const void* p = sqlite3_column_blob(st_, col);
  int n = sqlite3_column_bytes(st_, col);
  if (!p || n <= 0) return {};
  return std::string(static_cast<const char*>(p), (size_t)n);
}

// ---- Connector ----

Connector::Connector(std::string path, RetryPolicy policy, int busy_timeout_ms)
  : path_(std::move(path)), policy_(policy), busy_timeout_ms_(busy_timeout_ms) {}

void Connector::add_initializer(Initializer init) {
  initializers_.push_back(std::move(init));
}

std::unique_ptr<Connection> Connector::connect() {
  const int attempts = policy_.max_retries > 0 ? policy_.max_retries : 1;
  std::exception_ptr last;

  for (int attempt = 1; attempt <= attempts; ++attempt) {
    try {
      auto conn = std::make_unique<Connection>(path_, busy_timeout_ms_);
      conn->ping();
      for (auto& init : initializers_) init(*conn);
      return conn;
    } catch (const TransientBackendError& e) {
      last = std::current_exception();
      if (attempt < attempts) {
        log_warn("connector", "connection attempt " + std::to_string(attempt) + " failed: " +
                 e.what() + ". Retrying in " + std::to_string(policy_.retry_delay.count()) + " ms");
        std::this_thread::sleep_for(policy_.retry_delay);
      }
    }
  }

  log_error("connector", "all " + std::to_string(attempts) + " connection attempts failed");
  std::rethrow_exception(last);
}
