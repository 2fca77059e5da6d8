#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// forward-declared so callers don't need sqlite3.h
struct sqlite3;
struct sqlite3_stmt;

struct RetryPolicy {
  int max_retries = 3;                               // total connection attempts
  std::chrono::milliseconds retry_delay{1000};      // fixed wait between attempts
};

// Shared flag a caller flips to abort an in-flight backend operation.
class CancellationToken {
public:
  void cancel() { flag_.store(true); }
  bool cancelled() const { return flag_.load(); }

private:
  std::atomic<bool> flag_{false};
};

// One live sqlite connection. Closed on destruction.
class Connection {
public:
  Connection(const std::string& path, int busy_timeout_ms);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  sqlite3* handle() const { return db_; }
  const std::string& path() const { return path_; }

  void exec(const std::string& sql);
  void ping();     // SELECT 1
  int64_t last_insert_rowid() const;
  int changes() const;

  // Installs a progress handler so a fired token interrupts running statements.
  void set_cancellation(const CancellationToken* token);
  const CancellationToken* cancellation() const { return cancel_; }

  // Maps a failing sqlite result code to the matching exception type.
  [[noreturn]] void fail(int rc, const std::string& what) const;

private:
  std::string path_;
  sqlite3* db_ = nullptr;
  const CancellationToken* cancel_ = nullptr;
};

// Prepared statement bound to a connection. Finalized on destruction.
class Statement {
public:
  Statement(Connection& conn, const std::string& sql);
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void bind_text(int idx, const std::string& v);
  void bind_blob(int idx, const std::string& bytes);
  void bind_int(int idx, int v);
  void bind_int64(int idx, int64_t v);
  void bind_null(int idx);

  // true while rows are produced, false once done; throws on error.
  bool step();
  void reset();

  bool column_is_null(int col) const;
  int column_int(int col) const;
  int64_t column_int64(int col) const;
  double column_double(int col) const;
  std::string column_text(int col) const;     // NULL reads as ""
  std::string column_blob(int col) const;

private:
  Connection& conn_;
  sqlite3_stmt* st_ = nullptr;
};

// Hands out a fresh, health-checked connection per unit of work, retrying
// establishment on transient failures. The connection is released on every exit path.
class Connector {
public:
  using Initializer = std::function<void(Connection&)>;

  Connector(std::string path, RetryPolicy policy, int busy_timeout_ms = 5000);

  // Run on every new connection before it is handed out (e.g. registering SQL functions).
  void add_initializer(Initializer init);

  template <typename Body>
  auto with_connection(Body&& body, const CancellationToken* cancel = nullptr)
      -> decltype(body(std::declval<Connection&>())) {
    std::unique_ptr<Connection> conn = connect();
    conn->set_cancellation(cancel);
    return body(*conn);
  }

  const std::string& path() const { return path_; }
  const RetryPolicy& policy() const { return policy_; }

private:
  std::unique_ptr<Connection> connect();

  std::string path_;
  RetryPolicy policy_;
  int busy_timeout_ms_;
  std::vector<Initializer> initializers_;
};

bool is_transient_sqlite_code(int rc);
