#include <catch2/catch.hpp>

#include "connector.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <chrono>
#include <thread>

static RetryPolicy fast_policy(int attempts) {
  RetryPolicy p;
  p.max_retries = attempts;
  p.retry_delay = std::chrono::milliseconds(0);
  return p;
}

TEST_CASE("with_connection hands out a working connection", "[connector]") {
  TempDb db;
  Connector connector(db.path(), fast_policy(3));

  int v = connector.with_connection([](Connection& conn) {
    Statement st(conn, "SELECT 40 + 2");
    REQUIRE(st.step());
    return st.column_int(0);
  });
  CHECK(v == 42);
}

TEST_CASE("transient failures are retried until an attempt succeeds", "[connector]") {
  TempDb db;
  Connector connector(db.path(), fast_policy(3));
  int attempts = 0;
  connector.add_initializer([&](Connection&) {
    if (++attempts < 3) throw TransientBackendError("flaky backend");
  });

  CHECK_NOTHROW(connector.with_connection([](Connection& conn) { conn.ping(); }));
  CHECK(attempts == 3);
}

TEST_CASE("exhausted retries rethrow the last failure", "[connector]") {
  TempDb db;
  Connector connector(db.path(), fast_policy(4));
  int attempts = 0;
  connector.add_initializer([&](Connection&) {
    ++attempts;
    throw TransientBackendError("still down");
  });

  CHECK_THROWS_AS(connector.with_connection([](Connection&) {}), TransientBackendError);
  CHECK(attempts == 4);
}

TEST_CASE("non-transient failures are not retried", "[connector]") {
  TempDb db;
  Connector connector(db.path(), fast_policy(5));
  int attempts = 0;
  connector.add_initializer([&](Connection&) {
    ++attempts;
    throw BackendError("broken");
  });

  CHECK_THROWS_AS(connector.with_connection([](Connection&) {}), BackendError);
  CHECK(attempts == 1);
}

TEST_CASE("an unopenable database fails after every attempt", "[connector]") {
  Connector connector(unreachable_db_path(), fast_policy(2));
  CHECK_THROWS_AS(connector.with_connection([](Connection&) {}), TransientBackendError);
}

TEST_CASE("the connection is released when the body throws", "[connector]") {
  TempDb db;
  Connector connector(db.path(), fast_policy(1), 200);

  CHECK_THROWS_AS(connector.with_connection([](Connection& conn) {
    conn.exec("CREATE TABLE t (x INTEGER)");
    conn.exec("BEGIN IMMEDIATE");
    conn.exec("INSERT INTO t VALUES (1)");
    throw std::runtime_error("body failed");
  }), std::runtime_error);

  // a leaked connection would still hold the write lock
  int rows = -1;
  CHECK_NOTHROW(connector.with_connection([&](Connection& conn) {
    conn.exec("BEGIN IMMEDIATE");
    conn.exec("INSERT INTO t VALUES (2)");
    conn.exec("COMMIT");
    Statement st(conn, "SELECT COUNT(*) FROM t");
    REQUIRE(st.step());
    rows = st.column_int(0);
  }));
  CHECK(rows == 1);
}

TEST_CASE("sqlite errors map to the error taxonomy", "[connector]") {
  TempDb db;
  Connector connector(db.path(), fast_policy(1));
  connector.with_connection([](Connection& conn) {
    CHECK_THROWS_AS(conn.exec("SELECT * FROM no_such_table"), BackendError);
    CHECK_THROWS_AS(Statement(conn, "SELEC 1"), BackendError);
    try {
      conn.exec("NOT SQL AT ALL");
      FAIL("expected a BackendError");
    } catch (const TransientBackendError&) {
      FAIL("syntax errors are not transient");
    } catch (const BackendError& e) {
      CHECK(e.code() != 0);
    }
  });
  CHECK(is_transient_sqlite_code(5));      // SQLITE_BUSY
  CHECK(is_transient_sqlite_code(14));     // SQLITE_CANTOPEN
  CHECK_FALSE(is_transient_sqlite_code(1));  // SQLITE_ERROR
  CHECK_FALSE(is_transient_sqlite_code(19)); // SQLITE_CONSTRAINT
}

TEST_CASE("a fired token stops work before it starts", "[connector][cancel]") {
  TempDb db;
  Connector connector(db.path(), fast_policy(1));
  CancellationToken token;
  token.cancel();

  CHECK_THROWS_AS(connector.with_connection([](Connection& conn) {
    Statement st(conn, "SELECT 1");
    st.step();
  }, &token), OperationCancelled);

  CHECK_THROWS_AS(connector.with_connection([](Connection& conn) {
    conn.exec("CREATE TABLE t (x INTEGER)");
  }, &token), OperationCancelled);
}

TEST_CASE("a token fired mid-statement interrupts it", "[connector][cancel]") {
  TempDb db;
  Connector connector(db.path(), fast_policy(1));
  CancellationToken token;

  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    token.cancel();
  });

  CHECK_THROWS_AS(connector.with_connection([](Connection& conn) {
    Statement st(conn,
                 "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c WHERE x < 2000000000)"
                 " SELECT COUNT(*) FROM c");
    st.step();
  }, &token), OperationCancelled);
  canceller.join();
}
