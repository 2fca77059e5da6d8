#include <catch2/catch.hpp>

#include "errors.hpp"
#include "ingest.hpp"
#include "multi_vector_store.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <sstream>

TEST_CASE("to_matrix accepts one vector or a list of vectors", "[ingest]") {
  CHECK(to_matrix(nlohmann::json::array()).empty());

  auto flat = to_matrix(nlohmann::json{1.0, -2.0, 0.5});
  REQUIRE(flat.size() == 1);
  CHECK(flat[0] == std::vector<float>{1.0f, -2.0f, 0.5f});

  auto nested = to_matrix(nlohmann::json{{1, 2}, {3, 4}, {5, 6}});
  REQUIRE(nested.size() == 3);
  CHECK(nested[2] == std::vector<float>{5.0f, 6.0f});

  CHECK_THROWS_AS(to_matrix(nlohmann::json("1,2,3")), InvalidArgument);
  CHECK_THROWS_AS(to_matrix(nlohmann::json{{1, 2}, {"x", 4}}), InvalidArgument);
}

TEST_CASE("parse_chunk_line reads one record", "[ingest]") {
  auto c = parse_chunk_line(
      R"({"document_id": "doc", "chunk_number": 3, "content": "hi", "metadata": {"page": 7}, "embedding": [[1, -1], [-1, 1]]})",
      2);
  CHECK(c.document_id == "doc");
  CHECK(c.chunk_number == 3);
  CHECK(c.content == "hi");
  CHECK(c.metadata["page"] == 7);
  REQUIRE(c.embedding.size() == 2);
  CHECK(c.embedding[1] == std::vector<float>{-1.0f, 1.0f});

  auto bare = parse_chunk_line(R"({"document_id": "d", "chunk_number": 0, "metadata": null, "embedding": [1, 1]})", 2);
  CHECK(bare.content.empty());
  CHECK(bare.embedding.size() == 1);
}

TEST_CASE("parse_chunk_line rejects malformed records", "[ingest]") {
  CHECK_THROWS_AS(parse_chunk_line(R"({"document_id": "d", "chunk_number": 0, "embedding": [[1, 1, 1]]})", 2),
                  ShapeError);
  CHECK_THROWS_AS(parse_chunk_line(R"({"document_id": "d", "chunk_number": 0, "embedding": [[1, 1], [1]]})", 2),
                  ShapeError);

  CHECK_THROWS_AS(parse_chunk_line("not json", 2), InvalidArgument);
  CHECK_THROWS_AS(parse_chunk_line("[1, 2]", 2), InvalidArgument);
  CHECK_THROWS_AS(parse_chunk_line(R"({"chunk_number": 0, "embedding": [1, 1]})", 2), InvalidArgument);
  CHECK_THROWS_AS(parse_chunk_line(R"({"document_id": 5, "chunk_number": 0, "embedding": [1, 1]})", 2),
                  InvalidArgument);
  CHECK_THROWS_AS(parse_chunk_line(R"({"document_id": "d", "chunk_number": -1, "embedding": [1, 1]})", 2),
                  InvalidArgument);
  CHECK_THROWS_AS(parse_chunk_line(R"({"document_id": "d", "chunk_number": 1.5, "embedding": [1, 1]})", 2),
                  InvalidArgument);
  CHECK_THROWS_AS(parse_chunk_line(R"({"document_id": "d", "chunk_number": 4294967296, "embedding": [1, 1]})", 2),
                  InvalidArgument);
  CHECK_THROWS_AS(parse_chunk_line(R"({"document_id": "d", "chunk_number": 0, "content": 3, "embedding": [1, 1]})", 2),
                  InvalidArgument);
  CHECK_THROWS_AS(parse_chunk_line(R"({"document_id": "d", "chunk_number": 0, "metadata": [1], "embedding": [1, 1]})", 2),
                  InvalidArgument);
}

TEST_CASE("parse_chunk_key splits at the last colon", "[ingest]") {
  auto k = parse_chunk_key("doc:1");
  CHECK(k.document_id == "doc");
  CHECK(k.chunk_number == 1);

  auto nested = parse_chunk_key("a:b:30");
  CHECK(nested.document_id == "a:b");
  CHECK(nested.chunk_number == 30);

  CHECK_THROWS_AS(parse_chunk_key("doc"), InvalidArgument);
  CHECK_THROWS_AS(parse_chunk_key("doc:"), InvalidArgument);
  CHECK_THROWS_AS(parse_chunk_key(":1"), InvalidArgument);
  CHECK_THROWS_AS(parse_chunk_key("doc:1abc"), InvalidArgument);
  CHECK_THROWS_AS(parse_chunk_key("doc:-1"), InvalidArgument);
  CHECK_THROWS_AS(parse_chunk_key("doc: 1"), InvalidArgument);
  CHECK_THROWS_AS(parse_chunk_key("doc:99999999999"), InvalidArgument);
}

TEST_CASE("ingest_jsonl keeps going past bad lines", "[ingest]") {
  TempDb db;
  MultiVectorStore store(db.config(4));
  REQUIRE(store.initialize());

  std::istringstream in(
      R"({"document_id": "a", "chunk_number": 0, "content": "a0", "embedding": [[1, 1, -1, -1]]})" "\n"
      "\n"
      R"({"document_id": "a", "chunk_number": 1, "content": "a1", "embedding": [[1, 1, -1]]})" "\n"
      "   \n"
      "{broken\n"
      R"({"document_id": "b", "chunk_number": 0, "content": "b0", "embedding": [[-1, -1, 1, 1]]})" "\n"
      R"({"document_id": "b", "chunk_number": 1, "content": "b1", "embedding": [-1, 1, -1, 1]})" "\n");

  IngestReport report = ingest_jsonl(in, store, store.quantizer().dim(), 2);
  CHECK(report.records == 5);
  CHECK(report.stored == 3);
  CHECK(report.rejected == 2);

  auto got = store.get_chunks_by_id({{"a", 0}, {"a", 1}, {"b", 0}, {"b", 1}});
  REQUIRE(got.size() == 3);
  std::vector<std::string> contents;
  for (auto& c : got) contents.push_back(c.content);
  std::sort(contents.begin(), contents.end());
  CHECK(contents == std::vector<std::string>{"a0", "b0", "b1"});
}

TEST_CASE("ingest_jsonl counts a batch the store refuses and continues", "[ingest]") {
  TempDb db;
  MultiVectorStore store(db.config(4));
  REQUIRE(store.initialize());

  // Rows of 2 floats pass line parsing at dim 2 but not the store's dim of 4.
  std::istringstream in(
      R"({"document_id": "x", "chunk_number": 0, "embedding": [[1, -1]]})" "\n"
      R"({"document_id": "y", "chunk_number": 0, "embedding": [[1, -1]]})" "\n");

  IngestReport report = ingest_jsonl(in, store, 2, 1);
  CHECK(report.records == 2);
  CHECK(report.stored == 0);
  CHECK(report.rejected == 2);
}

TEST_CASE("ingest_jsonl skips duplicates without counting them as stored", "[ingest]") {
  TempDb db;
  MultiVectorStore store(db.config(4));
  REQUIRE(store.initialize());

  std::istringstream in(
      R"({"document_id": "a", "chunk_number": 0, "embedding": [1, 1, 1, 1]})" "\n"
      R"({"document_id": "a", "chunk_number": 0, "embedding": [1, 1, 1, 1]})" "\n");

  IngestReport report = ingest_jsonl(in, store, 4, 0);
  CHECK(report.records == 2);
  CHECK(report.stored == 1);
  CHECK(report.rejected == 0);
}
