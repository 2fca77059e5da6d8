#include <catch2/catch.hpp>

#include "errors.hpp"
#include "quantizer.hpp"
#include "test_support.hpp"

TEST_CASE("quantize sets a bit exactly for strictly positive components", "[quantizer]") {
  Quantizer q(8);
  std::vector<float> v = {0.5f, -0.1f, 0.0f, 3.0f, -2.0f, 1e-6f, -0.0f, 7.0f};
  BitVector b = q.quantize_one(v);

  REQUIRE(b.dim() == 8);
  for (size_t i = 0; i < v.size(); ++i) {
    CHECK(b.bit(i) == (v[i] > 0.0f));
  }
  CHECK(b.popcount() == 4);
}

TEST_CASE("quantize keeps one bit vector per input row", "[quantizer]") {
  Quantizer q(4);
  FloatMatrix m = {{1, 1, -1, -1}, {-1, -1, 1, 1}, {1, -1, 1, -1}};
  auto out = q.quantize(m);

  REQUIRE(out.size() == 3);
  CHECK(out[0] == bits("1100"));
  CHECK(out[1] == bits("0011"));
  CHECK(out[2] == bits("1010"));
}

TEST_CASE("quantize of an empty list is an empty list", "[quantizer]") {
  Quantizer q(16);
  CHECK(q.quantize(FloatMatrix{}).empty());
  CHECK(q.quantize_flat({}).empty());
}

TEST_CASE("dimension mismatch is a ShapeError", "[quantizer]") {
  Quantizer q(8);
  CHECK_THROWS_AS(q.quantize_one(std::vector<float>(7, 1.0f)), ShapeError);
  CHECK_THROWS_AS(q.quantize_one(std::vector<float>(9, 1.0f)), ShapeError);
  CHECK_THROWS_AS(q.quantize({std::vector<float>(8, 1.0f), std::vector<float>(4, 1.0f)}), ShapeError);
  CHECK_THROWS_AS(q.quantize_flat(std::vector<float>(12, 1.0f)), ShapeError);
}

TEST_CASE("quantize_flat reads a row-major buffer", "[quantizer]") {
  Quantizer q(3);
  auto out = q.quantize_flat({1, -1, 1, -1, -1, 2});
  REQUIRE(out.size() == 2);
  CHECK(out[0] == bits("101"));
  CHECK(out[1] == bits("001"));

  auto single = q.quantize_flat({-1, 5, 0});
  REQUIRE(single.size() == 1);
  CHECK(single[0] == bits("010"));
}

TEST_CASE("zero dimension is rejected", "[quantizer]") {
  CHECK_THROWS_AS(Quantizer(0), InvalidArgument);
}

TEST_CASE("wide vectors span several words", "[quantizer]") {
  Quantizer q(130);
  std::vector<float> v(130, -1.0f);
  v[0] = 1.0f;
  v[64] = 1.0f;
  v[129] = 1.0f;
  BitVector b = q.quantize_one(v);
  CHECK(b.words().size() == 3);
  CHECK(b.bit(0));
  CHECK(b.bit(64));
  CHECK(b.bit(129));
  CHECK_FALSE(b.bit(128));
  CHECK(b.popcount() == 3);
}

TEST_CASE("packed layout is a dim header plus LSB-first byte records", "[quantizer][pack]") {
  BitVector a(12);
  a.set(0);
  a.set(9);
  BitVector b(12);
  b.set(11);

  std::string blob = pack_vectors({a, b}, 12);
  REQUIRE(blob.size() == 4 + 2 * 2);
  CHECK((unsigned char)blob[0] == 12);
  CHECK((unsigned char)blob[1] == 0);
  CHECK((unsigned char)blob[4] == 0x01);
  CHECK((unsigned char)blob[5] == 0x02);
  CHECK((unsigned char)blob[6] == 0x00);
  CHECK((unsigned char)blob[7] == 0x08);

  auto back = unpack_vectors(blob.data(), blob.size(), 12);
  REQUIRE(back.size() == 2);
  CHECK(back[0] == a);
  CHECK(back[1] == b);
}

TEST_CASE("pack refuses mixed dimensions and unpack refuses malformed blobs", "[quantizer][pack]") {
  CHECK_THROWS_AS(pack_vectors({bits("1010"), bits("10")}, 4), ShapeError);

  std::string blob = pack_vectors({bits("10101010"), bits("11110000")}, 8);
  CHECK_THROWS_AS(unpack_vectors(blob.data(), 3), ShapeError);
  CHECK_THROWS_AS(unpack_vectors(blob.data(), blob.size(), 16), ShapeError);

  std::string truncated = pack_vectors({bits("101010101010")}, 12);
  truncated.pop_back();
  CHECK_THROWS_AS(unpack_vectors(truncated.data(), truncated.size()), ShapeError);

  std::string empty = pack_vectors({}, 8);
  CHECK(empty.size() == 4);
  CHECK(unpack_vectors(empty.data(), empty.size(), 8).empty());
}
