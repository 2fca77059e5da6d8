#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// One row per token/sub-unit.
using FloatMatrix = std::vector<std::vector<float>>;

// Fixed-dimension bit vector, packed LSB-first into 64-bit words.
class BitVector {
public:
  BitVector() = default;
  explicit BitVector(size_t dim);

  size_t dim() const { return dim_; }
  bool bit(size_t i) const;
  void set(size_t i);
  size_t popcount() const;

  const std::vector<uint64_t>& words() const { return words_; }

  bool operator==(const BitVector& o) const { return dim_ == o.dim_ && words_ == o.words_; }
  bool operator!=(const BitVector& o) const { return !(*this == o); }

private:
  size_t dim_ = 0;
  std::vector<uint64_t> words_;
};

// Sign-based binary quantization: bit i is 1 iff component i > 0.
class Quantizer {
public:
  explicit Quantizer(size_t dim);

  size_t dim() const { return dim_; }

  BitVector quantize_one(const std::vector<float>& v) const;
  std::vector<BitVector> quantize(const FloatMatrix& vectors) const;

  // Row-major [n, dim] buffer; a single vector is the n == 1 case.
  std::vector<BitVector> quantize_flat(const std::vector<float>& flat) const;

private:
  size_t dim_;
};

// Bytes per packed record for a given bit dimension.
inline size_t packed_stride(size_t dim) { return (dim + 7) / 8; }

// Storage layout: uint32 little-endian dim, then one ceil(dim/8)-byte record per
// vector (bit i in byte i/8 at position i%8). All vectors must have dimension `dim`.
std::string pack_vectors(const std::vector<BitVector>& vectors, size_t dim);

// Inverse of pack_vectors. expected_dim == 0 accepts whatever the header says.
// Throws ShapeError on a truncated blob or a header/expected_dim mismatch.
std::vector<BitVector> unpack_vectors(const void* data, size_t size, size_t expected_dim = 0);
