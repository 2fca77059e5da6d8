#include "quantizer.hpp"
#include "errors.hpp"
#include <string>

BitVector::BitVector(size_t dim) : dim_(dim), words_((dim + 63) / 64, 0) {}

bool BitVector::bit(size_t i) const {
  return (words_[i / 64] >> (i % 64)) & 1ULL;
}

void BitVector::set(size_t i) {
  words_[i / 64] |= (1ULL << (i % 64));
}

size_t BitVector::popcount() const {
  size_t n = 0;
  for (uint64_t w : words_) n += (size_t)__builtin_popcountll(w);
  return n;
}

Quantizer::Quantizer(size_t dim) : dim_(dim) {
  if (dim_ == 0) throw InvalidArgument("quantizer: dim must be > 0");
}

BitVector Quantizer::quantize_one(const std::vector<float>& v) const {
  if (v.size() != dim_) {
    throw ShapeError("quantizer: expected dim " + std::to_string(dim_) +
                     ", got " + std::to_string(v.size()));
  }
  BitVector out(dim_);
  for (size_t i = 0; i < dim_; ++i) {
    if (v[i] > 0.0f) out.set(i);
  }
  return out;
}

std::vector<BitVector> Quantizer::quantize(const FloatMatrix& vectors) const {
  std::vector<BitVector> out;
  out.reserve(vectors.size());
  for (auto& v : vectors) out.push_back(quantize_one(v));
  return out;
}

std::vector<BitVector> Quantizer::quantize_flat(const std::vector<float>& flat) const {
  if (flat.size() % dim_ != 0) {
    throw ShapeError("quantizer: flat buffer of " + std::to_string(flat.size()) +
                     " floats is not a multiple of dim " + std::to_string(dim_));
  }
  const size_t n = flat.size() / dim_;
  std::vector<BitVector> out;
  out.reserve(n);
  for (size_t r = 0; r < n; ++r) {
    const float* row = flat.data() + r * dim_;
    BitVector bv(dim_);
    for (size_t i = 0; i < dim_; ++i) {
      if (row[i] > 0.0f) bv.set(i);
    }
    out.push_back(std::move(bv));
  }
  return out;
}

std::string pack_vectors(const std::vector<BitVector>& vectors, size_t dim) {
  const size_t stride = packed_stride(dim);
  std::string blob(4 + stride * vectors.size(), '\0');
  const uint32_t d = (uint32_t)dim;
  blob[0] = (char)(d & 0xFF);
  blob[1] = (char)((d >> 8) & 0xFF);
  blob[2] = (char)((d >> 16) & 0xFF);
  blob[3] = (char)((d >> 24) & 0xFF);

  size_t off = 4;
  for (auto& v : vectors) {
    if (v.dim() != dim) {
      throw ShapeError("pack: vector dim " + std::to_string(v.dim()) +
                       " does not match " + std::to_string(dim));
    }
    const auto& w = v.words();
    for (size_t j = 0; j < stride; ++j) {
      blob[off + j] = (char)((w[j / 8] >> (8 * (j % 8))) & 0xFF);
    }
    off += stride;
  }
  return blob;
}

std::vector<BitVector> unpack_vectors(const void* data, size_t size, size_t expected_dim) {
  if (size < 4 || !data) throw ShapeError("unpack: blob too short for header");
  const auto* p = static_cast<const unsigned char*>(data);
  const size_t dim = (size_t)p[0] | ((size_t)p[1] << 8) | ((size_t)p[2] << 16) | ((size_t)p[3] << 24);
  if (dim == 0) throw ShapeError("unpack: zero dimension in header");
  if (expected_dim != 0 && dim != expected_dim) {
    throw ShapeError("unpack: blob dim " + std::to_string(dim) +
                     " does not match " + std::to_string(expected_dim));
  }
  const size_t stride = packed_stride(dim);
  const size_t payload = size - 4;
  if (payload % stride != 0) {
    throw ShapeError("unpack: payload of " + std::to_string(payload) +
                     " bytes is not a whole number of records");
  }

  const size_t n = payload / stride;
  std::vector<BitVector> out;
  out.reserve(n);
  for (size_t r = 0; r < n; ++r) {
    const unsigned char* rec = p + 4 + r * stride;
    BitVector bv(dim);
    for (size_t i = 0; i < dim; ++i) {
      if ((rec[i / 8] >> (i % 8)) & 1) bv.set(i);
    }
    out.push_back(std::move(bv));
  }
  return out;
}
