/*
 * Copyright (C) 2024 koolkdev
 *
 * This software may be modified and distributed under the terms
 * of the MIT license.  See the LICENSE file for details.
 */

#include "block_generator.h"

#include <cryptopp/sha.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <random>
#include <span>

#include "utils.h"

namespace {

constexpr size_t kSmallBlockSize = 4 * 1024;
constexpr size_t kMediumBlockSize = 32 * 1024;
constexpr size_t kLargeBlockSize = 64 * 1024;

constexpr uint64_t kMediumPayloadThreshold = 1024 * 1024;

// Fill |chunk| with symbols from the alphabet. Each 64-bit draw yields several symbols, keeping the engine out of
// the per-byte path.
void FillChunk(std::span<std::byte> chunk, std::mt19937_64& engine) {
  constexpr uint64_t kAlphabetSize = kFillerAlphabet.size();
  // 62^10 < 2^64, so one draw is good for ten symbols.
  constexpr size_t kSymbolsPerDraw = 10;
  auto it = chunk.begin();
  while (it != chunk.end()) {
    uint64_t value = engine();
    auto count = std::min<size_t>(kSymbolsPerDraw, static_cast<size_t>(chunk.end() - it));
    for (size_t i = 0; i < count; ++i) {
      *it++ = static_cast<std::byte>(kFillerAlphabet[value % kAlphabetSize]);
      value /= kAlphabetSize;
    }
  }
}

}  // namespace

size_t DataBlockSize(uint64_t size) {
  if (size <= kSmallBlockSize)
    return kSmallBlockSize;
  else if (size <= kMediumPayloadThreshold)
    return kMediumBlockSize;
  else
    return kLargeBlockSize;
}

std::vector<std::byte> GenerateBlock(std::string_view seed, size_t num_bytes, std::optional<uint64_t> filler_seed) {
  if (seed.size() >= num_bytes) {
    auto prefix = byte_span(seed.substr(0, num_bytes));
    return {prefix.begin(), prefix.end()};
  }

  std::mt19937_64 engine{filler_seed.value_or(
      static_cast<uint64_t>(std::chrono::system_clock::now().time_since_epoch().count()))};

  const auto chunk_size = DataBlockSize(num_bytes);
  std::vector<std::byte> data;
  data.reserve(div_ceil(num_bytes, chunk_size) * chunk_size);
  std::vector<std::byte> chunk(chunk_size);
  while (data.size() < num_bytes) {
    FillChunk(chunk, engine);
    data.insert(data.end(), chunk.begin(), chunk.end());
  }
  data.resize(num_bytes);
  return data;
}

uint64_t FillerSeedFromKey(std::string_view seed) {
  std::array<uint8_t, CryptoPP::SHA256::DIGESTSIZE> digest;
  CryptoPP::SHA256 sha256;
  sha256.Update(reinterpret_cast<const uint8_t*>(seed.data()), seed.size());
  sha256.Final(digest.data());

  uint64_t value = 0;
  for (size_t i = 0; i < sizeof(value); ++i)
    value = (value << 8) | digest[i];
  return value;
}
