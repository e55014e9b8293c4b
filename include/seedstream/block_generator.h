/*
 * Copyright (C) 2024 koolkdev
 *
 * This software may be modified and distributed under the terms
 * of the MIT license.  See the LICENSE file for details.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

inline constexpr std::string_view kFillerAlphabet = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

// Size of the filler chunks generated for a payload of |size| bytes. Always a power of two.
size_t DataBlockSize(uint64_t size);

// Returns exactly |num_bytes| bytes. If the seed is long enough the block is a prefix of the seed, otherwise it is
// alphanumeric filler. Without |filler_seed| the filler engine is seeded from the clock, so two calls are not
// expected to return the same filler.
std::vector<std::byte> GenerateBlock(std::string_view seed,
                                     size_t num_bytes,
                                     std::optional<uint64_t> filler_seed = std::nullopt);

// Stable filler seed for a key (first 8 bytes of SHA-256(key)).
uint64_t FillerSeedFromKey(std::string_view seed);
