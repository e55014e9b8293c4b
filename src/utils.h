/*
 * Copyright (C) 2017 koolkdev
 *
 * This software may be modified and distributed under the terms
 * of the MIT license.  See the LICENSE file for details.
 */

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

inline size_t div_ceil(size_t n, size_t div) {
  return (n + div - 1) / div;
}

inline std::span<const std::byte> byte_span(std::string_view str) {
  return {reinterpret_cast<const std::byte*>(str.data()), str.size()};
}
