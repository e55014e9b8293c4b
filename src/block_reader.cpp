/*
 * Copyright (C) 2024 koolkdev
 *
 * This software may be modified and distributed under the terms
 * of the MIT license.  See the LICENSE file for details.
 */

#include "block_reader.h"

#include <algorithm>
#include <cassert>

size_t BlockReader::Read(std::span<std::byte> output) {
  auto count = std::min(output.size(), remaining());
  if (count == 0)
    return 0;
  std::copy_n(data_.begin() + pos_, count, output.begin());
  pos_ += count;
  return count;
}

void BlockReader::SeekTo(size_t pos) {
  assert(pos <= data_.size());
  pos_ = pos;
}
