/*
 * Copyright (C) 2024 koolkdev
 *
 * This software may be modified and distributed under the terms
 * of the MIT license.  See the LICENSE file for details.
 */

#pragma once

#include <cstddef>
#include <span>
#include <vector>

// In-memory block with its own read cursor. PayloadStream tiles it by rewinding when it runs out.
class BlockReader {
 public:
  explicit BlockReader(std::vector<std::byte> data) : data_(std::move(data)), pos_(0) {}

  size_t size() const { return data_.size(); }
  bool empty() const { return data_.empty(); }
  size_t pos() const { return pos_; }
  size_t remaining() const { return data_.size() - pos_; }

  // Copies min(output.size(), remaining()) bytes and advances the cursor.
  size_t Read(std::span<std::byte> output);

  void SeekTo(size_t pos);
  void Rewind() { pos_ = 0; }

 private:
  std::vector<std::byte> data_;
  size_t pos_;
};
