/*
 * Copyright (C) 2024 koolkdev
 *
 * This software may be modified and distributed under the terms
 * of the MIT license.  See the LICENSE file for details.
 */

#pragma once

#include <boost/iostreams/categories.hpp>
#include <boost/iostreams/positioning.hpp>
#include <boost/iostreams/stream.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "errors.h"

class BlockReader;

enum class SeekAnchor {
  kFromStart,
  kFromCurrent,
  kFromEnd,
};

struct PayloadOptions {
  // Generate a single DataBlockSize() tile and repeat it instead of materializing the whole payload.
  bool tiled = false;
  // Explicit filler seed. When empty the filler is seeded from the clock.
  std::optional<uint64_t> filler_seed;
};

// Seekable stream of |size| synthetic bytes backed by an in-memory block. When the block is shorter than the
// stream, logical byte k is block byte k % BlockSize().
// Not thread safe, every concurrent user needs its own instance.
class PayloadStream {
 public:
  PayloadStream(int64_t size, std::string_view seed, const PayloadOptions& options = {});
  PayloadStream(int64_t size, std::vector<std::byte> block);
  PayloadStream(PayloadStream&&) noexcept;
  PayloadStream& operator=(PayloadStream&&) noexcept;
  ~PayloadStream();

  int64_t Size() const { return size_; }
  int64_t Offset() const { return offset_; }
  size_t BlockSize() const;

  // Fills min(buffer.size(), Size() - Offset()) bytes. Returns kEndOfStream once the offset reached the end.
  std::expected<size_t, StreamFailure> Read(std::span<std::byte> buffer);
  // FromEnd counts backwards: Seek(k, kFromEnd) moves to Size() - k.
  std::expected<int64_t, StreamFailure> Seek(int64_t offset, SeekAnchor anchor);

  class device {
   public:
    typedef char char_type;
    struct category : public boost::iostreams::input_seekable,
                      public boost::iostreams::device_tag,
                      public boost::iostreams::optimally_buffered_tag {};
    device(std::shared_ptr<PayloadStream> payload);

    std::streamsize read(char_type* s, std::streamsize n);
    boost::iostreams::stream_offset seek(boost::iostreams::stream_offset off, std::ios_base::seekdir way);
    std::streamsize optimal_buffer_size() const;

   private:
    std::shared_ptr<PayloadStream> payload_;
  };

  typedef boost::iostreams::stream<device> stream;

 private:
  int64_t size_;
  int64_t offset_;
  std::unique_ptr<BlockReader> block_;
};
