/*
 * Copyright (C) 2024 koolkdev
 *
 * This software may be modified and distributed under the terms
 * of the MIT license.  See the LICENSE file for details.
 */

#include "payload_stream.h"

#include <algorithm>
#include <format>
#include <ios>

#include "block_generator.h"
#include "block_reader.h"

namespace {

std::string_view AnchorName(SeekAnchor anchor) {
  switch (anchor) {
    case SeekAnchor::kFromStart:
      return "FromStart";
    case SeekAnchor::kFromCurrent:
      return "FromCurrent";
    case SeekAnchor::kFromEnd:
      return "FromEnd";
  }
  return "Unknown";
}

std::vector<std::byte> CreateBlock(int64_t size, std::string_view seed, const PayloadOptions& options) {
  auto block_size = static_cast<size_t>(size);
  if (options.tiled)
    block_size = std::min(block_size, DataBlockSize(static_cast<uint64_t>(size)));
  return GenerateBlock(seed, block_size, options.filler_seed);
}

}  // namespace

PayloadStream::PayloadStream(int64_t size, std::string_view seed, const PayloadOptions& options)
    : size_(std::max<int64_t>(size, 0)),
      offset_(0),
      block_(std::make_unique<BlockReader>(CreateBlock(size_, seed, options))) {}

PayloadStream::PayloadStream(int64_t size, std::vector<std::byte> block)
    : size_(std::max<int64_t>(size, 0)), offset_(0), block_(std::make_unique<BlockReader>(std::move(block))) {}

PayloadStream::PayloadStream(PayloadStream&&) noexcept = default;
PayloadStream& PayloadStream::operator=(PayloadStream&&) noexcept = default;
PayloadStream::~PayloadStream() = default;

size_t PayloadStream::BlockSize() const {
  return block_->size();
}

std::expected<size_t, StreamFailure> PayloadStream::Read(std::span<std::byte> buffer) {
  if (block_->empty())
    return std::unexpected(StreamFailure{StreamError::kUnconfigured, {}});

  if (offset_ >= size_)
    return std::unexpected(StreamFailure{StreamError::kEndOfStream, {}});

  auto to_read = std::min(buffer.size(), static_cast<size_t>(size_ - offset_));

  // Hot path for large uploads: copy whole runs of the block, rewinding it whenever it is exhausted.
  size_t transferred = 0;
  while (transferred < to_read) {
    transferred += block_->Read(buffer.subspan(transferred, to_read - transferred));
    if (block_->remaining() == 0)
      block_->Rewind();
  }

  offset_ += static_cast<int64_t>(to_read);
  return to_read;
}

std::expected<int64_t, StreamFailure> PayloadStream::Seek(int64_t offset, SeekAnchor anchor) {
  bool in_range = false;
  int64_t next = 0;
  switch (anchor) {
    case SeekAnchor::kFromStart:
      in_range = offset >= 0 && offset <= size_;
      if (in_range)
        next = offset;
      break;
    case SeekAnchor::kFromCurrent:
      in_range = offset >= -offset_ && offset <= size_ - offset_;
      if (in_range)
        next = offset_ + offset;
      break;
    case SeekAnchor::kFromEnd:
      in_range = offset >= 0 && offset <= size_;
      if (in_range)
        next = size_ - offset;
      break;
    default:
      return std::unexpected(
          StreamFailure{StreamError::kInvalidAnchor, std::format("anchor: {}", static_cast<int>(anchor))});
  }

  if (!in_range) {
    return std::unexpected(StreamFailure{
        StreamError::kOutOfRange,
        std::format("{} offset: {}, current: {}, size: {}", AnchorName(anchor), offset, offset_, size_)});
  }

  offset_ = next;
  if (!block_->empty())
    block_->SeekTo(static_cast<size_t>(offset_ % static_cast<int64_t>(block_->size())));
  return offset_;
}

PayloadStream::device::device(std::shared_ptr<PayloadStream> payload) : payload_(std::move(payload)) {}

std::streamsize PayloadStream::device::read(char_type* s, std::streamsize n) {
  auto res = payload_->Read({reinterpret_cast<std::byte*>(s), static_cast<size_t>(n)});
  if (!res.has_value()) {
    if (res.error().error == StreamError::kEndOfStream)
      return -1;
    throw StreamException(std::move(res.error()));
  }
  return static_cast<std::streamsize>(*res);
}

boost::iostreams::stream_offset PayloadStream::device::seek(boost::iostreams::stream_offset off,
                                                            std::ios_base::seekdir way) {
  std::expected<int64_t, StreamFailure> res;
  switch (way) {
    case std::ios_base::beg:
      res = payload_->Seek(off, SeekAnchor::kFromStart);
      break;
    case std::ios_base::cur:
      res = payload_->Seek(off, SeekAnchor::kFromCurrent);
      break;
    case std::ios_base::end:
      res = payload_->Seek(-off, SeekAnchor::kFromEnd);
      break;
    default:
      throw std::ios_base::failure("bad seek direction");
  }

  if (!res.has_value())
    throw std::ios_base::failure(StreamException(std::move(res.error())).what());
  return *res;
}

std::streamsize PayloadStream::device::optimal_buffer_size() const {
  return static_cast<std::streamsize>(DataBlockSize(static_cast<uint64_t>(payload_->Size())));
}
