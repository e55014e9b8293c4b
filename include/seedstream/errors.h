/*
 * Copyright (C) 2024 koolkdev
 *
 * This software may be modified and distributed under the terms
 * of the MIT license.  See the LICENSE file for details.
 */

#pragma once

#include <exception>
#include <expected>
#include <string>
#include <utility>

enum StreamError {
  kUnconfigured,
  kEndOfStream,
  kOutOfRange,
  kInvalidAnchor,
};

struct StreamFailure {
  StreamError error;
  std::string detail;

  // Only a rejected seek can be retried with corrected arguments.
  bool retryable() const { return error == StreamError::kOutOfRange; }
};

class StreamException : public std::exception {
 public:
  StreamException(StreamFailure failure);
  virtual char const* what() const noexcept override;

  StreamError error() const { return error_; }

 private:
  StreamError error_;
  std::string msg_;
};

char const* ErrorMessage(StreamError error);

template <typename T>
T throw_if_error(std::expected<T, StreamFailure> res) {
  if (!res.has_value())
    throw StreamException(std::move(res.error()));
  return *res;
}
