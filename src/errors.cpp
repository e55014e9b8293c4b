/*
 * Copyright (C) 2017 koolkdev
 *
 * This software may be modified and distributed under the terms
 * of the MIT license.  See the LICENSE file for details.
 */

#include "errors.h"

#include <format>

char const* ErrorMessage(StreamError error) {
  switch (error) {
    case StreamError::kUnconfigured:
      return "Data needs to be set before reading";
    case StreamError::kEndOfStream:
      return "End of stream";
    case StreamError::kOutOfRange:
      return "Cannot seek past start or end of stream";
    case StreamError::kInvalidAnchor:
      return "Invalid seek anchor";
  }
  return "";
}

StreamException::StreamException(StreamFailure failure)
    : error_(failure.error),
      msg_(failure.detail.empty() ? std::string(ErrorMessage(failure.error))
                                  : std::format("{}: {}", ErrorMessage(failure.error), failure.detail)) {}

char const* StreamException::what() const noexcept {
  return msg_.c_str();
}
