/*
 * Copyright (C) 2024 koolkdev
 *
 * This software may be modified and distributed under the terms
 * of the MIT license.  See the LICENSE file for details.
 */

#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>

#include <vector>

#include <seedstream/block_generator.h>
#include <seedstream/payload_stream.h>

TEST_CASE("Payload benchmarks", "[!benchmark]") {
  BENCHMARK("generate 4KiB block") {
    return GenerateBlock("object-1-key", 4096);
  };

  BENCHMARK("generate 8MiB block") {
    return GenerateBlock("object-1-key", 8 * 1024 * 1024);
  };

  constexpr int64_t kSize = 1024 * 1024;
  PayloadStream payload(kSize, "test-object-1meg");
  std::vector<std::byte> buffer(kSize);
  BENCHMARK("read 1MiB") {
    auto read = payload.Read(buffer);
    payload.Seek(0, SeekAnchor::kFromStart);
    return read;
  };

  PayloadStream tiled(kSize, "test-object-1meg", {.tiled = true});
  BENCHMARK("read 1MiB from a 32KiB tile") {
    auto read = tiled.Read(buffer);
    tiled.Seek(0, SeekAnchor::kFromStart);
    return read;
  };
}
