/*
 * Copyright (C) 2017 koolkdev
 *
 * This software may be modified and distributed under the terms
 * of the MIT license.  See the LICENSE file for details.
 */

#include <cryptopp/sha.h>
#include <string>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <seedstream/seedstream.h>

std::string hexdigest(CryptoPP::SHA256& sha256) {
	std::vector<uint8_t> digest(CryptoPP::SHA256::DIGESTSIZE);
	sha256.Final(digest.data());
	std::string hex;
	for (auto byte : digest)
		hex += std::format("{:02x}", byte);
	return hex;
}

int main(int argc, char *argv[]) {
	try {
		boost::program_options::options_description desc("Allowed options");
		int64_t size, offset;
		size_t chunk_size;
		std::string seed, output_path;
		desc.add_options()
			("help", "produce help message")
			("size", boost::program_options::value<int64_t>(&size), "payload size in bytes")
			("seed", boost::program_options::value<std::string>(&seed)->default_value(""), "seed (usually the object key)")
			("output", boost::program_options::value<std::string>(&output_path)->default_value("-"), "output file (default: \"-\" for stdout)")
			("offset", boost::program_options::value<int64_t>(&offset)->default_value(0), "offset to start writing from")
			("chunk-size", boost::program_options::value<size_t>(&chunk_size)->default_value(64 * 1024), "read size for each iteration")
			("tiled", "repeat a single data block instead of generating the whole payload")
			("deterministic", "derive the filler from the seed so every run produces the same payload")
			("digest", "print the SHA-256 of the written bytes")
			("verbose", "verbose output")
			;

		boost::program_options::variables_map vm;
		boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc), vm);
		boost::program_options::notify(vm);

		bool bad = false;
		if (!vm.count("size")) { std::cerr << "Missing payload size (--size)" << std::endl; bad = true; }
		else if (size < 0) { std::cerr << "Payload size can't be negative" << std::endl; bad = true; }
		if (chunk_size == 0) { std::cerr << "Chunk size must be positive" << std::endl; bad = true; }
		if (vm.count("help") || bad) {
			std::cout << "Usage: seedgen --size <bytes> [--seed <seed>] [--output <output file>] [--offset <bytes>] [--chunk-size <bytes>] [--tiled] [--deterministic] [--digest] [--verbose]" << std::endl;
			std::cout << desc << "\n";
			return 1;
		}
		bool verbose = !!vm.count("verbose");

		PayloadOptions options;
		options.tiled = !!vm.count("tiled");
		if (vm.count("deterministic"))
			options.filler_seed = FillerSeedFromKey(seed);
		PayloadStream payload(size, seed, options);
		if (size == 0) {
			std::cerr << "Nothing to write" << std::endl;
			return 0;
		}
		throw_if_error(payload.Seek(offset, SeekAnchor::kFromStart));

		std::ofstream output_file;
		std::ostream* output = &std::cout;
		if (output_path != "-") {
			boost::filesystem::path path(output_path);
			if (path.has_parent_path() && !boost::filesystem::exists(path.parent_path())) {
				if (!boost::filesystem::create_directories(path.parent_path())) {
					std::cerr << "Error: Failed to create directory " << path.parent_path() << std::endl;
					return 1;
				}
			}
			output_file.open(path.string(), std::ios::binary | std::ios::out);
			if (output_file.fail()) {
				std::cerr << "Error: Failed to open " << path << std::endl;
				return 1;
			}
			output = &output_file;
		}

		if (verbose)
			std::cerr << "Writing " << (size - offset) << " bytes (block size " << payload.BlockSize() << ")" << std::endl;
		CryptoPP::SHA256 sha256;
		std::vector<std::byte> data(chunk_size);
		int64_t written = 0;
		while (true) {
			auto read = payload.Read(data);
			if (!read.has_value()) {
				if (read.error().error == StreamError::kEndOfStream)
					break;
				throw StreamException(std::move(read.error()));
			}
			output->write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(*read));
			if (output->fail()) {
				std::cerr << "Error: Failed to write output" << std::endl;
				return 1;
			}
			sha256.Update(reinterpret_cast<const uint8_t*>(data.data()), *read);
			written += static_cast<int64_t>(*read);
		}
		output->flush();

		if (verbose)
			std::cerr << "Wrote " << written << " bytes" << std::endl;
		if (vm.count("digest"))
			std::cerr << "sha256: " << hexdigest(sha256) << std::endl;
	}
	catch (std::exception & e) {
		std::cerr << "Error: " << e.what() << std::endl;
		return 1;
	}
	return 0;
}
