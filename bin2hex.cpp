/*
 * Copyright 2025 TierOne Software
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <iostream>
#include <fstream>
#include <string>

#include <argparse/argparse.hpp>

#include "ihex/ihex.h"


int main(int argc, char *argv[]) {
	std::string outputfilename;
	std::string inputfilename;

	// Define arguments
	argparse::ArgumentParser parser("bin2hex");
	parser.add_argument("-i", "--input")
		.help("Input file name");
	parser.add_argument("-o", "--output")
		.help("Output file name")
		.default_value(std::string("output.hex"));
	parser.add_argument("-a", "--address")
		.help("Address of the first byte, decimal or 0x-prefixed hex")
		.default_value(0LL)
		.nargs(1)
		.scan<'i', long long>();
	parser.add_argument("-r", "--record-size")
		.help("Data bytes per record, 1 to 255")
		.default_value(16)
		.nargs(1)
		.scan<'i', int>();

	// Parse arguments
	try {
		parser.parse_args(argc, argv);
	} catch (const std::exception &err) {
		std::cerr << "Parsing command line arguments failed" << std::endl;
		std::cerr << err.what() << std::endl;
		std::cerr << parser;
		return 1;
	}

	// Check if input file is specified
	try {
		inputfilename = parser.get<std::string>("--input");
	} catch (const std::exception &err) {
		std::cerr << "No input file specified: " << err.what() << std::endl;
		std::cerr << parser;
		return 1;
	}

	// Check if output file is specified
	try {
		outputfilename = parser.get<std::string>("--output");
	} catch (const std::exception &err) {
		std::cerr << "Error getting output filename: " << err.what() << std::endl;
		std::cerr << parser;
		return 1;
	}

	const long long start_address = parser.get<long long>("--address");
	if (start_address < 0 || start_address > 0xFFFFFFFFLL) {
		std::cerr << "Start address out of range" << std::endl;
		return 1;
	}

	const int record_size = parser.get<int>("--record-size");
	if (record_size < 1 || record_size > 255) {
		std::cerr << "Invalid record size" << std::endl;
		return 1;
	}

	// Open input file
	std::ifstream input(inputfilename, std::ios::binary);
	if (!input.is_open()) {
		std::cerr << "Error opening input file" << std::endl;
		return 1;
	}

	// Open output file
	tierone::ihex::HexFile hfile(outputfilename);
	if (!hfile.is_open()) {
		std::cerr << "Error opening output file" << std::endl;
		return 1;
	}

	try {
		tierone::ihex::convert_bin_to_hex(input, hfile, static_cast<uint32_t>(start_address),
		                                  static_cast<size_t>(record_size));
	} catch (const std::exception &err) {
		std::cerr << "Error converting binary file: " << err.what() << std::endl;
		return 1;
	}

	return 0;
}
