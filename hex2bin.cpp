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

	// Define arguments
	argparse::ArgumentParser program("hex2bin");
	program.add_argument("-i", "--input")
		.help("Input file in Intel HEX format (default: stdin)");
	program.add_argument("-o", "--output")
		.help("Output file in binary format (default: stdout)");

	// Parse arguments
	try {
		program.parse_args(argc, argv);
	} catch (const std::exception &err) {
		std::cerr << "Parsing command line arguments failed" << std::endl;
		std::cerr << err.what() << std::endl;
		std::cerr << program;
		return 1;
	}

	std::ifstream input_file;
	std::istream *input = &std::cin;
	if (auto input_name = program.present("-i")) {
		input_file.open(*input_name);
		if (!input_file.is_open()) {
			std::cerr << "Error opening input file: " << *input_name << std::endl;
			return 1;
		}
		input = &input_file;
	}

	std::ofstream output_file;
	std::ostream *output = &std::cout;
	if (auto output_name = program.present("-o")) {
		output_file.open(*output_name, std::ios::binary | std::ios::trunc);
		if (!output_file.is_open()) {
			std::cerr << "Error opening output file: " << *output_name << std::endl;
			return 1;
		}
		output = &output_file;
	}

	try {
		tierone::ihex::convert_hex_to_bin(*input, *output);
	} catch (const std::exception &err) {
		std::cerr << "Error converting Intel HEX file: " << err.what() << std::endl;
		return 1;
	}

	return 0;
}
