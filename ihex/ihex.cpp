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

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

#include "ihex.h"

namespace tierone::ihex {

namespace {

uint8_t hex_char_to_nibble(char c, size_t position) {
	if (c >= '0' && c <= '9') {
		return static_cast<uint8_t>(c - '0');
	} else if (c >= 'A' && c <= 'F') {
		return static_cast<uint8_t>(c - 'A' + 10);
	} else if (c >= 'a' && c <= 'f') {
		return static_cast<uint8_t>(c - 'a' + 10);
	} else {
		throw IntelHexFormatException("Invalid hex character: " + std::string(1, c), 0, position + 1);
	}
}

// Throws if fewer than count bytes remain at offset
void require_bytes(const std::vector<uint8_t> &bytes, size_t offset, size_t count, const char *field) {
	if (offset > bytes.size() || bytes.size() - offset < count) {
		throw IntelHexFormatException(std::string("Error decoding ") + field + " field: record too short");
	}
}

std::string extended_count_message(uint8_t record_type, uint8_t byte_count) {
	std::ostringstream oss;
	oss << "Expected extended "
	    << (record_type == static_cast<uint8_t>(Record::Type::ExtendedSegmentAddress) ? "segment" : "linear")
	    << " address record to have byte count of 0x02 but got 0x"
	    << std::hex << std::uppercase << std::setfill('0') << std::setw(2)
	    << static_cast<unsigned int>(byte_count);
	return oss.str();
}

void write_record_line(std::ostream &output, const Record &record, const std::string &filename) {
	output << record.toString() << std::endl;
	if (!output) {
		throw IntelHexFileException("Failed to write record", filename);
	}
}

void write_segment_records(std::ostream &output, const std::vector<Segment> &segments, const std::string &filename) {
	// upper 16 bits of the last extended linear address written
	uint32_t linear_base = 0;

	for (const auto &segment : segments) {
		const uint32_t upper = segment.address >> 16;
		if (upper != linear_base) {
			linear_base = upper;
			write_record_line(output, Record::extendedLinearAddress(static_cast<uint16_t>(upper)), filename);
		}
		write_record_line(output, Record::data(static_cast<uint16_t>(segment.address & 0xFFFF), segment.data), filename);
	}

	write_record_line(output, Record::endOfFile(), filename);
}

} // namespace

std::string BytesToHexString(const std::vector<uint8_t> &bytes) {
	std::stringstream ss;
	ss << std::uppercase << std::hex << std::setfill('0');
	for (const auto byte : bytes) {
		ss << std::setw(2) << static_cast<unsigned int>(byte);
	}
	return ss.str();
}

std::vector<uint8_t> HexStringToBytes(const std::string &hex_str) {
	if (hex_str.size() % 2 != 0) {
		throw IntelHexFormatException("Odd length hex string (" + std::to_string(hex_str.size()) + " characters)");
	}

	std::vector<uint8_t> result;
	result.reserve(hex_str.size() / 2);
	for (size_t i = 0; i < hex_str.size(); i += 2) {
		uint8_t high = hex_char_to_nibble(hex_str[i], i);
		uint8_t low = hex_char_to_nibble(hex_str[i + 1], i + 1);
		result.push_back(static_cast<uint8_t>((high << 4) | low));
	}
	return result;
}

uint8_t checksum(const std::vector<uint8_t> &bytes) {
	unsigned long sum = 0;
	for (const auto byte : bytes) {
		sum += byte;
	}
	return static_cast<uint8_t>((~sum + 1) & 0xFF);
}

// ============================================================================
// Record
// ============================================================================

Record::Record(uint8_t count, uint16_t record_address, uint8_t type,
               const std::vector<uint8_t> &record_data, uint8_t record_checksum)
	: byte_count(count),
	  address(record_address),
	  record_type(type),
	  data_bytes(record_data),
	  checksum_byte(record_checksum)
{
}

Record::Record(Type type, uint16_t record_address, const std::vector<uint8_t> &record_data)
	: byte_count(0),
	  address(record_address),
	  record_type(static_cast<uint8_t>(type)),
	  data_bytes(record_data),
	  checksum_byte(0)
{
	if (record_data.size() > MAX_DATA_BYTES) {
		throw IntelHexValidationException(
			"Record data size exceeds maximum of 255 bytes",
			IntelHexValidationException::ValidationError::DATA_TOO_LARGE
		);
	}
	byte_count = static_cast<uint8_t>(record_data.size());
	checksum_byte = encode().back();
}

Record Record::data(uint16_t address, const std::vector<uint8_t> &payload) {
	return Record(Type::Data, address, payload);
}

const Record &Record::endOfFile() {
	static const Record eof_record(Type::EndOfFile, 0, std::vector<uint8_t>{});
	return eof_record;
}

Record Record::extendedSegmentAddress(uint16_t segment) {
	return Record(Type::ExtendedSegmentAddress, 0, {
		static_cast<uint8_t>((segment >> 8) & 0xFF),
		static_cast<uint8_t>(segment & 0xFF)
	});
}

Record Record::extendedLinearAddress(uint16_t upper_address) {
	return Record(Type::ExtendedLinearAddress, 0, {
		static_cast<uint8_t>((upper_address >> 8) & 0xFF),
		static_cast<uint8_t>(upper_address & 0xFF)
	});
}

Record Record::startSegmentAddress(uint16_t cs, uint16_t ip) {
	return Record(Type::StartSegmentAddress, 0, {
		static_cast<uint8_t>((cs >> 8) & 0xFF),
		static_cast<uint8_t>(cs & 0xFF),
		static_cast<uint8_t>((ip >> 8) & 0xFF),
		static_cast<uint8_t>(ip & 0xFF)
	});
}

Record Record::startLinearAddress(uint32_t eip) {
	return Record(Type::StartLinearAddress, 0, {
		static_cast<uint8_t>((eip >> 24) & 0xFF),
		static_cast<uint8_t>((eip >> 16) & 0xFF),
		static_cast<uint8_t>((eip >> 8) & 0xFF),
		static_cast<uint8_t>(eip & 0xFF)
	});
}

Record::Type Record::getType() const {
	if (record_type >= NUM_RECORD_TYPES) {
		throw IntelHexRecordTypeException(record_type);
	}
	return static_cast<Type>(record_type);
}

bool Record::isExtendedAddress() const {
	return record_type == static_cast<uint8_t>(Type::ExtendedSegmentAddress) ||
	       record_type == static_cast<uint8_t>(Type::ExtendedLinearAddress);
}

uint16_t Record::getExtendedAddress() const {
	if (!isExtendedAddress()) {
		throw IntelHexFormatException("Record is not an extended address record");
	}
	if (data_bytes.size() != 2) {
		throw IntelHexFormatException(extended_count_message(record_type, byte_count));
	}
	return static_cast<uint16_t>((data_bytes[0] << 8) | data_bytes[1]);
}

std::vector<uint8_t> Record::encode() const {
	if (data_bytes.size() != byte_count) {
		std::ostringstream oss;
		oss << "Byte count was " << static_cast<unsigned int>(byte_count)
		    << " but data length was " << data_bytes.size();
		throw IntelHexFormatException(oss.str());
	}
	if (record_type >= NUM_RECORD_TYPES) {
		throw IntelHexRecordTypeException(record_type);
	}
	if (isExtendedAddress() && byte_count != 2) {
		throw IntelHexFormatException(extended_count_message(record_type, byte_count));
	}

	std::vector<uint8_t> bytes;
	bytes.reserve(MIN_RECORD_SIZE + data_bytes.size());
	bytes.push_back(byte_count);
	bytes.push_back(static_cast<uint8_t>((address >> 8) & 0xFF));
	bytes.push_back(static_cast<uint8_t>(address & 0xFF));
	bytes.push_back(record_type);
	bytes.insert(bytes.end(), data_bytes.begin(), data_bytes.end());
	bytes.push_back(checksum(bytes));
	return bytes;
}

std::string Record::toString() const {
	std::vector<uint8_t> bytes = encode();

	std::string result;
	result.reserve(1 + bytes.size() * 2);
	result += START_CODE;
	result += BytesToHexString(bytes);
	return result;
}

Record Record::decode(const std::vector<uint8_t> &bytes) {
	require_bytes(bytes, 0, 1, "byte count");
	const uint8_t count = bytes[0];

	require_bytes(bytes, 1, 2, "address");
	const auto record_address = static_cast<uint16_t>((bytes[1] << 8) | bytes[2]);

	require_bytes(bytes, 3, 1, "record type");
	const uint8_t type = bytes[3];
	if (type >= NUM_RECORD_TYPES) {
		throw IntelHexRecordTypeException(type);
	}

	if ((type == static_cast<uint8_t>(Type::ExtendedSegmentAddress) ||
	     type == static_cast<uint8_t>(Type::ExtendedLinearAddress)) && count != 2) {
		throw IntelHexFormatException(extended_count_message(type, count));
	}

	require_bytes(bytes, HEADER_SIZE, count, "data");
	std::vector<uint8_t> record_data(bytes.begin() + HEADER_SIZE, bytes.begin() + HEADER_SIZE + count);

	const size_t checksum_offset = HEADER_SIZE + count;
	require_bytes(bytes, checksum_offset, 1, "checksum");
	const uint8_t record_checksum = bytes[checksum_offset];

	if (bytes.size() > checksum_offset + 1) {
		throw IntelHexFormatException("Unexpected " + std::to_string(bytes.size() - checksum_offset - 1) +
		                              " trailing bytes after checksum");
	}

	const uint8_t calculated = checksum(std::vector<uint8_t>(bytes.begin(), bytes.begin() + checksum_offset));
	if (calculated != record_checksum) {
		throw IntelHexChecksumException(record_checksum, calculated);
	}

	return Record(count, record_address, type, record_data, record_checksum);
}

Record Record::parse(const std::string &line) {
	if (line.empty()) {
		throw IntelHexFormatException("Missing start code");
	}
	if (line[0] != START_CODE) {
		throw IntelHexFormatException(
			std::string("Expected start code ") + START_CODE + " but got " + line[0], 0, 1);
	}

	std::vector<uint8_t> bytes;
	try {
		bytes = HexStringToBytes(line.substr(1));
	} catch (const IntelHexFormatException &e) {
		// report columns relative to the whole line
		const size_t column = e.getColumn() > 0 ? e.getColumn() + 1 : 0;
		throw IntelHexFormatException(e.what(), 0, column);
	}
	return decode(bytes);
}

bool Record::operator==(const Record &other) const {
	return byte_count == other.byte_count &&
	       address == other.address &&
	       record_type == other.record_type &&
	       data_bytes == other.data_bytes &&
	       checksum_byte == other.checksum_byte;
}

// ============================================================================
// Segment scanning
// ============================================================================

Record SegmentScanner::parse_line(const std::string &line) const {
	try {
		return Record::parse(line);
	} catch (const IntelHexFormatException &e) {
		if (e.getLineNumber() == 0) {
			throw IntelHexFormatException(e.what(), line_count, e.getColumn());
		}
		throw;
	}
}

bool SegmentScanner::scan() {
	if (first_error || end_of_file_seen) {
		return false;
	}

	try {
		std::string line;
		while (std::getline(input, line)) {
			++line_count;

			if (!line.empty() && line.back() == '\r') {
				line.pop_back();
			}
			if (line.empty()) {
				continue;
			}

			Record record = parse_line(line);

			switch (record.getType()) {
				case Record::Type::Data:
					current.address = base.resolve(record.getAddress());
					current.data = record.getData();
					return true;
				case Record::Type::EndOfFile:
					end_of_file_seen = true;
					return false;
				case Record::Type::ExtendedSegmentAddress:
					base = AddressBase::segmented(record.getExtendedAddress());
					break;
				case Record::Type::ExtendedLinearAddress:
					base = AddressBase::linear(record.getExtendedAddress());
					break;
				case Record::Type::StartSegmentAddress:
				case Record::Type::StartLinearAddress:
					break;
			}
		}
	} catch (const std::exception &) {
		// decode errors, and stream errors from inputs configured to throw, are kept as is
		first_error = std::current_exception();
		return false;
	}

	if (input.bad()) {
		first_error = std::make_exception_ptr(IntelHexFileException("Stream read error"));
	} else {
		first_error = std::make_exception_ptr(
			IntelHexFormatException("Unexpected end of stream without EOF record"));
	}
	return false;
}

void SegmentScanner::rethrow_error() const {
	if (first_error) {
		std::rethrow_exception(first_error);
	}
}

// ============================================================================
// Segment collections
// ============================================================================

void sort_segments(std::vector<Segment> &segments) {
	std::stable_sort(segments.begin(), segments.end());
}

uint64_t span_size(const std::vector<Segment> &segments) {
	if (segments.empty()) {
		return 0;
	}
	if (segments.size() == 1) {
		return segments.front().data.size();
	}
	return segments.back().end() - segments.front().address;
}

std::vector<uint8_t> flatten_segments(const std::vector<Segment> &segments, uint8_t fill) {
	if (segments.empty()) {
		return {};
	}

	const auto size = static_cast<size_t>(span_size(segments));
	const uint32_t origin = segments.front().address;
	std::vector<uint8_t> image(size, fill);

	for (const auto &segment : segments) {
		const size_t offset = segment.address - origin;
		if (offset >= size) {
			continue;
		}
		const size_t length = std::min(segment.data.size(), size - offset);
		std::copy_n(segment.data.begin(), length, image.begin() + static_cast<std::ptrdiff_t>(offset));
	}
	return image;
}

std::vector<Segment> split_into_segments(const std::vector<uint8_t> &image, uint32_t start_address,
                                         size_t record_size) {
	if (record_size == 0 || record_size > Record::MAX_DATA_BYTES) {
		throw std::invalid_argument("Record size must be between 1 and 255");
	}
	if (static_cast<uint64_t>(start_address) + image.size() > 0x100000000ULL) {
		throw IntelHexValidationException(
			"Image extends past address 0xFFFFFFFF",
			IntelHexValidationException::ValidationError::DATA_TOO_LARGE
		);
	}

	std::vector<Segment> segments;
	uint64_t address = start_address;
	size_t offset = 0;
	while (offset < image.size()) {
		// never cross a 64KiB boundary within one data record
		const auto to_boundary = static_cast<size_t>(0x10000 - (address & 0xFFFF));
		const size_t length = std::min({record_size, image.size() - offset, to_boundary});

		Segment segment;
		segment.address = static_cast<uint32_t>(address);
		segment.data.assign(image.begin() + static_cast<std::ptrdiff_t>(offset),
		                    image.begin() + static_cast<std::ptrdiff_t>(offset + length));
		segments.push_back(std::move(segment));

		offset += length;
		address += length;
	}
	return segments;
}

void write_segments(std::ostream &output, const std::vector<Segment> &segments) {
	write_segment_records(output, segments, "");
}

std::vector<Segment> read_segments(std::istream &input) {
	std::vector<Segment> segments;
	SegmentScanner scanner(input);
	while (scanner.scan()) {
		segments.push_back(scanner.segment());
	}
	scanner.rethrow_error();
	return segments;
}

std::vector<Segment> read_file(const std::string &filename) {
	std::ifstream file(filename);
	if (!file.is_open()) {
		throw IntelHexFileException("Failed to open file", filename);
	}
	return read_segments(file);
}

// ============================================================================
// HexFile
// ============================================================================

HexFile::HexFile(const std::string &file_name)
	: filename(file_name)
{
	file.open(filename, std::ios::out | std::ios::trunc);
}

HexFile::~HexFile() {
	file.close();
}

void HexFile::close() {
	file.flush();
	file.close();
}

bool HexFile::is_open() const {
	return file.is_open();
}

void HexFile::write_record(const Record &record) {
	if (!this->file.is_open()) {
		throw IntelHexFileException("File is not open", this->filename);
	}
	write_record_line(this->file, record, this->filename);
}

void HexFile::write_segments(const std::vector<Segment> &segments) {
	if (!this->file.is_open()) {
		throw IntelHexFileException("File is not open", this->filename);
	}
	write_segment_records(this->file, segments, this->filename);
}

void HexFile::write_end_of_file() {
	write_record(Record::endOfFile());
}

// ============================================================================
// Conversion
// ============================================================================

void convert_hex_to_bin(std::istream &input, std::ostream &output) {
	std::vector<Segment> segments = read_segments(input);
	if (segments.empty()) {
		throw IntelHexFormatException("No segments found");
	}

	sort_segments(segments);
	std::vector<uint8_t> image = flatten_segments(segments);

	output.write(reinterpret_cast<const char *>(image.data()), static_cast<std::streamsize>(image.size()));
	output.flush();
	if (!output) {
		throw IntelHexFileException("Failed to write binary output");
	}
}

void convert_bin_to_hex(std::istream &input, HexFile &hfile, uint32_t start_address, size_t record_size) {
	std::vector<uint8_t> image((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
	if (input.bad()) {
		throw IntelHexFileException("Input stream read error");
	}

	hfile.write_segments(split_into_segments(image, start_address, record_size));
	hfile.close();
}

} // namespace tierone::ihex
