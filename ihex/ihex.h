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

#pragma once

#include <fstream>
#include <istream>
#include <ostream>
#include <string>
#include <vector>
#include <exception>
#include <cinttypes>
#include <cstddef>

#include "ihex_exceptions.h"

namespace tierone::ihex {

/// Character every non-blank Intel HEX line starts with
constexpr char START_CODE = ':';

/**
 * @brief Convert bytes to hexadecimal text
 * @param bytes Bytes to convert
 * @return Uppercase hexadecimal string, two digits per byte
 */
std::string BytesToHexString(const std::vector<uint8_t> &bytes);

/**
 * @brief Convert hexadecimal text to bytes
 *
 * Accepts upper and lower case digits.
 *
 * @param hex_str Text holding an even number of hex digits
 * @return Decoded bytes
 * @throws IntelHexFormatException on odd length or a non-hex character
 */
std::vector<uint8_t> HexStringToBytes(const std::string &hex_str);

/**
 * @brief Two's complement checksum of a byte sequence
 *
 * Sums every byte and returns the negated sum modulo 256, so that
 * adding the result to the sum gives zero.
 *
 * @param bytes Bytes to sum
 * @return Checksum byte
 */
uint8_t checksum(const std::vector<uint8_t> &bytes);


/**
 * @brief One Intel HEX record
 *
 * A record holds the raw wire fields: byte count, 16-bit address,
 * record type, data and checksum. Records built through the typed
 * constructor or the factory functions are always consistent and carry
 * a correct checksum. The raw constructor stores whatever it is given,
 * and encode() rejects inconsistent fields.
 */
class Record {
public:
	/**
	 * @brief Record type enumeration, value is the wire byte
	 */
	enum class Type : uint8_t {
		Data = 0x00,                   ///< Payload bytes at an address in the current bank
		EndOfFile = 0x01,              ///< Terminates the stream
		ExtendedSegmentAddress = 0x02, ///< Segment base, effective base is value << 4
		StartSegmentAddress = 0x03,    ///< CS:IP start address
		ExtendedLinearAddress = 0x04,  ///< Upper 16 address bits, effective base is value << 16
		StartLinearAddress = 0x05      ///< EIP start address
	};

	static constexpr uint8_t NUM_RECORD_TYPES = 6;
	static constexpr size_t MAX_DATA_BYTES = 255;
	/// byte count + 2 address bytes + record type
	static constexpr size_t HEADER_SIZE = 4;
	/// header + checksum
	static constexpr size_t MIN_RECORD_SIZE = HEADER_SIZE + 1;

	/**
	 * @brief Construct a record from raw field values without validation
	 */
	Record(uint8_t byte_count, uint16_t record_address, uint8_t record_type,
	       const std::vector<uint8_t> &record_data, uint8_t record_checksum = 0);

	/**
	 * @brief Construct a valid record and compute its checksum
	 * @throws IntelHexValidationException if data exceeds 255 bytes
	 * @throws IntelHexFormatException if an extended address record does not carry 2 bytes
	 */
	Record(Type record_type, uint16_t record_address, const std::vector<uint8_t> &record_data);

	static Record data(uint16_t address, const std::vector<uint8_t> &payload);

	/**
	 * @brief Shared EOF record (":00000001FF"), built once
	 */
	static const Record &endOfFile();

	static Record extendedSegmentAddress(uint16_t segment);
	static Record extendedLinearAddress(uint16_t upper_address);
	static Record startSegmentAddress(uint16_t cs, uint16_t ip);
	static Record startLinearAddress(uint32_t eip);

	uint8_t getByteCount() const {
		return byte_count;
	}

	uint16_t getAddress() const {
		return address;
	}

	uint8_t getTypeByte() const {
		return record_type;
	}

	/**
	 * @brief Get the record type
	 * @throws IntelHexRecordTypeException if the type byte is not a known type
	 */
	Type getType() const;

	const std::vector<uint8_t> &getData() const {
		return data_bytes;
	}

	uint8_t getChecksum() const {
		return checksum_byte;
	}

	/**
	 * @brief 16-bit value carried by an extended address record
	 * @throws IntelHexFormatException if this is not an extended address record
	 */
	uint16_t getExtendedAddress() const;

	/**
	 * @brief Serialize the record to its binary wire form
	 *
	 * The checksum is computed over the serialized count, address, type
	 * and data fields; the stored checksum field is not used.
	 *
	 * @return 5 + byte count bytes
	 * @throws IntelHexFormatException if the byte count does not match the data length,
	 *         or an extended address record does not have a byte count of 2
	 * @throws IntelHexRecordTypeException if the type byte is not a known type
	 */
	std::vector<uint8_t> encode() const;

	/**
	 * @brief Convert the record to one line of Intel HEX text
	 *
	 * Example: ":0300300002337A1E" for a 3-byte data record at 0x0030
	 *
	 * @return Start code followed by the encoded record as uppercase hex
	 */
	std::string toString() const;

	/**
	 * @brief Decode a record from its binary wire form
	 *
	 * Fields are read in order: count, big-endian address, type, count
	 * data bytes, checksum. The input must be exactly 5 + count bytes.
	 *
	 * @throws IntelHexFormatException on missing or leftover bytes, or an
	 *         extended address record whose byte count is not 2
	 * @throws IntelHexRecordTypeException if the type byte is 0x06 or above
	 * @throws IntelHexChecksumException if the checksum does not match
	 */
	static Record decode(const std::vector<uint8_t> &bytes);

	/**
	 * @brief Decode a record from one line of Intel HEX text
	 * @param line Text starting with the start code, without line ending
	 * @throws IntelHexFormatException on a missing start code or bad hex text
	 * @throws IntelHexValidationException as decode()
	 */
	static Record parse(const std::string &line);

	bool operator==(const Record &other) const;
	bool operator!=(const Record &other) const {
		return !(*this == other);
	}

private:
	uint8_t byte_count;
	uint16_t address;
	uint8_t record_type;
	std::vector<uint8_t> data_bytes;
	uint8_t checksum_byte;

	bool isExtendedAddress() const;
};


/**
 * @brief Address extension currently in effect while scanning
 *
 * At most one kind of extension is active; setting one replaces the other.
 */
class AddressBase {
public:
	enum class Kind {
		None,      ///< No extension record seen
		Segmented, ///< From an extended segment address record
		Linear     ///< From an extended linear address record
	};

	AddressBase() = default;

	static AddressBase segmented(uint16_t segment) {
		return AddressBase(Kind::Segmented, static_cast<uint32_t>(segment) << 4);
	}

	static AddressBase linear(uint16_t upper_address) {
		return AddressBase(Kind::Linear, static_cast<uint32_t>(upper_address) << 16);
	}

	Kind getKind() const {
		return kind;
	}

	uint32_t getValue() const {
		return value;
	}

	/**
	 * @brief Absolute address of a 16-bit record offset under this base
	 */
	uint32_t resolve(uint16_t offset) const {
		return value + offset;
	}

private:
	AddressBase(Kind base_kind, uint32_t base_value) : kind(base_kind), value(base_value) {}

	Kind kind{Kind::None};
	uint32_t value{0};
};


/**
 * @brief Contiguous run of data at an absolute 32-bit address
 */
struct Segment {
	uint32_t address{0};
	std::vector<uint8_t> data;

	/// One past the last byte, widened so it cannot wrap
	uint64_t end() const {
		return static_cast<uint64_t>(address) + data.size();
	}

	bool operator<(const Segment &other) const {
		return address < other.address;
	}

	bool operator==(const Segment &other) const {
		return address == other.address && data == other.data;
	}
};


/**
 * @brief Pull-based scanner turning Intel HEX lines into segments
 *
 * Each call to scan() reads lines until a data record yields a segment,
 * the EOF record ends the stream, or an error occurs. Extension records
 * update the address base carried across lines.
 *
 * The first error is kept and scan() returns false from then on. Reaching
 * the end of the input before an EOF record is an error.
 *
 * @code
 * SegmentScanner scanner(input);
 * while (scanner.scan()) {
 *     segments.push_back(scanner.segment());
 * }
 * scanner.rethrow_error();
 * @endcode
 *
 * @warning This class is not thread-safe
 */
class SegmentScanner {
public:
	explicit SegmentScanner(std::istream &input_stream) : input(input_stream) {}

	/**
	 * @brief Advance to the next segment
	 * @return true if a segment is ready, false at EOF record or on error
	 */
	bool scan();

	/**
	 * @brief Segment found by the last successful scan()
	 * @return Copy of the segment
	 */
	Segment segment() const {
		return current;
	}

	/**
	 * @brief Terminal error, or nullptr if none has occurred
	 */
	std::exception_ptr error() const {
		return first_error;
	}

	/**
	 * @brief Throw the terminal error if there is one
	 */
	void rethrow_error() const;

	/**
	 * @brief Whether the EOF record has been seen
	 */
	bool finished() const {
		return end_of_file_seen;
	}

	/**
	 * @brief Number of lines read so far, 1-based line of the last record
	 */
	size_t line_number() const {
		return line_count;
	}

	AddressBase address_base() const {
		return base;
	}

private:
	std::istream &input;
	size_t line_count{0};
	AddressBase base;
	Segment current;
	std::exception_ptr first_error;
	bool end_of_file_seen{false};

	Record parse_line(const std::string &line) const;
};


/**
 * @brief Sort segments by ascending address, keeping the order of equal addresses
 */
void sort_segments(std::vector<Segment> &segments);

/**
 * @brief Number of bytes from the first segment's address to the end of the last
 *
 * Segments must be sorted and non-overlapping.
 *
 * @return 0 for no segments, the data length for one segment
 */
uint64_t span_size(const std::vector<Segment> &segments);

/**
 * @brief Assemble sorted segments into one flat image
 *
 * The image starts at the first segment's address and is span_size()
 * bytes long. Bytes not covered by any segment hold the fill value.
 *
 * @param segments Sorted segments
 * @param fill Value for gaps
 * @return Flat image, empty for no segments
 */
std::vector<uint8_t> flatten_segments(const std::vector<Segment> &segments, uint8_t fill = 0xFF);

/**
 * @brief Split a flat image into data-record sized segments
 *
 * No segment crosses a 64KiB boundary, so each one can be written as a
 * single data record under an extended linear address.
 *
 * @param image Bytes to split
 * @param start_address Address of the first byte
 * @param record_size Maximum bytes per segment, 1 to 255
 * @throws std::invalid_argument if record_size is out of range
 * @throws IntelHexValidationException if the image runs past 0xFFFFFFFF
 */
std::vector<Segment> split_into_segments(const std::vector<uint8_t> &image, uint32_t start_address,
                                         size_t record_size = 16);

/**
 * @brief Write segments as Intel HEX text, ending with the EOF record
 *
 * An extended linear address record is written whenever the upper 16
 * address bits differ from the last one written (initially 0). Segments
 * should be sorted.
 *
 * @throws IntelHexValidationException if a segment holds more than 255 bytes
 * @throws IntelHexFileException if the stream fails
 */
void write_segments(std::ostream &output, const std::vector<Segment> &segments);

/**
 * @brief Read every segment from an Intel HEX stream
 * @throws The scanner's terminal error
 */
std::vector<Segment> read_segments(std::istream &input);

/**
 * @brief Read every segment from an Intel HEX file
 * @throws IntelHexFileException if the file cannot be opened
 */
std::vector<Segment> read_file(const std::string &filename);


/**
 * @brief Intel HEX file writer
 *
 * @note Files are opened in truncate mode and will overwrite existing content
 * @warning This class is not thread-safe
 */
class HexFile {
	std::string filename;
	std::ofstream file;

public:
	/**
	 * @brief Construct and open an Intel HEX file for writing
	 * @param file_name Path to the output file
	 */
	explicit HexFile(const std::string &file_name);

	~HexFile();

	void close();

	bool is_open() const;

	/**
	 * @brief Write one record as a line
	 * @throws IntelHexFileException if the file is not open or the write fails
	 */
	void write_record(const Record &record);

	/**
	 * @brief Write segments followed by the EOF record
	 * @throws IntelHexFileException if the file is not open or the write fails
	 */
	void write_segments(const std::vector<Segment> &segments);

	/**
	 * @brief Write the EOF record
	 * @throws IntelHexFileException if the file is not open or the write fails
	 */
	void write_end_of_file();

	std::string getFilename() const {
		return filename;
	}
};


/**
 * @brief Convert an Intel HEX stream to a flat binary image
 *
 * Gaps between segments are filled with 0xFF.
 *
 * @throws IntelHexFormatException if the stream holds no data
 * @throws IntelHexFileException if the output fails
 */
void convert_hex_to_bin(std::istream &input, std::ostream &output);

/**
 * @brief Convert a binary stream to an Intel HEX file
 * @param input Binary input
 * @param hfile Output file, closed on return
 * @param start_address Address of the first input byte
 * @param record_size Data bytes per record, 1 to 255
 */
void convert_bin_to_hex(std::istream &input, HexFile &hfile, uint32_t start_address, size_t record_size = 16);

} // namespace tierone::ihex
