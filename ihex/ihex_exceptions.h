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

#include <cstdint>
#include <exception>
#include <iomanip>
#include <string>
#include <sstream>

namespace tierone::ihex {

/**
 * Base exception class for all Intel HEX errors
 */
class IntelHexException : public std::exception {
protected:
    mutable std::string message_;
    
public:
    explicit IntelHexException(const std::string& msg) : message_(msg) {}
    
    const char* what() const noexcept override {
        return message_.c_str();
    }
};

/**
 * Exception thrown for malformed records and text: bad start code,
 * bad hex digits, wrong field layout, byte count not matching the data,
 * leftover bytes, or a stream without an EOF record
 */
class IntelHexFormatException : public IntelHexException {
private:
    size_t line_number_;
    size_t column_;
    
public:
    IntelHexFormatException(const std::string& msg, size_t line = 0, size_t col = 0)
        : IntelHexException(msg), line_number_(line), column_(col) {
        
        if (line_number_ > 0) {
            std::ostringstream oss;
            oss << message_;
            oss << " at line " << line_number_;
            if (column_ > 0) {
                oss << ", column " << column_;
            }
            message_ = oss.str();
        }
    }
    
    size_t getLineNumber() const { return line_number_; }
    size_t getColumn() const { return column_; }
};

/**
 * Exception thrown for file and stream I/O errors
 */
class IntelHexFileException : public IntelHexException {
private:
    std::string filename_;
    
public:
    IntelHexFileException(const std::string& msg, const std::string& filename = "")
        : IntelHexException(msg), filename_(filename) {
        
        if (!filename_.empty()) {
            message_ = message_ + " (file: " + filename_ + ")";
        }
    }
    
    const std::string& getFilename() const { return filename_; }
};

/**
 * Exception thrown when a record fails validation
 */
class IntelHexValidationException : public IntelHexException {
public:
    enum class ValidationError {
        CHECKSUM_MISMATCH,
        INVALID_RECORD_TYPE,
        DATA_TOO_LARGE
    };
    
private:
    ValidationError error_type_;
    
public:
    IntelHexValidationException(const std::string& msg, ValidationError error_type)
        : IntelHexException(msg), error_type_(error_type) {}
    
    ValidationError getErrorType() const { return error_type_; }
};

/**
 * Exception thrown when a record's checksum byte does not match the
 * checksum calculated over its other fields
 */
class IntelHexChecksumException : public IntelHexValidationException {
private:
    uint8_t expected_;
    uint8_t calculated_;
    
public:
    IntelHexChecksumException(uint8_t expected, uint8_t calculated)
        : IntelHexValidationException(
            createMessage(expected, calculated),
            ValidationError::CHECKSUM_MISMATCH
          ),
          expected_(expected),
          calculated_(calculated) {}
    
    uint8_t getExpected() const { return expected_; }
    uint8_t getCalculated() const { return calculated_; }
    
private:
    static std::string createMessage(uint8_t expected, uint8_t calculated) {
        std::ostringstream oss;
        oss << std::hex << std::uppercase << std::setfill('0')
            << "Expected checksum 0x" << std::setw(2) << static_cast<unsigned int>(expected)
            << " but calculated 0x" << std::setw(2) << static_cast<unsigned int>(calculated);
        return oss.str();
    }
};

/**
 * Exception thrown for a record type byte outside 0x00-0x05
 */
class IntelHexRecordTypeException : public IntelHexValidationException {
private:
    uint8_t record_type_;
    
public:
    explicit IntelHexRecordTypeException(uint8_t record_type)
        : IntelHexValidationException(
            createMessage(record_type),
            ValidationError::INVALID_RECORD_TYPE
          ),
          record_type_(record_type) {}
    
    uint8_t getRecordType() const { return record_type_; }
    
private:
    static std::string createMessage(uint8_t record_type) {
        std::ostringstream oss;
        oss << "Invalid record type 0x" << std::hex << std::uppercase << std::setfill('0')
            << std::setw(2) << static_cast<unsigned int>(record_type);
        return oss.str();
    }
};

} // namespace tierone::ihex
