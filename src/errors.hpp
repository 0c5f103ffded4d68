#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace hexmill {

// Base of every fault raised by the library.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Malformed input: bad sentinel character, wrong length, bad field.
class ParseError : public Error {
public:
    using Error::Error;
};

class ChecksumError : public Error {
public:
    ChecksumError(const std::string& message, uint8_t expected, uint8_t actual)
        : Error(message), expected_(expected), actual_(actual) {}

    uint8_t expected() const { return expected_; }
    uint8_t actual() const { return actual_; }

private:
    uint8_t expected_;
    uint8_t actual_;
};

class UnsupportedTypeError : public Error {
public:
    using Error::Error;
};

// Data neither adjacent to nor allowed to overlap existing data.
class AddDataError : public Error {
public:
    using Error::Error;
};

class RangeError : public Error {
public:
    using Error::Error;
};

class EmptyStoreError : public Error {
public:
    EmptyStoreError() : Error("no data in the image") {}
};

class UnsupportedFileFormatError : public Error {
public:
    UnsupportedFileFormatError() : Error("unsupported file format") {}
};

} // namespace hexmill
