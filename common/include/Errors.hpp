#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstdint>

class SimpError : public std::runtime_error {
public:
    explicit SimpError(const std::string& what) : std::runtime_error(what) {}
};

// Unknown kind/operation/sequence byte in a received header.
class InvalidEnumValue : public SimpError {
public:
    InvalidEnumValue(const std::string& field, const uint8_t& value);
    const std::string& Field() const { return field_; }
    uint8_t Value() const { return value_; }
private:
    std::string field_;
    uint8_t value_;
};

// Truncated header or text that is not valid UTF-8.
class DecodeError : public SimpError {
public:
    explicit DecodeError(const std::string& what) : SimpError(what) {}
};

// Control message built with text on a non-ERR operation.
class ConstructionError : public SimpError {
public:
    explicit ConstructionError(const std::string& what) : SimpError(what) {}
};

#endif // ERRORS_HPP
