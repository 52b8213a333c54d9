#include "Errors.hpp"

#include <sstream>

InvalidEnumValue::InvalidEnumValue(const std::string& field, const uint8_t& value)
    : SimpError([&field, &value]() {
        std::ostringstream oss;
        oss << "invalid " << field << " value: 0x" << std::hex << static_cast<int>(value);
        return oss.str();
    }())
    , field_(field)
    , value_(value) {}
