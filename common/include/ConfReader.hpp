#ifndef CONF_READER_HPP
#define CONF_READER_HPP

#include <fstream>
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

#include "Protocol.hpp"

struct EndpointConfig {
    EndpointConfig();

    std::string host;
    uint16_t port;
    std::string username;
    uint32_t resend_timeout;
    uint32_t buffer_size;
    std::string log_file;
};

void from_json(const nlohmann::json& data, EndpointConfig& conf);

class ConfReader {
public:
    ConfReader(const std::string& path = "./");
    // Missing file or keys keep the defaults; malformed JSON throws
    // nlohmann::json::exception, an out of range resend_timeout or
    // buffer_size throws std::out_of_range.
    EndpointConfig ReadEndpointConfig(const std::string& filename);
private:
    std::string path_;
};

#endif // CONF_READER_HPP
