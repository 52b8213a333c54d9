#include "ConfReader.hpp"

#include <stdexcept>

using json = nlohmann::json;

EndpointConfig::EndpointConfig()
    : host(DEFAULT_HOST)
    , port(DEFAULT_PORT)
    , resend_timeout(RESEND_TIMEOUT_SECONDS)
    , buffer_size(BUFFER_SIZE)
    , log_file("logs.txt") {}

void from_json(const json& data, EndpointConfig& conf) {
    conf.host = data.value("host", conf.host);
    conf.port = data.value("port", conf.port);
    conf.username = data.value("username", conf.username);

    int64_t resend_timeout = data.value("resend_timeout", static_cast<int64_t>(conf.resend_timeout));
    if (resend_timeout < 1 || resend_timeout > static_cast<int64_t>(MAX_RESEND_TIMEOUT_SECONDS)) {
        throw std::out_of_range("resend_timeout must be between 1 and "
                                + std::to_string(MAX_RESEND_TIMEOUT_SECONDS) + " seconds");
    }
    conf.resend_timeout = static_cast<uint32_t>(resend_timeout);

    int64_t buffer_size = data.value("buffer_size", static_cast<int64_t>(conf.buffer_size));
    if (buffer_size < static_cast<int64_t>(HEADER_SIZE) || buffer_size > static_cast<int64_t>(MAX_BUFFER_SIZE)) {
        throw std::out_of_range("buffer_size must be between " + std::to_string(HEADER_SIZE)
                                + " and " + std::to_string(MAX_BUFFER_SIZE) + " bytes");
    }
    conf.buffer_size = static_cast<uint32_t>(buffer_size);

    conf.log_file = data.value("log_file", conf.log_file);
}

ConfReader::ConfReader(const std::string& path) : path_(path) {}

EndpointConfig ConfReader::ReadEndpointConfig(const std::string& filename) {
    EndpointConfig conf;
    std::ifstream f(path_ + filename);
    if (!f.is_open()) {
        return conf;
    }

    json data = json::parse(f);
    data.get_to(conf);
    return conf;
}
