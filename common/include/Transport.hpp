#ifndef TRANSPORT_HPP
#define TRANSPORT_HPP

#include <string>
#include <cstdint>

#include <unistd.h>
#include <arpa/inet.h>
#include <sys/socket.h>

#include "Protocol.hpp"
#include "Logger.hpp"

struct Endpoint {
    Endpoint() : port(0) {}
    Endpoint(const std::string& host_name, const uint16_t& port_number)
        : host(host_name), port(port_number) {}

    std::string ToString() const { return host + ":" + std::to_string(port); }
    bool operator==(const Endpoint& other) const { return host == other.host && port == other.port; }

    std::string host;
    uint16_t port;
};

enum class ReceiveStatus {
    DATA,
    TIMEOUT,
    INTERRUPTED,
    ERROR
};

struct ReceiveResult {
    ReceiveStatus status = ReceiveStatus::ERROR;
    Bytes data;
    Endpoint peer;
};

// Unreliable, unordered datagram channel.
class Transport {
public:
    virtual ~Transport() {}

    virtual bool Bind(const Endpoint& local) = 0;
    virtual bool Send(const Bytes& data, const Endpoint& peer) = 0;
    virtual ReceiveResult Receive(const size_t& max_bytes) = 0;
    // 0 blocks until data arrives.
    virtual void SetReceiveTimeout(const uint32_t& seconds) = 0;
};

class UdpTransport : public Transport {
public:
    explicit UdpTransport(Logger& logger);
    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;
    ~UdpTransport() override;

    bool Initialize();
    bool Bind(const Endpoint& local) override;
    bool Send(const Bytes& data, const Endpoint& peer) override;
    ReceiveResult Receive(const size_t& max_bytes) override;
    void SetReceiveTimeout(const uint32_t& seconds) override;

    uint32_t GetReceiveTimeout() const { return timeout_seconds_; }
private:
    bool Resolve(const Endpoint& endpoint, struct sockaddr_in& addr);

    Logger& logger_;
    int sockfd_;
    uint32_t timeout_seconds_;
};

#endif // TRANSPORT_HPP
