#include "Transport.hpp"

#include <algorithm>
#include <cstring>
#include <cerrno>
#include <sstream>
#include <poll.h>
#include <netdb.h>

UdpTransport::UdpTransport(Logger& logger)
    : logger_(logger)
    , sockfd_(-1)
    , timeout_seconds_(0) {}

bool UdpTransport::Initialize() {
    if ((sockfd_ = socket(AF_INET, SOCK_DGRAM, 0)) < 0) {
        logger_.Log(std::string("Error creating socket: ") + strerror(errno));
        return false;
    }
    return true;
}

bool UdpTransport::Resolve(const Endpoint& endpoint, struct sockaddr_in& addr) {
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint.port);

    if (inet_pton(AF_INET, endpoint.host.c_str(), &addr.sin_addr) == 1) {
        return true;
    }

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    struct addrinfo* result = nullptr;
    int rc = getaddrinfo(endpoint.host.c_str(), nullptr, &hints, &result);
    if (rc != 0 || result == nullptr) {
        logger_.Log("Cannot resolve " + endpoint.host + ": " + gai_strerror(rc));
        return false;
    }
    addr.sin_addr = reinterpret_cast<struct sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return true;
}

bool UdpTransport::Bind(const Endpoint& local) {
    struct sockaddr_in local_addr;
    if (!Resolve(local, local_addr)) {
        return false;
    }

    if (bind(sockfd_, (struct sockaddr *)&local_addr, sizeof(local_addr)) < 0) {
        logger_.Log("Error binding socket to " + local.ToString() + ": " + strerror(errno));
        return false;
    }

    logger_.Log("UDP socket bound to " + local.ToString());
    return true;
}

bool UdpTransport::Send(const Bytes& data, const Endpoint& peer) {
    struct sockaddr_in peer_addr;
    if (!Resolve(peer, peer_addr)) {
        return false;
    }

    ssize_t bytes_sent = sendto(sockfd_, data.data(), data.size(), 0,
                                (struct sockaddr *)&peer_addr, sizeof(peer_addr));
    if (bytes_sent < 0) {
        logger_.Log("Error sending data to " + peer.ToString() + ": " + strerror(errno));
        return false;
    }
    return true;
}

ReceiveResult UdpTransport::Receive(const size_t& max_bytes) {
    ReceiveResult result;

    struct pollfd poll_struct[1];
    poll_struct[0].fd = sockfd_;
    poll_struct[0].events = POLLIN;
    poll_struct[0].revents = 0;

    uint32_t seconds = std::min(timeout_seconds_, MAX_RESEND_TIMEOUT_SECONDS);
    int timeout_ms = seconds == 0 ? -1 : static_cast<int>(seconds * 1000);
    int ready = poll(poll_struct, 1, timeout_ms);
    if (ready < 0) {
        if (errno == EINTR) {
            result.status = ReceiveStatus::INTERRUPTED;
            return result;
        }
        logger_.Log(std::string("poll failed: ") + strerror(errno));
        result.status = ReceiveStatus::ERROR;
        return result;
    }
    if (ready == 0) {
        result.status = ReceiveStatus::TIMEOUT;
        return result;
    }

    struct sockaddr_in peer_addr;
    socklen_t len = sizeof(peer_addr);
    result.data.resize(max_bytes);
    ssize_t n = recvfrom(sockfd_, result.data.data(), max_bytes, 0, (struct sockaddr *)&peer_addr, &len);
    if (n < 0) {
        result.status = errno == EINTR ? ReceiveStatus::INTERRUPTED : ReceiveStatus::ERROR;
        if (result.status == ReceiveStatus::ERROR) {
            logger_.Log(std::string("recvfrom failed: ") + strerror(errno));
        }
        result.data.clear();
        return result;
    }
    result.data.resize(static_cast<size_t>(n));

    char host[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &peer_addr.sin_addr, host, sizeof(host));
    result.peer = Endpoint(host, ntohs(peer_addr.sin_port));
    result.status = ReceiveStatus::DATA;

    std::ostringstream oss;
    oss << "Received " << n << " bytes from " << result.peer.ToString();
    logger_.Log(oss.str());
    return result;
}

void UdpTransport::SetReceiveTimeout(const uint32_t& seconds) {
    timeout_seconds_ = seconds;
}

UdpTransport::~UdpTransport() {
    if (sockfd_ >= 0) {
        close(sockfd_);
    }
}
