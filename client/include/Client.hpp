#ifndef CLIENT_HPP
#define CLIENT_HPP

#include <iostream>
#include <string>

#include "ConfReader.hpp"
#include "Communication.hpp"
#include "Interaction.hpp"
#include "Logger.hpp"
#include "Transport.hpp"

enum class ConnectResult {
    CONNECTED,
    DECLINED,
    FAILED,
    INTERRUPTED
};

// Asks the operator for a name and opens the handshake with the server.
class Client {
public:
    Client(const EndpointConfig& conf, Interaction& ui, Logger& logger);
    Client(const Client&) = delete;

    bool Initialize();
    ConnectResult Connect();
    SessionEnd Run();

    const std::string& GetUsername() const { return session_.username; }
    ~Client();
private:
    EndpointConfig conf_;
    Interaction& ui_;
    Logger& logger_;
    UdpTransport transport_;
    SessionState session_;
    Communication communication_;
};

#endif // CLIENT_HPP
