#ifndef SERVER_HPP
#define SERVER_HPP

#include <iostream>
#include <string>

#include "ConfReader.hpp"
#include "Communication.hpp"
#include "Interaction.hpp"
#include "Logger.hpp"
#include "Transport.hpp"

constexpr const char* SERVER_USERNAME = "Server";

// Binds to the configured address and answers the first peer that sends SYN.
class Server {
public:
    Server(const EndpointConfig& conf, Interaction& ui, Logger& logger);
    Server(const Server&) = delete;

    bool Initialize();
    SessionEnd Run();

    ~Server();
private:
    EndpointConfig conf_;
    Interaction& ui_;
    Logger& logger_;
    UdpTransport transport_;
    SessionState session_;
    Communication communication_;
};

#endif // SERVER_HPP
