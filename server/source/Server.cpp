#include "Server.hpp"

Server::Server(const EndpointConfig& conf, Interaction& ui, Logger& logger)
    : conf_(conf)
    , ui_(ui)
    , logger_(logger)
    , transport_(logger)
    , session_(conf.host, conf.port, conf.username.empty() ? SERVER_USERNAME : conf.username)
    , communication_(transport_, ui, session_, logger, conf.resend_timeout, conf.buffer_size) {}

bool Server::Initialize() {
    logger_.Log(__func__);
    if (!transport_.Initialize()) {
        ui_.Notify("Error creating socket");
        return false;
    }

    if (!transport_.Bind(Endpoint(conf_.host, conf_.port))) {
        ui_.Notify("Error binding socket to " + conf_.host + ":" + std::to_string(conf_.port));
        return false;
    }

    // No timeout until the first chat reply goes out.
    transport_.SetReceiveTimeout(0);
    ui_.Notify("SIMP server listening on " + conf_.host + ":" + std::to_string(conf_.port));
    return true;
}

SessionEnd Server::Run() {
    logger_.Log(__func__);
    SessionEnd end = communication_.Run();
    logger_.Log(std::string("Session ended: ") + ToString(end));
    return end;
}

Server::~Server() {
    logger_.Log("Server stopped");
}
