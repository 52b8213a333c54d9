#include "Client.hpp"
#include "Signals.hpp"

Client::Client(const EndpointConfig& conf, Interaction& ui, Logger& logger)
    : conf_(conf)
    , ui_(ui)
    , logger_(logger)
    , transport_(logger)
    , session_(conf.host, conf.port, conf.username)
    , communication_(transport_, ui, session_, logger, conf.resend_timeout, conf.buffer_size) {}

bool Client::Initialize() {
    logger_.Log(__func__);
    if (session_.username.empty()) {
        session_.username = ui_.AskText("Insert username: ");
    }
    logger_.Log("Username: " + session_.username);

    if (!transport_.Initialize()) {
        ui_.Notify("Error creating socket");
        return false;
    }
    transport_.SetReceiveTimeout(0);
    return true;
}

ConnectResult Client::Connect() {
    logger_.Log(__func__);
    if (InterruptRequested()) {
        logger_.Log("Interrupted before connecting");
        return ConnectResult::INTERRUPTED;
    }
    bool accepted = ui_.AskYesNo("Connect to server? [Y/n] ");
    if (InterruptRequested()) {
        logger_.Log("Interrupted at connect prompt");
        return ConnectResult::INTERRUPTED;
    }
    if (!accepted) {
        logger_.Log("Operator declined to connect");
        return ConnectResult::DECLINED;
    }

    Endpoint server(conf_.host, conf_.port);
    if (!communication_.Connect(server)) {
        ui_.Notify("Error sending SYN to " + server.ToString());
        return ConnectResult::FAILED;
    }
    return ConnectResult::CONNECTED;
}

SessionEnd Client::Run() {
    logger_.Log(__func__);
    SessionEnd end = communication_.Run();
    logger_.Log(std::string("Session ended: ") + ToString(end));
    return end;
}

Client::~Client() {
    logger_.Log("Client stopped");
}
