#include "StateMachine.hpp"

#include <sstream>

const char* ToString(const SessionPhase& phase) {
    switch (phase) {
        case SessionPhase::IDLE:              return "IDLE";
        case SessionPhase::HANDSHAKE_PENDING: return "HANDSHAKE_PENDING";
        case SessionPhase::ACTIVE:            return "ACTIVE";
    }
    return "UNKNOWN";
}

SessionState::SessionState(const std::string& host_name, const uint16_t& port_number, const std::string& name)
    : host(host_name)
    , port(port_number)
    , username(name)
    , phase(SessionPhase::IDLE) {}

std::string SessionState::ChatIdentity() const {
    std::ostringstream oss;
    oss << "(" << host << ":" << port << ")" << username;
    return oss.str();
}

Decision Decision::Reply(const Message& message) {
    Decision decision;
    decision.type = DecisionType::REPLY;
    decision.message = message;
    return decision;
}

Decision Decision::ReplyAndClose(const Message& message) {
    Decision decision;
    decision.type = DecisionType::REPLY_AND_CLOSE;
    decision.message = message;
    return decision;
}

Decision Decision::Close(const std::string& reason) {
    Decision decision;
    decision.type = DecisionType::CLOSE;
    decision.reason = reason;
    return decision;
}

Decision Decision::NoReply() {
    Decision decision;
    decision.type = DecisionType::NO_REPLY;
    return decision;
}

Decision StateMachine::Handle(SessionState& session, const Message& incoming, Interaction& ui) {
    if (incoming.IsChat()) {
        return ProcessChat(session, incoming, ui);
    }

    switch (incoming.GetOperation()) {
        case Operation::SYN:
            return ProcessSyn(session, incoming, ui);
        case Operation::ACK:
            return ProcessAcknowledge(session, incoming, ui);
        case Operation::SYN_ACK:
            return ProcessSynAcknowledge(session, incoming, ui);
        case Operation::FIN:
            return ProcessFin(session);
        case Operation::ERR:
            return ProcessError(session, incoming);
    }
    return Decision::NoReply();
}

Decision StateMachine::ProcessSyn(SessionState& session, const Message& incoming, Interaction& ui) {
    if (session.Busy()) {
        return Decision::ReplyAndClose(
            Message::Control(session.username, Operation::ERR, false, "User already in another chat"));
    }

    ui.Notify("Connection request from " + incoming.GetUser());
    if (!ui.AskYesNo("Accept connection? [Y/n] ")) {
        return Decision::Reply(Message::Control(session.username, Operation::FIN));
    }

    session.phase = SessionPhase::HANDSHAKE_PENDING;
    return Decision::Reply(Message::Control(session.username, Operation::SYN_ACK));
}

Decision StateMachine::ProcessAcknowledge(SessionState& session, const Message& incoming, Interaction& ui) {
    session.phase = SessionPhase::ACTIVE;
    ui.Notify("Connected! with " + incoming.GetUser());
    std::string text = ui.AskText("[" + session.username + "]: ");
    return Decision::Reply(Message::Chat(session.ChatIdentity(), text));
}

Decision StateMachine::ProcessSynAcknowledge(SessionState& session, const Message& incoming, Interaction& ui) {
    if (session.Busy()) {
        return Decision::ReplyAndClose(
            Message::Control(session.username, Operation::ERR, false, session.username + " is busy"));
    }

    session.phase = SessionPhase::ACTIVE;
    ui.Notify("Connecting with " + incoming.GetUser() + "...");
    return Decision::Reply(Message::Control(session.username, Operation::ACK));
}

Decision StateMachine::ProcessFin(SessionState& session) {
    session.phase = SessionPhase::IDLE;
    return Decision::Close("Connection closed");
}

Decision StateMachine::ProcessError(SessionState& session, const Message& incoming) {
    session.phase = SessionPhase::IDLE;
    return Decision::Close(incoming.GetData());
}

Decision StateMachine::ProcessChat(SessionState& session, const Message& incoming, Interaction& ui) {
    if (!session.Busy()) {
        return Decision::ReplyAndClose(
            Message::Control(session.username, Operation::ERR, false, session.username + " is not in a chat"));
    }

    ui.Notify("[" + incoming.GetUser() + "]: " + incoming.GetData());
    std::string text = ui.AskText("[" + session.username + "]: ");
    return Decision::Reply(Message::Chat(session.ChatIdentity(), text));
}
