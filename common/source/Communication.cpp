#include "Communication.hpp"
#include "Codec.hpp"
#include "Errors.hpp"
#include "Signals.hpp"

#include <sstream>

const char* ToString(const SessionEnd& end) {
    switch (end) {
        case SessionEnd::CLOSED:          return "CLOSED";
        case SessionEnd::PEER_CLOSED:     return "PEER_CLOSED";
        case SessionEnd::QUIT:            return "QUIT";
        case SessionEnd::ABORTED:         return "ABORTED";
        case SessionEnd::INTERRUPTED:     return "INTERRUPTED";
        case SessionEnd::TRANSPORT_ERROR: return "TRANSPORT_ERROR";
    }
    return "UNKNOWN";
}

Communication::Communication(Transport& transport, Interaction& ui, SessionState& session, Logger& logger,
                             const uint32_t& resend_timeout, const size_t& buffer_size)
    : transport_(transport)
    , ui_(ui)
    , session_(session)
    , logger_(logger)
    , resend_timeout_(resend_timeout)
    , buffer_size_(buffer_size)
    , timeout_armed_(false)
    , has_latest_message_(false) {}

bool Communication::Connect(const Endpoint& peer) {
    logger_.Log(__func__);
    peer_ = peer;
    Message syn = Message::Control(session_.username, Operation::SYN);
    if (!SendMessage(syn)) {
        return false;
    }
    latest_message_ = syn;
    has_latest_message_ = true;
    session_.phase = SessionPhase::HANDSHAKE_PENDING;
    return true;
}

SessionEnd Communication::Run() {
    logger_.Log(__func__);
    while (true) {
        if (InterruptRequested()) {
            logger_.Log("Interrupt requested");
            return SessionEnd::INTERRUPTED;
        }

        ReceiveResult received = transport_.Receive(buffer_size_);
        switch (received.status) {
            case ReceiveStatus::TIMEOUT: {
                if (!Resend()) {
                    return SessionEnd::TRANSPORT_ERROR;
                }
                continue;
            }
            case ReceiveStatus::INTERRUPTED: {
                logger_.Log("Receive interrupted");
                return SessionEnd::INTERRUPTED;
            }
            case ReceiveStatus::ERROR: {
                logger_.Log("Receive failed");
                return SessionEnd::TRANSPORT_ERROR;
            }
            case ReceiveStatus::DATA: {
                break;
            }
        }
        peer_ = received.peer;

        Message incoming;
        try {
            incoming = Message::FromBytes(received.data).first;
        } catch (const SimpError& e) {
            logger_.Log(std::string("Decode failed: ") + e.what());
            ui_.Notify(std::string("<ERROR> ABORTING CONNECTION.\n") + e.what());
            return SessionEnd::ABORTED;
        }

        if (!PayloadLengthMatches(incoming.GetHeader(), incoming.GetData().size())) {
            std::ostringstream oss;
            oss << "Declared payload length " << incoming.GetHeader().length
                << " differs from received " << incoming.GetData().size() << " bytes";
            logger_.Log(oss.str());
        }
        logger_.Log("Received " + incoming.ToString() + " from " + peer_.ToString());

        SessionPhase before = session_.phase;
        Decision decision = StateMachine::Handle(session_, incoming, ui_);
        if (before != session_.phase) {
            logger_.Log(std::string("Phase ") + ToString(before) + " -> " + ToString(session_.phase));
        }
        // Operator prompts may have been cut short by SIGINT; nothing is sent then.
        if (InterruptRequested()) {
            logger_.Log("Interrupt requested while handling " + incoming.ToString());
            return SessionEnd::INTERRUPTED;
        }

        switch (decision.type) {
            case DecisionType::NO_REPLY: {
                continue;
            }
            case DecisionType::CLOSE: {
                logger_.Log("Connection closed by peer: " + decision.reason);
                ui_.Notify("<ERROR> ABORTING CONNECTION.\n" + decision.reason);
                return SessionEnd::PEER_CLOSED;
            }
            case DecisionType::REPLY:
            case DecisionType::REPLY_AND_CLOSE: {
                break;
            }
        }

        const Message& reply = decision.message;
        if (reply.IsChat() && reply.GetData() == "quit") {
            SendFin();
            return SessionEnd::QUIT;
        }
        if (reply.IsChat()) {
            ArmResendTimeout();
        }

        latest_message_ = reply;
        has_latest_message_ = true;
        if (!SendMessage(reply)) {
            return SessionEnd::TRANSPORT_ERROR;
        }

        if (decision.type == DecisionType::REPLY_AND_CLOSE) {
            SendFin();
            return SessionEnd::CLOSED;
        }
    }
}

bool Communication::SendMessage(const Message& message) {
    logger_.Log("Send " + message.ToString() + " to " + peer_.ToString());
    return transport_.Send(message.ToBytes(), peer_);
}

void Communication::SendFin() {
    if (!SendMessage(Message::Control(session_.username, Operation::FIN))) {
        logger_.Log("FIN could not be sent to " + peer_.ToString());
    }
}

bool Communication::Resend() {
    if (!has_latest_message_) {
        logger_.Log("No message to resend");
        return true;
    }

    latest_message_ = latest_message_.WithSequence(Sequence::RE);
    logger_.Log("Resending latest message");
    return SendMessage(latest_message_);
}

void Communication::ArmResendTimeout() {
    if (timeout_armed_) {
        return;
    }
    transport_.SetReceiveTimeout(resend_timeout_);
    timeout_armed_ = true;

    std::ostringstream oss;
    oss << "Resend timeout set to " << resend_timeout_ << "s";
    logger_.Log(oss.str());
}
