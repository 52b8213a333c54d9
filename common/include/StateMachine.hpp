#ifndef STATE_MACHINE_HPP
#define STATE_MACHINE_HPP

#include <string>

#include "Message.hpp"
#include "Interaction.hpp"

enum class SessionPhase {
    IDLE,
    HANDSHAKE_PENDING,
    ACTIVE
};

const char* ToString(const SessionPhase& phase);

struct SessionState {
    SessionState() : port(0), phase(SessionPhase::IDLE) {}
    SessionState(const std::string& host_name, const uint16_t& port_number, const std::string& name);

    bool Busy() const { return phase == SessionPhase::ACTIVE; }
    // Identity stamped on outgoing chat messages: (host:port)username
    std::string ChatIdentity() const;

    std::string host;
    uint16_t port;
    std::string username;
    SessionPhase phase;
};

enum class DecisionType {
    REPLY,
    REPLY_AND_CLOSE,
    CLOSE,
    NO_REPLY
};

struct Decision {
    static Decision Reply(const Message& message);
    static Decision ReplyAndClose(const Message& message);
    static Decision Close(const std::string& reason);
    static Decision NoReply();

    bool HasReply() const { return type == DecisionType::REPLY || type == DecisionType::REPLY_AND_CLOSE; }
    bool Closes() const { return type == DecisionType::REPLY_AND_CLOSE || type == DecisionType::CLOSE; }

    DecisionType type = DecisionType::NO_REPLY;
    Message message;
    std::string reason;
};

/**
 * Connection state machine
 *
 * Maps the current session phase and one incoming message to the next
 * phase and the reply to send. Performs no I/O besides asking the operator
 * through the Interaction.
 */
class StateMachine {
public:
    static Decision Handle(SessionState& session, const Message& incoming, Interaction& ui);
private:
    static Decision ProcessSyn(SessionState& session, const Message& incoming, Interaction& ui);
    static Decision ProcessAcknowledge(SessionState& session, const Message& incoming, Interaction& ui);
    static Decision ProcessSynAcknowledge(SessionState& session, const Message& incoming, Interaction& ui);
    static Decision ProcessFin(SessionState& session);
    static Decision ProcessError(SessionState& session, const Message& incoming);
    static Decision ProcessChat(SessionState& session, const Message& incoming, Interaction& ui);
};

#endif // STATE_MACHINE_HPP
