#ifndef COMMUNICATION_HPP
#define COMMUNICATION_HPP

#include <string>

#include "Protocol.hpp"
#include "Message.hpp"
#include "StateMachine.hpp"
#include "Transport.hpp"
#include "Interaction.hpp"
#include "Logger.hpp"

enum class SessionEnd {
    CLOSED,           // we replied ERR and sent FIN
    PEER_CLOSED,      // peer sent FIN or ERR
    QUIT,             // operator typed quit
    ABORTED,          // undecodable datagram
    INTERRUPTED,
    TRANSPORT_ERROR
};

const char* ToString(const SessionEnd& end);

/**
 * Communication loop shared by server and client.
 *
 * Receives a datagram, hands the decoded message to the StateMachine and
 * sends back its reply. The last reply is kept and resent with the RE flag
 * whenever the receive times out. The timeout is armed by the first chat
 * reply and never disarmed.
 */
class Communication {
public:
    Communication(Transport& transport, Interaction& ui, SessionState& session, Logger& logger,
                  const uint32_t& resend_timeout = RESEND_TIMEOUT_SECONDS,
                  const size_t& buffer_size = BUFFER_SIZE);
    Communication(const Communication&) = delete;

    // Starts the handshake by sending SYN to peer.
    bool Connect(const Endpoint& peer);
    SessionEnd Run();

    bool HasLatestMessage() const { return has_latest_message_; }
    const Message& GetLatestMessage() const { return latest_message_; }
    const Endpoint& GetPeer() const { return peer_; }
private:
    bool SendMessage(const Message& message);
    void SendFin();
    bool Resend();
    void ArmResendTimeout();

    Transport& transport_;
    Interaction& ui_;
    SessionState& session_;
    Logger& logger_;
    uint32_t resend_timeout_;
    size_t buffer_size_;
    bool timeout_armed_;
    bool has_latest_message_;
    Message latest_message_;
    Endpoint peer_;
};

#endif // COMMUNICATION_HPP
