#pragma once
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

// ------------------------------------------------------------
// SupervisorLink
// Transport to the external observer. Only the broadcaster's sender
// thread calls into it. Every call is bounded by the timeout it is given.
// ------------------------------------------------------------
class SupervisorLink {
public:
    enum class SendResult {
        Ok,
        Failed,         // this message is lost, the link is still usable
        Disconnected    // the link is gone; reconnect before sending again
    };

    virtual ~SupervisorLink() = default;

    virtual std::string describe() const = 0;

    // Establish the transport.
    virtual bool connect(std::chrono::milliseconds timeout, std::string& err) = 0;

    // Request/response round trip, used for the auth handshake.
    virtual bool exchange(const nlohmann::json& request, nlohmann::json& reply,
                          std::chrono::milliseconds timeout, std::string& err) = 0;

    virtual SendResult send(const nlohmann::json& event,
                            std::chrono::milliseconds timeout, std::string& err) = 0;

    virtual void close() = 0;
};
