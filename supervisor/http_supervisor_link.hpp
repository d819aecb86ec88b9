#pragma once
#include "supervisor/supervisor_link.hpp"

// JSON over HTTP:
//   connect()  GET  <url>/health
//   exchange() POST <url>/auth
//   send()     POST <url>/events   (Authorization: Bearer <token>)
class HttpSupervisorLink : public SupervisorLink {
public:
    HttpSupervisorLink(std::string baseUrl, std::string token);

    std::string describe() const override { return baseUrl_; }

    bool connect(std::chrono::milliseconds timeout, std::string& err) override;
    bool exchange(const nlohmann::json& request, nlohmann::json& reply,
                  std::chrono::milliseconds timeout, std::string& err) override;
    SendResult send(const nlohmann::json& event,
                    std::chrono::milliseconds timeout, std::string& err) override;
    void close() override {}

private:
    std::string baseUrl_;
    std::string token_;
};
