#include "supervisor/http_supervisor_link.hpp"

#include <cpr/cpr.h>

HttpSupervisorLink::HttpSupervisorLink(std::string baseUrl, std::string token)
    : baseUrl_(std::move(baseUrl)), token_(std::move(token)) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
}

static std::string describeFailure(const cpr::Response& r) {
    if (r.error.code != cpr::ErrorCode::OK) return r.error.message;
    return "HTTP " + std::to_string(r.status_code);
}

bool HttpSupervisorLink::connect(std::chrono::milliseconds timeout, std::string& err) {
    if (baseUrl_.empty()) {
        err = "no supervisor url";
        return false;
    }

    try {
        auto r = cpr::Get(cpr::Url{baseUrl_ + "/health"},
                          cpr::Timeout{static_cast<int32_t>(timeout.count())});
        if (r.status_code >= 200 && r.status_code < 300) return true;
        err = describeFailure(r);
    } catch (const std::exception& e) {
        err = e.what();
    }
    return false;
}

bool HttpSupervisorLink::exchange(const nlohmann::json& request, nlohmann::json& reply,
                                  std::chrono::milliseconds timeout, std::string& err) {
    try {
        auto r = cpr::Post(cpr::Url{baseUrl_ + "/auth"},
                           cpr::Header{{"Content-Type", "application/json"}},
                           cpr::Body{request.dump()},
                           cpr::Timeout{static_cast<int32_t>(timeout.count())});
        if (r.status_code < 200 || r.status_code >= 300) {
            err = describeFailure(r);
            return false;
        }

        reply = nlohmann::json::parse(r.text, nullptr, false);
        if (reply.is_discarded()) {
            err = "malformed auth reply";
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        err = e.what();
        return false;
    }
}

SupervisorLink::SendResult HttpSupervisorLink::send(const nlohmann::json& event,
                                                    std::chrono::milliseconds timeout,
                                                    std::string& err) {
    try {
        auto r = cpr::Post(cpr::Url{baseUrl_ + "/events"},
                           cpr::Header{{"Content-Type", "application/json"},
                                       {"Authorization", "Bearer " + token_}},
                           cpr::Body{event.dump()},
                           cpr::Timeout{static_cast<int32_t>(timeout.count())});

        if (r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            err = "send timed out";
            return SendResult::Failed;
        }
        if (r.error.code != cpr::ErrorCode::OK) {
            err = r.error.message;
            return SendResult::Disconnected;
        }
        if (r.status_code == 401 || r.status_code == 403) {
            err = "session rejected (HTTP " + std::to_string(r.status_code) + ")";
            return SendResult::Disconnected;
        }
        if (r.status_code < 200 || r.status_code >= 300) {
            err = describeFailure(r);
            return SendResult::Failed;
        }
        return SendResult::Ok;
    } catch (const std::exception& e) {
        err = e.what();
        return SendResult::Failed;
    }
}
