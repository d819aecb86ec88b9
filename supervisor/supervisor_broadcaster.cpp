#include "supervisor/supervisor_broadcaster.hpp"
#include "logger.hpp"

#include <algorithm>

using json = nlohmann::json;
using std::chrono::milliseconds;

SupervisorEventBroadcaster::SupervisorEventBroadcaster(std::unique_ptr<SupervisorLink> link,
                                                       BroadcasterConfig cfg)
    : link_(std::move(link)), cfg_(std::move(cfg)) {
    cfg_.outboxCapacity = std::max<size_t>(1, cfg_.outboxCapacity);
}

SupervisorEventBroadcaster::~SupervisorEventBroadcaster() {
    stop();
}

milliseconds SupervisorEventBroadcaster::backoffDelay(int attempt, milliseconds initial, milliseconds max) {
    if (attempt < 1) attempt = 1;
    milliseconds delay = initial;
    for (int i = 1; i < attempt && delay < max; ++i) delay *= 2;
    return std::min(delay, max);
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------
void SupervisorEventBroadcaster::start() {
    if (running_.exchange(true)) return;
    if (!link_) {
        running_ = false;
        LOG_WARN("Supervisor", "No link configured, broadcaster not started");
        return;
    }
    thread_ = std::thread(&SupervisorEventBroadcaster::run, this);
    LOG_DEBUG("Supervisor", "Broadcaster started -> " + link_->describe());
}

void SupervisorEventBroadcaster::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_.exchange(false) && !thread_.joinable()) return;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();

    if (link_) link_->close();
    connected_ = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        outbox_.clear();
        pendingAmplitude_.reset();
        stats_.connected = false;
    }
    LOG_DEBUG("Supervisor", "Broadcaster stopped");
}

// ------------------------------------------------------------
// Producers (audio loop side): never wait on the link
// ------------------------------------------------------------
void SupervisorEventBroadcaster::publishTranscription(const TranscriptionEvent& ev) {
    json msg = SupervisorEvents::transcription(ev);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_ || !connected_) {
            ++stats_.dropped;
            return;
        }
        outbox_.push_back(std::move(msg));
        if (outbox_.size() > cfg_.outboxCapacity) {
            outbox_.pop_front();
            ++stats_.dropped;
        }
    }
    cv_.notify_one();
}

void SupervisorEventBroadcaster::publishAmplitude(float value) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_ || !connected_) return;
        pendingAmplitude_ = value;
    }
    cv_.notify_one();
}

SupervisorEventBroadcaster::Stats SupervisorEventBroadcaster::stats() const {
    std::lock_guard<std::mutex> lock(mtx_);
    Stats s = stats_;
    s.connected = connected_.load();
    return s;
}

// ------------------------------------------------------------
// Sender thread
// ------------------------------------------------------------
bool SupervisorEventBroadcaster::waitFor(milliseconds d) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait_for(lock, d, [&] { return !running_.load(); });
    return running_.load();
}

void SupervisorEventBroadcaster::dropOutbox() {
    std::lock_guard<std::mutex> lock(mtx_);
    stats_.dropped += outbox_.size();
    outbox_.clear();
    pendingAmplitude_.reset();
}

bool SupervisorEventBroadcaster::tryConnect() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        ++stats_.connectAttempts;
    }

    std::string err;
    if (!link_->connect(cfg_.sendTimeout, err)) {
        LOG_TRACE("Supervisor", "Connect failed: " + err);
        return false;
    }

    json reply;
    bool success = false;
    if (!link_->exchange(SupervisorEvents::auth(cfg_.authToken), reply, cfg_.sendTimeout, err)) {
        link_->close();
        LOG_TRACE("Supervisor", "Auth exchange failed: " + err);
        return false;
    }
    if (!SupervisorEvents::parseAuthResult(reply, success) || !success) {
        link_->close();
        {
            std::lock_guard<std::mutex> lock(mtx_);
            ++stats_.authFailures;
        }
        ErrorManager::reportTo(errorSink_, ErrorKind::SupervisorLink, "ERR_SUPERVISOR_AUTH", link_->describe());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        ++stats_.connects;
        connected_ = true;
    }
    LOG_DEBUG("Supervisor", "Connected and authenticated: " + link_->describe());
    return true;
}

void SupervisorEventBroadcaster::sendOne(const json& msg) {
    std::string err;
    auto result = link_->send(msg, cfg_.sendTimeout, err);

    switch (result) {
        case SupervisorLink::SendResult::Ok: {
            std::lock_guard<std::mutex> lock(mtx_);
            ++stats_.sent;
            break;
        }
        case SupervisorLink::SendResult::Failed: {
            bool first;
            {
                std::lock_guard<std::mutex> lock(mtx_);
                first = (stats_.sendFailures == 0);
                ++stats_.sendFailures;
                ++stats_.dropped;
            }
            if (first) {
                ErrorManager::reportTo(errorSink_, ErrorKind::SupervisorLink, "ERR_SUPERVISOR_SEND", err);
            } else {
                LOG_TRACE("Supervisor", "Event dropped: " + err);
            }
            break;
        }
        case SupervisorLink::SendResult::Disconnected:
            connected_ = false;
            link_->close();
            {
                std::lock_guard<std::mutex> lock(mtx_);
                ++stats_.dropped;
            }
            dropOutbox();
            ErrorManager::reportTo(errorSink_, ErrorKind::SupervisorLink, "ERR_SUPERVISOR_CONNECT",
                                   "link lost: " + err);
            break;
    }
}

void SupervisorEventBroadcaster::run() {
    int attempt = 0;                 // failed connects since the last success
    bool reportedDown = false;
    auto lastAmplitude = std::chrono::steady_clock::now() - cfg_.amplitudeInterval;

    while (running_) {
        if (!connected_) {
            if (attempt > 0) {
                auto delay = backoffDelay(attempt, cfg_.initialBackoff, cfg_.maxBackoff);
                LOG_TRACE("Supervisor", "Reconnect in " + std::to_string(delay.count()) + " ms");
                if (!waitFor(delay)) break;
            }

            if (tryConnect()) {
                attempt = 0;
                reportedDown = false;
            } else {
                ++attempt;
                if (!reportedDown) {
                    ErrorManager::reportTo(errorSink_, ErrorKind::SupervisorLink, "ERR_SUPERVISOR_CONNECT",
                                           link_->describe());
                    reportedDown = true;
                }
            }
            continue;
        }

        std::optional<json> next;
        std::optional<float> amplitude;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            auto amplitudeDue = [&] {
                return pendingAmplitude_.has_value() &&
                       std::chrono::steady_clock::now() - lastAmplitude >= cfg_.amplitudeInterval;
            };
            cv_.wait_for(lock, cfg_.amplitudeInterval, [&] {
                return !running_.load() || !connected_.load() || !outbox_.empty() || amplitudeDue();
            });
            if (!running_) break;

            if (!outbox_.empty()) {
                next = std::move(outbox_.front());
                outbox_.pop_front();
            } else if (amplitudeDue()) {
                amplitude = *pendingAmplitude_;
                pendingAmplitude_.reset();
            }
        }

        if (next) {
            sendOne(*next);
        } else if (amplitude) {
            lastAmplitude = std::chrono::steady_clock::now();
            sendOne(SupervisorEvents::amplitude(*amplitude));
        }

        if (!connected_) {
            // Link lost (already reported): first retry waits initialBackoff
            attempt = 1;
            reportedDown = true;
        }
    }
}
