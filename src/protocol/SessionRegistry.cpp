/**
 * @file SessionRegistry.cpp
 * @brief Session arena implementation
 */

#include "facecue/protocol/SessionRegistry.hpp"
#include "facecue/core/exception.h"
#include "facecue/core/Logger.hpp"

#include <atomic>
#include <iomanip>
#include <random>
#include <sstream>

namespace facecue {
namespace protocol {

SessionRegistry::SessionRegistry(const gesture::DetectorConfig& config,
                                 LandmarkProviderFactory factory,
                                 GestureSession::Clock clock,
                                 GestureSession::WallClock wall_clock)
    : config_(config)
    , factory_(std::move(factory))
    , clock_(std::move(clock))
    , wall_clock_(std::move(wall_clock)) {
    config_.validate();
    if (!factory_) {
        FACECUE_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                           "Session registry needs a landmark provider factory");
    }
}

std::string SessionRegistry::generate_id() {
    static std::atomic<uint64_t> counter{0};
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(12) << (rng() & 0xFFFFFFFFFFFFULL)
       << "-" << std::dec << ++counter;
    return ss.str();
}

std::shared_ptr<GestureSession> SessionRegistry::create_locked(const std::string& id) {
    auto session = std::make_shared<GestureSession>(id, config_, factory_(), clock_, wall_clock_);
    sessions_.emplace(id, session);
    FACECUE_LOG_INFO("SessionRegistry") << "Session " << id << " opened ("
                                        << sessions_.size() << " active)";
    return session;
}

std::shared_ptr<GestureSession> SessionRegistry::open(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string session_id = id;
    if (session_id.empty()) {
        do {
            session_id = generate_id();
        } while (sessions_.count(session_id) > 0);
    } else if (sessions_.count(session_id) > 0) {
        FACECUE_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                           "Session already exists: " + session_id);
    }
    return create_locked(session_id);
}

std::shared_ptr<GestureSession> SessionRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<GestureSession> SessionRegistry::get_or_open(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it != sessions_.end()) {
        return it->second;
    }
    return create_locked(id);
}

bool SessionRegistry::close(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(id) == 0) {
        return false;
    }
    FACECUE_LOG_INFO("SessionRegistry") << "Session " << id << " closed ("
                                        << sessions_.size() << " active)";
    return true;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::session_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace protocol
} // namespace facecue
