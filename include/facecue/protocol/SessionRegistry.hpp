/**
 * @file SessionRegistry.hpp
 * @brief Arena of live gesture sessions keyed by session identifier
 *
 * @copyright 2025 FaceCue Project
 * @license MIT License
 */

#ifndef FACECUE_PROTOCOL_SESSION_REGISTRY_HPP
#define FACECUE_PROTOCOL_SESSION_REGISTRY_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <facecue/protocol/GestureSession.hpp>

namespace facecue {
namespace protocol {

/**
 * @brief Creates the landmark backend of a new session
 */
using LandmarkProviderFactory = std::function<std::unique_ptr<face::ILandmarkProvider>()>;

/**
 * @brief Thread-safe session map
 *
 * A session lives from open() to close(). Lookups hand out shared
 * ownership so a session being processed outlives a concurrent close().
 */
class SessionRegistry {
public:
    /**
     * @throws core::ConfigException if config is invalid
     */
    SessionRegistry(const gesture::DetectorConfig& config,
                    LandmarkProviderFactory factory,
                    GestureSession::Clock clock = GestureSession::Clock(),
                    GestureSession::WallClock wall_clock = GestureSession::WallClock());

    /**
     * @brief Create a session
     * @param id Identifier; a fresh one is generated when empty
     * @throws core::Exception (ERROR_INVALID_PARAMETER) if the id is taken
     */
    std::shared_ptr<GestureSession> open(const std::string& id = "");

    /**
     * @return The session, or nullptr if unknown
     */
    std::shared_ptr<GestureSession> find(const std::string& id) const;

    /**
     * @brief Session on first frame: return the existing one or create it
     */
    std::shared_ptr<GestureSession> get_or_open(const std::string& id);

    /**
     * @brief Discard a session and its detector state
     * @return False if the id was unknown
     */
    bool close(const std::string& id);

    size_t size() const;
    std::vector<std::string> session_ids() const;

    const gesture::DetectorConfig& config() const { return config_; }

    static std::string generate_id();

private:
    gesture::DetectorConfig config_;
    LandmarkProviderFactory factory_;
    GestureSession::Clock clock_;
    GestureSession::WallClock wall_clock_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<GestureSession>> sessions_;

    std::shared_ptr<GestureSession> create_locked(const std::string& id);
};

} // namespace protocol
} // namespace facecue

#endif // FACECUE_PROTOCOL_SESSION_REGISTRY_HPP
