#pragma once
#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"
#include "edgli/configuration/edge_client_config.hpp"
#include "edgli/identity/node_key_pair.hpp"
#include "edgli/interfaces/i_clock.hpp"
#include "edgli/interfaces/i_random_source.hpp"
#include "edgli/interfaces/i_relay_directory.hpp"
#include "edgli/interfaces/i_session_event_handler.hpp"
#include "edgli/interfaces/i_transport.hpp"
#include "edgli/session/session_manager.hpp"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <span>
#include <thread>

namespace edgli::client {

/**
 * @brief An edge node: local keys, relay directory, transport and the
 *        session layer on top of them
 *
 * Start() launches the driver thread that fires session timers every
 * tick_interval; Stop() (or destruction) joins it. Without Start() the
 * owner drives timers through Poll().
 *
 * Inbound bytes from the transport go to OnRawReceived().
 */
class EdgeClient {
public:
    /**
     * @param random Defaults to libsodium's CSPRNG
     * @param clock Defaults to std::chrono::steady_clock
     *
     * @return Config failure when `config` does not validate
     */
    static Result<std::unique_ptr<EdgeClient>, SessionFailure> Create(
        const configuration::EdgeClientConfig& config,
        identity::NodeKeyPair keys,
        std::shared_ptr<IRelayDirectory> directory,
        std::shared_ptr<ITransport> transport,
        std::shared_ptr<ISessionEventHandler> handler = nullptr,
        std::shared_ptr<IRandomSource> random = nullptr,
        std::shared_ptr<IClock> clock = nullptr);

    EdgeClient(const EdgeClient&) = delete;
    EdgeClient& operator=(const EdgeClient&) = delete;
    EdgeClient(EdgeClient&&) = delete;
    EdgeClient& operator=(EdgeClient&&) = delete;
    ~EdgeClient();

    /// @return InvalidState when already running
    Result<Unit, SessionFailure> Start();
    void Stop();
    [[nodiscard]] bool IsRunning() const;

    /// Open a session to a relay known to the directory.
    Result<session::SessionId, SessionFailure> Open(
        const identity::PeerId& destination,
        const session::OpenOptions& options = {});

    Result<session::SessionId, SessionFailure> Open(
        const identity::RelayIdentity& destination,
        const session::OpenOptions& options = {});

    Result<Unit, SessionFailure> Send(const session::SessionId& id, std::span<const uint8_t> message);
    Result<std::shared_ptr<session::MessageStream>, SessionFailure> Receive(const session::SessionId& id);
    Result<Unit, SessionFailure> Close(const session::SessionId& id);

    void OnRawReceived(std::span<const uint8_t> bytes);
    void Poll();

    [[nodiscard]] const identity::PeerId& Id() const noexcept { return keys_->Id(); }
    [[nodiscard]] const crypto::Key32& PublicKey() const noexcept { return keys_->PublicKey(); }
    [[nodiscard]] identity::RelayIdentity Identity() const { return keys_->ToRelayIdentity(); }
    [[nodiscard]] const configuration::EdgeClientConfig& Config() const noexcept { return config_; }
    [[nodiscard]] session::SessionManager& Manager() noexcept { return *manager_; }

private:
    EdgeClient(
        configuration::EdgeClientConfig config,
        std::shared_ptr<const identity::NodeKeyPair> keys,
        std::shared_ptr<IRelayDirectory> directory,
        std::shared_ptr<ISessionEventHandler> handler,
        std::shared_ptr<IClock> clock,
        std::shared_ptr<session::SessionManager> manager);

    void DriverLoop();

    const configuration::EdgeClientConfig config_;
    const std::shared_ptr<const identity::NodeKeyPair> keys_;
    const std::shared_ptr<IRelayDirectory> directory_;
    const std::shared_ptr<ISessionEventHandler> handler_;
    const std::shared_ptr<IClock> clock_;
    const std::shared_ptr<session::SessionManager> manager_;

    mutable std::mutex driver_lock_;
    std::condition_variable driver_wakeup_;
    std::thread driver_;
    bool running_;
    bool start_reported_;
};

}
