#include "edgli/client/edge_client.hpp"
#include "edgli/crypto/sodium_interop.hpp"
#include "edgli/crypto/sodium_random_source.hpp"
#include "edgli/path/path_selector.hpp"
#include "edgli/core/format.hpp"
#include "edgli/debug/trace_logger.hpp"
#include <utility>

namespace edgli::client {
    using configuration::EdgeClientConfig;
    using crypto::SodiumInterop;
    using identity::NodeKeyPair;
    using identity::PeerId;
    using identity::RelayIdentity;
    using session::MessageStream;
    using session::OpenOptions;
    using session::SessionId;
    using session::SessionManager;

    Result<std::unique_ptr<EdgeClient>, SessionFailure> EdgeClient::Create(
        const EdgeClientConfig& config,
        NodeKeyPair keys,
        std::shared_ptr<IRelayDirectory> directory,
        std::shared_ptr<ITransport> transport,
        std::shared_ptr<ISessionEventHandler> handler,
        std::shared_ptr<IRandomSource> random,
        std::shared_ptr<IClock> clock) {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<std::unique_ptr<EdgeClient>, SessionFailure>::Err(
                SessionFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        if (auto valid = config.Validate(); valid.IsErr()) {
            return Result<std::unique_ptr<EdgeClient>, SessionFailure>::Err(valid.UnwrapErr());
        }
        if (!directory || !transport) {
            return Result<std::unique_ptr<EdgeClient>, SessionFailure>::Err(
                SessionFailure::InvalidInput("Relay directory and transport are required"));
        }
        if (!random) {
            random = std::make_shared<crypto::SodiumRandomSource>();
        }
        if (!clock) {
            clock = std::make_shared<SteadyClock>();
        }

        auto shared_keys = std::make_shared<const NodeKeyPair>(std::move(keys));
        auto selector = std::make_shared<path::PathSelector>(directory, random);
        auto manager_result = SessionManager::Create(
            shared_keys, config.session, std::move(transport), std::move(selector),
            std::move(random), clock, config.replay_tag_lifetime);
        if (manager_result.IsErr()) {
            return Result<std::unique_ptr<EdgeClient>, SessionFailure>::Err(manager_result.UnwrapErr());
        }
        auto manager = std::move(manager_result).Unwrap();
        manager->SetEventHandler(handler);

        return Result<std::unique_ptr<EdgeClient>, SessionFailure>::Ok(
            std::unique_ptr<EdgeClient>(new EdgeClient(
                config, std::move(shared_keys), std::move(directory), std::move(handler),
                std::move(clock), std::move(manager))));
    }

    EdgeClient::EdgeClient(
        EdgeClientConfig config,
        std::shared_ptr<const NodeKeyPair> keys,
        std::shared_ptr<IRelayDirectory> directory,
        std::shared_ptr<ISessionEventHandler> handler,
        std::shared_ptr<IClock> clock,
        std::shared_ptr<SessionManager> manager)
        : config_(std::move(config))
          , keys_(std::move(keys))
          , directory_(std::move(directory))
          , handler_(std::move(handler))
          , clock_(std::move(clock))
          , manager_(std::move(manager))
          , running_(false)
          , start_reported_(false) {
    }

    EdgeClient::~EdgeClient() {
        Stop();
    }

    Result<Unit, SessionFailure> EdgeClient::Start() {
        bool report = false;
        {
            std::lock_guard guard(driver_lock_);
            if (running_) {
                return Result<Unit, SessionFailure>::Err(
                    SessionFailure::InvalidState("Edge client is already running"));
            }
            running_ = true;
            report = !start_reported_;
            start_reported_ = true;
            driver_ = std::thread([this] { DriverLoop(); });
        }
        EDGLI_TRACE_BYTES("CLIENT", "started node", Id().AsSpan());
        if (report && handler_) {
            handler_->OnNodeStarted(Id(), PublicKey());
        }
        return Result<Unit, SessionFailure>::Ok(unit);
    }

    void EdgeClient::Stop() {
        std::thread driver;
        {
            std::lock_guard guard(driver_lock_);
            if (!running_) {
                return;
            }
            running_ = false;
            driver = std::move(driver_);
        }
        driver_wakeup_.notify_all();
        if (driver.joinable()) {
            driver.join();
        }
    }

    bool EdgeClient::IsRunning() const {
        std::lock_guard guard(driver_lock_);
        return running_;
    }

    void EdgeClient::DriverLoop() {
        std::unique_lock lock(driver_lock_);
        while (running_) {
            driver_wakeup_.wait_for(lock, config_.tick_interval, [this] { return !running_; });
            if (!running_) {
                break;
            }
            lock.unlock();
            manager_->Poll(clock_->Now());
            lock.lock();
        }
    }

    Result<SessionId, SessionFailure> EdgeClient::Open(const PeerId& destination, const OpenOptions& options) {
        for (const auto& relay : directory_->KnownRelays()) {
            if (relay.address == destination) {
                return manager_->Open(relay, options);
            }
        }
        return Result<SessionId, SessionFailure>::Err(
            SessionFailure::NoRouteAvailable(
                compat::format("Destination {} is not in the relay directory", destination.ShortHex())));
    }

    Result<SessionId, SessionFailure> EdgeClient::Open(const RelayIdentity& destination, const OpenOptions& options) {
        return manager_->Open(destination, options);
    }

    Result<Unit, SessionFailure> EdgeClient::Send(const SessionId& id, std::span<const uint8_t> message) {
        return manager_->Send(id, message);
    }

    Result<std::shared_ptr<MessageStream>, SessionFailure> EdgeClient::Receive(const SessionId& id) {
        return manager_->Receive(id);
    }

    Result<Unit, SessionFailure> EdgeClient::Close(const SessionId& id) {
        return manager_->Close(id);
    }

    void EdgeClient::OnRawReceived(std::span<const uint8_t> bytes) {
        manager_->OnRawReceived(bytes);
    }

    void EdgeClient::Poll() {
        manager_->Poll(clock_->Now());
    }
}
