#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace edgli {

inline constexpr uint32_t kWireVersion = 1;

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;
inline constexpr size_t kPeerIdBytes = 32;
inline constexpr size_t kSessionIdBytes = 16;
inline constexpr size_t kHmacBytes = 32;
inline constexpr size_t kStreamKeyBytes = 32;
inline constexpr size_t kAeadTagBytes = 16;
inline constexpr size_t kReplayTagBytes = 16;

// Onion packet layout
inline constexpr size_t kMaxPathLength = 5;
inline constexpr size_t kRoutingSlotBytes = 1 + kPeerIdBytes + kHmacBytes;
inline constexpr size_t kRoutingHeaderBytes = kMaxPathLength * kRoutingSlotBytes;
inline constexpr size_t kPacketBytes = 1024;
inline constexpr size_t kPacketHeaderBytes = kX25519PublicKeyBytes + kRoutingHeaderBytes + kHmacBytes;
inline constexpr size_t kPacketBodyBytes = kPacketBytes - kPacketHeaderBytes;
inline constexpr size_t kBodyPlaintextBytes = kPacketBodyBytes - kAeadTagBytes;
inline constexpr size_t kBodyPrefixBytes = 3;
inline constexpr size_t kMaxFragmentBytes = kBodyPlaintextBytes - kBodyPrefixBytes;

static_assert(kPacketBytes > kPacketHeaderBytes + kAeadTagBytes + kBodyPrefixBytes,
              "Packet size leaves no room for payload");

// Session framing
inline constexpr size_t kFrameOverheadBytes = 64;
inline constexpr size_t kMaxFramePayloadBytes = kMaxFragmentBytes - kFrameOverheadBytes;
inline constexpr size_t kMaxAcknowledgedPerUnit = 64;
inline constexpr size_t kAcknowledgementHeaderBytes = kSessionIdBytes + 1;

static_assert(kAcknowledgementHeaderBytes + kMaxAcknowledgedPerUnit * sizeof(uint64_t) <= kMaxFragmentBytes,
              "Acknowledgement unit must fit one packet");

// Key derivation labels
inline constexpr std::string_view kHeaderStreamInfo = "edgli-sphinx-rho";
inline constexpr std::string_view kHeaderMacInfo = "edgli-sphinx-mu";
inline constexpr std::string_view kBodyStreamInfo = "edgli-sphinx-pi";
inline constexpr std::string_view kBodyAeadInfo = "edgli-sphinx-aead";
inline constexpr std::string_view kBlindingInfo = "edgli-sphinx-blind";
inline constexpr std::string_view kReplayTagInfo = "edgli-sphinx-tag";

// Session defaults
inline constexpr std::chrono::milliseconds kDefaultRetransmitTimeout{800};
inline constexpr std::chrono::milliseconds kDefaultSetupTimeout{1500};
inline constexpr std::chrono::milliseconds kDefaultDrainTimeout{5000};
inline constexpr std::chrono::seconds kDefaultIdleTimeout{120};
inline constexpr std::chrono::milliseconds kDefaultTickInterval{50};
inline constexpr std::chrono::seconds kDefaultFailedSessionRetention{60};
inline constexpr uint32_t kDefaultMaxRetransmits = 5;
inline constexpr uint32_t kDefaultSetupAttempts = 3;
inline constexpr size_t kDefaultMaxSessions = 64;
inline constexpr size_t kDefaultHopCount = 3;
inline constexpr size_t kDefaultReorderWindow = 1024;
inline constexpr size_t kDefaultMaxFragmentsPerMessage = 128;

// Replay filter
inline constexpr std::chrono::minutes kReplayTagLifetime{10};
inline constexpr std::chrono::seconds kReplayCleanupInterval{30};
inline constexpr size_t kMaxTrackedReplayTags = 1 << 20;

}  // namespace edgli
