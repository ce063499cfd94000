#pragma once

/**
 * @file trace_logger.hpp
 * @brief Debug tracing for path selection, onion processing and session state.
 *
 * SECURITY WARNING: traces include peer addresses, session identifiers and
 * per-hop replay tags. Only enable EDGLI_DEBUG_TRACE for local debugging.
 * NEVER enable in production builds.
 *
 * Enable via CMake: -DEDGLI_DEBUG_TRACE=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace edgli::debug {

#ifdef EDGLI_DEBUG_TRACE

inline std::string ToHex(std::span<const uint8_t> data, size_t max_bytes = 8) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    const size_t count = data.size() < max_bytes ? data.size() : max_bytes;
    result.reserve(count * 2 + 3);
    for (size_t i = 0; i < count; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    if (count < data.size()) {
        result += "..";
    }
    return result;
}

#define EDGLI_TRACE_MSG(component, message) \
    do { \
        fprintf(stderr, "[EDGLI-TRACE] %s %s\n", component, message); \
        fflush(stderr); \
    } while(0)

#define EDGLI_TRACE_BYTES(component, name, data) \
    do { \
        fprintf(stderr, "[EDGLI-TRACE] %s %s: %s\n", \
            component, \
            name, \
            ::edgli::debug::ToHex(data).c_str()); \
        fflush(stderr); \
    } while(0)

#define EDGLI_TRACE_VALUE(component, name, value) \
    do { \
        fprintf(stderr, "[EDGLI-TRACE] %s %s: %s\n", \
            component, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stderr); \
    } while(0)

inline void TracePathSelected(
    std::span<const uint8_t> destination,
    size_t hop_count,
    size_t candidate_count) {

    EDGLI_TRACE_BYTES("PATH", "destination", destination);
    EDGLI_TRACE_VALUE("PATH", "hop_count", hop_count);
    EDGLI_TRACE_VALUE("PATH", "candidates", candidate_count);
}

inline void TracePacketEncoded(
    std::span<const uint8_t> first_hop,
    size_t path_length,
    std::string_view kind) {

    EDGLI_TRACE_MSG("ENCODE", kind.data());
    EDGLI_TRACE_BYTES("ENCODE", "first_hop", first_hop);
    EDGLI_TRACE_VALUE("ENCODE", "path_length", path_length);
}

inline void TraceHopDecoded(
    std::span<const uint8_t> replay_tag,
    bool is_final) {

    EDGLI_TRACE_BYTES("DECODE", "replay_tag", replay_tag);
    EDGLI_TRACE_MSG("DECODE", is_final ? "final hop" : "forward");
}

inline void TraceSessionTransition(
    std::span<const uint8_t> session_id,
    std::string_view from,
    std::string_view to) {

    fprintf(stderr, "[EDGLI-TRACE] SESSION %s: %.*s -> %.*s\n",
        ToHex(session_id).c_str(),
        static_cast<int>(from.size()), from.data(),
        static_cast<int>(to.size()), to.data());
    fflush(stderr);
}

inline void TraceRetransmit(
    std::span<const uint8_t> session_id,
    uint64_t sequence,
    uint32_t attempt) {

    EDGLI_TRACE_BYTES("RETRANSMIT", "session", session_id);
    EDGLI_TRACE_VALUE("RETRANSMIT", "sequence", sequence);
    EDGLI_TRACE_VALUE("RETRANSMIT", "attempt", attempt);
}

#else // !EDGLI_DEBUG_TRACE

#define EDGLI_TRACE_MSG(component, message) ((void)0)
#define EDGLI_TRACE_BYTES(component, name, data) ((void)0)
#define EDGLI_TRACE_VALUE(component, name, value) ((void)0)

inline void TracePathSelected(std::span<const uint8_t>, size_t, size_t) {}
inline void TracePacketEncoded(std::span<const uint8_t>, size_t, std::string_view) {}
inline void TraceHopDecoded(std::span<const uint8_t>, bool) {}
inline void TraceSessionTransition(std::span<const uint8_t>, std::string_view, std::string_view) {}
inline void TraceRetransmit(std::span<const uint8_t>, uint64_t, uint32_t) {}

#endif // EDGLI_DEBUG_TRACE

} // namespace edgli::debug
