#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace pluginhost::protocol {

// Frame format:
// [4-byte big-endian length][1-byte msg_type][JSON payload]
// length counts the type byte plus the payload.
constexpr uint32_t kMaxFrameBytes = 16 * 1024 * 1024;

enum class MessageType : uint8_t {
    INIT       = 0x01,  // host -> worker {pluginId, pluginDir, main, permissions, config, manifest, apiCallTimeoutMs}
    READY      = 0x02,  // worker -> host {ok, name?, version?, error?}
    REQUEST    = 0x03,  // host -> worker {id, method, args}
    RESPONSE   = 0x04,  // worker -> host {id, ok, result | error}
    API_CALL   = 0x05,  // worker -> host {id, api, args}
    API_RESULT = 0x06,  // host -> worker {id, ok, result | error}
    EVENT      = 0x07,  // worker -> host {event, data}
    LOG        = 0x08,  // worker -> host {level, message}
    SHUTDOWN   = 0x09,  // host -> worker {}
};

[[nodiscard]] const char* message_type_to_string(MessageType type);
[[nodiscard]] bool is_known_message_type(uint8_t raw);

struct Message {
    MessageType type;
    nlohmann::json payload;
};

enum class ReadStatus { OK, CLOSED, MALFORMED };

/// Blocking read of one frame. CLOSED on EOF/socket error, MALFORMED on a bad
/// length, unknown type or unparsable JSON.
[[nodiscard]] ReadStatus read_frame(int fd, Message& out);

/// Blocking write of one frame. Callers serialize concurrent writers.
[[nodiscard]] bool write_frame(int fd, const Message& msg);

// ---- Payload helpers -------------------------------------------------------

/// {"id", "ok": true, "result"}
[[nodiscard]] nlohmann::json make_result(const std::string& id, nlohmann::json result);

/// {"id", "ok": false, "error": {"kind", "message"}}
[[nodiscard]] nlohmann::json make_error(const std::string& id, ErrorKind kind,
                                        const std::string& message);

/// Decode the error object of a RESPONSE / API_RESULT / READY payload.
/// Unknown kinds map to PLUGIN_ERROR.
[[nodiscard]] PluginError decode_error(const nlohmann::json& payload);

} // namespace pluginhost::protocol
