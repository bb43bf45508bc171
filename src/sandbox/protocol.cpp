#include "sandbox/protocol.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <vector>

namespace pluginhost::protocol {

const char* message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::INIT:       return "INIT";
        case MessageType::READY:      return "READY";
        case MessageType::REQUEST:    return "REQUEST";
        case MessageType::RESPONSE:   return "RESPONSE";
        case MessageType::API_CALL:   return "API_CALL";
        case MessageType::API_RESULT: return "API_RESULT";
        case MessageType::EVENT:      return "EVENT";
        case MessageType::LOG:        return "LOG";
        case MessageType::SHUTDOWN:   return "SHUTDOWN";
    }
    return "UNKNOWN";
}

bool is_known_message_type(uint8_t raw) {
    return raw >= static_cast<uint8_t>(MessageType::INIT) &&
           raw <= static_cast<uint8_t>(MessageType::SHUTDOWN);
}

namespace {

bool read_all(int fd, void* data, size_t size) {
    auto* bytes = static_cast<uint8_t*>(data);
    size_t done = 0;
    while (done < size) {
        const ssize_t rc = ::recv(fd, bytes + done, size - done, 0);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (rc == 0) return false;
        done += static_cast<size_t>(rc);
    }
    return true;
}

bool write_all(int fd, const uint8_t* data, size_t size) {
    size_t sent = 0;
    while (sent < size) {
        const ssize_t rc = ::send(fd, data + sent, size - sent, MSG_NOSIGNAL);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (rc == 0) return false;
        sent += static_cast<size_t>(rc);
    }
    return true;
}

} // anonymous namespace

ReadStatus read_frame(int fd, Message& out) {
    uint8_t len_buf[4];
    if (!read_all(fd, len_buf, sizeof(len_buf))) return ReadStatus::CLOSED;

    const uint32_t length = (static_cast<uint32_t>(len_buf[0]) << 24) |
                            (static_cast<uint32_t>(len_buf[1]) << 16) |
                            (static_cast<uint32_t>(len_buf[2]) << 8) |
                             static_cast<uint32_t>(len_buf[3]);

    if (length < 1 || length > kMaxFrameBytes) return ReadStatus::MALFORMED;

    uint8_t raw_type = 0;
    if (!read_all(fd, &raw_type, 1)) return ReadStatus::CLOSED;

    std::vector<uint8_t> payload(length - 1);
    if (!payload.empty() && !read_all(fd, payload.data(), payload.size())) {
        return ReadStatus::CLOSED;
    }

    if (!is_known_message_type(raw_type)) return ReadStatus::MALFORMED;

    out.type = static_cast<MessageType>(raw_type);
    if (payload.empty()) {
        out.payload = nlohmann::json::object();
        return ReadStatus::OK;
    }
    out.payload = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
    if (out.payload.is_discarded()) return ReadStatus::MALFORMED;
    return ReadStatus::OK;
}

bool write_frame(int fd, const Message& msg) {
    const std::string body = msg.payload.dump();
    if (body.size() + 1 > kMaxFrameBytes) return false;

    const uint32_t length = static_cast<uint32_t>(1 + body.size());
    std::vector<uint8_t> frame;
    frame.reserve(5 + body.size());
    frame.push_back(static_cast<uint8_t>((length >> 24) & 0xFF));
    frame.push_back(static_cast<uint8_t>((length >> 16) & 0xFF));
    frame.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
    frame.push_back(static_cast<uint8_t>(length & 0xFF));
    frame.push_back(static_cast<uint8_t>(msg.type));
    frame.insert(frame.end(), body.begin(), body.end());

    return write_all(fd, frame.data(), frame.size());
}

nlohmann::json make_result(const std::string& id, nlohmann::json result) {
    return {{"id", id}, {"ok", true}, {"result", std::move(result)}};
}

nlohmann::json make_error(const std::string& id, ErrorKind kind, const std::string& message) {
    return {
        {"id", id},
        {"ok", false},
        {"error", {{"kind", error_kind_to_string(kind)}, {"message", message}}},
    };
}

PluginError decode_error(const nlohmann::json& payload) {
    std::string kind = "plugin_error";
    std::string message = "unknown plugin error";
    if (const auto it = payload.find("error"); it != payload.end() && it->is_object()) {
        if (const auto k = it->find("kind"); k != it->end() && k->is_string()) {
            kind = k->get<std::string>();
        }
        if (const auto m = it->find("message"); m != it->end() && m->is_string()) {
            message = m->get<std::string>();
        }
    }
    return PluginError(error_kind_from_string(kind), message);
}

} // namespace pluginhost::protocol
