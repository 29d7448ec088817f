#include <tether/rpc/message_pipe.h>
#include <tether/core/config.h>
#include <tether/core/errors.h>

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace tether::rpc {

namespace {

// Write exactly n bytes to fd, handling partial writes and EINTR.
bool write_all(int fd, const uint8_t* data, size_t len) {
    size_t written = 0;
    while (written < len) {
        ssize_t n = ::send(fd, data + written, len - written, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false;
        written += static_cast<size_t>(n);
    }
    return true;
}

// Read exactly n bytes from fd. Returns false on EOF or error.
bool read_all(int fd, uint8_t* buf, size_t len) {
    size_t total_read = 0;
    while (total_read < len) {
        ssize_t n = ::read(fd, buf + total_read, len - total_read);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false; // EOF
        total_read += static_cast<size_t>(n);
    }
    return true;
}

} // anonymous namespace

std::pair<MessagePipe, MessagePipe> MessagePipe::create_pair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
        throw core::TransportError(
            std::string("socketpair failed: ") + std::strerror(errno));
    }
    return {MessagePipe(fds[0]), MessagePipe(fds[1])};
}

MessagePipe::MessagePipe(int fd) : fd_(fd) {}

MessagePipe::~MessagePipe() {
    close();
}

MessagePipe::MessagePipe(MessagePipe&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

MessagePipe& MessagePipe::operator=(MessagePipe&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

bool MessagePipe::send(const Message& msg) {
    return send_frame(encode_message(msg));
}

std::optional<Message> MessagePipe::receive() {
    auto frame = receive_frame();
    if (!frame) return std::nullopt;
    return decode_message(*frame);
}

bool MessagePipe::send_frame(const std::vector<uint8_t>& frame) {
    if (!is_open()) return false;
    if (frame.size() > core::config::kMaxFrameSize) return false;

    // 4-byte length prefix in network byte order
    uint32_t net_len = htonl(static_cast<uint32_t>(frame.size()));
    auto* prefix = reinterpret_cast<const uint8_t*>(&net_len);
    if (!write_all(fd_, prefix, 4)) return false;

    if (!frame.empty()) {
        if (!write_all(fd_, frame.data(), frame.size())) return false;
    }
    return true;
}

std::optional<std::vector<uint8_t>> MessagePipe::receive_frame() {
    if (!is_open()) return std::nullopt;

    uint32_t net_len = 0;
    auto* prefix = reinterpret_cast<uint8_t*>(&net_len);
    if (!read_all(fd_, prefix, 4)) return std::nullopt;

    uint32_t len = ntohl(net_len);
    if (len > core::config::kMaxFrameSize) {
        close();
        return std::nullopt;
    }

    std::vector<uint8_t> frame(len);
    if (len > 0) {
        if (!read_all(fd_, frame.data(), len)) return std::nullopt;
    }
    return frame;
}

void MessagePipe::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool MessagePipe::is_open() const {
    return fd_ >= 0;
}

} // namespace tether::rpc
