#pragma once
#include <tether/rpc/message.h>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace tether::rpc {

// Length-prefixed message framing over a connected stream socket.
class MessagePipe {
public:
    // Create a pair of connected pipes (for in-process sessions and tests)
    static std::pair<MessagePipe, MessagePipe> create_pair();

    // Takes ownership of an existing connected descriptor
    explicit MessagePipe(int fd);

    ~MessagePipe();

    // Move-only
    MessagePipe(MessagePipe&& other) noexcept;
    MessagePipe& operator=(MessagePipe&& other) noexcept;
    MessagePipe(const MessagePipe&) = delete;
    MessagePipe& operator=(const MessagePipe&) = delete;

    // False when the pipe is closed or the peer went away.
    bool send(const Message& msg);

    // Nullopt on EOF, on a closed pipe, or on a frame above
    // config::kMaxFrameSize (the pipe is closed in that case). Throws
    // protocol::DecodeError when a complete frame fails to decode.
    std::optional<Message> receive();

    void close();
    bool is_open() const;

    int fd() const { return fd_; }

private:
    int fd_ = -1;

    bool send_frame(const std::vector<uint8_t>& frame);
    std::optional<std::vector<uint8_t>> receive_frame();
};

} // namespace tether::rpc
