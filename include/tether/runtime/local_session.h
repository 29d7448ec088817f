#pragma once
#include <tether/rpc/session.h>
#include <cstddef>

namespace tether::runtime {

class RuntimeAgent;

// Session that hands each request straight to an in-process RuntimeAgent.
class LocalSession : public rpc::Session {
public:
    explicit LocalSession(RuntimeAgent& agent) : agent_(agent) {}

    protocol::JsonValue send(const std::string& method,
                             const protocol::JsonValue& params) override;

    std::size_t request_count() const { return request_count_; }

private:
    RuntimeAgent& agent_;
    std::size_t request_count_ = 0;
};

} // namespace tether::runtime
