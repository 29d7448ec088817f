#include <tether/runtime/local_session.h>
#include <tether/runtime/runtime_agent.h>

namespace tether::runtime {

protocol::JsonValue LocalSession::send(const std::string& method,
                                       const protocol::JsonValue& params) {
    ++request_count_;
    return agent_.dispatch(method, params);
}

} // namespace tether::runtime
