#include <tether/handle/element_handle.h>

#include <utility>

namespace tether::handle {

ElementHandle::ElementHandle(ExecutionContext& context, protocol::RemoteObject remote_object)
    : JSHandle(context, std::move(remote_object), HandleKind::Element) {}

} // namespace tether::handle
