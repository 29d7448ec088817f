#pragma once
#include <tether/handle/js_handle.h>

namespace tether::handle {

// Handle to a remote DOM node (descriptor subtype "node").
class ElementHandle final : public JSHandle {
public:
    ElementHandle(ExecutionContext& context, protocol::RemoteObject remote_object);
};

} // namespace tether::handle
