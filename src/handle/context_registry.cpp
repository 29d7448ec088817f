#include <tether/handle/context_registry.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace tether::handle {

ContextRegistry::ContextRegistry(rpc::Session& session, HandleFactory factory,
                                 core::DiagnosticEmitter* emitter)
    : session_(session), factory_(std::move(factory)), emitter_(emitter) {}

ExecutionContext& ContextRegistry::create(int64_t context_id) {
    if (contexts_.count(context_id) > 0) {
        throw std::invalid_argument("execution context " + std::to_string(context_id) +
                                    " already exists");
    }
    auto context = std::make_unique<ExecutionContext>(session_, context_id, factory_, emitter_);
    auto it = contexts_.emplace(context_id, std::move(context)).first;
    return *it->second;
}

ExecutionContext* ContextRegistry::find(int64_t context_id) const {
    auto it = contexts_.find(context_id);
    return it == contexts_.end() ? nullptr : it->second.get();
}

bool ContextRegistry::destroy(int64_t context_id) {
    return contexts_.erase(context_id) > 0;
}

void ContextRegistry::clear() {
    contexts_.clear();
}

} // namespace tether::handle
