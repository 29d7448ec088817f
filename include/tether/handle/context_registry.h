#pragma once
#include <tether/handle/execution_context.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>

namespace tether::handle {

// Owns the execution contexts of one session, keyed by remote context id.
// Destroying a context here orphans the handles it produced; they can still
// be disposed but no longer evaluate anything.
class ContextRegistry {
public:
    explicit ContextRegistry(rpc::Session& session,
                             HandleFactory factory = default_handle_factory(),
                             core::DiagnosticEmitter* emitter = nullptr);

    // Throws std::invalid_argument if the id is already registered.
    ExecutionContext& create(int64_t context_id);
    ExecutionContext* find(int64_t context_id) const;
    bool destroy(int64_t context_id);
    void clear();

    std::size_t size() const { return contexts_.size(); }

private:
    rpc::Session& session_;
    HandleFactory factory_;
    core::DiagnosticEmitter* emitter_;
    std::unordered_map<int64_t, std::unique_ptr<ExecutionContext>> contexts_;
};

} // namespace tether::handle
