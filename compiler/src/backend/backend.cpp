#include "backend/backend.hpp"

#include "backend/direct_emitter.hpp"
#include "backend/toolchain_bridge.hpp"

namespace kir::backend {

auto backend_kind_name(BackendKind kind) -> const char* {
    switch (kind) {
    case BackendKind::Direct:
        return "direct";
    case BackendKind::Toolchain:
        return "toolchain";
    }
    return "unknown";
}

auto create_backend(BackendKind kind, const regalloc::TargetDesc& target)
    -> std::unique_ptr<Backend> {
    switch (kind) {
    case BackendKind::Direct:
        return std::make_unique<DirectEmitter>(target);
    case BackendKind::Toolchain:
        return std::make_unique<ToolchainBridge>(target);
    }
    return nullptr;
}

} // namespace kir::backend
