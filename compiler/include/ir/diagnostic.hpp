// KIR Diagnostics
//
// Structured error records surfaced to the driver. Every fatal condition in
// the midend is reported as a Diagnostic carried in a Result; nothing throws
// across component boundaries.
//
// Categories:
// - MalformedIr: an invariant violation caught by the verifier
// - UnsupportedOpcode: a backend has no lowering for an instruction
// - AllocationExhaustion: register allocation failed even with spilling
// - InternalCompilerError: lowering met an unrepresentable type, or the
//   compile was cancelled between passes
//
// Pass refusals are not diagnostics; passes log them at debug level.

#pragma once

#include "common.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kir::ir {

enum class DiagnosticKind {
    MalformedIr,
    UnsupportedOpcode,
    AllocationExhaustion,
    InternalCompilerError,
};

enum class Stage {
    Build,
    Verify,
    Ssa,
    Optimize,
    RegAlloc,
    Backend,
    Driver,
};

[[nodiscard]] auto diagnostic_kind_name(DiagnosticKind kind) -> const char*;
[[nodiscard]] auto stage_name(Stage stage) -> const char*;

struct Diagnostic {
    DiagnosticKind kind;
    Stage stage;
    std::string function; // Empty when not tied to a function
    std::string message;
    std::optional<SourceSpan> span;
    std::vector<std::string> notes;

    // "<stage> error in '<function>': <message> (at file:line:col)"
    [[nodiscard]] auto to_string() const -> std::string;
};

auto make_diagnostic(DiagnosticKind kind, Stage stage, std::string function, std::string message,
                     std::optional<SourceSpan> span = std::nullopt) -> Diagnostic;

} // namespace kir::ir
