// KIR Diagnostics Implementation

#include "ir/diagnostic.hpp"

#include <sstream>

namespace kir::ir {

auto diagnostic_kind_name(DiagnosticKind kind) -> const char* {
    switch (kind) {
    case DiagnosticKind::MalformedIr:
        return "malformed IR";
    case DiagnosticKind::UnsupportedOpcode:
        return "unsupported opcode";
    case DiagnosticKind::AllocationExhaustion:
        return "allocation exhaustion";
    case DiagnosticKind::InternalCompilerError:
        return "internal compiler error";
    }
    return "error";
}

auto stage_name(Stage stage) -> const char* {
    switch (stage) {
    case Stage::Build:
        return "build";
    case Stage::Verify:
        return "verify";
    case Stage::Ssa:
        return "ssa";
    case Stage::Optimize:
        return "optimize";
    case Stage::RegAlloc:
        return "regalloc";
    case Stage::Backend:
        return "backend";
    case Stage::Driver:
        return "driver";
    }
    return "?";
}

auto Diagnostic::to_string() const -> std::string {
    std::ostringstream out;
    out << stage_name(stage) << " " << diagnostic_kind_name(kind);
    if (!function.empty()) {
        out << " in '" << function << "'";
    }
    out << ": " << message;
    if (span) {
        out << " (at " << span->to_string() << ")";
    }
    for (const auto& note : notes) {
        out << "\n  note: " << note;
    }
    return out.str();
}

auto make_diagnostic(DiagnosticKind kind, Stage stage, std::string function, std::string message,
                     std::optional<SourceSpan> span) -> Diagnostic {
    return Diagnostic{kind, stage, std::move(function), std::move(message), std::move(span), {}};
}

} // namespace kir::ir
