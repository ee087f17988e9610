#pragma once

// Linear-Scan Register Allocation
//
// Intervals of each register class are swept in order of start. Intervals
// whose end precedes the new start expire and free their register. When no
// register is free, the active interval with the furthest end is spilled;
// that may be the new interval itself. Ties between equal ends keep the
// interval that is already active.
//
// Spilled values are rewritten into explicit frame traffic:
// - the definition writes a fresh register and a STORE to the value's spill
//   slot follows it
// - every use reads a fresh register loaded from the slot immediately before
//   the use
// Reload and spilled-definition registers are placed in the class's scratch
// registers, then in allocatable registers that hold nothing at that point.
// Where one instruction needs more of them than that, the interval through it
// with the furthest end is spilled as well. AllocationExhaustion is left for
// an instruction whose own operands need more registers than exist.
//
// Phis, parameters and phi operands on an edge never need a register for
// spill traffic. A spilled phi result, a spilled parameter, and the reload of
// a spilled phi operand before the terminator are located in the slot itself;
// the backend copies slot to slot on the edge and elides their LOAD/STORE.
//
// After allocation every other register of the function has a physical
// register. Spilled values keep a SpillSlot entry in the result for reporting.

#include "ir/diagnostic.hpp"
#include "ir/ir.hpp"
#include "regalloc/live_intervals.hpp"
#include "regalloc/target.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kir::regalloc {

struct Location {
    enum class Kind {
        None,
        Register,
        SpillSlot,
        Constant,
        Global,
    };

    Kind kind = Kind::None;
    std::string reg;   // Register
    uint32_t slot = 0; // SpillSlot

    static auto in_register(std::string name) -> Location {
        return Location{Kind::Register, std::move(name), 0};
    }
    static auto in_slot(uint32_t slot) -> Location {
        return Location{Kind::SpillSlot, {}, slot};
    }

    [[nodiscard]] auto to_string() const -> std::string;
};

struct AllocationResult {
    std::string function;
    std::unordered_map<ir::ValueId, Location> locations;
    std::map<ir::ValueId, uint32_t> spilled; // Spilled value -> slot
    uint32_t spill_slot_count = 0;
    size_t reloads_inserted = 0;
    size_t stores_inserted = 0;

    [[nodiscard]] auto location(ir::ValueId vreg) const -> Location {
        auto it = locations.find(vreg);
        return it != locations.end() ? it->second : Location{};
    }
};

class LinearScanAllocator {
public:
    explicit LinearScanAllocator(const TargetDesc& target) : target_(target) {}

    // Allocates `func` in place. The function must be in SSA form.
    [[nodiscard]] auto allocate(ir::Function& func) -> Result<AllocationResult, ir::Diagnostic>;

private:
    const TargetDesc& target_;

    // Assignment and spill decisions over the intervals of one class
    void scan(const std::vector<const LiveInterval*>& intervals, RegClass cls,
              AllocationResult& result);

    // Spills further intervals wherever the reloads of one instruction
    // outnumber the registers free there
    auto relieve_pressure(ir::Function& func, const LivenessInfo& liveness,
                          AllocationResult& result) -> std::optional<ir::Diagnostic>;

    // Turns spilled values into explicit loads and stores
    auto insert_spill_code(ir::Function& func, const LivenessInfo& liveness,
                           AllocationResult& result) -> std::optional<ir::Diagnostic>;
};

[[nodiscard]] auto allocate_registers(ir::Function& func, const TargetDesc& target)
    -> Result<AllocationResult, ir::Diagnostic>;

} // namespace kir::regalloc
