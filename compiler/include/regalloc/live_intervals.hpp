#pragma once

// Liveness and Live Intervals
//
// Instructions are numbered in layout order: blocks as they appear in the
// function, instructions in order within a block. Instruction k reads its
// operands at position 2k and writes its result at 2k+1, so a value whose
// last use is instruction k no longer overlaps a value defined by k.
// Parameters are defined at position 0.
//
// Liveness is the usual backward dataflow over the CFG. A phi operand is a
// use at the end of the corresponding predecessor; a phi result is defined
// at the phi itself.
//
// Each register gets one interval [start, end] covering its definition, its
// uses and every block it is live into or out of. A value live into a loop
// header is live across the back edge, so its interval is widened to cover
// every block of that loop.

#include "ir/ir.hpp"
#include "regalloc/target.hpp"

#include <set>
#include <unordered_map>
#include <vector>

namespace kir::regalloc {

struct LiveInterval {
    ir::ValueId vreg;
    RegClass cls;
    uint32_t start;
    uint32_t end;
    std::vector<uint32_t> uses; // Sorted use positions

    [[nodiscard]] auto overlaps(uint32_t from, uint32_t to) const -> bool {
        return start <= to && from <= end;
    }
};

struct BlockRange {
    uint32_t first; // Use position of the first instruction
    uint32_t last;  // Def position of the terminator
};

struct LivenessInfo {
    std::vector<LiveInterval> intervals; // Sorted by start, then register
    std::unordered_map<ir::BlockId, BlockRange> blocks;
    std::unordered_map<ir::BlockId, std::set<ir::ValueId>> live_in;
    std::unordered_map<ir::BlockId, std::set<ir::ValueId>> live_out;

    // Index of each instruction in the numbering, by block and position
    [[nodiscard]] auto instruction_index(ir::BlockId block, size_t index) const -> uint32_t {
        return blocks.at(block).first / 2 + static_cast<uint32_t>(index);
    }

    [[nodiscard]] auto find(ir::ValueId vreg) const -> const LiveInterval*;
};

[[nodiscard]] auto compute_liveness(const ir::Function& func) -> LivenessInfo;

} // namespace kir::regalloc
