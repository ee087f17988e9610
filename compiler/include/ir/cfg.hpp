// KIR Control-Flow Analyses
//
// Dominator tree (Cooper-Harvey-Kennedy iteration over reverse post-order),
// dominance frontiers, iterated dominance frontiers and natural loops.
//
// All analyses are snapshots: they read the function's stored predecessor and
// successor lists, so callers run Function::rebuild_cfg() after editing
// terminators and recompute the analysis.

#pragma once

#include "ir/ir.hpp"

#include <set>
#include <unordered_map>
#include <vector>

namespace kir::ir {

class DominatorTree {
public:
    explicit DominatorTree(const Function& func);

    // Immediate dominator; nullopt for the entry and for unreachable blocks
    [[nodiscard]] auto idom(BlockId block) const -> std::optional<BlockId>;

    // Reflexive: every reachable block dominates itself
    [[nodiscard]] auto dominates(BlockId a, BlockId b) const -> bool;

    [[nodiscard]] auto children(BlockId block) const -> const std::vector<BlockId>&;

    [[nodiscard]] auto is_reachable(BlockId block) const -> bool {
        return rpo_index_.contains(block);
    }

    [[nodiscard]] auto reverse_post_order() const -> const std::vector<BlockId>& {
        return rpo_;
    }

    [[nodiscard]] auto entry() const -> BlockId {
        return entry_;
    }

    [[nodiscard]] auto dominance_frontier(BlockId block) const -> const std::vector<BlockId>&;

    // DF+(blocks): the limit of DF applied to the set and its own results
    [[nodiscard]] auto iterated_dominance_frontier(const std::set<BlockId>& blocks) const
        -> std::set<BlockId>;

private:
    BlockId entry_ = INVALID_BLOCK;
    std::vector<BlockId> rpo_;
    std::unordered_map<BlockId, size_t> rpo_index_;
    std::unordered_map<BlockId, BlockId> idom_;
    std::unordered_map<BlockId, std::vector<BlockId>> children_;
    std::unordered_map<BlockId, std::vector<BlockId>> frontier_;

    void compute_frontiers(const Function& func);
};

// Blocks reachable from entry, in reverse post-order
[[nodiscard]] auto compute_rpo(const Function& func) -> std::vector<BlockId>;

// A natural loop: the header plus every block that reaches a latch without
// passing through the header.
struct Loop {
    BlockId header;
    std::vector<BlockId> latches; // Sources of back edges into the header
    std::set<BlockId> blocks;     // Includes the header and latches
    std::vector<BlockId> exits;   // Blocks outside the loop with a predecessor inside

    [[nodiscard]] auto contains(BlockId block) const -> bool {
        return blocks.contains(block);
    }
};

// Loops ordered by header position in reverse post-order. Back edges whose
// target does not dominate the source (irreducible flow) are ignored.
[[nodiscard]] auto find_loops(const Function& func, const DominatorTree& dom) -> std::vector<Loop>;

} // namespace kir::ir
