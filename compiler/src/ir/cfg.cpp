// KIR Control-Flow Analyses Implementation

#include "ir/cfg.hpp"

#include <algorithm>
#include <unordered_set>

namespace kir::ir {

auto compute_rpo(const Function& func) -> std::vector<BlockId> {
    std::vector<BlockId> post_order;
    if (func.blocks.empty()) {
        return post_order;
    }

    // Iterative DFS; the stack holds (block, next successor index)
    std::unordered_set<BlockId> visited;
    std::vector<std::pair<BlockId, size_t>> stack;
    BlockId entry = func.blocks.front().id;
    stack.emplace_back(entry, 0);
    visited.insert(entry);

    while (!stack.empty()) {
        auto& [block_id, next] = stack.back();
        const auto* block = func.get_block(block_id);
        if (block && next < block->successors.size()) {
            BlockId succ = block->successors[next++];
            if (visited.insert(succ).second && func.get_block(succ)) {
                stack.emplace_back(succ, 0);
            }
        } else {
            post_order.push_back(block_id);
            stack.pop_back();
        }
    }

    std::reverse(post_order.begin(), post_order.end());
    return post_order;
}

DominatorTree::DominatorTree(const Function& func) {
    rpo_ = compute_rpo(func);
    if (rpo_.empty()) {
        return;
    }
    for (size_t i = 0; i < rpo_.size(); ++i) {
        rpo_index_[rpo_[i]] = i;
    }
    entry_ = rpo_.front();
    idom_[entry_] = entry_;

    auto intersect = [this](BlockId b1, BlockId b2) {
        while (b1 != b2) {
            while (rpo_index_[b1] > rpo_index_[b2]) {
                b1 = idom_[b1];
            }
            while (rpo_index_[b2] > rpo_index_[b1]) {
                b2 = idom_[b2];
            }
        }
        return b1;
    };

    bool changed = true;
    while (changed) {
        changed = false;
        for (size_t i = 1; i < rpo_.size(); ++i) {
            BlockId b = rpo_[i];
            const auto* block = func.get_block(b);

            std::optional<BlockId> new_idom;
            for (BlockId p : block->predecessors) {
                if (!idom_.contains(p)) {
                    continue;
                }
                new_idom = new_idom ? intersect(p, *new_idom) : p;
            }
            if (!new_idom) {
                continue;
            }

            auto it = idom_.find(b);
            if (it == idom_.end() || it->second != *new_idom) {
                idom_[b] = *new_idom;
                changed = true;
            }
        }
    }

    // Children in RPO order so tree walks are deterministic
    for (BlockId b : rpo_) {
        if (b != entry_) {
            children_[idom_[b]].push_back(b);
        }
    }

    compute_frontiers(func);
}

void DominatorTree::compute_frontiers(const Function& func) {
    for (BlockId b : rpo_) {
        const auto* block = func.get_block(b);
        std::vector<BlockId> preds;
        for (BlockId p : block->predecessors) {
            if (is_reachable(p)) {
                preds.push_back(p);
            }
        }
        if (preds.size() < 2) {
            continue;
        }
        BlockId stop = idom_[b];
        for (BlockId p : preds) {
            BlockId runner = p;
            while (runner != stop) {
                auto& df = frontier_[runner];
                if (std::find(df.begin(), df.end(), b) == df.end()) {
                    df.push_back(b);
                }
                if (runner == entry_) {
                    break;
                }
                runner = idom_[runner];
            }
        }
    }
}

auto DominatorTree::idom(BlockId block) const -> std::optional<BlockId> {
    auto it = idom_.find(block);
    if (it == idom_.end() || block == entry_) {
        return std::nullopt;
    }
    return it->second;
}

auto DominatorTree::dominates(BlockId a, BlockId b) const -> bool {
    if (!is_reachable(a) || !is_reachable(b)) {
        return false;
    }
    while (true) {
        if (a == b) {
            return true;
        }
        if (b == entry_) {
            return false;
        }
        b = idom_.at(b);
    }
}

auto DominatorTree::children(BlockId block) const -> const std::vector<BlockId>& {
    static const std::vector<BlockId> empty;
    auto it = children_.find(block);
    return it == children_.end() ? empty : it->second;
}

auto DominatorTree::dominance_frontier(BlockId block) const -> const std::vector<BlockId>& {
    static const std::vector<BlockId> empty;
    auto it = frontier_.find(block);
    return it == frontier_.end() ? empty : it->second;
}

auto DominatorTree::iterated_dominance_frontier(const std::set<BlockId>& blocks) const
    -> std::set<BlockId> {
    std::set<BlockId> result;
    std::vector<BlockId> worklist(blocks.begin(), blocks.end());
    std::set<BlockId> queued(blocks.begin(), blocks.end());

    while (!worklist.empty()) {
        BlockId b = worklist.back();
        worklist.pop_back();
        for (BlockId f : dominance_frontier(b)) {
            if (result.insert(f).second && queued.insert(f).second) {
                worklist.push_back(f);
            }
        }
    }
    return result;
}

auto find_loops(const Function& func, const DominatorTree& dom) -> std::vector<Loop> {
    std::vector<Loop> loops;

    for (BlockId header : dom.reverse_post_order()) {
        const auto* header_block = func.get_block(header);
        Loop loop;
        loop.header = header;
        for (BlockId pred : header_block->predecessors) {
            if (dom.dominates(header, pred)) {
                loop.latches.push_back(pred);
            }
        }
        if (loop.latches.empty()) {
            continue;
        }

        // Walk predecessors backwards from each latch until the header
        loop.blocks.insert(header);
        std::vector<BlockId> worklist = loop.latches;
        while (!worklist.empty()) {
            BlockId b = worklist.back();
            worklist.pop_back();
            if (!loop.blocks.insert(b).second) {
                continue;
            }
            for (BlockId p : func.get_block(b)->predecessors) {
                if (dom.is_reachable(p)) {
                    worklist.push_back(p);
                }
            }
        }

        for (BlockId b : loop.blocks) {
            for (BlockId succ : func.get_block(b)->successors) {
                if (!loop.blocks.contains(succ) &&
                    std::find(loop.exits.begin(), loop.exits.end(), succ) == loop.exits.end()) {
                    loop.exits.push_back(succ);
                }
            }
        }
        loops.push_back(std::move(loop));
    }
    return loops;
}

} // namespace kir::ir
