//! # Loop Unrolling Pass
//!
//! Fully unrolls loops whose trip count is known at compile time.
//!
//! ## Recognized Shape
//!
//! ```
//! pre:    ...                          ; single entry edge
//!         jump header
//! header: %i = phi [pre: START], [latch: %next]
//!         %c = cmp lt %i, BOUND
//!         jump_if %c, body, exit       ; the only exit of the loop
//! body:   ...
//! latch:  %next = add %i, STEP
//!         jump header                  ; the only back edge
//! ```
//!
//! START, BOUND and STEP must be constants. The trip count is found by
//! stepping the induction variable with the same arithmetic the target
//! uses, so wraparound and unsigned comparisons count correctly.
//!
//! ## Transformation
//!
//! The body is replicated once per iteration, followed by a final copy of
//! the header that jumps straight to the exit. In copy k the induction
//! variable is the folded constant for iteration k and every other header
//! phi takes the value the previous copy carried around the back edge. The
//! back edge and the header phis disappear with the original loop; the
//! now-constant compares and increments are left for constant folding and
//! dead-code elimination.
//!
//! Loops over the trip-count cap or the unrolled-size cap stay intact.

#pragma once

#include "ir/cfg.hpp"
#include "ir/ir_pass.hpp"

namespace kir::ir {

struct LoopUnrollOptions {
    // Maximum trip count for full unrolling
    size_t max_trip_count = 8;

    // Maximum instructions of the unrolled loop (trip count x loop size)
    size_t max_unrolled_size = 256;
};

class LoopUnrollPass : public FunctionPass {
public:
    explicit LoopUnrollPass(LoopUnrollOptions opts = {}) : options_(opts) {}

    [[nodiscard]] auto name() const -> std::string override {
        return "loop-unroll";
    }

protected:
    auto run_on_function(Function& func) -> bool override;

private:
    struct LoopInfo {
        BlockId header;
        BlockId latch;
        BlockId preheader;
        BlockId exit;
        BlockId body_entry;            // In-loop successor of the header
        std::vector<BlockId> blocks;   // Loop blocks other than the header, in layout order
        ValueId induction_var;         // The header phi
        std::vector<int64_t> iv_values; // Induction variable per iteration
    };

    // Checks the loop's shape and computes its trip count
    auto analyze_loop(const Function& func, const Loop& loop) -> std::optional<LoopInfo>;

    void fully_unroll(Function& func, const LoopInfo& info);

    LoopUnrollOptions options_;
};

} // namespace kir::ir
