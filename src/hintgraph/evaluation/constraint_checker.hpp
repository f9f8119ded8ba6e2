/**
 * @file constraint_checker.hpp
 * @brief Re-verification of computed outputs after evaluation.
 */
#pragma once
#include "hintgraph/common/common.hpp"
#include "hintgraph/common/graph_diagnostics.hpp"
#include "hintgraph/common/node_store.hpp"

namespace hintgraph
{

/**
 * @brief Checks that every computed output matches its operation.
 *
 * @details
 * The checker recomputes each computed node from its operands' current
 * outputs, with the same overflow policy the evaluator used, and compares
 * the result with the stored output. It is deliberately independent from
 * `Evaluator`: it catches any change made to outputs after filling, and it
 * is the place a proof system would substitute its own checks.
 *
 * `check()` stops at the first problem and throws. `diagnose()` visits the
 * whole store and reports every problem without throwing.
 */
class ConstraintChecker
{
public:
    explicit ConstraintChecker(OverflowPolicy policy)
        : m_policy{policy}
    {}

    /**
     * @brief Verify every computed node.
     * @return True when all constraints hold.
     * @throw ConstraintError with `ConstraintViolation` on the first mismatch.
     * @throw StructuralError with `UnsetOutput` if an operand or a computed
     *        node has no output.
     * @throw ArithmeticError if recomputation overflows under `Checked`.
     */
    bool check(const NodeStore& store) const;

    /**
     * @brief Collect every problem in the store.
     * @param store The store to inspect.
     * @param evaluated Whether a fill has completed on this store.
     */
    std::shared_ptr<GraphDiagnostics> diagnose(const NodeStore& store, bool evaluated) const;

private:
    OverflowPolicy m_policy;
};

} // namespace hintgraph
