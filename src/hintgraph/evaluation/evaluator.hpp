/**
 * @file evaluator.hpp
 * @brief Evaluator that fills a node store from one input value.
 */
#pragma once
#include "hintgraph/common/common.hpp"
#include "hintgraph/common/node_store.hpp"

namespace hintgraph
{

/**
 * @brief Propagates an input value through a node store in index order.
 *
 * @details
 * The evaluator writes the given value to the designated input node and then
 * visits every node in ascending index order. Each computed node receives
 * its operation applied to its operands' outputs; input, constant and hint
 * nodes are left untouched.
 *
 * Index order is a topological order because `NodeStore::append()` rejects
 * references to nodes that do not exist yet, so every operand has been
 * visited before the node that reads it.
 *
 * @par Thread Safety
 * - Stateless apart from the policy; `fill()` mutates only the store passed in.
 */
class Evaluator
{
public:
    explicit Evaluator(OverflowPolicy policy)
        : m_policy{policy}
    {}

    /**
     * @brief Fill the store from one input value.
     * @param store The store to fill.
     * @param input_idx Index of the input node to set.
     * @param value The value to give it.
     * @throw StructuralError with `InvalidNodeIndex` if input_idx does not
     *        exist, `NotAnInputNode` if it is not an input node, or
     *        `UnsetOutput` if a computed node reads a node with no output.
     * @throw ArithmeticError if a result overflows under `Checked`.
     * @note Outputs computed before a throw stay in the store.
     */
    void fill(NodeStore& store, NodeIdx input_idx, Value value) const;

    OverflowPolicy policy() const noexcept { return m_policy; }

private:
    OverflowPolicy m_policy;
};

} // namespace hintgraph
