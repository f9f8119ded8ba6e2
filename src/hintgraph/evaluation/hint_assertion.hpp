/**
 * @file hint_assertion.hpp
 * @brief Equality check between a hint's linked node and a reconstruction.
 */
#pragma once
#include "hintgraph/common/common.hpp"
#include "hintgraph/common/node_store.hpp"

namespace hintgraph
{

/**
 * @brief Check that a hint is consistent with the node it is linked to.
 *
 * @details
 * A hint node carries a value the graph cannot derive (for example an
 * integer square root) and a link to the node it describes. The graph author
 * wires the hint through further computed nodes to rebuild the linked value
 * (for a square root, `h * h`) and passes that reconstruction as `target_idx`.
 * The hint holds when the linked node's output equals the target's output.
 *
 * @param store A filled store.
 * @param hint_idx Index of the hint node.
 * @param target_idx Index of the node holding the reconstruction.
 * @return True when the outputs are equal.
 * @throw ConstraintError with `HintMismatch` when they differ.
 * @throw StructuralError with `InvalidNodeIndex`, `NotAHintNode` or
 *        `UnsetOutput`.
 */
bool assert_hint_equal(const NodeStore& store, NodeIdx hint_idx, NodeIdx target_idx);

} // namespace hintgraph
