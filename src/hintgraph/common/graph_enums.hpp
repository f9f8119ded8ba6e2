/**
 * @file graph_enums.hpp
 */
#pragma once
#include "hintgraph/common/common.hpp"

namespace hintgraph
{

// ============================================================================
// Index and value type aliases
// ============================================================================

/**
 * @brief Type alias for node indices.
 *
 * @details
 * `NodeIdx` identifies a node by its position in the node store. It is the
 * only handle callers hold on a node. This alias exists for clarity in API
 * signatures and documentation, not for compile-time type safety.
 */
using NodeIdx = size_t;

/**
 * @brief Type alias for node values.
 *
 * @details
 * All node outputs are 32-bit unsigned integers. What happens when a sum or
 * product does not fit is decided by `OverflowPolicy`.
 */
using Value = std::uint32_t;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Binary operations a computed node can perform.
 */
enum class Operation
{
    Add,
    Multiply
};

/**
 * @brief The four kinds of node a graph is made of.
 *
 * @details
 * - `Input`: value supplied at evaluation time through `fill_nodes()`.
 * - `Constant`: value fixed at construction.
 * - `Computed`: value derived from two earlier nodes through an `Operation`.
 * - `Hint`: value supplied from outside the algebra, linked to the node it
 *   claims a relationship to.
 */
enum class NodeKind
{
    Input,
    Constant,
    Computed,
    Hint
};

/**
 * @brief Behavior of Add and Multiply when the result exceeds `Value`.
 *
 * @details
 * - `Checked`: the operation throws `ArithmeticError` with code
 *   `ArithmeticOverflow`. This is the default, since a constraint system
 *   cannot tolerate a silently truncated witness.
 * - `Wrapping`: the result is taken modulo 2^32.
 *
 * The evaluator and the constraint checker always use the same policy, so a
 * wrapped value recomputes to itself.
 */
enum class OverflowPolicy
{
    Checked,
    Wrapping
};

} // namespace hintgraph
