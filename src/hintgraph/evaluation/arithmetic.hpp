/**
 * @file arithmetic.hpp
 * @brief Add and Multiply on `Value` under an overflow policy.
 */
#pragma once
#include "hintgraph/common/common.hpp"
#include "hintgraph/common/graph_enums.hpp"

namespace hintgraph
{

/**
 * @brief Apply an operation, reporting overflow instead of wrapping.
 * @return The result, or empty if it does not fit in `Value`.
 */
std::optional<Value> checked_apply(Operation op, Value lhs, Value rhs) noexcept;

/**
 * @brief Apply an operation modulo 2^32.
 */
Value wrapping_apply(Operation op, Value lhs, Value rhs) noexcept;

/**
 * @brief Apply an operation under the given policy.
 * @param node Index of the computed node, used in the error message.
 * @throw ArithmeticError if the policy is `Checked` and the result overflows.
 */
Value apply_operation(Operation op, Value lhs, Value rhs, OverflowPolicy policy, NodeIdx node);

} // namespace hintgraph
