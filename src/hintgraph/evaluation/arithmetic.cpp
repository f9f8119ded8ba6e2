/**
 * @file arithmetic.cpp
 */
#include "hintgraph/evaluation/arithmetic.hpp"
#include "hintgraph/common/graph_format.hpp"
#include "hintgraph/common/logging.hpp"

namespace hintgraph
{

namespace
{

/// Exact result in 64 bits; a product of two 32-bit values always fits.
std::uint64_t wide_apply(Operation op, Value lhs, Value rhs) noexcept
{
    auto a = static_cast<std::uint64_t>(lhs);
    auto b = static_cast<std::uint64_t>(rhs);
    return op == Operation::Add ? a + b : a * b;
}

} // namespace

std::optional<Value> checked_apply(Operation op, Value lhs, Value rhs) noexcept
{
    std::uint64_t wide = wide_apply(op, lhs, rhs);
    if (wide > std::numeric_limits<Value>::max())
    {
        return std::nullopt;
    }
    return static_cast<Value>(wide);
}

Value wrapping_apply(Operation op, Value lhs, Value rhs) noexcept
{
    return static_cast<Value>(wide_apply(op, lhs, rhs));
}

Value apply_operation(Operation op, Value lhs, Value rhs, OverflowPolicy policy, NodeIdx node)
{
    if (policy == OverflowPolicy::Wrapping)
    {
        return wrapping_apply(op, lhs, rhs);
    }
    auto result = checked_apply(op, lhs, rhs);
    if (!result)
    {
        log_and_throw(ArithmeticError(
            fmt::format("{} of {} and {} overflows 32 bits at node {}", op, lhs, rhs, node),
            node));
    }
    return *result;
}

} // namespace hintgraph
