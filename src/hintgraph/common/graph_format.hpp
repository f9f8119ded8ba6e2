/**
 * @file graph_format.hpp
 * @brief Human-readable rendering of graph types through fmt.
 */
#pragma once
#include "hintgraph/common/common.hpp"
#include "hintgraph/common/graph_enums.hpp"
#include "hintgraph/common/node.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

namespace hintgraph
{

inline const char* to_string(Operation op) noexcept
{
    switch (op)
    {
        case Operation::Add:
            return "Add";
        case Operation::Multiply:
            return "Multiply";
    }
    return "?";
}

inline const char* to_string(NodeKind kind) noexcept
{
    switch (kind)
    {
        case NodeKind::Input:
            return "Input";
        case NodeKind::Constant:
            return "Constant";
        case NodeKind::Computed:
            return "Computed";
        case NodeKind::Hint:
            return "Hint";
    }
    return "?";
}

inline const char* to_string(OverflowPolicy policy) noexcept
{
    switch (policy)
    {
        case OverflowPolicy::Checked:
            return "Checked";
        case OverflowPolicy::Wrapping:
            return "Wrapping";
    }
    return "?";
}

} // namespace hintgraph

template <> struct fmt::formatter<hintgraph::Operation> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(hintgraph::Operation op, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", hintgraph::to_string(op));
    }
};

template <> struct fmt::formatter<hintgraph::NodeKind> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(hintgraph::NodeKind kind, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", hintgraph::to_string(kind));
    }
};

template <> struct fmt::formatter<hintgraph::OverflowPolicy> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(hintgraph::OverflowPolicy policy, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", hintgraph::to_string(policy));
    }
};

/// Renders as `Node { id: 2, kind: Computed, op: Add, inputs: (0, 1), output: 16, hint: - }`.
template <> struct fmt::formatter<hintgraph::Node> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const hintgraph::Node& node, FormatContext& ctx) const {
        auto out = fmt::format_to(ctx.out(), "Node {{ id: {}, kind: {}, op: ", node.id(), node.kind());
        if (const auto* c = node.computed())
        {
            out = fmt::format_to(out, "{}, inputs: ({}, {})", c->op, c->lhs, c->rhs);
        }
        else
        {
            out = fmt::format_to(out, "-, inputs: ()");
        }
        if (node.output())
        {
            out = fmt::format_to(out, ", output: {}", *node.output());
        }
        else
        {
            out = fmt::format_to(out, ", output: -");
        }
        if (auto link = node.hint_link())
        {
            return fmt::format_to(out, ", hint: {} }}", *link);
        }
        return fmt::format_to(out, ", hint: - }}");
    }
};
