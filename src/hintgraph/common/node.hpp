/**
 * @file node.hpp
 * @brief Node record and its per-kind payloads.
 */
#pragma once
#include "hintgraph/common/common.hpp"
#include "hintgraph/common/graph_enums.hpp"

namespace hintgraph
{

// ============================================================================
// Per-kind payloads
// ============================================================================

/// Value supplied at evaluation time.
struct InputNode
{
};

/// Value fixed at construction.
struct ConstantNode
{
};

/**
 * @brief Value derived from two earlier nodes.
 * @invariant `lhs` and `rhs` are smaller than the owning node's index.
 */
struct ComputedNode
{
    Operation op;
    NodeIdx lhs;
    NodeIdx rhs;
};

/**
 * @brief Externally supplied value linked to the node it claims to describe.
 * @invariant `link` is smaller than the owning node's index.
 */
struct HintNode
{
    NodeIdx link;
};

using NodeVariant = std::variant<InputNode, ConstantNode, ComputedNode, HintNode>;

// ============================================================================
// Node
// ============================================================================

/**
 * @brief A single entry in the computation graph.
 *
 * @details
 * A node is identified by its position in the node store. Its structure
 * (the variant payload) never changes after construction; only the output
 * is written by the evaluator.
 *
 * The record-style accessors `inputs()`, `operation()` and `hint_link()`
 * give the flat view used by formatting and by callers that do not want to
 * visit the variant.
 *
 * @par Thread safety
 * - Value type; copies are independent.
 */
class Node
{
public:
    Node(NodeIdx id, NodeVariant payload, std::optional<Value> output)
        : m_id{id}
        , m_payload{std::move(payload)}
        , m_output{output}
    {}

    NodeIdx id() const noexcept { return m_id; }

    const NodeVariant& payload() const noexcept { return m_payload; }

    NodeKind kind() const noexcept
    {
        return static_cast<NodeKind>(m_payload.index());
    }

    bool is_input() const noexcept { return std::holds_alternative<InputNode>(m_payload); }
    bool is_constant() const noexcept { return std::holds_alternative<ConstantNode>(m_payload); }
    bool is_computed() const noexcept { return std::holds_alternative<ComputedNode>(m_payload); }
    bool is_hint() const noexcept { return std::holds_alternative<HintNode>(m_payload); }

    /**
     * @brief The computed payload, or nullptr for other kinds.
     */
    const ComputedNode* computed() const noexcept
    {
        return std::get_if<ComputedNode>(&m_payload);
    }

    /**
     * @brief Operand indices: empty, or exactly two for computed nodes.
     */
    std::vector<NodeIdx> inputs() const
    {
        if (const auto* c = computed())
        {
            return {c->lhs, c->rhs};
        }
        return {};
    }

    /**
     * @brief The operation of a computed node; empty for other kinds.
     */
    std::optional<Operation> operation() const noexcept
    {
        if (const auto* c = computed())
        {
            return c->op;
        }
        return std::nullopt;
    }

    /**
     * @brief The linked node of a hint node; empty for other kinds.
     */
    std::optional<NodeIdx> hint_link() const noexcept
    {
        if (const auto* h = std::get_if<HintNode>(&m_payload))
        {
            return h->link;
        }
        return std::nullopt;
    }

    const std::optional<Value>& output() const noexcept { return m_output; }

    bool has_output() const noexcept { return m_output.has_value(); }

    // Allow the store to write outputs during evaluation
    friend class NodeStore;

private:
    NodeIdx m_id;
    NodeVariant m_payload;
    std::optional<Value> m_output;
};

static_assert(std::variant_size_v<NodeVariant> == 4,
    "NodeKind must list one enumerator per NodeVariant alternative");

} // namespace hintgraph
