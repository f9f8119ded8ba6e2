/**
 * @file node_store.cpp
 */
#include "hintgraph/common/node_store.hpp"
#include "hintgraph/common/logging.hpp"

namespace hintgraph
{

// ============================================================================
// Index validation
// ============================================================================

void NodeStore::require_index(NodeIdx idx, const char* role) const
{
    if (idx >= m_nodes.size())
    {
        log_and_throw(StructuralError(
            GraphErrorCode::InvalidNodeIndex,
            std::string(role) + " index " + std::to_string(idx) +
                " does not exist (node count is " + std::to_string(m_nodes.size()) + ")",
            idx));
    }
}

// ============================================================================
// Mutation
// ============================================================================

NodeIdx NodeStore::append(NodeVariant payload, std::optional<Value> output)
{
    // Operands and links must already exist, which keeps index order topological
    if (const auto* c = std::get_if<ComputedNode>(&payload))
    {
        require_index(c->lhs, "Left operand");
        require_index(c->rhs, "Right operand");
    }
    else if (const auto* h = std::get_if<HintNode>(&payload))
    {
        require_index(h->link, "Hint link");
    }

    NodeIdx idx = m_nodes.size();
    m_nodes.emplace_back(idx, std::move(payload), output);
    return idx;
}

void NodeStore::set_output(NodeIdx idx, Value value)
{
    require_index(idx, "Node");
    m_nodes[idx].m_output = value;
}

// ============================================================================
// Query methods
// ============================================================================

const Node& NodeStore::at(NodeIdx idx) const
{
    require_index(idx, "Node");
    return m_nodes[idx];
}

Value NodeStore::output_of(NodeIdx idx) const
{
    const Node& node = at(idx);
    if (!node.has_output())
    {
        log_and_throw(StructuralError(
            GraphErrorCode::UnsetOutput,
            "Output of node " + std::to_string(idx) + " is read before it was set",
            idx));
    }
    return *node.output();
}

} // namespace hintgraph
