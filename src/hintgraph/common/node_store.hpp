/**
 * @file node_store.hpp
 * @brief Append-only arena of nodes addressed by index.
 */
#pragma once
#include "hintgraph/common/common.hpp"
#include "hintgraph/common/graph_enums.hpp"
#include "hintgraph/common/node.hpp"

namespace hintgraph
{

/**
 * @brief Append-only, index-addressed storage for graph nodes.
 *
 * @details
 * `NodeStore` owns every node of one graph. A node's index is its position
 * in the store and is assigned by `append()` in strictly increasing order.
 * Nodes are never removed or reordered; only outputs change after append.
 *
 * @par Index requirements
 * Every index a payload refers to (operands of a computed node, the link of
 * a hint node) must already exist when the node is appended. Since a new
 * node always receives index `size()`, this makes construction order a valid
 * topological order of the graph.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent access requires external synchronization.
 * - Concurrent reads (const methods) are safe if no concurrent writes occur.
 */
class NodeStore
{
public:
    NodeStore() = default;

    /**
     * @brief Get the number of nodes in the store.
     */
    size_t size() const noexcept { return m_nodes.size(); }

    /**
     * @brief Check whether an index refers to an existing node.
     */
    bool contains(NodeIdx idx) const noexcept { return idx < m_nodes.size(); }

    /**
     * @brief Append a node.
     * @param payload The node's kind and structural fields.
     * @param output Initial output (set for constants and hints).
     * @return The index assigned to the new node.
     * @throw StructuralError with `InvalidNodeIndex` if the payload refers to
     *        an index that does not exist yet.
     */
    NodeIdx append(NodeVariant payload, std::optional<Value> output);

    /**
     * @brief Access a node.
     * @throw StructuralError with `InvalidNodeIndex` if idx is out of range.
     */
    const Node& at(NodeIdx idx) const;

    /**
     * @brief Read a node's output.
     * @throw StructuralError with `InvalidNodeIndex` if idx is out of range,
     *        or `UnsetOutput` if the node has no output yet.
     */
    Value output_of(NodeIdx idx) const;

    /**
     * @brief Write a node's output.
     * @throw StructuralError with `InvalidNodeIndex` if idx is out of range.
     */
    void set_output(NodeIdx idx, Value value);

    const std::vector<Node>& nodes() const noexcept { return m_nodes; }

private:
    /// Throw `InvalidNodeIndex` unless idx exists; `role` names the index in the message.
    void require_index(NodeIdx idx, const char* role) const;

    std::vector<Node> m_nodes;
};

} // namespace hintgraph
