/**
 * @file graph_builder.hpp
 * @brief GraphBuilder constructs, fills and validates a hint graph.
 */
#pragma once
#include "hintgraph/common/common.hpp"
#include "hintgraph/common/graph_diagnostics.hpp"
#include "hintgraph/common/graph_format.hpp"
#include "hintgraph/common/node_store.hpp"

namespace hintgraph
{

/**
 * @brief Configuration for builder behavior.
 */
struct BuilderConfig
{
    /**
     * @brief Behavior of Add and Multiply on overflow.
     * @details Used by both fill_nodes() and check_constraints().
     */
    OverflowPolicy overflow_policy{OverflowPolicy::Checked};

    /**
     * @brief Whether to log every appended node at trace level.
     */
    bool log_construction{false};
};

/**
 * @brief Builder class for arithmetic graphs with hint nodes.
 *
 * @details
 * GraphBuilder owns the node store of one graph and is the only way to
 * reach it. Nodes are referred to by the `NodeIdx` the construction methods
 * return.
 *
 * @par Usage
 * 1. Create leaves: init() for inputs, constant() for fixed values.
 * 2. Combine them with add() and multiply().
 * 3. Add hint() nodes for values the algebra cannot derive, and wire them
 *    through further computed nodes.
 * 4. Call fill_nodes() with a value for the input node.
 * 5. Call check_constraints() and assert_equal() to validate.
 * Steps 4 and 5 may be repeated with other input values.
 *
 * @par Errors
 * Every failure is a `GraphError`. Misuse throws `StructuralError` at the
 * call that commits it; inconsistent values throw `ConstraintError`;
 * overflow under `OverflowPolicy::Checked` throws `ArithmeticError`.
 *
 * @par Thread Safety
 * - No internal synchronization.
 * - Concurrent access requires external synchronization.
 * - Copies are independent; copy the builder to evaluate the same graph
 *   concurrently with different inputs.
 */
class GraphBuilder
{
public:
    /**
     * @brief Construct an empty GraphBuilder.
     * @param config Overflow policy and logging options.
     */
    explicit GraphBuilder(BuilderConfig config = {});

    // ------------------------------------------------------------------------
    // Construction
    // ------------------------------------------------------------------------

    /**
     * @brief Add an input node, to be given a value by fill_nodes().
     * @return Index of the new node.
     */
    NodeIdx init();

    /**
     * @brief Add a constant node.
     * @param value The node's fixed output.
     * @return Index of the new node.
     */
    NodeIdx constant(Value value);

    /**
     * @brief Add a node computing `a + b`.
     * @throw StructuralError with `InvalidNodeIndex` if a or b does not exist.
     */
    NodeIdx add(NodeIdx a, NodeIdx b);

    /**
     * @brief Add a node computing `a * b`.
     * @throw StructuralError with `InvalidNodeIndex` if a or b does not exist.
     */
    NodeIdx multiply(NodeIdx a, NodeIdx b);

    /**
     * @brief Add a hint node.
     * @param value Externally computed value.
     * @param dependent_idx The node this value claims a relationship to.
     * @return Index of the new node.
     * @throw StructuralError with `InvalidNodeIndex` if dependent_idx does not exist.
     */
    NodeIdx hint(Value value, NodeIdx dependent_idx);

    // ------------------------------------------------------------------------
    // Evaluation and validation
    // ------------------------------------------------------------------------

    /**
     * @brief Fill the graph from one input value.
     *
     * @details
     * Sets the input node's output, then computes every computed node in
     * index order. Constants and hints are not touched. Calling it again
     * overwrites every computed output.
     *
     * @throw StructuralError with `InvalidNodeIndex`, `NotAnInputNode`, or
     *        `UnsetOutput` when a computed node reads another unfilled input.
     * @throw ArithmeticError on overflow under `OverflowPolicy::Checked`.
     * @post On success, is_evaluated() is true. On throw, it is false.
     */
    void fill_nodes(NodeIdx input_idx, Value value);

    /**
     * @brief Re-verify every computed node against its operands.
     * @return True when all constraints hold.
     * @throw StructuralError with `NotEvaluated` if fill_nodes() has not
     *        completed, or `UnsetOutput`.
     * @throw ConstraintError with `ConstraintViolation` on a mismatch.
     */
    bool check_constraints() const;

    /**
     * @brief Assert that a hint is consistent with its reconstruction.
     * @param hint_idx The hint node.
     * @param target_idx The node rebuilding the hint's linked value.
     * @return True when the linked node's output equals the target's output.
     * @throw ConstraintError with `HintMismatch` when they differ.
     * @throw StructuralError with `NotEvaluated`, `InvalidNodeIndex`,
     *        `NotAHintNode` or `UnsetOutput`.
     */
    bool assert_equal(NodeIdx hint_idx, NodeIdx target_idx) const;

    /**
     * @brief Report every constraint problem without throwing.
     */
    std::shared_ptr<GraphDiagnostics> get_diagnostics() const;

    // ------------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------------

    /**
     * @brief Get a copy of a node.
     * @throw StructuralError with `InvalidNodeIndex` if idx does not exist.
     */
    Node get_node(NodeIdx idx) const;

    size_t node_count() const noexcept { return m_store.size(); }

    const std::vector<Node>& nodes() const noexcept { return m_store.nodes(); }

    const BuilderConfig& config() const noexcept { return m_config; }

    /**
     * @brief Whether the last fill_nodes() call completed.
     */
    bool is_evaluated() const noexcept { return m_evaluated; }

private:
    /// Append a node and log it if configured.
    NodeIdx append(NodeVariant payload, std::optional<Value> output);

    /// Throw `NotEvaluated` unless a fill has completed.
    void require_evaluated(const char* operation) const;

    BuilderConfig m_config;
    NodeStore m_store;
    bool m_evaluated{false};
};

} // namespace hintgraph

/// Renders the whole graph, one node per line.
template <> struct fmt::formatter<hintgraph::GraphBuilder> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const hintgraph::GraphBuilder& builder, FormatContext& ctx) const {
        auto out = fmt::format_to(ctx.out(), "GraphBuilder {{ nodes: {}, overflow: {}, evaluated: {} }}",
                                  builder.node_count(), builder.config().overflow_policy,
                                  builder.is_evaluated());
        for (const auto& node : builder.nodes())
        {
            out = fmt::format_to(out, "\n  {}", node);
        }
        return out;
    }
};
