#include "hintgraph/common/graph_builder.hpp"
#include "hintgraph/common/logging.hpp"
#include "hintgraph/evaluation/constraint_checker.hpp"
#include "hintgraph/evaluation/evaluator.hpp"
#include "hintgraph/evaluation/hint_assertion.hpp"

namespace hintgraph
{

GraphBuilder::GraphBuilder(BuilderConfig config)
    : m_config{config}
    , m_store{}
{}

NodeIdx GraphBuilder::append(NodeVariant payload, std::optional<Value> output)
{
    NodeIdx idx = m_store.append(std::move(payload), output);
    if (m_config.log_construction)
    {
        HINTGRAPH_TRACE("appended {}", m_store.at(idx));
    }
    return idx;
}

NodeIdx GraphBuilder::init()
{
    return append(InputNode{}, std::nullopt);
}

NodeIdx GraphBuilder::constant(Value value)
{
    return append(ConstantNode{}, value);
}

NodeIdx GraphBuilder::add(NodeIdx a, NodeIdx b)
{
    return append(ComputedNode{Operation::Add, a, b}, std::nullopt);
}

NodeIdx GraphBuilder::multiply(NodeIdx a, NodeIdx b)
{
    return append(ComputedNode{Operation::Multiply, a, b}, std::nullopt);
}

NodeIdx GraphBuilder::hint(Value value, NodeIdx dependent_idx)
{
    return append(HintNode{dependent_idx}, value);
}

void GraphBuilder::require_evaluated(const char* operation) const
{
    if (!m_evaluated)
    {
        log_and_throw(StructuralError(
            GraphErrorCode::NotEvaluated,
            std::string(operation) + " requires a completed fill_nodes() call"));
    }
}

void GraphBuilder::fill_nodes(NodeIdx input_idx, Value value)
{
    // A fill that throws midway leaves a mix of fresh and stale outputs
    m_evaluated = false;
    Evaluator(m_config.overflow_policy).fill(m_store, input_idx, value);
    m_evaluated = true;
}

bool GraphBuilder::check_constraints() const
{
    require_evaluated("check_constraints()");
    return ConstraintChecker(m_config.overflow_policy).check(m_store);
}

bool GraphBuilder::assert_equal(NodeIdx hint_idx, NodeIdx target_idx) const
{
    require_evaluated("assert_equal()");
    return assert_hint_equal(m_store, hint_idx, target_idx);
}

std::shared_ptr<GraphDiagnostics> GraphBuilder::get_diagnostics() const
{
    return ConstraintChecker(m_config.overflow_policy).diagnose(m_store, m_evaluated);
}

Node GraphBuilder::get_node(NodeIdx idx) const
{
    return m_store.at(idx);
}

} // namespace hintgraph
