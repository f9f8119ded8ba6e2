/**
 * @file evaluator.cpp
 */
#include "hintgraph/evaluation/evaluator.hpp"
#include "hintgraph/common/graph_format.hpp"
#include "hintgraph/common/logging.hpp"
#include "hintgraph/evaluation/arithmetic.hpp"

namespace hintgraph
{

void Evaluator::fill(NodeStore& store, NodeIdx input_idx, Value value) const
{
    const Node& input = store.at(input_idx);
    if (!input.is_input())
    {
        log_and_throw(StructuralError(
            GraphErrorCode::NotAnInputNode,
            fmt::format("Node {} is a {} node; only input nodes can be filled",
                        input_idx, input.kind()),
            input_idx));
    }

    HINTGRAPH_DEBUG("filling node {} with {} ({} nodes, {} arithmetic)",
                    input_idx, value, store.size(), m_policy);
    store.set_output(input_idx, value);

    for (NodeIdx idx = 0; idx < store.size(); ++idx)
    {
        const ComputedNode* c = store.at(idx).computed();
        if (!c)
        {
            continue;
        }
        Value lhs = store.output_of(c->lhs);
        Value rhs = store.output_of(c->rhs);
        Value result = apply_operation(c->op, lhs, rhs, m_policy, idx);
        HINTGRAPH_TRACE("node {}: {} {} {} -> {}", idx, lhs, c->op, rhs, result);
        store.set_output(idx, result);
    }
}

} // namespace hintgraph
