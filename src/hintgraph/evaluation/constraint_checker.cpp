/**
 * @file constraint_checker.cpp
 */
#include "hintgraph/evaluation/constraint_checker.hpp"
#include "hintgraph/common/graph_format.hpp"
#include "hintgraph/common/logging.hpp"
#include "hintgraph/evaluation/arithmetic.hpp"

#include <unordered_set>

namespace hintgraph
{

// ============================================================================
// Throwing check
// ============================================================================

bool ConstraintChecker::check(const NodeStore& store) const
{
    size_t checked = 0;
    for (const Node& node : store.nodes())
    {
        const ComputedNode* c = node.computed();
        if (!c)
        {
            continue;
        }
        Value lhs = store.output_of(c->lhs);
        Value rhs = store.output_of(c->rhs);
        Value expected = apply_operation(c->op, lhs, rhs, m_policy, node.id());
        Value actual = store.output_of(node.id());
        if (actual != expected)
        {
            log_and_throw(ConstraintError(
                GraphErrorCode::ConstraintViolation,
                fmt::format("Constraint violated at node {}: {} {} {} = {}, but output is {}",
                            node.id(), lhs, c->op, rhs, expected, actual),
                node.id(), expected, actual));
        }
        ++checked;
    }
    HINTGRAPH_DEBUG("{} constraints hold", checked);
    return true;
}

// ============================================================================
// Diagnostics
// ============================================================================

std::shared_ptr<GraphDiagnostics> ConstraintChecker::diagnose(const NodeStore& store,
                                                              bool evaluated) const
{
    auto diag = std::make_shared<GraphDiagnostics>();

    if (!evaluated)
    {
        diag->add({DiagnosticSeverity::Warning, DiagnosticCategory::UnevaluatedGraph,
                   "fill_nodes() has not completed on this graph", std::nullopt,
                   std::nullopt, std::nullopt});
    }

    // Unfilled inputs that a computed node reads are reported as UnsetOperand
    // on the reader, so only report the ones nothing reads here.
    std::unordered_set<NodeIdx> read_nodes;

    for (const Node& node : store.nodes())
    {
        const ComputedNode* c = node.computed();
        if (!c)
        {
            continue;
        }
        read_nodes.insert(c->lhs);
        read_nodes.insert(c->rhs);

        const auto& lhs = store.at(c->lhs).output();
        const auto& rhs = store.at(c->rhs).output();
        bool operands_set = true;
        for (NodeIdx operand : {c->lhs, c->rhs})
        {
            if (!store.at(operand).has_output())
            {
                operands_set = false;
                diag->add({DiagnosticSeverity::Error, DiagnosticCategory::UnsetOperand,
                           fmt::format("Node {} reads node {}, which has no output",
                                       node.id(), operand),
                           node.id(), std::nullopt, std::nullopt});
            }
        }
        if (!node.has_output())
        {
            diag->add({DiagnosticSeverity::Error, DiagnosticCategory::UnsetOutput,
                       fmt::format("Computed node {} has no output", node.id()),
                       node.id(), std::nullopt, std::nullopt});
        }
        if (!operands_set)
        {
            continue;
        }

        std::optional<Value> expected = m_policy == OverflowPolicy::Wrapping
            ? std::optional<Value>{wrapping_apply(c->op, *lhs, *rhs)}
            : checked_apply(c->op, *lhs, *rhs);
        if (!expected)
        {
            diag->add({DiagnosticSeverity::Error, DiagnosticCategory::ArithmeticOverflow,
                       fmt::format("{} of {} and {} overflows 32 bits at node {}",
                                   c->op, *lhs, *rhs, node.id()),
                       node.id(), std::nullopt, std::nullopt});
            continue;
        }
        if (node.has_output() && *node.output() != *expected)
        {
            diag->add({DiagnosticSeverity::Error, DiagnosticCategory::ConstraintMismatch,
                       fmt::format("Node {}: {} {} {} = {}, but output is {}", node.id(),
                                   *lhs, c->op, *rhs, *expected, *node.output()),
                       node.id(), expected, node.output()});
        }
    }

    for (const Node& node : store.nodes())
    {
        if (node.is_input() && !node.has_output() && read_nodes.count(node.id()) == 0)
        {
            diag->add({DiagnosticSeverity::Warning, DiagnosticCategory::UnfilledInput,
                       fmt::format("Input node {} has no value", node.id()),
                       node.id(), std::nullopt, std::nullopt});
        }
    }

    return diag;
}

} // namespace hintgraph
