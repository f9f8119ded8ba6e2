/**
 * @file hint_assertion.cpp
 */
#include "hintgraph/evaluation/hint_assertion.hpp"
#include "hintgraph/common/graph_format.hpp"
#include "hintgraph/common/logging.hpp"

namespace hintgraph
{

bool assert_hint_equal(const NodeStore& store, NodeIdx hint_idx, NodeIdx target_idx)
{
    const Node& hint = store.at(hint_idx);
    auto link = hint.hint_link();
    if (!link)
    {
        log_and_throw(StructuralError(
            GraphErrorCode::NotAHintNode,
            fmt::format("Node {} is a {} node, not a hint", hint_idx, hint.kind()),
            hint_idx));
    }

    Value linked = store.output_of(*link);
    Value reconstructed = store.output_of(target_idx);
    if (linked != reconstructed)
    {
        log_and_throw(ConstraintError(
            GraphErrorCode::HintMismatch,
            fmt::format("Hint {} (value {}) does not hold: linked node {} is {}, "
                        "but node {} reconstructs {}",
                        hint_idx, hint.output().value_or(0), *link, linked, target_idx,
                        reconstructed),
            target_idx, linked, reconstructed));
    }

    HINTGRAPH_DEBUG("hint {} holds: node {} == node {} == {}", hint_idx, *link, target_idx, linked);
    return true;
}

} // namespace hintgraph
