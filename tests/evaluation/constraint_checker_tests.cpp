/**
 * @file constraint_checker_tests.cpp
 * @brief Tests for check_constraints() and get_diagnostics().
 */
#include <gtest/gtest.h>
#include "hintgraph/common/graph_builder.hpp"
#include "hintgraph/common/graph_exceptions.hpp"
#include "hintgraph/evaluation/constraint_checker.hpp"
#include "hintgraph/evaluation/evaluator.hpp"

using namespace hintgraph;

namespace
{

/// Store for y = x*x + 5 + x, filled with x = 6.
NodeStore make_filled_polynomial()
{
    NodeStore store;
    store.append(InputNode{}, std::nullopt);                             // 0: x
    store.append(ComputedNode{Operation::Multiply, 0, 0}, std::nullopt); // 1: x*x
    store.append(ConstantNode{}, Value{5});                              // 2: 5
    store.append(ComputedNode{Operation::Add, 1, 2}, std::nullopt);      // 3: x*x + 5
    store.append(ComputedNode{Operation::Add, 3, 0}, std::nullopt);      // 4: y
    Evaluator(OverflowPolicy::Checked).fill(store, 0, 6);
    return store;
}

bool has_category(const std::vector<DiagnosticItem>& items, DiagnosticCategory category)
{
    for (const auto& item : items)
    {
        if (item.category == category)
        {
            return true;
        }
    }
    return false;
}

} // namespace

// ============================================================================
// check()
// ============================================================================

TEST(ConstraintCheckerTests, Check_FilledStoreHolds)
{
    NodeStore store = make_filled_polynomial();
    EXPECT_EQ(store.output_of(4), 47u);
    EXPECT_TRUE(ConstraintChecker(OverflowPolicy::Checked).check(store));
}

TEST(ConstraintCheckerTests, Check_CorruptedOutputThrowsWithContext)
{
    NodeStore store = make_filled_polynomial();
    store.set_output(4, 46);
    try
    {
        ConstraintChecker(OverflowPolicy::Checked).check(store);
        FAIL() << "Expected ConstraintError";
    }
    catch (const ConstraintError& e)
    {
        EXPECT_EQ(e.code(), GraphErrorCode::ConstraintViolation);
        EXPECT_EQ(e.category(), ErrorCategory::Constraint);
        EXPECT_EQ(e.node(), std::optional<NodeIdx>{4});
        EXPECT_EQ(e.expected(), std::optional<Value>{47});
        EXPECT_EQ(e.actual(), std::optional<Value>{46});
    }
}

TEST(ConstraintCheckerTests, Check_CorruptedOperandBreaksReader)
{
    // Node 3 now disagrees too, but node 1 comes first in index order
    NodeStore store = make_filled_polynomial();
    store.set_output(1, 35);
    try
    {
        ConstraintChecker(OverflowPolicy::Checked).check(store);
        FAIL() << "Expected ConstraintError";
    }
    catch (const ConstraintError& e)
    {
        EXPECT_EQ(e.node(), std::optional<NodeIdx>{1});
    }
}

TEST(ConstraintCheckerTests, Check_UnfilledComputedThrowsUnsetOutput)
{
    NodeStore store;
    store.append(ConstantNode{}, Value{2});
    store.append(ComputedNode{Operation::Add, 0, 0}, std::nullopt);
    try
    {
        ConstraintChecker(OverflowPolicy::Checked).check(store);
        FAIL() << "Expected StructuralError";
    }
    catch (const StructuralError& e)
    {
        EXPECT_EQ(e.code(), GraphErrorCode::UnsetOutput);
        EXPECT_EQ(e.node(), std::optional<NodeIdx>{1});
    }
}

TEST(ConstraintCheckerTests, Check_EmptyStoreHolds)
{
    NodeStore store;
    EXPECT_TRUE(ConstraintChecker(OverflowPolicy::Checked).check(store));
}

TEST(ConstraintCheckerTests, Check_UsesSamePolicyAsEvaluator)
{
    NodeStore store;
    store.append(InputNode{}, std::nullopt);
    store.append(ComputedNode{Operation::Multiply, 0, 0}, std::nullopt);
    Evaluator(OverflowPolicy::Wrapping).fill(store, 0, 65536);
    EXPECT_EQ(store.output_of(1), 0u);

    EXPECT_TRUE(ConstraintChecker(OverflowPolicy::Wrapping).check(store));
    EXPECT_THROW(ConstraintChecker(OverflowPolicy::Checked).check(store), ArithmeticError);
}

// ============================================================================
// diagnose()
// ============================================================================

TEST(ConstraintCheckerTests, Diagnose_FilledStoreIsValid)
{
    NodeStore store = make_filled_polynomial();
    auto diag = ConstraintChecker(OverflowPolicy::Checked).diagnose(store, true);
    EXPECT_TRUE(diag->is_valid());
    EXPECT_FALSE(diag->has_errors());
    EXPECT_FALSE(diag->has_warnings());
}

TEST(ConstraintCheckerTests, Diagnose_ReportsEveryMismatch)
{
    NodeStore store = make_filled_polynomial();
    store.set_output(3, 40);
    store.set_output(4, 100);
    auto diag = ConstraintChecker(OverflowPolicy::Checked).diagnose(store, true);

    ASSERT_EQ(diag->errors().size(), 2u);
    EXPECT_EQ(diag->errors()[0].category, DiagnosticCategory::ConstraintMismatch);
    EXPECT_EQ(diag->errors()[0].node, std::optional<NodeIdx>{3});
    EXPECT_EQ(diag->errors()[0].expected, std::optional<Value>{41});
    EXPECT_EQ(diag->errors()[0].actual, std::optional<Value>{40});
    // Node 4 is judged against the corrupted node 3: 40 + 6
    EXPECT_EQ(diag->errors()[1].node, std::optional<NodeIdx>{4});
    EXPECT_EQ(diag->errors()[1].expected, std::optional<Value>{46});
    EXPECT_EQ(diag->errors()[1].actual, std::optional<Value>{100});
}

TEST(ConstraintCheckerTests, Diagnose_UnevaluatedGraph)
{
    GraphBuilder builder;
    NodeIdx x = builder.init();
    builder.multiply(x, x);
    builder.init();

    auto diag = builder.get_diagnostics();
    EXPECT_FALSE(diag->is_valid());
    EXPECT_TRUE(has_category(diag->warnings(), DiagnosticCategory::UnevaluatedGraph));
    EXPECT_TRUE(has_category(diag->warnings(), DiagnosticCategory::UnfilledInput));
    EXPECT_TRUE(has_category(diag->errors(), DiagnosticCategory::UnsetOperand));
    EXPECT_TRUE(has_category(diag->errors(), DiagnosticCategory::UnsetOutput));
    EXPECT_EQ(diag->all_items().size(), diag->errors().size() + diag->warnings().size());
    EXPECT_EQ(diag->all_items().front().severity, DiagnosticSeverity::Error);
}

TEST(ConstraintCheckerTests, Diagnose_UnreadInputIsOnlyWarning)
{
    GraphBuilder builder;
    NodeIdx x = builder.init();
    NodeIdx unused = builder.init();
    builder.add(x, x);
    builder.fill_nodes(x, 1);

    auto diag = builder.get_diagnostics();
    EXPECT_TRUE(diag->is_valid());
    ASSERT_EQ(diag->warnings().size(), 1u);
    EXPECT_EQ(diag->warnings()[0].category, DiagnosticCategory::UnfilledInput);
    EXPECT_EQ(diag->warnings()[0].node, std::optional<NodeIdx>{unused});
}

TEST(ConstraintCheckerTests, Diagnose_ReportsOverflowUnderCheckedPolicy)
{
    NodeStore store;
    store.append(InputNode{}, std::nullopt);
    store.append(ComputedNode{Operation::Add, 0, 0}, std::nullopt);
    Evaluator(OverflowPolicy::Wrapping).fill(store, 0, 4294967295u);

    auto diag = ConstraintChecker(OverflowPolicy::Checked).diagnose(store, true);
    ASSERT_EQ(diag->errors().size(), 1u);
    EXPECT_EQ(diag->errors()[0].category, DiagnosticCategory::ArithmeticOverflow);
    EXPECT_TRUE(ConstraintChecker(OverflowPolicy::Wrapping).diagnose(store, true)->is_valid());
}
