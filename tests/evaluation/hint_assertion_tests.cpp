/**
 * @file hint_assertion_tests.cpp
 * @brief Tests for assert_equal() on square-root and division hints.
 */
#include <gtest/gtest.h>
#include "hintgraph/common/graph_builder.hpp"
#include "hintgraph/common/graph_exceptions.hpp"
#include "hintgraph/evaluation/hint_assertion.hpp"

using namespace hintgraph;

// =============================================================================
// Test graphs
// =============================================================================

/**
 * @brief h claims to be sqrt(x + 7); computed_sq rebuilds x + 7 from h.
 */
class SqrtHintTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        x = builder.init();
        seven = builder.constant(7);
        x_plus_seven = builder.add(x, seven);
        h = builder.hint(4, x_plus_seven);
        computed_sq = builder.multiply(h, h);
    }

    GraphBuilder builder;
    NodeIdx x{};
    NodeIdx seven{};
    NodeIdx x_plus_seven{};
    NodeIdx h{};
    NodeIdx computed_sq{};
};

/**
 * @brief c claims to be (a + 1) / 8; c_times_8 rebuilds a + 1 from c.
 */
class DivisionHintTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        a = builder.init();
        one = builder.constant(1);
        b = builder.add(a, one);
        c = builder.hint(1, b);
        eight = builder.constant(8);
        c_times_8 = builder.multiply(c, eight);
    }

    GraphBuilder builder;
    NodeIdx a{};
    NodeIdx one{};
    NodeIdx b{};
    NodeIdx c{};
    NodeIdx eight{};
    NodeIdx c_times_8{};
};

// =============================================================================
// Square root
// =============================================================================

TEST_F(SqrtHintTests, PerfectSquare_Holds)
{
    builder.fill_nodes(x, 9);
    EXPECT_EQ(builder.get_node(x_plus_seven).output(), std::optional<Value>{16});
    EXPECT_TRUE(builder.check_constraints());
    EXPECT_TRUE(builder.assert_equal(h, computed_sq));
}

TEST_F(SqrtHintTests, WrongRoot_ThrowsHintMismatch)
{
    builder.fill_nodes(x, 10);
    // The algebra itself is consistent; only the hint is wrong
    EXPECT_TRUE(builder.check_constraints());
    try
    {
        builder.assert_equal(h, computed_sq);
        FAIL() << "Expected ConstraintError";
    }
    catch (const ConstraintError& e)
    {
        EXPECT_EQ(e.code(), GraphErrorCode::HintMismatch);
        EXPECT_EQ(e.category(), ErrorCategory::Constraint);
        EXPECT_EQ(e.node(), std::optional<NodeIdx>{computed_sq});
        EXPECT_EQ(e.expected(), std::optional<Value>{17});
        EXPECT_EQ(e.actual(), std::optional<Value>{16});
    }
}

TEST_F(SqrtHintTests, Refill_HoldsAgainAfterFailure)
{
    builder.fill_nodes(x, 10);
    EXPECT_THROW(builder.assert_equal(h, computed_sq), ConstraintError);
    builder.fill_nodes(x, 9);
    EXPECT_TRUE(builder.assert_equal(h, computed_sq));
}

TEST_F(SqrtHintTests, HintOutputIsNeverRecomputed)
{
    builder.fill_nodes(x, 10);
    EXPECT_EQ(builder.get_node(h).output(), std::optional<Value>{4});
    EXPECT_EQ(builder.get_node(computed_sq).output(), std::optional<Value>{16});
}

TEST_F(SqrtHintTests, NonHintFirstArgument_Throws)
{
    builder.fill_nodes(x, 9);
    try
    {
        builder.assert_equal(x_plus_seven, computed_sq);
        FAIL() << "Expected StructuralError";
    }
    catch (const StructuralError& e)
    {
        EXPECT_EQ(e.code(), GraphErrorCode::NotAHintNode);
        EXPECT_EQ(e.node(), std::optional<NodeIdx>{x_plus_seven});
    }
}

TEST_F(SqrtHintTests, UnknownTarget_Throws)
{
    builder.fill_nodes(x, 9);
    EXPECT_THROW(builder.assert_equal(h, 99), StructuralError);
}

// =============================================================================
// Division
// =============================================================================

TEST_F(DivisionHintTests, ExactQuotient_Holds)
{
    builder.fill_nodes(a, 7);
    EXPECT_TRUE(builder.check_constraints());
    EXPECT_TRUE(builder.assert_equal(c, c_times_8));
}

TEST_F(DivisionHintTests, WrongQuotient_ThrowsHintMismatch)
{
    builder.fill_nodes(a, 6);
    EXPECT_TRUE(builder.check_constraints());
    EXPECT_THROW(builder.assert_equal(c, c_times_8), ConstraintError);
}

// =============================================================================
// assert_equal iff the linked output equals the target output
// =============================================================================

TEST(HintAssertionTests, HoldsExactlyWhenOutputsEqual)
{
    GraphBuilder builder;
    NodeIdx x = builder.init();
    NodeIdx h = builder.hint(3, x);
    NodeIdx three_h = builder.multiply(h, builder.constant(3));

    for (Value value = 0; value < 20; ++value)
    {
        builder.fill_nodes(x, value);
        if (value == 9)
        {
            EXPECT_TRUE(builder.assert_equal(h, three_h));
        }
        else
        {
            EXPECT_THROW(builder.assert_equal(h, three_h), ConstraintError) << "x = " << value;
        }
    }
}

TEST(HintAssertionTests, Store_UnsetLinkedOutputThrows)
{
    NodeStore store;
    store.append(InputNode{}, std::nullopt);
    store.append(HintNode{0}, Value{2});
    try
    {
        assert_hint_equal(store, 1, 1);
        FAIL() << "Expected StructuralError";
    }
    catch (const StructuralError& e)
    {
        EXPECT_EQ(e.code(), GraphErrorCode::UnsetOutput);
        EXPECT_EQ(e.node(), std::optional<NodeIdx>{0});
    }
}

TEST(HintAssertionTests, Store_TargetMayBeAnyFilledNode)
{
    NodeStore store;
    store.append(ConstantNode{}, Value{8});
    store.append(HintNode{0}, Value{8});
    EXPECT_TRUE(assert_hint_equal(store, 1, 1));
    EXPECT_TRUE(assert_hint_equal(store, 1, 0));
}
