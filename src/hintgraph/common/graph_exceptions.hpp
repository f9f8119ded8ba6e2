/**
 * @file graph_exceptions.hpp
 */
#pragma once
#include "hintgraph/common/common.hpp"
#include "hintgraph/common/graph_enums.hpp"

namespace hintgraph
{

/**
 * @brief Error codes for graph operations.
 */
enum class GraphErrorCode
{
    InvalidNodeIndex,
    UnsetOutput,
    NotAnInputNode,
    NotAHintNode,
    NotEvaluated,
    ArithmeticOverflow,
    ConstraintViolation,
    HintMismatch
};

/**
 * @brief Coarse grouping of error codes.
 *
 * @details
 * - `Structural`: the graph or the call sequence was misused (unknown index,
 *   reading an unset output, validating before evaluation). Fixing it means
 *   fixing the calling code.
 * - `Overflow`: a sum or product did not fit in `Value` under
 *   `OverflowPolicy::Checked`.
 * - `Constraint`: the filled values are inconsistent with the graph or with
 *   a hint. This is the correctness signal the library exists to produce.
 */
enum class ErrorCategory
{
    Structural,
    Overflow,
    Constraint
};

/**
 * @brief Map an error code to its category.
 */
inline ErrorCategory category_of(GraphErrorCode code) noexcept
{
    switch (code)
    {
        case GraphErrorCode::ArithmeticOverflow:
            return ErrorCategory::Overflow;
        case GraphErrorCode::ConstraintViolation:
        case GraphErrorCode::HintMismatch:
            return ErrorCategory::Constraint;
        default:
            return ErrorCategory::Structural;
    }
}

/**
 * @brief Base exception class for graph errors.
 *
 * @details
 * `GraphError` is thrown by `GraphBuilder` and the evaluation functions when
 * preconditions are violated or when filled values break a constraint. Each
 * exception carries an error code, a descriptive message, the index of the
 * offending node (if any) and, for value comparisons, the expected and
 * actual values.
 *
 * Callers that only care about the category can catch one of the derived
 * classes: `StructuralError`, `ArithmeticError` or `ConstraintError`.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class GraphError : public std::exception
{
public:
    /**
     * @brief Construct a GraphError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     * @param node The offending node index, if any.
     * @param expected The value that was required, if the error compares values.
     * @param actual The value that was found, if the error compares values.
     */
    GraphError(GraphErrorCode code,
               std::string message,
               std::optional<NodeIdx> node = std::nullopt,
               std::optional<Value> expected = std::nullopt,
               std::optional<Value> actual = std::nullopt)
        : m_code(code)
        , m_message(std::move(message))
        , m_node(node)
        , m_expected(expected)
        , m_actual(actual)
    {
    }

    /**
     * @brief Get the error code.
     */
    GraphErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error category.
     */
    ErrorCategory category() const noexcept
    {
        return category_of(m_code);
    }

    /**
     * @brief Index of the node the error is about, if any.
     */
    const std::optional<NodeIdx>& node() const noexcept
    {
        return m_node;
    }

    /**
     * @brief The required value, for value comparison errors.
     */
    const std::optional<Value>& expected() const noexcept
    {
        return m_expected;
    }

    /**
     * @brief The value found, for value comparison errors.
     */
    const std::optional<Value>& actual() const noexcept
    {
        return m_actual;
    }

    /**
     * @brief Get the error message.
     * @return A C-string describing the error.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    GraphErrorCode m_code;
    std::string m_message;
    std::optional<NodeIdx> m_node;
    std::optional<Value> m_expected;
    std::optional<Value> m_actual;
};

/**
 * @brief Misuse of the graph or of the call sequence.
 */
class StructuralError : public GraphError
{
public:
    using GraphError::GraphError;
};

/**
 * @brief A checked Add or Multiply did not fit in `Value`.
 */
class ArithmeticError : public GraphError
{
public:
    ArithmeticError(std::string message, NodeIdx node)
        : GraphError(GraphErrorCode::ArithmeticOverflow, std::move(message), node)
    {
    }
};

/**
 * @brief Filled values are inconsistent with the graph or with a hint.
 */
class ConstraintError : public GraphError
{
public:
    ConstraintError(GraphErrorCode code,
                    std::string message,
                    NodeIdx node,
                    Value expected,
                    Value actual)
        : GraphError(code, std::move(message), node, expected, actual)
    {
    }
};

} // namespace hintgraph
