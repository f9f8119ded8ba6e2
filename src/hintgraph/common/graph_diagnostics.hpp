/**
 * @file graph_diagnostics.hpp
 */
#pragma once
#include "hintgraph/common/common.hpp"
#include "hintgraph/common/graph_enums.hpp"

namespace hintgraph
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Non-blocking issue that may indicate a problem.
    Error     ///< A constraint that does not hold or cannot be checked.
};

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    ConstraintMismatch,     ///< Stored output differs from recomputation.
    UnsetOperand,           ///< A computed node reads an operand with no output.
    UnsetOutput,            ///< A computed node was never given an output.
    ArithmeticOverflow,     ///< Recomputation overflows under the checked policy.
    UnfilledInput,          ///< An input node has no value.
    UnevaluatedGraph        ///< fill_nodes() has not completed on this graph.
};

/**
 * @brief A single diagnostic item (error or warning).
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;

    /// The node the issue is about; empty for graph-wide issues.
    std::optional<NodeIdx> node;

    /// Recomputed value, for ConstraintMismatch.
    std::optional<Value> expected;

    /// Stored value, for ConstraintMismatch.
    std::optional<Value> actual;
};

// ============================================================================
// GraphDiagnostics
// ============================================================================

/**
 * @brief Diagnostic information collected from a filled graph.
 *
 * @details
 * `GraphDiagnostics` lists every problem the constraint checker can find,
 * rather than stopping at the first one as `check_constraints()` does. It is
 * produced by `GraphBuilder::get_diagnostics()`.
 *
 * @par Error vs Warning
 * - **Errors** mean `check_constraints()` would throw. Examples:
 *   ConstraintMismatch, UnsetOperand, UnsetOutput, ArithmeticOverflow.
 * - **Warnings** do not make `check_constraints()` fail by themselves.
 *   Examples: UnfilledInput for an input nothing reads, UnevaluatedGraph.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class GraphDiagnostics
{
public:
    /**
     * @brief Check if the graph has any errors.
     */
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    /**
     * @brief Check if the graph has any warnings.
     */
    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    /**
     * @brief Check if every constraint holds.
     * @return True if there are no errors (warnings are allowed).
     */
    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Get all diagnostic items (errors and warnings combined).
     * @return A vector containing all items, errors first then warnings.
     */
    std::vector<DiagnosticItem> all_items() const
    {
        std::vector<DiagnosticItem> result;
        result.reserve(m_errors.size() + m_warnings.size());
        result.insert(result.end(), m_errors.begin(), m_errors.end());
        result.insert(result.end(), m_warnings.begin(), m_warnings.end());
        return result;
    }

    /**
     * @brief Record an item under errors or warnings according to its severity.
     */
    void add(DiagnosticItem item)
    {
        if (item.severity == DiagnosticSeverity::Error)
        {
            m_errors.push_back(std::move(item));
        }
        else
        {
            m_warnings.push_back(std::move(item));
        }
    }

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace hintgraph
