/**
 * @file errors.hpp
 */
#pragma once
#include "giantt/common/common.hpp"

namespace giantt
{

/**
 * @brief Error codes carried by every giantt exception.
 */
enum class GianttErrorCode
{
    ParseFailure,
    ItemNotFound,
    DuplicateItem,
    NoMatch,
    AmbiguousMatch,
    CycleDetected,
    CircularInclude,
    MissingFile,
    WorkspaceInvalid,
    WriteFailed,
    IoFailure,
    InvalidArgument
};

/**
 * @brief Base class for all errors raised by the giantt library.
 *
 * @details
 * Each exception carries an error code and a descriptive message. Subclasses
 * identify the layer that raised the error so callers can catch by category:
 * - `ParseError` for malformed notation text.
 * - `CycleDetected` for a mutation rejected because it would close a cycle.
 * - `GraphOperationError` for graph mutations and lookups naming bad ids.
 * - `GraphException` for storage-level structural failures.
 * - `IOError` for file system failures.
 */
class GianttError : public std::exception
{
public:
    /**
     * @brief Construct a GianttError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    GianttError(GianttErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    GianttErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    GianttErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Raised when notation text does not match the grammar.
 *
 * @details
 * `input()` holds the offending text (a whole line, or the fragment being
 * parsed when the error came from a sub-grammar such as a duration).
 * `column()` is the zero-based byte offset within `input()` where the
 * mismatch was detected.
 */
class ParseError : public GianttError
{
public:
    ParseError(std::string message, std::string input, size_t column = 0)
        : GianttError(GianttErrorCode::ParseFailure, std::move(message))
        , m_input(std::move(input))
        , m_column(column)
    {
    }

    const std::string& input() const noexcept
    {
        return m_input;
    }

    size_t column() const noexcept
    {
        return m_column;
    }

private:
    std::string m_input;
    size_t m_column;
};

/**
 * @brief Raised when a mutation would introduce a cycle among strict edges.
 *
 * @details
 * `cycle()` lists the ids along the cycle with the first id repeated at the
 * end, e.g. `{"a", "b", "a"}`.
 */
class CycleDetected : public GianttError
{
public:
    explicit CycleDetected(std::vector<std::string> cycle)
        : GianttError(GianttErrorCode::CycleDetected, describe(cycle))
        , m_cycle(std::move(cycle))
    {
    }

    const std::vector<std::string>& cycle() const noexcept
    {
        return m_cycle;
    }

private:
    static std::string describe(const std::vector<std::string>& cycle)
    {
        std::string text = "Cycle detected: ";
        for (size_t i = 0; i < cycle.size(); ++i)
        {
            if (i > 0)
            {
                text += " -> ";
            }
            text += cycle[i];
        }
        return text;
    }

    std::vector<std::string> m_cycle;
};

/**
 * @brief Raised by graph mutations and lookups that reference bad item ids.
 */
class GraphOperationError : public GianttError
{
public:
    GraphOperationError(GianttErrorCode code, std::string message)
        : GianttError(code, std::move(message))
    {
    }
};

/**
 * @brief Raised by the storage layer for structural failures.
 *
 * @details
 * Circular or missing includes, workspace validation failures, and failed
 * atomic write batches.
 */
class GraphException : public GianttError
{
public:
    GraphException(GianttErrorCode code, std::string message)
        : GianttError(code, std::move(message))
    {
    }
};

/**
 * @brief Raised for file system failures (unreadable or unwritable paths).
 */
class IOError : public GianttError
{
public:
    explicit IOError(std::string message)
        : GianttError(GianttErrorCode::IoFailure, std::move(message))
    {
    }
};

} // namespace giantt
