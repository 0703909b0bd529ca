/**
 * @file errors.hpp
 * @brief Exception types and error codes used across genoflow.
 */
#pragma once
#include "genoflow/common/common.hpp"

namespace genoflow
{

class PlanDiagnostics;

/**
 * @brief Error codes raised while compiling or validating a Plan.
 *
 * @details
 * All of these are fatal for the operation that raised them: no Plan is
 * produced and no task runs.
 */
enum class PlanErrorCode
{
    InvalidConfiguration,
    UnknownDependency,
    CyclicDependency,
    UndeclaredDependency
};

inline const char* to_string(PlanErrorCode code) noexcept
{
    switch (code)
    {
    case PlanErrorCode::InvalidConfiguration:
        return "InvalidConfiguration";
    case PlanErrorCode::UnknownDependency:
        return "UnknownDependency";
    case PlanErrorCode::CyclicDependency:
        return "CyclicDependency";
    case PlanErrorCode::UndeclaredDependency:
        return "UndeclaredDependency";
    }
    return "Unknown";
}

/**
 * @brief Exception thrown when a Plan cannot be compiled or fails validation.
 *
 * @details
 * Each exception carries an error code and a descriptive message. When the
 * error comes from the validation pass, the full diagnostics (all errors and
 * warnings found) are attached as well; the code is that of the first error.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class PlanError : public std::exception
{
public:
    /**
     * @brief Construct a PlanError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     * @param diagnostics Validation diagnostics, or nullptr.
     */
    PlanError(PlanErrorCode code,
              std::string message,
              std::shared_ptr<const PlanDiagnostics> diagnostics = nullptr)
        : m_code(code)
        , m_message(std::move(message))
        , m_diagnostics(std::move(diagnostics))
    {
    }

    PlanErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

    /**
     * @brief Diagnostics that caused the failure, if raised by validation.
     */
    const std::shared_ptr<const PlanDiagnostics>& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

private:
    PlanErrorCode m_code;
    std::string m_message;
    std::shared_ptr<const PlanDiagnostics> m_diagnostics;
};

/**
 * @brief Error codes raised while resolving output references.
 */
enum class ResolutionErrorCode
{
    /// The producing task has not Succeeded at resolution time.
    UnresolvedReference,
    /// The producing task Succeeded but did not emit the requested key.
    MissingOutputKey
};

inline const char* to_string(ResolutionErrorCode code) noexcept
{
    switch (code)
    {
    case ResolutionErrorCode::UnresolvedReference:
        return "UnresolvedReference";
    case ResolutionErrorCode::MissingOutputKey:
        return "MissingOutputKey";
    }
    return "Unknown";
}

/**
 * @brief Exception thrown by the reference resolver. Fails the owning task only.
 */
class ResolutionError : public std::exception
{
public:
    ResolutionError(ResolutionErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    ResolutionErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    ResolutionErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Failure signaled by a task body.
 *
 * @details
 * `kind` is a short machine-readable classification chosen by the task body
 * (e.g. "io", "timeout", "invalid_input"); `what()` is the verbatim message
 * preserved in the TaskResult.
 */
class TaskError : public std::runtime_error
{
public:
    TaskError(std::string kind, const std::string& message)
        : std::runtime_error(message)
        , m_kind(std::move(kind))
    {
    }

    const std::string& kind() const noexcept
    {
        return m_kind;
    }

private:
    std::string m_kind;
};

/**
 * @brief Exception thrown when a persisted document cannot be read or written.
 */
class PersistenceError : public std::runtime_error
{
public:
    explicit PersistenceError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

} // namespace genoflow
