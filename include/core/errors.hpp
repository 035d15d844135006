/**
 * @file errors.hpp
 * @brief Exception types raised by the rebalancing core
 *
 * All three derive from the standard exception hierarchy so callers that
 * already catch std::invalid_argument / std::runtime_error keep working.
 *
 * - ValidationError: malformed portfolio input
 * - DomainError: arithmetic that is undefined for the given inputs
 * - OptimizationError: the LP solver could not produce an optimum
 */

#ifndef CAPM_CORE_ERRORS_HPP
#define CAPM_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace capm
{

    /**
     * @class ValidationError
     * @brief Malformed input (empty portfolio, negative price, missing return)
     */
    class ValidationError : public std::invalid_argument
    {
    public:
        explicit ValidationError(const std::string &message)
            : std::invalid_argument(message)
        {
        }
    };

    /**
     * @class DomainError
     * @brief Division by zero or a non-finite intermediate value
     */
    class DomainError : public std::domain_error
    {
    public:
        explicit DomainError(const std::string &message)
            : std::domain_error(message)
        {
        }
    };

    /**
     * @class OptimizationError
     * @brief Solver reported infeasible, unbounded or failed
     *
     * The solver status string is kept alongside the message so callers can
     * branch on it without parsing what().
     */
    class OptimizationError : public std::runtime_error
    {
    public:
        OptimizationError(const std::string &message, const std::string &solver_status)
            : std::runtime_error(message), solver_status_(solver_status)
        {
        }

        const std::string &solver_status() const { return solver_status_; }

    private:
        std::string solver_status_;
    };

} // namespace capm

#endif // CAPM_CORE_ERRORS_HPP
