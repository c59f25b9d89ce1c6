/**
 * @file errors.hpp
 * @brief Exception hierarchy for the simulation engine
 *
 * Every error carries optional context (step date, symbol, policy name)
 * so a failure inside a long run can be traced to the step that caused it.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace portsim
{

    /**
     * @struct ErrorContext
     * @brief Where in a run an error was raised
     */
    struct ErrorContext
    {
        std::string date;   ///< Simulation step date (YYYY-MM-DD)
        std::string symbol; ///< Asset involved, if any
        std::string policy; ///< Allocation policy name, if any

        bool empty() const { return date.empty() && symbol.empty() && policy.empty(); }

        std::string describe() const
        {
            std::string out;
            if (!date.empty())
                out += "date=" + date;
            if (!symbol.empty())
                out += (out.empty() ? "" : " ") + std::string("symbol=") + symbol;
            if (!policy.empty())
                out += (out.empty() ? "" : " ") + std::string("policy=") + policy;
            return out;
        }
    };

    /**
     * @class SimulationError
     * @brief Base class for all engine errors
     */
    class SimulationError : public std::runtime_error
    {
    public:
        SimulationError(const std::string &kind, const std::string &msg,
                        const ErrorContext &context = ErrorContext())
            : std::runtime_error(format(kind, msg, context)),
              kind_(kind), detail_(msg), context_(context)
        {
        }

        const std::string &kind() const { return kind_; }
        const std::string &detail() const { return detail_; }
        const ErrorContext &context() const { return context_; }

    private:
        static std::string format(const std::string &kind, const std::string &msg,
                                  const ErrorContext &context)
        {
            std::string text = kind + ": " + msg;
            if (!context.empty())
                text += " [" + context.describe() + "]";
            return text;
        }

        std::string kind_;
        std::string detail_;
        ErrorContext context_;
    };

    /// Invalid or missing policy parameters, empty asset universe.
    class ConfigurationError : public SimulationError
    {
    public:
        explicit ConfigurationError(const std::string &msg, const ErrorContext &context = ErrorContext())
            : SimulationError("ConfigurationError", msg, context) {}
    };

    /// Start date not before end date, or no data inside the window.
    class InvalidDateRangeError : public SimulationError
    {
    public:
        explicit InvalidDateRangeError(const std::string &msg, const ErrorContext &context = ErrorContext())
            : SimulationError("InvalidDateRangeError", msg, context) {}
    };

    /// Singular covariance, solver failure, non-convergence.
    class OptimizationError : public SimulationError
    {
    public:
        explicit OptimizationError(const std::string &msg, const ErrorContext &context = ErrorContext())
            : SimulationError("OptimizationError", msg, context) {}
    };

    /// A cash debit would take the balance below zero.
    class InsufficientCashError : public SimulationError
    {
    public:
        InsufficientCashError(const std::string &msg, double requested, double available,
                              const ErrorContext &context = ErrorContext())
            : SimulationError("InsufficientCashError", msg, context),
              requested_(requested), available_(available) {}

        double requested() const { return requested_; }
        double available() const { return available_; }

    private:
        double requested_;
        double available_;
    };

    /// Mutation attempted on a portfolio that is not in the required state.
    class InvalidStateError : public SimulationError
    {
    public:
        explicit InvalidStateError(const std::string &msg, const ErrorContext &context = ErrorContext())
            : SimulationError("InvalidStateError", msg, context) {}
    };

} // namespace portsim
