#ifndef PARETO_COMMON_ERRORS_HPP
#define PARETO_COMMON_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Pareto {
    // Invalid user input: sample ratios, option values, tensor shapes that do not line up.
    class ConfigurationError : public std::invalid_argument {
    public:
        explicit ConfigurationError(const std::string& message) : std::invalid_argument(message) {}
    };

    // An object was used outside the lifecycle it supports (unbound operator, unset buffer).
    class InvalidStateError : public std::logic_error {
    public:
        explicit InvalidStateError(const std::string& message) : std::logic_error(message) {}
    };

    // Only raised when strict convergence is requested; otherwise the best-effort solution is kept.
    class NonConvergenceError : public std::runtime_error {
    public:
        NonConvergenceError(const std::string& message, std::int64_t iterations, double residual)
            : std::runtime_error(message), iterations_(iterations), residual_(residual) {}

        [[nodiscard]] std::int64_t iterations() const noexcept { return iterations_; }
        [[nodiscard]] double residual() const noexcept { return residual_; }

    private:
        std::int64_t iterations_;
        double residual_;
    };
}

#endif // PARETO_COMMON_ERRORS_HPP
