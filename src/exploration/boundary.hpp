#ifndef PARETO_EXPLORATION_BOUNDARY_HPP
#define PARETO_EXPLORATION_BOUNDARY_HPP
/*
 * Solvers consumed by the exploration loop.
 * ---------------------------------------------------------------------------
 *  - AlphaSolver: Jacobian (T x P) -> min-norm simplex weights (T) and the norm
 *    of the weighted gradient sum.
 *  - LinearSolver: Krylov method for a symmetric, possibly indefinite operator.
 *    It receives the operator, right-hand side, starting guess and an iteration
 *    budget, and returns its best iterate. Convergence within the budget is not
 *    required; the caller keeps partial solutions.
 * All vectors crossing these boundaries are detached 1-D tensors in the model's
 * dtype and device.
 */

#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "../data/simplex.hpp"

namespace Pareto::Exploration {
    using LinearOperator = std::function<torch::Tensor(const torch::Tensor&)>;

    struct MinNormResult {
        torch::Tensor alpha{};
        double min_norm{0.0};
    };

    struct SolveResult {
        torch::Tensor solution{};
        bool converged{false};
        int64_t iterations{0};
        double residual{std::numeric_limits<double>::quiet_NaN()};
    };

    using AlphaSolver = std::function<MinNormResult(const torch::Tensor& jacobian)>;
    using LinearSolver = std::function<SolveResult(const LinearOperator& op,
                                                   const torch::Tensor& rhs,
                                                   const torch::Tensor& x0,
                                                   int64_t max_iter)>;

    namespace Detail {
        inline constexpr double kSimplexTolerance = 1e-4;
    }

    // Runs the alpha boundary and checks that its answer is a usable simplex vector.
    [[nodiscard]] inline torch::Tensor solve_alpha(const AlphaSolver& solver, const torch::Tensor& jacobian)
    {
        if (!solver) {
            throw ConfigurationError("No alpha solver configured.");
        }
        auto result = solver(jacobian.detach());
        if (!result.alpha.defined() || result.alpha.dim() != 1 || result.alpha.size(0) != jacobian.size(0)) {
            throw ConfigurationError("Alpha solver must return one weight per task (" + std::to_string(jacobian.size(0))
                                     + " expected).");
        }
        if (!Data::Simplex::contains(result.alpha, Detail::kSimplexTolerance)) {
            throw ConfigurationError("Alpha solver returned weights outside the probability simplex.");
        }
        return result.alpha.detach().to(jacobian.device(), jacobian.scalar_type());
    }

    [[nodiscard]] inline SolveResult solve_direction(const LinearSolver& solver,
                                                     const LinearOperator& op,
                                                     const torch::Tensor& rhs,
                                                     const torch::Tensor& x0,
                                                     int64_t max_iter)
    {
        if (!solver) {
            throw ConfigurationError("No linear solver configured.");
        }
        auto result = solver(op, rhs, x0, max_iter);
        if (!result.solution.defined() || result.solution.numel() != rhs.numel()) {
            throw ConfigurationError("Linear solver returned a solution of " +
                                     std::to_string(result.solution.defined() ? result.solution.numel() : 0)
                                     + " entries for a system of size " + std::to_string(rhs.numel()) + ".");
        }
        result.solution = result.solution.detach().reshape({-1}).to(rhs.device(), rhs.scalar_type());
        return result;
    }
}

#endif // PARETO_EXPLORATION_BOUNDARY_HPP
