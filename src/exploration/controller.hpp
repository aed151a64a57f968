#ifndef PARETO_EXPLORATION_CONTROLLER_HPP
#define PARETO_EXPLORATION_CONTROLLER_HPP
/*
 * Continuous exploration loop.
 * ---------------------------------------------------------------------------
 * For every starting weight combination k and every task direction t:
 *
 *   Seeded       load <root>/<k>/start/parameters.binary, fresh SGD optimizer
 *   WarmedUp     full-ratio Jacobian J0, alpha0 = min_norm(J0), reset both
 *                momentum buffers
 *   Stepping     x num_steps:
 *                  J   = estimate(sample_ratio)    Js = jacobian_buffer(J)
 *                  a   = min_norm(J)               as = alpha_buffer(a)
 *                  d   = krylov((H_as + damping I), Js[t], mean(Js))
 *                  grad <- d / |d|, one optimizer step
 *                  evaluate on the held-out batch
 *   Checkpointed <root>/<k>/<t>_<step>/
 *
 * Alpha is computed from the unsmoothed partial Jacobian and smoothed on its
 * own track. Every (k, t) run re-seeds from the same start checkpoint and
 * builds fresh momentum buffers and a fresh optimizer.
 */

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/config.hpp"
#include "../common/errors.hpp"
#include "../common/flatten.hpp"
#include "../common/model.hpp"
#include "../common/save_load.hpp"
#include "../data/stream.hpp"
#include "../evaluation/evaluation.hpp"
#include "../loss/loss.hpp"
#include "../optimizer/optimizer.hpp"
#include "boundary.hpp"
#include "estimator.hpp"
#include "hvp.hpp"
#include "momentum.hpp"
#include "options.hpp"

namespace Pareto::Exploration {
    enum class Phase { Idle, Seeded, WarmedUp, Stepping, Checkpointed, Done };

    [[nodiscard]] inline const char* to_string(Phase phase) noexcept
    {
        switch (phase) {
            case Phase::Idle: return "idle";
            case Phase::Seeded: return "seeded";
            case Phase::WarmedUp: return "warmed-up";
            case Phase::Stepping: return "stepping";
            case Phase::Checkpointed: return "checkpointed";
            case Phase::Done: return "done";
        }
        return "unknown";
    }

    struct StepRecord {
        std::size_t weight{0};
        std::size_t direction{0};
        std::size_t step{0};
        Evaluation::Report metrics{};
        std::vector<double> alpha{};
        double raw_direction_norm{0.0};
        bool solver_converged{false};
        int64_t solver_iterations{0};
        double solver_residual{std::numeric_limits<double>::quiet_NaN()};
        bool skipped{false};                   // non-finite or null direction, nothing applied
        std::filesystem::path checkpoint{};    // empty when nothing was persisted
    };

    struct RunReport {
        std::size_t weight{0};
        std::size_t direction{0};
        std::vector<StepRecord> steps{};
        bool cancelled{false};
    };

    struct ExplorationReport {
        std::vector<RunReport> runs{};
        bool cancelled{false};

        [[nodiscard]] std::size_t completed_steps() const noexcept
        {
            std::size_t total = 0;
            for (const auto& run : runs) {
                for (const auto& step : run.steps) {
                    total += step.skipped ? 0 : 1;
                }
            }
            return total;
        }

        [[nodiscard]] std::size_t skipped_steps() const noexcept
        {
            std::size_t total = 0;
            for (const auto& run : runs) {
                for (const auto& step : run.steps) {
                    total += step.skipped ? 1 : 0;
                }
            }
            return total;
        }
    };

    struct Callbacks {
        // Flat copy of the parameters right after loading the start checkpoint.
        std::function<void(std::size_t weight, std::size_t direction, const torch::Tensor& parameters)> on_seeded{};
        std::function<void(const StepRecord&)> on_step{};
    };

    // Unit-norm copy of the solver output, or nothing when it cannot be normalized.
    [[nodiscard]] inline std::optional<torch::Tensor> normalize_direction(const torch::Tensor& direction)
    {
        if (!direction.defined() || direction.numel() == 0) {
            return std::nullopt;
        }
        auto flat = direction.detach().reshape({-1});
        if (!torch::isfinite(flat).all().template item<bool>()) {
            return std::nullopt;
        }
        const auto norm = flat.norm().template item<double>();
        if (!std::isfinite(norm) || norm == 0.0) {
            return std::nullopt;
        }
        return flat / norm;
    }

    namespace Detail {
        [[nodiscard]] inline std::vector<double> to_vector(const torch::Tensor& tensor)
        {
            auto values = tensor.detach().to(torch::kCPU, torch::kFloat64).contiguous().reshape({-1});
            return std::vector<double>(values.template data_ptr<double>(),
                                       values.template data_ptr<double>() + values.numel());
        }

        inline std::ostream* log_stream(const ExplorationOptions& options)
        {
            return options.print_summary ? options.stream : nullptr;
        }

        inline void log_warning(const ExplorationOptions& options, const std::string& message)
        {
            if (options.stream != nullptr) {
                (*options.stream) << "[Pareto][warning] " << message << "\n";
            }
        }

        inline void maybe_print(std::ostream* stream, const StepRecord& record)
        {
            if (stream == nullptr) {
                return;
            }
            (*stream) << "[Pareto] weight " << record.weight << " direction " << record.direction
                      << " step " << record.step;
            if (record.skipped) {
                (*stream) << " | skipped\n";
                return;
            }
            (*stream) << " | |d|: " << std::setprecision(6) << record.raw_direction_norm
                      << " | solver: " << record.solver_iterations << " it"
                      << (record.solver_converged ? "" : " (not converged)");
            for (std::size_t task = 0; task < record.metrics.losses.size(); ++task) {
                (*stream) << " | task " << task << " loss: " << std::setprecision(6) << record.metrics.losses[task];
                if (!std::isnan(record.metrics.top1[task])) {
                    (*stream) << ", top1: " << std::setprecision(4) << record.metrics.top1[task];
                }
            }
            (*stream) << "\n";
        }
    }

    template <class Model>
    class ExplorationController {
    public:
        ExplorationController(Model& model,
                              std::vector<Loss::Descriptor> losses,
                              Data::CyclicStream estimator_stream,
                              Data::CyclicStream hvp_stream,
                              Data::Batch held_out,
                              AlphaSolver alpha_solver,
                              LinearSolver linear_solver,
                              ExplorationOptions options,
                              Callbacks callbacks = {})
            : model_(model),
              losses_(std::move(losses)),
              estimator_(model, losses_, std::move(estimator_stream)),
              hvp_(model, losses_, std::move(hvp_stream), options.damping),
              held_out_(std::move(held_out)),
              alpha_solver_(std::move(alpha_solver)),
              linear_solver_(std::move(linear_solver)),
              options_(std::move(options)),
              callbacks_(std::move(callbacks))
        {
            validate(options_, losses_.size());
            if (!alpha_solver_) {
                throw ConfigurationError("ExplorationController requires an alpha solver.");
            }
            if (!linear_solver_) {
                throw ConfigurationError("ExplorationController requires a linear solver.");
            }
            if (held_out_.targets.size() != losses_.size()) {
                throw ConfigurationError("Held-out set provides targets for " + std::to_string(held_out_.targets.size())
                                         + " tasks but " + std::to_string(losses_.size()) + " losses were given.");
            }
        }

        ExplorationController(const ExplorationController&) = delete;
        ExplorationController& operator=(const ExplorationController&) = delete;

        // Every configured weight combination times every direction. Cancellation is
        // checked between steps; a step that has started always completes.
        [[nodiscard]] ExplorationReport run(std::stop_token stop = {})
        {
            ExplorationReport report{};
            if (options_.save_checkpoints) {
                Common::Config::save_exploration_options(options_.checkpoint_root / Common::Config::kOptionsFile,
                                                         options_);
            }

            const auto directions = active_directions();
            for (std::size_t weight = 0; weight < options_.weights.size(); ++weight) {
                for (const auto direction : directions) {
                    if (stop.stop_requested()) {
                        report.cancelled = true;
                        break;
                    }
                    report.runs.push_back(run_single(weight, direction, stop));
                    if (report.runs.back().cancelled) {
                        report.cancelled = true;
                        break;
                    }
                }
                if (report.cancelled) {
                    break;
                }
            }

            phase_ = Phase::Done;
            if (auto* stream = Detail::log_stream(options_)) {
                (*stream) << "[Pareto] exploration " << (report.cancelled ? "cancelled" : "finished") << " after "
                          << report.completed_steps() << " steps (" << report.skipped_steps() << " skipped)\n";
            }
            return report;
        }

        [[nodiscard]] RunReport run_single(std::size_t weight, std::size_t direction, std::stop_token stop = {})
        {
            if (weight >= options_.weights.size()) {
                throw ConfigurationError("Weight index " + std::to_string(weight) + " is out of range for "
                                         + std::to_string(options_.weights.size()) + " combinations.");
            }
            if (direction >= losses_.size()) {
                throw ConfigurationError("Direction " + std::to_string(direction) + " is out of range for "
                                         + std::to_string(losses_.size()) + " tasks.");
            }

            RunReport report{.weight = weight, .direction = direction};
            auto params = Common::trainable_parameters(model_);

            // Seeded
            Common::SaveLoad::load_start(options_.checkpoint_root, weight, params);
            auto optimizer = Optimizer::make(params, options_.optimizer);
            phase_ = Phase::Seeded;
            if (auto* stream = Detail::log_stream(options_)) {
                (*stream) << "[Pareto] weight " << weight << " direction " << direction << " seeded from "
                          << Common::SaveLoad::start_directory(options_.checkpoint_root, weight).string() << "\n";
            }
            if (callbacks_.on_seeded) {
                callbacks_.on_seeded(weight, direction, Common::flatten_parameters(params));
            }

            // WarmedUp
            MomentumBuffer jacobian_buffer(options_.momentum);
            MomentumBuffer alpha_buffer(options_.momentum);
            const auto jacobian = estimator_.estimate(options_.warmup_ratio);
            jacobian_buffer.reset(jacobian);
            alpha_buffer.reset(solve_alpha(alpha_solver_, jacobian));
            phase_ = Phase::WarmedUp;

            for (int64_t step = 0; step < options_.num_steps; ++step) {
                if (stop.stop_requested()) {
                    report.cancelled = true;
                    break;
                }
                phase_ = Phase::Stepping;
                auto record = take_step(weight, direction, static_cast<std::size_t>(step),
                                         params, *optimizer, jacobian_buffer, alpha_buffer);
                Detail::maybe_print(Detail::log_stream(options_), record);
                if (callbacks_.on_step) {
                    callbacks_.on_step(record);
                }
                report.steps.push_back(std::move(record));
            }
            return report;
        }

        [[nodiscard]] Phase phase() const noexcept { return phase_; }
        [[nodiscard]] const ExplorationOptions& options() const noexcept { return options_; }
        [[nodiscard]] const GradientEstimator<Model>& estimator() const noexcept { return estimator_; }
        [[nodiscard]] const ImplicitHVPOperator<Model>& hvp() const noexcept { return hvp_; }

        [[nodiscard]] std::vector<std::size_t> active_directions() const
        {
            if (!options_.directions.empty()) {
                return options_.directions;
            }
            std::vector<std::size_t> directions(losses_.size());
            for (std::size_t task = 0; task < directions.size(); ++task) {
                directions[task] = task;
            }
            return directions;
        }

    private:
        StepRecord take_step(std::size_t weight,
                             std::size_t direction,
                             std::size_t step,
                             const std::vector<torch::Tensor>& params,
                             torch::optim::Optimizer& optimizer,
                             MomentumBuffer& jacobian_buffer,
                             MomentumBuffer& alpha_buffer)
        {
            StepRecord record{.weight = weight, .direction = direction, .step = step};

            const auto partial = estimator_.estimate(options_.sample_ratio);
            const auto smoothed_jacobian = jacobian_buffer.update(partial);
            const auto smoothed_alpha = alpha_buffer.update(solve_alpha(alpha_solver_, partial));
            record.alpha = Detail::to_vector(smoothed_alpha);

            const auto rhs = smoothed_jacobian[static_cast<int64_t>(direction)].clone();
            const auto x0 = smoothed_jacobian.mean(0);

            SolveResult solved{};
            {
                auto binding = hvp_.bind(smoothed_alpha);
                solved = solve_direction(linear_solver_, hvp_.as_linear_operator(), rhs, x0, options_.max_iter);
            }
            record.solver_converged = solved.converged;
            record.solver_iterations = solved.iterations;
            record.solver_residual = solved.residual;
            record.raw_direction_norm = solved.solution.norm().template item<double>();

            if (!solved.converged) {
                std::ostringstream message;
                message << "linear solver stopped after " << solved.iterations << " iterations (residual "
                        << solved.residual << ") at weight " << weight << " direction " << direction
                        << " step " << step;
                if (options_.strict_convergence) {
                    throw NonConvergenceError(message.str(), solved.iterations, solved.residual);
                }
                Detail::log_warning(options_, message.str() + "; keeping the partial solution");
            }

            const auto unit = normalize_direction(solved.solution);
            if (!unit) {
                Detail::log_warning(options_, "direction at weight " + std::to_string(weight) + " direction "
                                                  + std::to_string(direction) + " step " + std::to_string(step)
                                                  + " is not finite or has zero norm; step skipped");
                record.skipped = true;
                return record;
            }

            optimizer.zero_grad();
            Common::assign_gradients(*unit, params);
            optimizer.step();

            record.metrics = Evaluation::Evaluate(model_, losses_, held_out_.inputs, held_out_.targets,
                                                  options_.evaluation);
            if (!record.metrics.finite()) {
                Detail::log_warning(options_, "held-out losses are not finite at weight " + std::to_string(weight)
                                                  + " direction " + std::to_string(direction) + " step "
                                                  + std::to_string(step));
            }

            if (options_.save_checkpoints) {
                Common::SaveLoad::CheckpointRecord checkpoint{};
                checkpoint.key = {weight, direction, step};
                checkpoint.weights = options_.weights[weight];
                checkpoint.losses = record.metrics.losses;
                checkpoint.top1 = record.metrics.top1;
                checkpoint.alpha = record.alpha;
                checkpoint.raw_direction_norm = record.raw_direction_norm;
                checkpoint.solver_converged = record.solver_converged;
                checkpoint.solver_iterations = record.solver_iterations;
                checkpoint.solver_residual = record.solver_residual;
                record.checkpoint = Common::SaveLoad::write_checkpoint(options_.checkpoint_root, checkpoint, params,
                                                                       optimizer, options_.overwrite_checkpoints);
                phase_ = Phase::Checkpointed;
            }
            return record;
        }

        Model& model_;
        std::vector<Loss::Descriptor> losses_;
        GradientEstimator<Model> estimator_;
        ImplicitHVPOperator<Model> hvp_;
        Data::Batch held_out_;
        AlphaSolver alpha_solver_;
        LinearSolver linear_solver_;
        ExplorationOptions options_;
        Callbacks callbacks_;
        Phase phase_{Phase::Idle};
    };
}

#endif // PARETO_EXPLORATION_CONTROLLER_HPP
