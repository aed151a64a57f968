#include <cmath>
#include <filesystem>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <stop_token>
#include <vector>

#include "support.hpp"

using namespace ParetoTest;
namespace Exploration = Pareto::Exploration;
namespace SaveLoad = Pareto::Common::SaveLoad;

namespace {
    const std::vector<Pareto::Loss::Descriptor> kLosses{Pareto::Loss::MAE(), Pareto::Loss::MAE()};

    struct Fixture {
        TempDirectory directory{"exploration"};
        SplitHead model;
        std::vector<Pareto::Loss::Descriptor> losses;
        torch::Tensor start;
        std::ostringstream log;

        explicit Fixture(std::vector<Pareto::Loss::Descriptor> task_losses = kLosses) : losses(std::move(task_losses))
        {
            const auto params = Pareto::Common::trainable_parameters(model);
            (void)SaveLoad::write_start(directory.path(), 0, params);
            start = Pareto::Common::flatten_parameters(params);
        }

        Exploration::ExplorationOptions options(int64_t num_steps)
        {
            Exploration::ExplorationOptions options{};
            options.damping = 0.1;
            options.momentum = 0.9;
            options.warmup_ratio = 1.0;
            options.sample_ratio = 0.5;
            options.num_steps = num_steps;
            options.max_iter = 10;
            options.weights = {{0.5, 0.5}};
            options.optimizer = Pareto::Optimizer::SGD({.learning_rate = 0.01});
            options.evaluation.batch_size = 4;
            options.checkpoint_root = directory.path();
            options.stream = &log;
            return options;
        }

        Exploration::ExplorationController<SplitHead> controller(Exploration::ExplorationOptions options,
                                                                 Exploration::LinearSolver solver = conjugate_gradient,
                                                                 Exploration::Callbacks callbacks = {},
                                                                 Exploration::AlphaSolver alpha_solver = two_task_min_norm)
        {
            return Exploration::ExplorationController<SplitHead>(model, losses, split_head_stream(), split_head_stream(),
                                                                 split_head_batch(4), std::move(alpha_solver), std::move(solver),
                                                                 std::move(options), std::move(callbacks));
        }

        [[nodiscard]] torch::Tensor current() { return Pareto::Common::flatten_parameters(Pareto::Common::trainable_parameters(model)); }
    };
}

int main()
{
    Checker check;

    // Normalization of solver output.
    {
        for (const double scale : {1e-8, 1.0, 3.0, 1e8}) {
            const auto unit = Exploration::normalize_direction(scale * vec({3.0, -4.0, 0.0}));
            check.expect(unit.has_value() && std::abs(unit->norm().item<double>() - 1.0) < 1e-12,
                         "normalized direction has unit norm");
            check.expect(unit.has_value() && close(*unit, vec({0.6, -0.8, 0.0})), "normalization keeps the direction");
        }
        const auto nan = std::numeric_limits<double>::quiet_NaN();
        const auto inf = std::numeric_limits<double>::infinity();
        check.expect(!Exploration::normalize_direction(vec({1.0, nan})).has_value(), "NaN direction is rejected");
        check.expect(!Exploration::normalize_direction(vec({inf, 0.0})).has_value(), "infinite direction is rejected");
        check.expect(!Exploration::normalize_direction(vec({0.0, 0.0})).has_value(), "zero direction is rejected");
    }

    // Two tasks, four parameters, rows [1,0,0,0] and [0,1,0,0], flat loss landscape:
    // (0.1 I) d = [1,0,0,0] from x0 = [0.5,0.5,0,0] gives d = [10,0,0,0].
    {
        SplitHead model;
        Exploration::GradientEstimator<SplitHead> estimator(model, kLosses, split_head_stream());
        Exploration::ImplicitHVPOperator<SplitHead> hvp(model, kLosses, split_head_stream(), 0.1);

        const auto jacobian = estimator.estimate(1.0);
        check.expect(close(jacobian, torch::tensor({{1.0, 0.0, 0.0, 0.0}, {0.0, 1.0, 0.0, 0.0}}, torch::kFloat64)),
                     "scenario Jacobian rows");
        const auto alpha = Exploration::solve_alpha(two_task_min_norm, jacobian);
        check.expect(close(alpha, vec({0.5, 0.5})), "scenario alpha");

        Exploration::SolveResult solved{};
        {
            auto binding = hvp.bind(alpha);
            solved = Exploration::solve_direction(conjugate_gradient, hvp.as_linear_operator(), jacobian[0].clone(),
                                                  jacobian.mean(0), 10);
        }
        check.expect(close(solved.solution, vec({10.0, 0.0, 0.0, 0.0}), 1e-8), "raw direction before normalization");
        const auto unit = Exploration::normalize_direction(solved.solution);
        check.expect(unit.has_value() && close(*unit, vec({1.0, 0.0, 0.0, 0.0}), 1e-8), "direction after normalization");
        check.expect(!hvp.bound(), "operator released after the solve");
    }

    // Same scenario through the controller: one step along task 0.
    {
        Fixture fixture;
        std::vector<Exploration::StepRecord> records;
        Exploration::Callbacks callbacks{.on_step = [&](const Exploration::StepRecord& record) { records.push_back(record); }};
        auto controller = fixture.controller(fixture.options(1), conjugate_gradient, callbacks);

        const auto run = controller.run_single(0, 0);
        check.expect(run.steps.size() == 1 && records.size() == 1, "one step recorded");
        check.expect(controller.phase() == Exploration::Phase::Checkpointed, "step ends checkpointed");

        const auto& step = run.steps.front();
        check.expect(!step.skipped, "finite step is applied");
        check.expect(std::abs(step.raw_direction_norm - 10.0) < 1e-8, "raw direction norm");
        check.expect(step.alpha.size() == 2 && std::abs(step.alpha[0] - 0.5) < 1e-12, "smoothed alpha recorded");
        check.expect(close(fixture.current(), fixture.start - 0.01 * vec({1.0, 0.0, 0.0, 0.0}), 1e-12),
                     "exactly one SGD step along the unit direction");

        const auto directory = SaveLoad::step_directory(fixture.directory.path(), {0, 0, 0});
        check.expect(step.checkpoint == directory, "checkpoint path reported");
        check.expect(std::filesystem::exists(directory / SaveLoad::kParametersFile)
                         && std::filesystem::exists(directory / SaveLoad::kOptimizerFile),
                     "parameter and optimizer state persisted");
        const auto metrics = SaveLoad::read_metrics(directory);
        check.expect(std::abs(metrics.losses[0] - 100.49) < 1e-9 && std::abs(metrics.losses[1] - 99.75) < 1e-9,
                     "held-out losses persisted");
        check.expect(std::isnan(metrics.top1[0]) && std::isnan(metrics.top1[1]), "top-1 undefined for regression tasks");
        check.expect(metrics.solver_converged, "solver diagnostics persisted");

        check.expect(fixture.log.str().find("[Pareto] weight 0 direction 0 step 0") != std::string::npos,
                     "step summary logged");

        check.expect_throw<std::runtime_error>([&] { (void)controller.run_single(0, 0); },
                                               "existing checkpoints are not overwritten");
    }

    // Every direction re-seeds from the start checkpoint.
    {
        Fixture fixture;
        std::vector<torch::Tensor> seeds;
        Exploration::Callbacks callbacks{
            .on_seeded = [&](std::size_t, std::size_t, const torch::Tensor& parameters) { seeds.push_back(parameters); }};
        auto controller = fixture.controller(fixture.options(2), conjugate_gradient, callbacks);

        const auto report = controller.run();
        check.expect(!report.cancelled && report.runs.size() == 2 && report.completed_steps() == 4, "full sweep");
        check.expect(controller.phase() == Exploration::Phase::Done, "sweep ends done");
        check.expect(seeds.size() == 2 && torch::equal(seeds[0], fixture.start) && torch::equal(seeds[1], fixture.start),
                     "seeded state is bit-identical for every direction");

        const auto root = fixture.directory.path();
        for (const auto& key : std::vector<SaveLoad::CheckpointKey>{{0, 0, 0}, {0, 0, 1}, {0, 1, 0}, {0, 1, 1}}) {
            check.expect(std::filesystem::exists(SaveLoad::step_directory(root, key) / SaveLoad::kMetricsFile),
                         "checkpoint for every (direction, step)");
        }
        check.expect(std::filesystem::exists(root / Pareto::Common::Config::kOptionsFile), "sweep options recorded");

        const auto first = SaveLoad::read_metrics(SaveLoad::step_directory(root, {0, 1, 0}));
        check.expect(std::abs(first.losses[0] - 100.5) < 1e-9, "direction 1 starts from the untouched task 0 head");
        check.expect(std::abs(first.losses[1] - 99.74) < 1e-9, "direction 1 moves the task 1 head");
    }

    // Quadratic heads make the Jacobian move with the parameters, so every smoothed quantity is checkable.
    // d/da mean((a + 100)^2) = 2 (a + 100): a = 0.5 and b = -0.25 give rows [201,0,0,0] and [0,199.5,0,0].
    // With momentum 0.5 and unit SGD steps the second step sees the average of the first two estimates.
    {
        Fixture fixture({Pareto::Loss::MSE(), Pareto::Loss::MSE()});
        auto options = fixture.options(2);
        options.momentum = 0.5;
        options.optimizer = Pareto::Optimizer::SGD({.learning_rate = 1.0});
        options.save_checkpoints = false;

        std::vector<torch::Tensor> alpha_inputs;
        Exploration::AlphaSolver recording_alpha = [&](const torch::Tensor& jacobian) {
            alpha_inputs.push_back(jacobian.clone());
            return two_task_min_norm(jacobian);
        };
        std::vector<torch::Tensor> rhs_seen;
        std::vector<torch::Tensor> x0_seen;
        Exploration::LinearSolver recording_solver = [&](const Exploration::LinearOperator&, const torch::Tensor& rhs,
                                                         const torch::Tensor& x0, int64_t) {
            rhs_seen.push_back(rhs.clone());
            x0_seen.push_back(x0.clone());
            return Exploration::SolveResult{rhs.clone(), true, 1, 0.0};
        };

        auto controller = fixture.controller(options, recording_solver, {}, recording_alpha);
        const auto report = controller.run();
        check.expect(report.runs.size() == 2 && report.completed_steps() == 4, "quadratic sweep completes");
        check.expect(alpha_inputs.size() == 6 && rhs_seen.size() == 4 && x0_seen.size() == 4,
                     "one alpha solve per warmup and step, one linear solve per step");

        const auto start_jacobian = torch::tensor({{201.0, 0.0, 0.0, 0.0}, {0.0, 199.5, 0.0, 0.0}}, torch::kFloat64);
        const auto moved_a = torch::tensor({{199.0, 0.0, 0.0, 0.0}, {0.0, 199.5, 0.0, 0.0}}, torch::kFloat64);
        const auto moved_b = torch::tensor({{201.0, 0.0, 0.0, 0.0}, {0.0, 197.5, 0.0, 0.0}}, torch::kFloat64);
        const auto alpha_of = [](const torch::Tensor& jacobian) { return two_task_min_norm(jacobian).alpha; };
        if (alpha_inputs.size() == 6 && rhs_seen.size() == 4 && report.runs.size() == 2) {
            // Direction 0: a moves from 0.5 to -0.5 after the first step.
            check.expect(close(alpha_inputs[0], start_jacobian) && close(alpha_inputs[1], start_jacobian),
                         "warmup and first step estimate at the start point");
            check.expect(close(alpha_inputs[2], moved_a), "alpha is solved from the unsmoothed partial Jacobian");
            check.expect(close(rhs_seen[0], vec({201.0, 0.0, 0.0, 0.0})) && close(x0_seen[0], vec({100.5, 99.75, 0.0, 0.0})),
                         "first step solves against the warmed-up Jacobian");
            check.expect(close(rhs_seen[1], vec({200.0, 0.0, 0.0, 0.0})), "rhs is the smoothed row of the target task");
            check.expect(close(x0_seen[1], vec({100.0, 99.75, 0.0, 0.0})), "initial guess is the smoothed task mean");

            const auto& steps = report.runs[0].steps;
            check.expect(close(vec(steps[0].alpha), alpha_of(start_jacobian), 1e-12), "first step alpha");
            check.expect(close(vec(steps[1].alpha), 0.5 * (alpha_of(start_jacobian) + alpha_of(moved_a)), 1e-12),
                         "alpha is smoothed on its own momentum track");
            check.expect(std::abs(steps[1].raw_direction_norm - 200.0) < 1e-12, "raw norm of the smoothed row");

            // Direction 1 starts over: fresh buffers hold only estimates taken from the start point.
            check.expect(close(alpha_inputs[3], start_jacobian) && close(alpha_inputs[4], start_jacobian),
                         "second direction warms up at the start point");
            check.expect(close(alpha_inputs[5], moved_b), "second direction estimates after moving b");
            check.expect(close(rhs_seen[2], vec({0.0, 199.5, 0.0, 0.0})) && close(x0_seen[2], vec({100.5, 99.75, 0.0, 0.0})),
                         "second direction carries no momentum from the first");
            check.expect(close(rhs_seen[3], vec({0.0, 198.5, 0.0, 0.0})) && close(x0_seen[3], vec({100.5, 99.25, 0.0, 0.0})),
                         "second direction smooths only its own estimates");

            const auto& other = report.runs[1].steps;
            check.expect(close(vec(other[0].alpha), alpha_of(start_jacobian), 1e-12),
                         "alpha buffer is reset for every direction");
            check.expect(close(vec(other[1].alpha), 0.5 * (alpha_of(start_jacobian) + alpha_of(moved_b)), 1e-12),
                         "second direction alpha smooths its own track");
        }
        check.expect(close(fixture.current(), vec({0.5, -2.25, 2.0, 2.0}), 1e-12),
                     "last direction took two unit steps on b from the start point");
    }

    // Cancellation is honored at the next step boundary.
    {
        Fixture fixture;
        std::stop_source source;
        Exploration::Callbacks callbacks{.on_step = [&](const Exploration::StepRecord&) { source.request_stop(); }};
        auto controller = fixture.controller(fixture.options(3), conjugate_gradient, callbacks);

        const auto report = controller.run(source.get_token());
        check.expect(report.cancelled, "report flags cancellation");
        check.expect(report.runs.size() == 1 && report.runs.front().steps.size() == 1, "the running step completes");
        check.expect(report.runs.front().cancelled, "run flags cancellation");
    }

    // Non-finite or null directions are reported and never applied or persisted.
    for (const double fill : {std::numeric_limits<double>::quiet_NaN(), 0.0}) {
        Fixture fixture;
        Exploration::LinearSolver broken = [fill](const Exploration::LinearOperator&, const torch::Tensor& rhs,
                                                  const torch::Tensor&, int64_t) {
            return Exploration::SolveResult{torch::full_like(rhs, fill), true, 1, 0.0};
        };
        auto controller = fixture.controller(fixture.options(2), broken);
        const auto run = controller.run_single(0, 0);

        check.expect(run.steps.size() == 2 && run.steps[0].skipped && run.steps[1].skipped, "unusable steps are skipped");
        check.expect(torch::equal(fixture.current(), fixture.start), "skipped steps leave the parameters untouched");
        check.expect(!std::filesystem::exists(SaveLoad::step_directory(fixture.directory.path(), {0, 0, 0})),
                     "skipped steps write no checkpoint");
        check.expect(fixture.log.str().find("[Pareto][warning]") != std::string::npos, "skip is reported as a warning");
    }

    // Non-convergence keeps the partial solution unless strict mode is requested.
    {
        Exploration::LinearSolver stalled = [](const Exploration::LinearOperator&, const torch::Tensor&,
                                               const torch::Tensor& x0, int64_t max_iter) {
            return Exploration::SolveResult{x0.clone(), false, max_iter, 1.0};
        };

        Fixture lenient;
        auto controller = lenient.controller(lenient.options(1), stalled);
        const auto run = controller.run_single(0, 1);
        check.expect(!run.steps.front().skipped && !run.steps.front().solver_converged, "partial solution applied");
        check.expect(lenient.log.str().find("linear solver stopped after 10 iterations") != std::string::npos,
                     "non-convergence is reported");

        Fixture strict;
        auto options = strict.options(1);
        options.strict_convergence = true;
        auto strict_controller = strict.controller(options, stalled);
        check.expect_throw<Pareto::NonConvergenceError>([&] { (void)strict_controller.run_single(0, 1); },
                                                        "strict mode raises on non-convergence");
        check.expect(torch::equal(strict.current(), strict.start), "strict failure happens before the step");
    }

    // Option and boundary validation.
    {
        Fixture fixture;
        auto no_weights = fixture.options(1);
        no_weights.weights.clear();
        check.expect_throw<Pareto::ConfigurationError>([&] { (void)fixture.controller(no_weights); }, "no weights");

        auto off_simplex = fixture.options(1);
        off_simplex.weights = {{0.7, 0.7}};
        check.expect_throw<Pareto::ConfigurationError>([&] { (void)fixture.controller(off_simplex); },
                                                       "weights off the simplex");

        auto controller = fixture.controller(fixture.options(1));
        check.expect_throw<Pareto::ConfigurationError>([&] { (void)controller.run_single(0, 2); }, "direction out of range");
        check.expect_throw<Pareto::ConfigurationError>([&] { (void)controller.run_single(1, 0); }, "weight out of range");

        auto bad_alpha = Exploration::ExplorationController<SplitHead>(
            fixture.model, kLosses, split_head_stream(), split_head_stream(), split_head_batch(4),
            [](const torch::Tensor& jacobian) {
                return Exploration::MinNormResult{torch::full({jacobian.size(0)}, 0.9, jacobian.options()), 0.0};
            },
            conjugate_gradient, fixture.options(1));
        check.expect_throw<Pareto::ConfigurationError>([&] { (void)bad_alpha.run_single(0, 0); },
                                                       "alpha outside the simplex");

        auto missing = fixture.options(1);
        missing.checkpoint_root = fixture.directory.path() / "absent";
        auto unseeded = fixture.controller(missing);
        check.expect_throw<std::runtime_error>([&] { (void)unseeded.run_single(0, 0); }, "missing start checkpoint");
    }

    return check.finish("Exploration controller test");
}
