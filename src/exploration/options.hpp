#ifndef PARETO_EXPLORATION_OPTIONS_HPP
#define PARETO_EXPLORATION_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "../common/errors.hpp"
#include "../data/simplex.hpp"
#include "../evaluation/evaluation.hpp"
#include "../optimizer/optimizer.hpp"

namespace Pareto::Exploration {
    struct ExplorationOptions {
        double damping{0.1};
        double momentum{0.9};
        double warmup_ratio{1.0};    // fraction of an epoch for the unsmoothed seed estimate
        double sample_ratio{0.25};   // fraction of an epoch per step
        int64_t num_steps{10};
        int64_t max_iter{50};        // Krylov iteration budget per step

        // Starting points on the simplex; entry k pairs with <checkpoint_root>/<k>/start.
        std::vector<std::vector<double>> weights{};
        // Task directions to explore; empty explores every task.
        std::vector<std::size_t> directions{};

        Optimizer::SGDDescriptor optimizer{};
        Evaluation::Options evaluation{};

        std::filesystem::path checkpoint_root{};
        bool save_checkpoints{true};
        bool overwrite_checkpoints{false};
        bool strict_convergence{false};

        bool print_summary{true};
        std::ostream* stream{&std::cout};
    };

    inline void validate(const ExplorationOptions& options, std::size_t num_tasks)
    {
        if (!(options.damping >= 0.0)) {
            throw ConfigurationError("Damping must be non-negative, got " + std::to_string(options.damping) + ".");
        }
        if (!(options.momentum >= 0.0 && options.momentum < 1.0)) {
            throw ConfigurationError("Momentum must lie in [0, 1), got " + std::to_string(options.momentum) + ".");
        }
        if (!(options.warmup_ratio > 0.0 && options.warmup_ratio <= 1.0)) {
            throw ConfigurationError("Warm-up ratio must lie in (0, 1].");
        }
        if (!(options.sample_ratio > 0.0 && options.sample_ratio <= 1.0)) {
            throw ConfigurationError("Sample ratio must lie in (0, 1].");
        }
        if (options.num_steps <= 0) {
            throw ConfigurationError("Exploration requires at least one step per direction.");
        }
        if (options.max_iter <= 0) {
            throw ConfigurationError("Linear solver iteration budget must be positive.");
        }
        if (options.weights.empty()) {
            throw ConfigurationError("Exploration requires at least one starting weight combination.");
        }
        Data::Simplex::validate(options.weights, num_tasks);
        for (const auto direction : options.directions) {
            if (direction >= num_tasks) {
                throw ConfigurationError("Direction " + std::to_string(direction) + " is out of range for "
                                         + std::to_string(num_tasks) + " tasks.");
            }
        }
        if (options.checkpoint_root.empty()) {
            throw ConfigurationError("Exploration requires a checkpoint root holding the starting checkpoints.");
        }
        Optimizer::Details::validate(options.optimizer.options);
        if (options.evaluation.batch_size <= 0) {
            throw ConfigurationError("Evaluation batch size must be greater than zero.");
        }
    }
}

#endif // PARETO_EXPLORATION_OPTIONS_HPP
