#ifndef PARETO_DATA_SIMPLEX_HPP
#define PARETO_DATA_SIMPLEX_HPP

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../common/errors.hpp"

namespace Pareto::Data::Simplex {
    [[nodiscard]] inline bool contains(const std::vector<double>& weights, double tolerance = 1e-6)
    {
        if (weights.empty()) {
            return false;
        }
        double total = 0.0;
        for (const auto w : weights) {
            if (!std::isfinite(w) || w < -tolerance) {
                return false;
            }
            total += w;
        }
        return std::abs(total - 1.0) <= tolerance;
    }

    [[nodiscard]] inline bool contains(const torch::Tensor& weights, double tolerance = 1e-6)
    {
        if (!weights.defined() || weights.dim() != 1 || weights.numel() == 0) {
            return false;
        }
        auto values = weights.detach().to(torch::kCPU, torch::kFloat64).contiguous();
        return contains(std::vector<double>(values.data_ptr<double>(), values.data_ptr<double>() + values.numel()),
                        tolerance);
    }

    // Das-Dennis lattice: every vector of `num_tasks` multiples of 1/divisions summing to one.
    // With two tasks and d divisions this is the evenly spaced sweep (0, 1), (1/d, 1 - 1/d), ..., (1, 0).
    [[nodiscard]] inline std::vector<std::vector<double>> lattice(std::size_t num_tasks, std::size_t divisions)
    {
        if (num_tasks == 0) {
            throw ConfigurationError("Simplex lattice requires at least one task.");
        }
        if (divisions == 0) {
            throw ConfigurationError("Simplex lattice requires at least one division.");
        }

        std::vector<std::vector<double>> points;
        std::vector<std::size_t> counts(num_tasks, 0);

        auto fill = [&](auto&& self, std::size_t index, std::size_t remaining) -> void {
            if (index + 1 == num_tasks) {
                counts[index] = remaining;
                std::vector<double> point(num_tasks);
                for (std::size_t t = 0; t < num_tasks; ++t) {
                    point[t] = static_cast<double>(counts[t]) / static_cast<double>(divisions);
                }
                points.push_back(std::move(point));
                return;
            }
            for (std::size_t value = 0; value <= remaining; ++value) {
                counts[index] = value;
                self(self, index + 1, remaining - value);
            }
        };
        fill(fill, 0, divisions);
        return points;
    }

    inline void validate(const std::vector<std::vector<double>>& weights, std::size_t num_tasks)
    {
        for (std::size_t i = 0; i < weights.size(); ++i) {
            if (weights[i].size() != num_tasks) {
                throw ConfigurationError("Weight combination " + std::to_string(i) + " has "
                                         + std::to_string(weights[i].size()) + " entries, expected "
                                         + std::to_string(num_tasks) + ".");
            }
            if (!contains(weights[i])) {
                throw ConfigurationError("Weight combination " + std::to_string(i) + " does not lie on the simplex.");
            }
        }
    }
}

#endif // PARETO_DATA_SIMPLEX_HPP
