#ifndef PARETO_LOSS_HPP
#define PARETO_LOSS_HPP
// This file is a factory, must exempt it from any logical-code beyond dispatch. For functions look into "/details"
#include <string>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "details/reduction.hpp"
#include "details/ce.hpp"
#include "details/nll.hpp"
#include "details/mse.hpp"
#include "details/mae.hpp"

namespace Pareto::Loss {
    using Reduction = Details::Reduction;
    using Accumulation = Details::Accumulation;

    using Descriptor = std::variant<
        Details::CrossEntropyDescriptor,
        Details::NegativeLogLikelihoodDescriptor,
        Details::MSEDescriptor,
        Details::MAEDescriptor>;

    [[nodiscard]] constexpr auto CrossEntropy(const Details::CrossEntropyOptions& options = {}) noexcept -> Details::CrossEntropyDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto NegativeLogLikelihood(const Details::NegativeLogLikelihoodOptions& options = {}) noexcept -> Details::NegativeLogLikelihoodDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto MSE(const Details::MSEOptions& options = {}) noexcept -> Details::MSEDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto MAE(const Details::MAEOptions& options = {}) noexcept -> Details::MAEDescriptor {
        return {options};
    }

    [[nodiscard]] inline torch::Tensor compute(const Descriptor& descriptor,
                                               const torch::Tensor& prediction,
                                               const torch::Tensor& target)
    {
        return std::visit([&](const auto& concrete) { return Details::compute(concrete, prediction, target); }, descriptor);
    }

    [[nodiscard]] inline Accumulation accumulate(const Descriptor& descriptor,
                                                 const torch::Tensor& prediction,
                                                 const torch::Tensor& target)
    {
        return std::visit([&](const auto& concrete) { return Details::accumulate(concrete, prediction, target); }, descriptor);
    }

    // Losses whose predictions are class scores, for which top-1 accuracy is defined.
    [[nodiscard]] inline bool is_classification(const Descriptor& descriptor) noexcept
    {
        return std::holds_alternative<Details::CrossEntropyDescriptor>(descriptor)
            || std::holds_alternative<Details::NegativeLogLikelihoodDescriptor>(descriptor);
    }

    [[nodiscard]] inline Reduction reduction_of(const Descriptor& descriptor) noexcept
    {
        return std::visit([](const auto& concrete) { return concrete.options.reduction; }, descriptor);
    }

    [[nodiscard]] inline std::vector<torch::Tensor> compute_tasks(const std::vector<Descriptor>& descriptors,
                                                                  const std::vector<torch::Tensor>& outputs,
                                                                  const std::vector<torch::Tensor>& targets)
    {
        if (outputs.size() != descriptors.size() || targets.size() != descriptors.size()) {
            throw ConfigurationError("Expected " + std::to_string(descriptors.size()) + " task outputs and targets, got "
                                     + std::to_string(outputs.size()) + " outputs and "
                                     + std::to_string(targets.size()) + " targets.");
        }

        std::vector<torch::Tensor> losses;
        losses.reserve(descriptors.size());
        for (std::size_t task = 0; task < descriptors.size(); ++task) {
            auto loss = compute(descriptors[task], outputs[task], targets[task].to(outputs[task].device()));
            if (loss.numel() != 1) {
                throw ConfigurationError("Loss of task " + std::to_string(task) + " is not a scalar.");
            }
            losses.push_back(loss.reshape({}));
        }
        return losses;
    }
}

#endif // PARETO_LOSS_HPP
