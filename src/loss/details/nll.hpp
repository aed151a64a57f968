#ifndef PARETO_LOSS_NLL_HPP
#define PARETO_LOSS_NLL_HPP

#include <optional>
#include <torch/torch.h>
#include <vector>

#include "reduction.hpp"

namespace Pareto::Loss::Details {
    // Expects log-probabilities, e.g. heads ending in log_softmax.
    struct NegativeLogLikelihoodOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
        std::optional<int64_t> ignore_index{};
    };

    struct NegativeLogLikelihoodDescriptor {
        NegativeLogLikelihoodOptions options{};
    };

    inline torch::Tensor compute(const NegativeLogLikelihoodDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target)
    {
        auto opts = torch::nn::functional::NLLLossFuncOptions{};
        opts = opts.reduction(to_torch_reduction<torch::nn::functional::NLLLossFuncOptions>(descriptor.options.reduction));

        if (!descriptor.options.weight.empty()) {
            opts = opts.weight(torch::tensor(
                descriptor.options.weight,
                torch::TensorOptions().dtype(prediction.scalar_type()).device(prediction.device())));
        }
        if (descriptor.options.ignore_index.has_value()) {
            opts = opts.ignore_index(descriptor.options.ignore_index.value());
        }

        return torch::nn::functional::nll_loss(prediction, target.to(torch::kLong), opts);
    }

    // Ignored targets count toward neither the sum nor the normalizer.
    inline Accumulation accumulate(const NegativeLogLikelihoodDescriptor& descriptor,
                                   const torch::Tensor& prediction,
                                   const torch::Tensor& target)
    {
        auto summed = descriptor;
        summed.options.reduction = Reduction::Sum;
        auto labels = target.to(prediction.device(), torch::kLong).reshape({-1});
        auto kept = torch::ones_like(labels, torch::kBool);
        if (descriptor.options.ignore_index.has_value()) {
            kept = labels.ne(descriptor.options.ignore_index.value());
            labels = labels.masked_fill(kept.logical_not(), 0);
        }
        auto per_target = kept.to(prediction.scalar_type());
        if (!descriptor.options.weight.empty()) {
            per_target = per_target * torch::tensor(descriptor.options.weight, prediction.options()).index_select(0, labels);
        }
        return {compute(summed, prediction, target), per_target.sum()};
    }
}

#endif // PARETO_LOSS_NLL_HPP
