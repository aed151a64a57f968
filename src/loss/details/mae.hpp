#ifndef PARETO_LOSS_MAE_HPP
#define PARETO_LOSS_MAE_HPP

#include <torch/torch.h>
#include <vector>

#include "reduction.hpp"

namespace Pareto::Loss::Details {
    struct MAEOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
    };

    struct MAEDescriptor {
        MAEOptions options{};
    };

    inline torch::Tensor compute(const MAEDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        namespace F = torch::nn::functional;
        const auto aligned = target.to(prediction.device(), prediction.scalar_type()).view_as(prediction);
        if (descriptor.options.weight.empty()) {
            return F::l1_loss(prediction, aligned,
                F::L1LossFuncOptions().reduction(to_torch_reduction<F::L1LossFuncOptions>(descriptor.options.reduction)));
        }

        auto per_elem = F::l1_loss(prediction, aligned, F::L1LossFuncOptions().reduction(torch::kNone));
        auto weight = torch::tensor(descriptor.options.weight,
                                    torch::TensorOptions().dtype(prediction.scalar_type()).device(prediction.device()));
        if (weight.numel() == per_elem.numel()) {
            weight = weight.reshape(per_elem.sizes());
        }
        return apply_reduction_weighted(per_elem, weight, descriptor.options.reduction);
    }

    inline Accumulation accumulate(const MAEDescriptor& descriptor,
                                   const torch::Tensor& prediction,
                                   const torch::Tensor& target)
    {
        auto summed = descriptor;
        summed.options.reduction = Reduction::Sum;
        if (descriptor.options.weight.empty()) {
            return {compute(summed, prediction, target),
                    torch::scalar_tensor(static_cast<double>(prediction.numel()), prediction.options())};
        }
        auto weight = torch::tensor(descriptor.options.weight, prediction.options());
        if (weight.numel() == prediction.numel()) {
            weight = weight.reshape(prediction.sizes());
        }
        return {compute(summed, prediction, target), weight.expand_as(prediction).sum()};
    }
}

#endif // PARETO_LOSS_MAE_HPP
