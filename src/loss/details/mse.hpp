#ifndef PARETO_LOSS_MSE_HPP
#define PARETO_LOSS_MSE_HPP

#include <torch/torch.h>
#include <vector>

#include "reduction.hpp"

namespace Pareto::Loss::Details {

    namespace F = torch::nn::functional;

    struct MSEOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
    };

    struct MSEDescriptor {
        MSEOptions options{};
    };

    inline torch::Tensor compute(const MSEDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target)
    {
        const auto aligned = target.to(prediction.device(), prediction.scalar_type()).view_as(prediction);
        if (descriptor.options.weight.empty()) {
            return F::mse_loss(
                prediction,
                aligned,
                F::MSELossFuncOptions().reduction(to_torch_reduction<F::MSELossFuncOptions>(descriptor.options.reduction)));
        }

        auto per_elem = F::mse_loss(prediction, aligned, F::MSELossFuncOptions().reduction(torch::kNone));
        auto weight = torch::tensor(descriptor.options.weight,
                                    torch::TensorOptions().dtype(prediction.scalar_type()).device(prediction.device()));
        if (weight.numel() == per_elem.numel()) {
            weight = weight.reshape(per_elem.sizes());
        }
        return apply_reduction_weighted(per_elem, weight, descriptor.options.reduction);
    }

    inline Accumulation accumulate(const MSEDescriptor& descriptor,
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

#endif // PARETO_LOSS_MSE_HPP
