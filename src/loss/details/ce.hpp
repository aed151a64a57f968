#ifndef PARETO_LOSS_CE_HPP
#define PARETO_LOSS_CE_HPP

#include <torch/torch.h>
#include <vector>

#include "reduction.hpp"

namespace Pareto::Loss::Details {
    struct CrossEntropyOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
        double label_smoothing{0.0};
    };

    struct CrossEntropyDescriptor {
        CrossEntropyOptions options{};
    };

    inline torch::Tensor compute(const CrossEntropyDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target) {
        auto opts = torch::nn::functional::CrossEntropyFuncOptions{};
        opts = opts.reduction(to_torch_reduction<torch::nn::functional::CrossEntropyFuncOptions>(descriptor.options.reduction));
        opts = opts.label_smoothing(descriptor.options.label_smoothing);
        if (!descriptor.options.weight.empty()) {
            opts = opts.weight(torch::tensor(
                descriptor.options.weight,
                torch::TensorOptions().dtype(prediction.scalar_type()).device(prediction.device())));
        }
        return torch::nn::functional::cross_entropy(prediction, target.to(torch::kLong), opts);
    }

    inline Accumulation accumulate(const CrossEntropyDescriptor& descriptor,
                                   const torch::Tensor& prediction,
                                   const torch::Tensor& target) {
        auto summed = descriptor;
        summed.options.reduction = Reduction::Sum;
        const auto labels = target.to(prediction.device(), torch::kLong).reshape({-1});
        torch::Tensor normalizer;
        if (descriptor.options.weight.empty()) {
            normalizer = torch::scalar_tensor(static_cast<double>(labels.numel()), prediction.options());
        } else {
            normalizer = torch::tensor(descriptor.options.weight, prediction.options()).index_select(0, labels).sum();
        }
        return {compute(summed, prediction, target), normalizer};
    }
}
#endif // PARETO_LOSS_CE_HPP
