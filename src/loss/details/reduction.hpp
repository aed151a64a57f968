#ifndef PARETO_LOSS_REDUCTION_HPP
#define PARETO_LOSS_REDUCTION_HPP

#include <torch/torch.h>
#include <type_traits>

namespace Pareto::Loss::Details {

    // Task losses are always scalars, so there is no element-wise reduction mode.
    enum class Reduction { Mean, Sum };

    // Use: to_torch_reduction<torch::nn::functional::MSELossFuncOptions>(Reduction::Mean)
    template <typename Options>
    inline typename Options::reduction_t to_torch_reduction(Reduction r) {
        using RT = typename Options::reduction_t;
        static_assert(!std::is_void_v<RT>, "Options must define nested type 'reduction_t'");

        switch (r) {
            case Reduction::Sum:  return RT{torch::kSum};
            case Reduction::Mean:
            default:              return RT{torch::kMean};
        }
    }

    // Sum-reduced loss of one batch and the denominator a Mean reduction divides it by,
    // so that batches can be combined into the loss of the whole set.
    struct Accumulation {
        torch::Tensor total;
        torch::Tensor normalizer;
    };

    inline torch::Tensor apply_reduction_weighted(const torch::Tensor& loss, const torch::Tensor& weight, Reduction reduction) {
        auto w = weight.to(loss.device(), loss.scalar_type()).expand_as(loss);
        if (reduction == Reduction::Sum) {
            return (loss * w).sum();
        }
        return (loss * w).sum() / w.sum().clamp_min(1e-12);
    }
}

#endif // PARETO_LOSS_REDUCTION_HPP
