#ifndef PARETO_OPTIMIZER_HPP
#define PARETO_OPTIMIZER_HPP

#include <memory>
#include <vector>

#include <torch/torch.h>

#include "registry.hpp"
#include "details/sgd.hpp"

namespace Pareto::Optimizer {
    using SGDOptions = Details::SGDOptions;
    using SGDDescriptor = Details::SGDDescriptor;

    [[nodiscard]] inline constexpr auto SGD(const SGDOptions& options = {}) noexcept -> SGDDescriptor {
        return SGDDescriptor{.options = options};
    }

    [[nodiscard]] inline std::unique_ptr<torch::optim::Optimizer> make(const std::vector<torch::Tensor>& params,
                                                                     const SGDDescriptor& descriptor) {
        return Details::build_optimizer(params, descriptor);
    }
}

#endif // PARETO_OPTIMIZER_HPP
