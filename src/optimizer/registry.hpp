#ifndef PARETO_OPTIMIZER_REGISTRY_HPP
#define PARETO_OPTIMIZER_REGISTRY_HPP

#include <memory>
#include <vector>

#include <torch/torch.h>

#include "details/sgd.hpp"

namespace Pareto::Optimizer::Details {
    inline std::unique_ptr<torch::optim::Optimizer> build_optimizer(const std::vector<torch::Tensor>& params,
                                                                    const SGDDescriptor& descriptor) {
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::SGD>(params, options);
    }
}

#endif // PARETO_OPTIMIZER_REGISTRY_HPP
