#ifndef PARETO_OPTIMIZER_SGD_HPP
#define PARETO_OPTIMIZER_SGD_HPP

#include <string>
#include <torch/torch.h>

#include "../../common/errors.hpp"

namespace Pareto::Optimizer::Details {

    // The exploration step installs the normalized direction as the gradient, so the
    // learning rate is the length of each move along the front.
    struct SGDOptions {
        double learning_rate{1e-2};
        double momentum{0.0};
        double dampening{0.0};
        double weight_decay{0.0};
        bool nesterov{false};
    };

    struct SGDDescriptor {
        SGDOptions options{};
    };

    inline void validate(const SGDOptions& options) {
        if (!(options.learning_rate > 0.0))
            throw ConfigurationError("SGD learning rate must be positive, got " + std::to_string(options.learning_rate) + ".");
        if (options.momentum < 0.0)
            throw ConfigurationError("SGD momentum must be non-negative.");
        if (options.weight_decay < 0.0)
            throw ConfigurationError("SGD weight decay must be non-negative.");
        if (options.nesterov && (options.momentum <= 0.0 || options.dampening != 0.0))
            throw ConfigurationError("Nesterov momentum requires a positive momentum and zero dampening.");
    }

    inline torch::optim::SGDOptions to_torch_options(const SGDOptions& options) {
        validate(options);
        torch::optim::SGDOptions torch_options(options.learning_rate);
        torch_options = torch_options.momentum(options.momentum);
        torch_options = torch_options.dampening(options.dampening);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.nesterov(options.nesterov);
        return torch_options;
    }

} // namespace Pareto::Optimizer::Details

#endif // PARETO_OPTIMIZER_SGD_HPP
