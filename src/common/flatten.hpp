#ifndef PARETO_COMMON_FLATTEN_HPP
#define PARETO_COMMON_FLATTEN_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "errors.hpp"

namespace Pareto::Common {
    [[nodiscard]] inline int64_t count_parameters(const std::vector<torch::Tensor>& params)
    {
        int64_t total = 0;
        for (const auto& p : params) {
            total += p.numel();
        }
        return total;
    }

    // Concatenates per-parameter gradients into one vector. An undefined gradient means the
    // parameter is unreachable from the loss and is replaced by zeros of the parameter's shape.
    // Graph-attached gradients stay attached.
    [[nodiscard]] inline torch::Tensor flatten_gradients(const std::vector<torch::Tensor>& grads,
                                                         const std::vector<torch::Tensor>& params)
    {
        if (grads.size() != params.size()) {
            throw ConfigurationError("Gradient list has " + std::to_string(grads.size())
                                     + " entries but the model has " + std::to_string(params.size())
                                     + " parameter tensors.");
        }
        std::vector<torch::Tensor> pieces;
        pieces.reserve(grads.size());
        for (std::size_t i = 0; i < grads.size(); ++i) {
            if (grads[i].defined()) {
                pieces.push_back(grads[i].contiguous().view({-1}));
            } else {
                pieces.push_back(torch::zeros({params[i].numel()}, params[i].options()));
            }
        }
        return torch::cat(pieces);
    }

    // Slices a flat vector back into per-parameter shapes and installs each slice as the
    // parameter's gradient.
    inline void assign_gradients(const torch::Tensor& flat, const std::vector<torch::Tensor>& params)
    {
        const auto expected = count_parameters(params);
        if (flat.dim() != 1 || flat.numel() != expected) {
            throw ConfigurationError("Direction vector has " + std::to_string(flat.numel())
                                     + " entries but the model has " + std::to_string(expected)
                                     + " parameters.");
        }

        torch::NoGradGuard no_grad;
        int64_t offset = 0;
        for (const auto& param : params) {
            const auto count = param.numel();
            auto slice = flat.narrow(0, offset, count).view_as(param).to(param.device(), param.scalar_type()).clone();
            param.mutable_grad() = slice;
            offset += count;
        }
    }

    [[nodiscard]] inline torch::Tensor flatten_parameters(const std::vector<torch::Tensor>& params)
    {
        torch::NoGradGuard no_grad;
        std::vector<torch::Tensor> pieces;
        pieces.reserve(params.size());
        for (const auto& p : params) {
            pieces.push_back(p.detach().contiguous().view({-1}));
        }
        return torch::cat(pieces).clone();
    }
}

#endif // PARETO_COMMON_FLATTEN_HPP
