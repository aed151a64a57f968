#ifndef PARETO_COMMON_MODEL_HPP
#define PARETO_COMMON_MODEL_HPP
/*
 * Uniform access to the multi-task network.
 * ---------------------------------------------------------------------------
 * The exploration engine never owns the architecture. Any object works as long
 * as it exposes:
 *  - `parameters()` returning the ordered trainable tensors,
 *  - `forward(inputs)` (or a call operator) returning one output per task,
 * whether it is held by value, by raw pointer, or through a libtorch
 * `ModuleHolder` (`TORCH_MODULE`) wrapper.
 */

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "errors.hpp"

namespace Pareto::Common {
    namespace Detail {
        template <typename>
        inline constexpr bool dependent_false_v = false;

        template <class Model>
        [[nodiscard]] auto fetch_parameters(Model& model)
        {
            if constexpr (requires { model.parameters(); }) {
                return model.parameters();
            } else if constexpr (requires { model->parameters(); }) {
                return model->parameters();
            } else {
                static_assert(dependent_false_v<Model>, "Model must expose parameters() or operator->().parameters()");
            }
        }

        template <class Model>
        [[nodiscard]] auto call_forward(Model& model, const torch::Tensor& inputs)
        {
            if constexpr (requires { model.forward(inputs); }) {
                return model.forward(inputs);
            } else if constexpr (requires { model->forward(inputs); }) {
                return model->forward(inputs);
            } else if constexpr (requires { model(inputs); }) {
                return model(inputs);
            } else {
                static_assert(dependent_false_v<Model>, "Model must provide a forward method or call operator");
            }
        }
    }

    template <class Model>
    [[nodiscard]] inline std::vector<torch::Tensor> trainable_parameters(Model& model)
    {
        std::vector<torch::Tensor> params;
        for (const auto& parameter : Detail::fetch_parameters(model)) {
            if (parameter.requires_grad()) {
                params.push_back(parameter);
            }
        }
        if (params.empty()) {
            throw ConfigurationError("Model exposes no trainable parameters.");
        }

        const auto reference_device = params.front().device();
        const auto reference_dtype = params.front().scalar_type();
        for (const auto& parameter : params) {
            if (parameter.device() != reference_device) {
                throw ConfigurationError("Expected all model parameters on the same device.");
            }
            if (parameter.scalar_type() != reference_dtype) {
                throw ConfigurationError("Expected all model parameters to share one floating-point type.");
            }
        }
        return params;
    }

    // One output tensor per task, in task order.
    template <class Model>
    [[nodiscard]] inline std::vector<torch::Tensor> forward_tasks(Model& model, const torch::Tensor& inputs)
    {
        auto outputs = Detail::call_forward(model, inputs);
        using Output = std::decay_t<decltype(outputs)>;
        if constexpr (std::is_same_v<Output, std::vector<torch::Tensor>>) {
            return outputs;
        } else if constexpr (std::is_constructible_v<std::vector<torch::Tensor>, Output>) {
            return std::vector<torch::Tensor>(std::move(outputs));
        } else {
            static_assert(Detail::dependent_false_v<Model>,
                          "Model forward must return one tensor per task (std::vector<torch::Tensor>).");
        }
    }

    template <class Model>
    inline void set_training(Model& model, bool on)
    {
        if constexpr (requires { model.train(on); }) {
            model.train(on);
        } else if constexpr (requires { model->train(on); }) {
            model->train(on);
        }
    }

    template <class Model>
    [[nodiscard]] inline bool is_training(Model& model)
    {
        if constexpr (requires { model.is_training(); }) {
            return model.is_training();
        } else if constexpr (requires { model->is_training(); }) {
            return model->is_training();
        } else {
            return true;
        }
    }

    // Restores the previous train/eval mode on scope exit.
    template <class Model>
    class ModeGuard {
    public:
        ModeGuard(Model& model, bool training) : model_(model), previous_(is_training(model))
        {
            set_training(model_, training);
        }

        ~ModeGuard() { set_training(model_, previous_); }

        ModeGuard(const ModeGuard&) = delete;
        ModeGuard& operator=(const ModeGuard&) = delete;

    private:
        Model& model_;
        bool previous_;
    };

    [[nodiscard]] inline std::string format_tensor_shape(const torch::Tensor& tensor)
    {
        std::ostringstream stream;
        stream << '(';
        for (int64_t i = 0; i < tensor.dim(); ++i) {
            if (i > 0) {
                stream << ", ";
            }
            stream << tensor.size(i);
        }
        stream << ')';
        return stream.str();
    }
}

#endif // PARETO_COMMON_MODEL_HPP
