#ifndef PARETO_EXPLORATION_MOMENTUM_HPP
#define PARETO_EXPLORATION_MOMENTUM_HPP

#include <cstdint>
#include <string>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "../common/model.hpp"

namespace Pareto::Exploration {
    // Exponential moving average without bias correction:
    //   buffer <- momentum * buffer + (1 - momentum) * value
    // evaluated as a lerp so that a buffer equal to the incoming value stays bit-identical.
    // Used once for the Jacobian matrix and once for the alpha vector of a run.
    class MomentumBuffer {
    public:
        explicit MomentumBuffer(double momentum) : momentum_(momentum)
        {
            if (!(momentum >= 0.0 && momentum < 1.0)) {
                throw ConfigurationError("Momentum must lie in [0, 1), got " + std::to_string(momentum) + ".");
            }
        }

        void reset(const torch::Tensor& initial)
        {
            if (!initial.defined()) {
                throw ConfigurationError("Momentum buffer cannot be reset from an undefined tensor.");
            }
            buffer_ = initial.detach().clone();
            updates_ = 0;
        }

        // Returns a copy; the caller may modify it in place without touching the buffer.
        [[nodiscard]] torch::Tensor update(const torch::Tensor& value)
        {
            if (!initialized()) {
                throw InvalidStateError("Momentum buffer updated before reset().");
            }
            if (!value.defined() || value.sizes() != buffer_.sizes()) {
                throw ConfigurationError("Momentum update of shape "
                                         + (value.defined() ? Common::format_tensor_shape(value) : std::string{"<undefined>"})
                                         + " does not match buffer shape " + Common::format_tensor_shape(buffer_) + ".");
            }
            torch::NoGradGuard no_grad;
            buffer_.lerp_(value.detach().to(buffer_.device(), buffer_.scalar_type()), 1.0 - momentum_);
            ++updates_;
            return buffer_.clone();
        }

        [[nodiscard]] torch::Tensor value() const
        {
            if (!initialized()) {
                throw InvalidStateError("Momentum buffer read before reset().");
            }
            return buffer_.clone();
        }

        [[nodiscard]] bool initialized() const noexcept { return buffer_.defined(); }
        [[nodiscard]] double momentum() const noexcept { return momentum_; }
        [[nodiscard]] int64_t updates() const noexcept { return updates_; }

    private:
        double momentum_;
        torch::Tensor buffer_{};
        int64_t updates_{0};
    };
}

#endif // PARETO_EXPLORATION_MOMENTUM_HPP
