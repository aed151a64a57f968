#ifndef PARETO_EXPLORATION_HVP_HPP
#define PARETO_EXPLORATION_HVP_HPP
/*
 * Implicit damped Hessian of the alpha-weighted multi-task loss.
 * ---------------------------------------------------------------------------
 * bind(alpha) draws one fresh mini-batch, differentiates every task loss with
 * create_graph=true and keeps g = alpha^T J (a graph-attached vector of length
 * P). apply(v) then differentiates <g, v> once more, which yields H_alpha v
 * without ever forming the P x P Hessian, and adds damping * v.
 *
 * The bound state lives exactly as long as the Binding returned by bind();
 * its destructor releases the graph on every exit path.
 */

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "../common/flatten.hpp"
#include "../common/model.hpp"
#include "../data/stream.hpp"
#include "../loss/loss.hpp"
#include "boundary.hpp"

namespace Pareto::Exploration {
    template <class Model>
    class ImplicitHVPOperator {
    public:
        class Binding {
        public:
            Binding(const Binding&) = delete;
            Binding& operator=(const Binding&) = delete;
            Binding& operator=(Binding&&) = delete;

            Binding(Binding&& other) noexcept : owner_(std::exchange(other.owner_, nullptr)) {}

            ~Binding()
            {
                if (owner_ != nullptr) {
                    owner_->release();
                }
            }

            [[nodiscard]] torch::Tensor apply(const torch::Tensor& vector) const
            {
                if (owner_ == nullptr) {
                    throw InvalidStateError("HVP binding was moved from and no longer owns the bound operator.");
                }
                return owner_->apply(vector);
            }

        private:
            friend class ImplicitHVPOperator;
            explicit Binding(ImplicitHVPOperator& owner) noexcept : owner_(&owner) {}

            ImplicitHVPOperator* owner_;
        };

        ImplicitHVPOperator(Model& model, std::vector<Loss::Descriptor> losses, Data::CyclicStream stream, double damping)
            : model_(model), losses_(std::move(losses)), stream_(std::move(stream)), damping_(damping)
        {
            if (losses_.empty()) {
                throw ConfigurationError("ImplicitHVPOperator requires at least one task loss.");
            }
            if (stream_.num_tasks() != losses_.size()) {
                throw ConfigurationError("Stream provides targets for " + std::to_string(stream_.num_tasks())
                                         + " tasks but " + std::to_string(losses_.size()) + " losses were given.");
            }
            if (!(damping_ >= 0.0)) {
                throw ConfigurationError("Damping must be non-negative, got " + std::to_string(damping_) + ".");
            }
        }

        ImplicitHVPOperator(const ImplicitHVPOperator&) = delete;
        ImplicitHVPOperator& operator=(const ImplicitHVPOperator&) = delete;

        [[nodiscard]] Binding bind(const torch::Tensor& alpha)
        {
            if (bound()) {
                throw InvalidStateError("ImplicitHVPOperator is already bound; release the active binding first.");
            }

            auto params = Common::trainable_parameters(model_);
            const auto num_params = Common::count_parameters(params);
            const auto num_tasks = static_cast<int64_t>(losses_.size());
            if (!alpha.defined() || alpha.dim() != 1 || alpha.size(0) != num_tasks) {
                throw ConfigurationError("Alpha must be a vector of " + std::to_string(num_tasks) + " task weights.");
            }

            // The stream may hold its data on another device than the model.
            auto batch = stream_.next_batch().to(params.front().device());
            auto outputs = Common::forward_tasks(model_, batch.inputs);
            auto task_losses = Loss::compute_tasks(losses_, outputs, batch.targets);

            std::vector<torch::Tensor> rows;
            rows.reserve(task_losses.size());
            for (const auto& loss : task_losses) {
                if (!loss.requires_grad()) {
                    rows.push_back(torch::zeros({num_params}, params.front().options()));
                    continue;
                }
                auto grads = torch::autograd::grad({loss}, params, {},
                                                   /*retain_graph=*/true,
                                                   /*create_graph=*/true,
                                                   /*allow_unused=*/true);
                rows.push_back(Common::flatten_gradients(grads, params));
            }

            const auto weights = alpha.detach().to(params.front().device(), params.front().scalar_type());
            gradient_ = torch::matmul(weights, torch::stack(rows));
            params_ = std::move(params);
            return Binding{*this};
        }

        [[nodiscard]] torch::Tensor apply(const torch::Tensor& vector)
        {
            if (!bound()) {
                throw InvalidStateError("ImplicitHVPOperator::apply called outside an active bind() scope.");
            }
            if (!vector.defined() || vector.numel() != gradient_.numel()) {
                throw ConfigurationError("HVP operand has " + std::to_string(vector.defined() ? vector.numel() : 0)
                                         + " entries, expected " + std::to_string(gradient_.numel()) + ".");
            }

            const auto v = vector.detach().reshape({-1}).to(gradient_.device(), gradient_.scalar_type());
            torch::Tensor product;
            if (gradient_.requires_grad()) {
                auto projected = torch::dot(gradient_, v);
                auto grads = torch::autograd::grad({projected}, params_, {},
                                                   /*retain_graph=*/true,
                                                   /*create_graph=*/false,
                                                   /*allow_unused=*/true);
                product = Common::flatten_gradients(grads, params_).detach();
            } else {
                // The bound gradient is constant in the parameters: the loss is locally linear.
                product = torch::zeros_like(v);
            }
            ++applications_;
            if (damping_ != 0.0) {
                product = product + damping_ * v;
            }
            return product;
        }

        // View for the Krylov boundary; only valid while a Binding is alive.
        [[nodiscard]] LinearOperator as_linear_operator()
        {
            return [this](const torch::Tensor& vector) { return apply(vector); };
        }

        [[nodiscard]] bool bound() const noexcept { return gradient_.defined(); }
        [[nodiscard]] double damping() const noexcept { return damping_; }
        [[nodiscard]] int64_t dimension() const { return bound() ? gradient_.numel() : 0; }
        [[nodiscard]] int64_t applications() const noexcept { return applications_; }
        [[nodiscard]] const Data::CyclicStream& stream() const noexcept { return stream_; }

    private:
        void release() noexcept
        {
            gradient_ = torch::Tensor();
            params_.clear();
        }

        Model& model_;
        std::vector<Loss::Descriptor> losses_;
        Data::CyclicStream stream_;
        double damping_;
        torch::Tensor gradient_{};
        std::vector<torch::Tensor> params_{};
        int64_t applications_{0};
    };
}

#endif // PARETO_EXPLORATION_HVP_HPP
