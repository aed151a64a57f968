#ifndef PARETO_EXPLORATION_ESTIMATOR_HPP
#define PARETO_EXPLORATION_ESTIMATOR_HPP

#include <cmath>
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

namespace Pareto::Exploration {
    // Averages per-task first-order gradients over a fraction of an epoch and returns them
    // stacked as a (num_tasks, num_parameters) Jacobian. Advances its stream; not reentrant.
    template <class Model>
    class GradientEstimator {
    public:
        GradientEstimator(Model& model, std::vector<Loss::Descriptor> losses, Data::CyclicStream stream)
            : model_(model), losses_(std::move(losses)), stream_(std::move(stream))
        {
            if (losses_.empty()) {
                throw ConfigurationError("GradientEstimator requires at least one task loss.");
            }
            if (stream_.num_tasks() != losses_.size()) {
                throw ConfigurationError("Stream provides targets for " + std::to_string(stream_.num_tasks())
                                         + " tasks but " + std::to_string(losses_.size()) + " losses were given.");
            }
        }

        [[nodiscard]] int64_t batches_for(double sample_ratio) const
        {
            if (!(sample_ratio > 0.0 && sample_ratio <= 1.0)) {
                throw ConfigurationError("Sample ratio must lie in (0, 1], got " + std::to_string(sample_ratio) + ".");
            }
            const auto batches = static_cast<int64_t>(
                std::llround(sample_ratio * static_cast<double>(stream_.batches_per_epoch())));
            if (batches <= 0) {
                throw ConfigurationError("Sample ratio " + std::to_string(sample_ratio) + " of "
                                         + std::to_string(stream_.batches_per_epoch())
                                         + " batches per epoch rounds to zero batches.");
            }
            return batches;
        }

        [[nodiscard]] torch::Tensor estimate(double sample_ratio)
        {
            const auto batches = batches_for(sample_ratio);
            const auto params = Common::trainable_parameters(model_);
            const auto num_params = Common::count_parameters(params);
            const auto num_tasks = static_cast<int64_t>(losses_.size());

            auto jacobian = torch::zeros({num_tasks, num_params}, params.front().options());
            for (int64_t b = 0; b < batches; ++b) {
                auto batch = stream_.next_batch().to(params.front().device());
                auto outputs = Common::forward_tasks(model_, batch.inputs);
                auto task_losses = Loss::compute_tasks(losses_, outputs, batch.targets);

                std::vector<torch::Tensor> rows;
                rows.reserve(task_losses.size());
                for (std::size_t task = 0; task < task_losses.size(); ++task) {
                    if (!task_losses[task].requires_grad()) {
                        rows.push_back(torch::zeros({num_params}, params.front().options()));
                        continue;
                    }
                    // All tasks share one forward graph; only the last backward may free it.
                    const bool retain = task + 1 < task_losses.size();
                    auto grads = torch::autograd::grad({task_losses[task]}, params, {},
                                                       /*retain_graph=*/retain,
                                                       /*create_graph=*/false,
                                                       /*allow_unused=*/true);
                    rows.push_back(Common::flatten_gradients(grads, params).detach());
                }
                jacobian.add_(torch::stack(rows));
            }
            return jacobian.div_(static_cast<double>(batches));
        }

        [[nodiscard]] std::size_t num_tasks() const noexcept { return losses_.size(); }
        [[nodiscard]] int64_t num_parameters() { return Common::count_parameters(Common::trainable_parameters(model_)); }
        [[nodiscard]] const Data::CyclicStream& stream() const noexcept { return stream_; }
        [[nodiscard]] const std::vector<Loss::Descriptor>& losses() const noexcept { return losses_; }

    private:
        Model& model_;
        std::vector<Loss::Descriptor> losses_;
        Data::CyclicStream stream_;
    };
}

#endif // PARETO_EXPLORATION_ESTIMATOR_HPP
