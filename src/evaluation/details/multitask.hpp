#ifndef PARETO_EVALUATION_MULTITASK_HPP
#define PARETO_EVALUATION_MULTITASK_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../common/model.hpp"
#include "../../loss/loss.hpp"

namespace Pareto::Evaluation::Details::MultiTask {
    struct Options {
        int64_t batch_size{256};
        bool print_summary{false};
        std::ostream* stream{&std::cout};
    };

    struct Report {
        std::vector<double> losses{};
        std::vector<double> top1{};  // NaN for tasks that are not classification
        int64_t total_samples{0};

        [[nodiscard]] bool finite() const
        {
            return std::all_of(losses.begin(), losses.end(), [](double value) { return std::isfinite(value); });
        }
    };

    namespace detail {
        inline void maybe_print(std::ostream* stream, bool enabled, const Report& report)
        {
            if (!enabled || stream == nullptr) {
                return;
            }
            (*stream) << "[Evaluation] Samples: " << report.total_samples;
            for (std::size_t task = 0; task < report.losses.size(); ++task) {
                (*stream) << " | task " << task << " loss: " << std::setprecision(6) << report.losses[task];
                if (!std::isnan(report.top1[task])) {
                    (*stream) << ", top1: " << std::setprecision(4) << report.top1[task];
                }
            }
            (*stream) << "\n";
        }
    }

    // Per-task loss and top-1 accuracy over a held-out set, in eval mode and without grad.
    // Each loss equals the descriptor applied to the whole set at once, whatever the batch size:
    // batches contribute their summed loss and, for Mean reductions, their share of the normalizer.
    template <class Model>
    [[nodiscard]] inline Report Evaluate(Model& model,
                                         const std::vector<Loss::Descriptor>& losses,
                                         const torch::Tensor& inputs,
                                         const std::vector<torch::Tensor>& targets,
                                         const Options& options = Options{})
    {
        if (!inputs.defined() || inputs.dim() == 0 || inputs.size(0) == 0) {
            throw ConfigurationError("Evaluation requires a non-empty input tensor.");
        }
        if (targets.size() != losses.size()) {
            throw ConfigurationError("Evaluation received targets for " + std::to_string(targets.size())
                                     + " tasks but " + std::to_string(losses.size()) + " losses.");
        }
        if (options.batch_size <= 0) {
            throw ConfigurationError("Evaluation batch size must be greater than zero.");
        }

        const auto device = Common::trainable_parameters(model).front().device();
        const auto num_tasks = losses.size();
        const auto total = inputs.size(0);

        std::vector<double> loss_sums(num_tasks, 0.0);
        std::vector<double> normalizers(num_tasks, 0.0);
        std::vector<int64_t> correct(num_tasks, 0);

        Common::ModeGuard<Model> mode(model, /*training=*/false);
        torch::NoGradGuard no_grad;

        for (int64_t offset = 0; offset < total; offset += options.batch_size) {
            const auto count = std::min<int64_t>(options.batch_size, total - offset);
            auto batch_inputs = inputs.narrow(0, offset, count).to(device);
            std::vector<torch::Tensor> batch_targets;
            batch_targets.reserve(num_tasks);
            for (const auto& target : targets) {
                batch_targets.push_back(target.narrow(0, offset, count).to(device));
            }

            auto outputs = Common::forward_tasks(model, batch_inputs);
            if (outputs.size() != num_tasks) {
                throw ConfigurationError("Model produced " + std::to_string(outputs.size()) + " task outputs, expected "
                                         + std::to_string(num_tasks) + ".");
            }
            for (std::size_t task = 0; task < num_tasks; ++task) {
                const auto accumulation = Loss::accumulate(losses[task], outputs[task], batch_targets[task]);
                loss_sums[task] += accumulation.total.template item<double>();
                normalizers[task] += accumulation.normalizer.template item<double>();
                if (Loss::is_classification(losses[task])) {
                    auto predicted = outputs[task].argmax(1);
                    auto labels = batch_targets[task].to(torch::kLong).view({-1});
                    correct[task] += predicted.eq(labels).sum().template item<int64_t>();
                }
            }
        }

        Report report{};
        report.total_samples = total;
        report.losses.reserve(num_tasks);
        report.top1.reserve(num_tasks);
        for (std::size_t task = 0; task < num_tasks; ++task) {
            if (Loss::reduction_of(losses[task]) == Loss::Reduction::Sum) {
                report.losses.push_back(loss_sums[task]);
            } else {
                report.losses.push_back(normalizers[task] > 0.0 ? loss_sums[task] / normalizers[task]
                                                                : std::numeric_limits<double>::quiet_NaN());
            }
            report.top1.push_back(Loss::is_classification(losses[task])
                                      ? static_cast<double>(correct[task]) / static_cast<double>(total)
                                      : std::numeric_limits<double>::quiet_NaN());
        }

        detail::maybe_print(options.stream, options.print_summary, report);
        return report;
    }
}

#endif // PARETO_EVALUATION_MULTITASK_HPP
