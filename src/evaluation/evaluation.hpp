#ifndef PARETO_EVALUATION_HPP
#define PARETO_EVALUATION_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "details/multitask.hpp"

namespace Pareto::Evaluation {
    using Options = Details::MultiTask::Options;
    using Report = Details::MultiTask::Report;

    template <class Model>
    [[nodiscard]] inline auto Evaluate(Model& model,
                                       const std::vector<Loss::Descriptor>& losses,
                                       const torch::Tensor& inputs,
                                       const std::vector<torch::Tensor>& targets,
                                       const Options& options = Options{}) -> Report {
        return Details::MultiTask::Evaluate(model, losses, inputs, targets, options);
    }
}

#endif // PARETO_EVALUATION_HPP
