#ifndef PARETO_TEST_SUPPORT_HPP
#define PARETO_TEST_SUPPORT_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../include/Pareto.h"

namespace ParetoTest {
    class Checker {
    public:
        void expect(bool ok, const std::string& what)
        {
            if (!ok) {
                std::cerr << "[FAIL] " << what << '\n';
                ++failures_;
            }
        }

        template <class Error, class Fn>
        void expect_throw(Fn&& fn, const std::string& what)
        {
            try {
                std::forward<Fn>(fn)();
            } catch (const Error&) {
                return;
            } catch (const std::exception& error) {
                std::cerr << "[FAIL] " << what << ": unexpected exception " << error.what() << '\n';
                ++failures_;
                return;
            }
            std::cerr << "[FAIL] " << what << ": nothing was thrown\n";
            ++failures_;
        }

        [[nodiscard]] int finish(const std::string& name) const
        {
            if (failures_ == 0) {
                std::cout << name << " passed." << std::endl;
                return 0;
            }
            std::cerr << name << ": " << failures_ << " check(s) failed." << std::endl;
            return 1;
        }

    private:
        int failures_{0};
    };

    [[nodiscard]] inline bool close(const torch::Tensor& a, const torch::Tensor& b, double tolerance = 1e-9)
    {
        return a.sizes() == b.sizes() && torch::allclose(a.to(torch::kFloat64), b.to(torch::kFloat64), tolerance, tolerance);
    }

    [[nodiscard]] inline torch::Tensor vec(std::vector<double> values)
    {
        return torch::tensor(values, torch::TensorOptions().dtype(torch::kFloat64));
    }

    // Two parameters w = (w0, w1), inputs x = (x0, x1).
    //   task 0: x0 w0 + x1 w1     task 1: (x0 w0) (x1 w1)
    // With x = (1, 1) and MSE against zero the Hessians are known in closed form.
    struct ProductModel {
        torch::Tensor w = torch::tensor({1.0, 2.0}, torch::TensorOptions().dtype(torch::kFloat64)).requires_grad_();

        [[nodiscard]] std::vector<torch::Tensor> parameters() const { return {w}; }

        [[nodiscard]] std::vector<torch::Tensor> forward(const torch::Tensor& inputs)
        {
            auto scaled = inputs * w;
            return {scaled.sum(1), scaled.select(1, 0) * scaled.select(1, 1)};
        }
    };

    // Four parameters a(1), b(1), c(2). Task 0 reads a, task 1 reads b, c is unused.
    struct SplitHeadImpl : torch::nn::Module {
        SplitHeadImpl()
        {
            const auto options = torch::TensorOptions().dtype(torch::kFloat64);
            a = register_parameter("a", torch::full({1}, 0.5, options));
            b = register_parameter("b", torch::full({1}, -0.25, options));
            c = register_parameter("c", torch::full({2}, 2.0, options));
        }

        std::vector<torch::Tensor> forward(const torch::Tensor& inputs)
        {
            return {(inputs * a).reshape({-1}), (inputs * b).reshape({-1})};
        }

        torch::Tensor a, b, c;
    };
    TORCH_MODULE(SplitHead);

    [[nodiscard]] inline Pareto::Data::CyclicStream product_stream(int64_t samples = 4, int64_t batch_size = 4)
    {
        const auto options = torch::TensorOptions().dtype(torch::kFloat64);
        return Pareto::Data::CyclicStream(torch::ones({samples, 2}, options),
                                          {torch::zeros({samples}, options), torch::zeros({samples}, options)},
                                          {.batch_size = batch_size});
    }

    // MAE against a far target: every task gradient is exactly one on its own head.
    [[nodiscard]] inline Pareto::Data::Batch split_head_batch(int64_t samples)
    {
        const auto options = torch::TensorOptions().dtype(torch::kFloat64);
        return {torch::ones({samples, 1}, options),
                {torch::full({samples}, -100.0, options), torch::full({samples}, -100.0, options)}};
    }

    [[nodiscard]] inline Pareto::Data::CyclicStream split_head_stream(int64_t samples = 8, int64_t batch_size = 4)
    {
        auto batch = split_head_batch(samples);
        return Pareto::Data::CyclicStream(batch.inputs, batch.targets, {.batch_size = batch_size});
    }

    // Closed-form min-norm point of the segment between two task gradients.
    inline Pareto::Exploration::MinNormResult two_task_min_norm(const torch::Tensor& jacobian)
    {
        const auto g0 = jacobian[0];
        const auto g1 = jacobian[1];
        const auto diff = g0 - g1;
        const auto denom = diff.dot(diff).item<double>();
        double weight = 0.5;
        if (denom > 0.0) {
            weight = std::clamp((g1 - g0).dot(g1).item<double>() / denom, 0.0, 1.0);
        }
        auto alpha = torch::tensor({weight, 1.0 - weight}, jacobian.options());
        auto combined = torch::matmul(alpha, jacobian);
        return {alpha, combined.norm().item<double>()};
    }

    // Plain conjugate gradients from a starting guess.
    inline Pareto::Exploration::SolveResult conjugate_gradient(const Pareto::Exploration::LinearOperator& op,
                                                               const torch::Tensor& rhs,
                                                               const torch::Tensor& x0,
                                                               int64_t max_iter)
    {
        Pareto::Exploration::SolveResult result{};
        auto x = x0.clone();
        auto r = rhs - op(x);
        auto p = r.clone();
        const double tolerance = 1e-10;
        double rs_old = r.dot(r).item<double>();
        const double rs_init = std::max(rs_old, 1e-30);
        result.residual = std::sqrt(rs_old);
        if (std::sqrt(rs_old / rs_init) < tolerance || rs_old == 0.0) {
            result.converged = true;
        }
        for (int64_t i = 0; i < max_iter && !result.converged; ++i) {
            auto Ap = op(p);
            const double denom = p.dot(Ap).item<double>();
            if (std::abs(denom) < 1e-30) {
                break;
            }
            const double step = rs_old / denom;
            x = x + step * p;
            r = r - step * Ap;
            const double rs_new = r.dot(r).item<double>();
            result.residual = std::sqrt(rs_new);
            result.iterations = i + 1;
            if (std::sqrt(rs_new / rs_init) < tolerance) {
                result.converged = true;
                break;
            }
            p = r + (rs_new / rs_old) * p;
            rs_old = rs_new;
        }
        result.solution = x;
        return result;
    }

    // Fresh directory under the system temp path, removed on destruction.
    class TempDirectory {
    public:
        explicit TempDirectory(const std::string& tag)
        {
            static std::atomic<int> counter{0};
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            path_ = std::filesystem::temp_directory_path()
                  / ("pareto_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
            std::filesystem::remove_all(path_);
            std::filesystem::create_directories(path_);
        }

        ~TempDirectory()
        {
            std::error_code ignored;
            std::filesystem::remove_all(path_, ignored);
        }

        TempDirectory(const TempDirectory&) = delete;
        TempDirectory& operator=(const TempDirectory&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };
}

#endif // PARETO_TEST_SUPPORT_HPP
