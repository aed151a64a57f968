#ifndef PARETO_DATA_STREAM_HPP
#define PARETO_DATA_STREAM_HPP

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/errors.hpp"

namespace Pareto::Data {
    struct Batch {
        torch::Tensor inputs{};
        std::vector<torch::Tensor> targets{};  // one per task

        [[nodiscard]] Batch to(const torch::Device& device) const
        {
            Batch moved{inputs.to(device), {}};
            moved.targets.reserve(targets.size());
            for (const auto& target : targets) {
                moved.targets.push_back(target.to(device));
            }
            return moved;
        }
    };

    struct StreamOptions {
        int64_t batch_size{256};
        bool shuffle{false};
        bool drop_last{false};
        std::optional<uint64_t> seed{};
        std::optional<torch::Device> device{};
    };

    // Endless mini-batch source over an in-memory dataset. The cursor wraps to the first
    // batch of a new cycle once every batch of the current cycle has been served, so callers
    // never observe an end of data. Each instance owns its cursor; copies are disabled so two
    // consumers can never share one by accident.
    class CyclicStream {
    public:
        CyclicStream(torch::Tensor inputs, std::vector<torch::Tensor> targets, StreamOptions options = {})
            : inputs_(std::move(inputs)), targets_(std::move(targets)), options_(std::move(options))
        {
            validate();
            const auto samples = inputs_.size(0);
            batches_per_epoch_ = options_.drop_last ? samples / options_.batch_size
                                                    : (samples + options_.batch_size - 1) / options_.batch_size;
            if (batches_per_epoch_ == 0) {
                throw ConfigurationError("Dataset of " + std::to_string(samples) + " samples yields no batch of size "
                                         + std::to_string(options_.batch_size) + " with drop_last enabled.");
            }
            rng_ = build_rng(options_.seed);
            order_.resize(static_cast<std::size_t>(samples));
            std::iota(order_.begin(), order_.end(), int64_t{0});
            if (options_.shuffle) {
                std::shuffle(order_.begin(), order_.end(), rng_);
            }
        }

        CyclicStream(const CyclicStream&) = delete;
        CyclicStream& operator=(const CyclicStream&) = delete;
        CyclicStream(CyclicStream&&) noexcept = default;
        CyclicStream& operator=(CyclicStream&&) noexcept = default;

        [[nodiscard]] Batch next_batch()
        {
            if (cursor_ == batches_per_epoch_) {
                begin_cycle();
            }

            const auto samples = inputs_.size(0);
            const auto start = cursor_ * options_.batch_size;
            const auto stop = std::min<int64_t>(start + options_.batch_size, samples);
            ++cursor_;
            ++served_;

            auto index = torch::tensor(std::vector<int64_t>(order_.begin() + start, order_.begin() + stop),
                                       torch::TensorOptions().dtype(torch::kLong));

            Batch batch{};
            batch.inputs = inputs_.index_select(0, index.to(inputs_.device()));
            batch.targets.reserve(targets_.size());
            for (const auto& target : targets_) {
                batch.targets.push_back(target.index_select(0, index.to(target.device())));
            }
            if (options_.device.has_value()) {
                return batch.to(*options_.device);
            }
            return batch;
        }

        // Rewinds to the start of a fresh cycle with the original ordering.
        void reset()
        {
            cursor_ = 0;
            cycle_ = 0;
            served_ = 0;
            rng_ = build_rng(options_.seed);
            std::iota(order_.begin(), order_.end(), int64_t{0});
            if (options_.shuffle) {
                std::shuffle(order_.begin(), order_.end(), rng_);
            }
        }

        [[nodiscard]] int64_t batches_per_epoch() const noexcept { return batches_per_epoch_; }
        [[nodiscard]] int64_t cursor() const noexcept { return cursor_; }
        [[nodiscard]] int64_t cycle() const noexcept { return cycle_; }
        [[nodiscard]] int64_t served() const noexcept { return served_; }
        [[nodiscard]] std::size_t num_tasks() const noexcept { return targets_.size(); }
        [[nodiscard]] int64_t num_samples() const { return inputs_.size(0); }
        [[nodiscard]] const StreamOptions& options() const noexcept { return options_; }

    private:
        static std::mt19937_64 build_rng(const std::optional<uint64_t>& seed)
        {
            if (seed) {
                return std::mt19937_64(*seed);
            }
            std::random_device rd;
            return std::mt19937_64(rd());
        }

        void validate() const
        {
            if (!inputs_.defined() || inputs_.dim() == 0) {
                throw ConfigurationError("Stream inputs must be a defined tensor with a batch dimension.");
            }
            if (inputs_.size(0) == 0) {
                throw ConfigurationError("Cannot stream an empty dataset.");
            }
            if (targets_.empty()) {
                throw ConfigurationError("Stream requires at least one task target tensor.");
            }
            for (std::size_t task = 0; task < targets_.size(); ++task) {
                const auto& target = targets_[task];
                if (!target.defined() || target.dim() == 0 || target.size(0) != inputs_.size(0)) {
                    throw ConfigurationError("Targets of task " + std::to_string(task)
                                             + " must hold one entry per input sample.");
                }
            }
            if (options_.batch_size <= 0) {
                throw ConfigurationError("Stream batch size must be greater than zero.");
            }
        }

        void begin_cycle()
        {
            cursor_ = 0;
            ++cycle_;
            if (options_.shuffle) {
                std::shuffle(order_.begin(), order_.end(), rng_);
            }
        }

        torch::Tensor inputs_;
        std::vector<torch::Tensor> targets_;
        StreamOptions options_;
        std::vector<int64_t> order_{};
        std::mt19937_64 rng_{};
        int64_t batches_per_epoch_{0};
        int64_t cursor_{0};
        int64_t cycle_{0};
        int64_t served_{0};
    };
}

#endif // PARETO_DATA_STREAM_HPP
