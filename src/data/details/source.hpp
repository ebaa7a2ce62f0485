#ifndef ROUNDWISE_DATA_DETAILS_SOURCE_HPP
#define ROUNDWISE_DATA_DETAILS_SOURCE_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Roundwise::Data::Details {
    // Pull-based stream of model input batches.
    class Source {
    public:
        virtual ~Source() = default;
        virtual std::optional<torch::Tensor> next() = 0;
    };

    class TensorSource final : public Source {
    public:
        explicit TensorSource(std::vector<torch::Tensor> batches) : batches_(std::move(batches)) {}

        std::optional<torch::Tensor> next() override
        {
            if (position_ >= batches_.size()) {
                return std::nullopt;
            }
            return batches_[position_++];
        }

    private:
        std::vector<torch::Tensor> batches_;
        std::size_t position_{0};
    };

    // Slices dimension 0 of `data` into batches of `batch_size`; the last
    // partial batch is dropped unless `keep_partial` is set.
    class SplitSource final : public Source {
    public:
        SplitSource(torch::Tensor data, std::int64_t batch_size, bool keep_partial = false)
            : data_(std::move(data)), batch_size_(batch_size), keep_partial_(keep_partial)
        {
            if (!data_.defined() || data_.dim() == 0) {
                throw std::invalid_argument("SplitSource requires a tensor with a batch dimension.");
            }
            if (batch_size_ <= 0) {
                throw std::invalid_argument("SplitSource batch size must be positive.");
            }
        }

        std::optional<torch::Tensor> next() override
        {
            const auto total = data_.size(0);
            if (offset_ >= total) {
                return std::nullopt;
            }
            const auto end = std::min(offset_ + batch_size_, total);
            if (end - offset_ < batch_size_ && !keep_partial_) {
                offset_ = total;
                return std::nullopt;
            }
            auto batch = data_.slice(/*dim=*/0, offset_, end);
            offset_ = end;
            return batch;
        }

    private:
        torch::Tensor data_;
        std::int64_t batch_size_;
        bool keep_partial_;
        std::int64_t offset_{0};
    };

    // Adapts any iterable (a torch data loader, a container of examples...)
    // with `extract` mapping an element to the model input.
    template <class Range, class Extract>
    class RangeSource final : public Source {
    public:
        RangeSource(Range& range, Extract extract)
            : range_(range), extract_(std::move(extract)) {}

        std::optional<torch::Tensor> next() override
        {
            if (!current_.has_value()) {
                current_.emplace(std::begin(range_));
            }
            if (*current_ == std::end(range_)) {
                return std::nullopt;
            }
            torch::Tensor batch = extract_(**current_);
            ++*current_;
            return batch;
        }

    private:
        Range& range_;
        Extract extract_;
        std::optional<decltype(std::begin(std::declval<Range&>()))> current_{};
    };

    template <class Range, class Extract>
    [[nodiscard]] std::unique_ptr<Source> make_source(Range& range, Extract extract)
    {
        return std::make_unique<RangeSource<Range, Extract>>(range, std::move(extract));
    }
}

#endif // ROUNDWISE_DATA_DETAILS_SOURCE_HPP
