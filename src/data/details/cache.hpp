#ifndef ROUNDWISE_DATA_DETAILS_CACHE_HPP
#define ROUNDWISE_DATA_DETAILS_CACHE_HPP

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <torch/torch.h>

#include "../../utils/log.hpp"
#include "source.hpp"

namespace Roundwise::Data::Details {
    // Owns a scratch directory for the lifetime of the object. The directory
    // is tagged with a marker file; only a tagged leftover of an earlier run
    // is cleared, any other non-empty directory is refused untouched.
    class WorkingDirectory {
    public:
        static constexpr const char* kMarker = ".roundwise_cache";

        explicit WorkingDirectory(std::filesystem::path path) : path_(std::move(path))
        {
            if (path_.empty()) {
                throw std::invalid_argument("Working directory path must not be empty.");
            }
            if (std::filesystem::exists(path_)) {
                if (!std::filesystem::is_directory(path_)) {
                    throw std::invalid_argument("Working directory '" + path_.string() + "' exists and is not a directory.");
                }
                if (std::filesystem::exists(path_ / kMarker)) {
                    ::Roundwise::Log::warning(::Roundwise::Log::Area::kData,
                                              "Removing stale working directory '", path_.string(), "'.");
                    std::filesystem::remove_all(path_);
                } else if (!std::filesystem::is_empty(path_)) {
                    throw std::invalid_argument("Working directory '" + path_.string()
                                                + "' already holds files Roundwise did not create.");
                }
            }
            std::filesystem::create_directories(path_);
            std::ofstream marker(path_ / kMarker);
            if (!marker) {
                std::error_code ignored;
                std::filesystem::remove_all(path_, ignored);
                throw std::runtime_error("Failed to tag working directory '" + path_.string() + "'.");
            }
        }

        ~WorkingDirectory()
        {
            std::error_code error;
            std::filesystem::remove_all(path_, error);
            if (error) {
                ::Roundwise::Log::error(::Roundwise::Log::Area::kData,
                                        "Failed to remove working directory '", path_.string(), "': ", error.message());
            } else {
                ::Roundwise::Log::debug(::Roundwise::Log::Area::kData,
                                        "Removed working directory '", path_.string(), "'.");
            }
        }

        WorkingDirectory(const WorkingDirectory&) = delete;
        WorkingDirectory& operator=(const WorkingDirectory&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    // Model inputs persisted once as "<path>/model_inputs_<i>" and read back
    // on demand.
    class CachedDataset {
    public:
        CachedDataset(Source& source, std::size_t num_batches, std::filesystem::path path)
            : path_(std::move(path)), size_(num_batches)
        {
            if (num_batches == 0) {
                throw std::invalid_argument("CachedDataset requires at least one batch.");
            }
            std::filesystem::create_directories(path_);

            for (std::size_t index = 0; index < num_batches; ++index) {
                auto batch = source.next();
                if (!batch.has_value()) {
                    std::ostringstream message;
                    message << "Can not fetch " << num_batches << " batches from the data source; only "
                            << index << " available.";
                    throw std::runtime_error(message.str());
                }
                torch::save(batch->detach().cpu(), file(index).string());
            }
            ::Roundwise::Log::info(::Roundwise::Log::Area::kData,
                                   "Cached ", num_batches, " batches in '", path_.string(), "'.");
        }

        [[nodiscard]] std::size_t size() const noexcept { return size_; }

        [[nodiscard]] torch::Tensor operator[](std::size_t index) const
        {
            if (index >= size_) {
                std::ostringstream message;
                message << "Batch index " << index << " is out of range for a cache of " << size_ << " batches.";
                throw std::out_of_range(message.str());
            }
            torch::Tensor batch;
            torch::load(batch, file(index).string());
            return batch;
        }

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        [[nodiscard]] std::filesystem::path file(std::size_t index) const
        {
            return path_ / ("model_inputs_" + std::to_string(index));
        }

        std::filesystem::path path_;
        std::size_t size_;
    };
}

#endif // ROUNDWISE_DATA_DETAILS_CACHE_HPP
