#ifndef ROUNDWISE_DATA_HPP
#define ROUNDWISE_DATA_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/cache.hpp"
#include "details/source.hpp"

namespace Roundwise::Data {
    using Source = Details::Source;
    using TensorSource = Details::TensorSource;
    using SplitSource = Details::SplitSource;
    using CachedDataset = Details::CachedDataset;
    using WorkingDirectory = Details::WorkingDirectory;

    using Details::make_source;
}
#endif //ROUNDWISE_DATA_HPP
