#ifndef ROUNDWISE_LIBRARY_H
#define ROUNDWISE_LIBRARY_H

#include "../src/core.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Re-exports the whole API surface: model descriptors, the quantization
//    simulation and Adaround entry points.
//  - Header-only; every module lives under src/.

#endif // ROUNDWISE_LIBRARY_H
