#pragma once

#include <cstdint>
#include <vector>

#include "FilterBackend.hpp"
#include "Kernel.hpp"

namespace pix {
namespace test {
namespace ops {
namespace ref {

/**
 * Naive 2D convolution of a `width` x `height` image with `bands` interleaved
 * bands per pixel (row-major, bands adjacent).
 *
 * Output samples of band `b` are clamped to `[sample_min[b], sample_max[b]]`
 * and truncated toward zero. Pixels whose kernel footprint leaves the image
 * are 0 (ZERO_FILL) or copied from `input` (NO_OP).
 */
std::vector<int32_t> ConvolveReference(int width, int height, int bands,
                                       const std::vector<int32_t>& input,
                                       const pix::Kernel& kernel,
                                       pix::EdgeCondition edge,
                                       const std::vector<int32_t>& sample_min,
                                       const std::vector<int32_t>& sample_max);

}  // namespace ref
}  // namespace ops
}  // namespace test
}  // namespace pix
