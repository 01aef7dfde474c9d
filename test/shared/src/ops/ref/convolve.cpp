#include <algorithm>
#include <cmath>

#include "RefOps.hpp"

using namespace pix;
using namespace pix::test::ops::ref;

std::vector<int32_t> pix::test::ops::ref::ConvolveReference(
    int width, int height, int bands, const std::vector<int32_t>& input,
    const pix::Kernel& kernel, pix::EdgeCondition edge,
    const std::vector<int32_t>& sample_min,
    const std::vector<int32_t>& sample_max) {
  auto result = std::vector<int32_t>(width * height * bands);

  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      const int left = x - kernel.XOrigin();
      const int top = y - kernel.YOrigin();

      const bool inside = left >= 0 && top >= 0 &&
                          left + kernel.Width() <= width &&
                          top + kernel.Height() <= height;

      for (int b = 0; b < bands; ++b) {
        const int idx = (y * width + x) * bands + b;

        if (!inside) {
          result[idx] = (edge == EdgeCondition::NO_OP) ? input[idx] : 0;
          continue;
        }

        double acc = 0;
        for (int j = 0; j < kernel.Height(); ++j)
          for (int i = 0; i < kernel.Width(); ++i)
            acc += kernel.At(i, j) *
                   (double)input[((top + j) * width + (left + i)) * bands + b];

        acc = std::min<double>(std::max<double>(acc, sample_min[b]),
                               sample_max[b]);
        result[idx] = static_cast<int32_t>(std::trunc(acc));
      }
    }
  }

  return result;
}
