#include "FilterBackend.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

using namespace pix;

std::ostream &pix::operator<<(std::ostream &stream, EdgeCondition edge) {
  switch (edge) {
    case EdgeCondition::ZERO_FILL:
      return stream << "ZERO_FILL";
    case EdgeCondition::NO_OP:
      return stream << "NO_OP";
  }
  return stream << "EdgeCondition(" << static_cast<int>(edge) << ")";
}

namespace {

int32_t ClampSample(double acc, const SampleRange &range) {
  if (std::isnan(acc)) return 0;
  if (acc <= range.min) return range.min;
  if (acc >= range.max) return range.max;
  return static_cast<int32_t>(acc);
}

}  // namespace

bool ScalarFilterBackend::Convolve(const Kernel &kernel, EdgeCondition edge,
                                   const Raster &src, Raster &dst) {
  const int width = std::min(src.Width(), dst.Width());
  const int height = std::min(src.Height(), dst.Height());
  const int bands = src.NumBands();

  const int kw = kernel.Width();
  const int kh = kernel.Height();
  const int kx = kernel.XOrigin();
  const int ky = kernel.YOrigin();

  const int src_w = src.Width();
  const int src_h = src.Height();
  const std::vector<int32_t> input =
      src.GetPixels(src.MinX(), src.MinY(), src_w, src_h);

  std::vector<int32_t> output(width * height * bands, 0);
  if (edge == EdgeCondition::NO_OP) {
    for (int y = 0; y < height; ++y)
      std::copy_n(&input[y * src_w * bands], width * bands,
                  &output[y * width * bands]);
  }

  std::vector<SampleRange> ranges(bands);
  for (int b = 0; b < bands; ++b) ranges[b] = RangeOf(*dst.Layout(), b);

  // Interior: every output pixel whose kernel footprint lies within the source.
  const int x_end = std::min(width, src_w - (kw - kx - 1));
  const int y_end = std::min(height, src_h - (kh - ky - 1));

  for (int y = ky; y < y_end; ++y) {
    for (int x = kx; x < x_end; ++x) {
      int32_t *out_pix = &output[(y * width + x) * bands];

      for (int b = 0; b < bands; ++b) {
        double acc = 0.0;
        for (int j = 0; j < kh; ++j) {
          const int32_t *row = &input[((y - ky + j) * src_w + (x - kx)) * bands];
          for (int i = 0; i < kw; ++i)
            acc += static_cast<double>(kernel.At(i, j)) * row[i * bands + b];
        }
        out_pix[b] = ClampSample(acc, ranges[b]);
      }
    }
  }

  dst.SetPixels(dst.MinX(), dst.MinY(), width, height, output.data());
  return true;
}
