#include "Rand.hpp"

#include <cmath>

using namespace pix::test;

int Rand::pseudo_rand() {
  const int a = 1664525;
  const int c = 1013904223;
  this->state = (int)((long long)a * this->state + c);
  return this->state;
}

std::vector<int32_t> Rand::rand_pixels(const pix::SampleLayout& layout,
                                       int pixel_count) {
  const int bands = layout.NumBands();

  std::vector<pix::SampleRange> ranges;
  for (int b = 0; b < bands; ++b) ranges.push_back(pix::RangeOf(layout, b));

  std::vector<int32_t> pixels(pixel_count * bands);
  for (int p = 0; p < pixel_count; ++p)
    for (int b = 0; b < bands; ++b)
      pixels[p * bands + b] =
          this->rand<int32_t>(ranges[b].min, ranges[b].max);
  return pixels;
}

/**
 * Random float with uniform distribution over [min, max)
 */
template <>
float Rand::get_rand<float>(Tag<float>, float min, float max) {
  auto t = static_cast<uint32_t>(this->rand<int32_t>());
  return (t * ldexpf(1, -32)) * (max - min) + min;
}
