#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "SampleLayout.hpp"

namespace pix {
namespace test {

/**
 * Seeded linear congruential generator, so that randomized tests are
 * reproducible from their seed.
 */
class Rand {
 protected:
  int state;

  // Because functions can't be overloaded on return type only, to overload
  // get_rand() we need to actually pass it a type indicating what we want.
  template <typename T>
  struct Tag {};

  // Default implementation
  template <typename T>
  T get_rand(Tag<T>);

  template <typename T>
  T get_rand(Tag<T>, T min, T max);

 protected:
  int pseudo_rand();

 public:
  constexpr Rand(int seed) noexcept : state(seed) {}

  /**
   * Get a pseudo-random value of type `T`.
   */
  template <typename T>
  T rand();

  /**
   * Get  pseudo-random value of type `T` between the specified values.
   *
   * The value `x` returned meets the following constraint:
   *     `min_inclusive <= x <= max_inclusive`
   */
  template <typename T>
  T rand(T min_inclusive, T max_inclusive);

  /**
   * Get `count` pseudo-random values in `[min_inclusive, max_inclusive]`.
   */
  template <typename T>
  std::vector<T> rand_vector(size_t count, T min_inclusive, T max_inclusive);

  /**
   * Get `pixel_count` pixels for `layout`, row-major with bands adjacent, each
   * sample drawn from the full range of its band (see `pix::RangeOf()`).
   */
  std::vector<int32_t> rand_pixels(const pix::SampleLayout &layout,
                                   int pixel_count);
};

template <typename T>
T Rand::get_rand(Tag<T>) {
  static_assert(sizeof(T) <= sizeof(int), "Rand yields at most an int");
  return static_cast<T>(pseudo_rand());
}

template <typename T>
T Rand::get_rand(Tag<T>, T min, T max) {
  assert(min <= max);
  int64_t span = static_cast<int64_t>(max) - min + 1;
  int64_t x = static_cast<int64_t>(static_cast<unsigned>(pseudo_rand()) % span);
  return static_cast<T>(min + x);
}

template <typename T>
T Rand::rand() {
  return this->get_rand(Tag<T>());
}

template <typename T>
T Rand::rand(T min_inclusive, T max_inclusive) {
  return get_rand(Tag<T>(), min_inclusive, max_inclusive);
}

template <typename T>
std::vector<T> Rand::rand_vector(size_t count, T min_inclusive,
                                 T max_inclusive) {
  std::vector<T> res(count);
  for (auto &v : res) v = this->rand<T>(min_inclusive, max_inclusive);
  return res;
}

// Specializations of get_rand() defined in Rand.cpp need to be declared here or
// the compiler will choose the generic implementation.

// Uniform distribution over the range [min, max)
template <>
float Rand::get_rand<float>(Tag<float>, float, float);

}  // namespace test
}  // namespace pix
