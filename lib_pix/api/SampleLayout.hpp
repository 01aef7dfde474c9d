#ifndef LIB_PIX_SAMPLE_LAYOUT_HPP_
#define LIB_PIX_SAMPLE_LAYOUT_HPP_

#include <cstdint>
#include <memory>
#include <vector>

#include "PixelBuffer.hpp"
#include "TransferArray.hpp"

namespace pix {

/**
 * Describes how the band samples of a `width` x `height` image are laid out
 * within a PixelBuffer.
 *
 * A layout never owns a PixelBuffer; every accessor is handed the buffer to
 * operate on. Coordinates are layout-local: (0, 0) is the first pixel and
 * every accessor requires `0 <= x < Width()` and `0 <= y < Height()`.
 *
 * Concrete layouts must supply the scalar sample pair (`GetSample()`,
 * `SetSample()`) and the single-pixel transfer pair (`GetDataElements()`,
 * `SetDataElements()`). Every other accessor has a default implementation in
 * terms of those, which a layout may override where it can do better.
 *
 * Samples are unsigned integral quantities (except for SHORT storage, which is
 * read sign-extended). The float and double accessors widen the integral
 * sample; there is no separate floating point representation.
 */
class SampleLayout {
 protected:
  int width;
  int height;
  int num_bands;
  DataType data_type;

  SampleLayout(DataType type, int width, int height, int num_bands);

 public:
  virtual ~SampleLayout() = default;

  int Width() const { return width; }
  int Height() const { return height; }
  int NumBands() const { return num_bands; }

  /**
   * The data type of the PixelBuffer storage this layout addresses.
   */
  DataType Type() const { return data_type; }

  /**
   * The data type used to exchange pixels via `Get/SetDataElements()`.
   */
  virtual DataType TransferType() const { return data_type; }

  /**
   * Number of transfer elements needed to hold one pixel.
   */
  virtual int NumDataElements() const = 0;

  /**
   * Test whether the specified pixel lies within this layout.
   */
  bool IsWithin(int x, int y) const {
    return x >= 0 && y >= 0 && x < width && y < height;
  }

  /**
   * Get band `b` of pixel (x, y).
   */
  virtual int GetSample(int x, int y, int b,
                        const PixelBuffer &data) const = 0;

  /**
   * Set band `b` of pixel (x, y). Bits of `s` beyond the band's sample size
   * are discarded.
   */
  virtual void SetSample(int x, int y, int b, int s,
                         PixelBuffer &data) const = 0;

  virtual float GetSampleFloat(int x, int y, int b,
                               const PixelBuffer &data) const;
  virtual double GetSampleDouble(int x, int y, int b,
                                 const PixelBuffer &data) const;

  void SetSample(int x, int y, int b, float s, PixelBuffer &data) const;
  void SetSample(int x, int y, int b, double s, PixelBuffer &data) const;

  /**
   * Read pixel (x, y) in the transfer type. `out` is reshaped to
   * `NumDataElements()` elements of `TransferType()`.
   */
  virtual void GetDataElements(int x, int y, TransferArray &out,
                               const PixelBuffer &data) const = 0;

  /**
   * Write pixel (x, y) from the first `NumDataElements()` elements of `in`.
   *
   * Throws InvalidArgument if `in` is not of `TransferType()` or is too short.
   */
  virtual void SetDataElements(int x, int y, const TransferArray &in,
                               PixelBuffer &data) const = 0;

  TransferArray GetDataElements(int x, int y, const PixelBuffer &data) const;

  /**
   * Read a rectangle of pixels in the transfer type, row-major, each pixel's
   * `NumDataElements()` elements adjacent.
   */
  virtual void GetDataElements(int x, int y, int w, int h, TransferArray &out,
                               const PixelBuffer &data) const;

  /**
   * Write a rectangle of pixels from transfer elements laid out as produced by
   * the rectangle form of `GetDataElements()`.
   */
  virtual void SetDataElements(int x, int y, int w, int h,
                               const TransferArray &in,
                               PixelBuffer &data) const;

  /**
   * Read every band of pixel (x, y) into `pixel[0 .. NumBands())`.
   */
  virtual void GetPixel(int x, int y, int32_t *pixel,
                        const PixelBuffer &data) const;
  void GetPixel(int x, int y, float *pixel, const PixelBuffer &data) const;
  void GetPixel(int x, int y, double *pixel, const PixelBuffer &data) const;
  std::vector<int32_t> GetPixel(int x, int y, const PixelBuffer &data) const;

  /**
   * Read every band of a rectangle of pixels, row-major with bands adjacent,
   * into `pixels[0 .. w * h * NumBands())`.
   */
  virtual void GetPixels(int x, int y, int w, int h, int32_t *pixels,
                         const PixelBuffer &data) const;
  void GetPixels(int x, int y, int w, int h, float *pixels,
                 const PixelBuffer &data) const;
  void GetPixels(int x, int y, int w, int h, double *pixels,
                 const PixelBuffer &data) const;
  std::vector<int32_t> GetPixels(int x, int y, int w, int h,
                                 const PixelBuffer &data) const;

  /**
   * Read band `b` of a rectangle of pixels, row-major, into
   * `samples[0 .. w * h)`.
   */
  virtual void GetSamples(int x, int y, int w, int h, int b, int32_t *samples,
                          const PixelBuffer &data) const;
  void GetSamples(int x, int y, int w, int h, int b, float *samples,
                  const PixelBuffer &data) const;
  void GetSamples(int x, int y, int w, int h, int b, double *samples,
                  const PixelBuffer &data) const;
  std::vector<int32_t> GetSamples(int x, int y, int w, int h, int b,
                                  const PixelBuffer &data) const;

  virtual void SetPixel(int x, int y, const int32_t *pixel,
                        PixelBuffer &data) const;
  void SetPixel(int x, int y, const float *pixel, PixelBuffer &data) const;
  void SetPixel(int x, int y, const double *pixel, PixelBuffer &data) const;

  virtual void SetPixels(int x, int y, int w, int h, const int32_t *pixels,
                         PixelBuffer &data) const;
  void SetPixels(int x, int y, int w, int h, const float *pixels,
                 PixelBuffer &data) const;
  void SetPixels(int x, int y, int w, int h, const double *pixels,
                 PixelBuffer &data) const;

  virtual void SetSamples(int x, int y, int w, int h, int b,
                          const int32_t *samples, PixelBuffer &data) const;
  void SetSamples(int x, int y, int w, int h, int b, const float *samples,
                  PixelBuffer &data) const;
  void SetSamples(int x, int y, int w, int h, int b, const double *samples,
                  PixelBuffer &data) const;

  /**
   * A new layout of the same kind and format with a different extent.
   */
  virtual std::shared_ptr<SampleLayout> CreateCompatibleSampleLayout(
      int w, int h) const = 0;

  /**
   * A new layout exposing only the listed bands, renumbered from 0 in the
   * order given.
   *
   * Throws FormatError if more bands are requested than exist, or if a band
   * index is out of range.
   */
  virtual std::shared_ptr<SampleLayout> CreateSubsetSampleLayout(
      const std::vector<int> &bands) const = 0;

  /**
   * Allocate a zero-filled PixelBuffer just large enough to back this layout.
   */
  virtual std::shared_ptr<PixelBuffer> CreatePixelBuffer() const = 0;

  /**
   * Number of significant bits of each band's samples.
   */
  virtual std::vector<int> SampleSize() const = 0;
  virtual int SampleSize(int band) const = 0;

 protected:
  /**
   * Throws FormatError unless `bands` is a valid band subset of this layout.
   */
  void CheckSubset(const std::vector<int> &bands) const;

  /**
   * Throws InvalidArgument unless `in` can supply `count` elements of the
   * transfer type.
   */
  void CheckTransfer(const TransferArray &in, int count) const;
};

/**
 * The smallest and largest values a band's samples can hold.
 */
struct SampleRange {
  int32_t min;
  int32_t max;
};

/**
 * Range of band `b` of `layout`: `[0, 2^bits - 1]` for unsigned samples, the
 * int16 range for SHORT storage, the int32 range for 32-bit samples.
 */
SampleRange RangeOf(const SampleLayout &layout, int b);

}  // namespace pix

#endif  // LIB_PIX_SAMPLE_LAYOUT_HPP_
