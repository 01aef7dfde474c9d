#ifndef LIB_PIX_COMPONENT_SAMPLE_LAYOUT_HPP_
#define LIB_PIX_COMPONENT_SAMPLE_LAYOUT_HPP_

#include <vector>

#include "SampleLayout.hpp"

namespace pix {

/**
 * Layout in which every sample occupies one whole element.
 *
 * Band `b` of pixel (x, y) lives in bank `BankIndices()[b]` at element
 *
 *   y * ScanlineStride() + x * PixelStride() + BandOffsets()[b]
 *
 * This covers pixel-interleaved images (one bank, pixel stride = bands, band
 * offsets 0..bands-1) as well as banded images (one bank per band, pixel
 * stride 1, band offsets 0).
 */
class ComponentSampleLayout : public SampleLayout {
 private:
  int pixel_stride;
  int scanline_stride;
  std::vector<int> bank_indices;
  std::vector<int> band_offsets;

 public:
  /**
   * Construct a layout whose bands all live in bank 0.
   */
  ComponentSampleLayout(DataType type, int width, int height, int pixel_stride,
                        int scanline_stride,
                        const std::vector<int> &band_offsets);

  /**
   * Construct a layout with explicit per-band bank indices.
   *
   * Throws InvalidArgument on negative strides, negative bank indices or band
   * offsets, or if `bank_indices` and `band_offsets` differ in length.
   */
  ComponentSampleLayout(DataType type, int width, int height, int pixel_stride,
                        int scanline_stride,
                        const std::vector<int> &bank_indices,
                        const std::vector<int> &band_offsets);

  /**
   * A pixel-interleaved layout with `bands` bands in band order.
   */
  static std::shared_ptr<ComponentSampleLayout> Interleaved(DataType type,
                                                            int width,
                                                            int height,
                                                            int bands);

  /**
   * A banded layout with each of `bands` bands in its own bank.
   */
  static std::shared_ptr<ComponentSampleLayout> Banded(DataType type,
                                                       int width, int height,
                                                       int bands);

  int NumDataElements() const override { return num_bands; }

  int PixelStride() const { return pixel_stride; }
  int ScanlineStride() const { return scanline_stride; }
  const std::vector<int> &BankIndices() const { return bank_indices; }
  const std::vector<int> &BandOffsets() const { return band_offsets; }

  /**
   * Index (within its bank) of band `b` of pixel (x, y).
   */
  int Offset(int x, int y, int b = 0) const {
    return y * scanline_stride + x * pixel_stride + band_offsets[b];
  }

  std::vector<int> SampleSize() const override;
  int SampleSize(int band) const override;

  using SampleLayout::GetDataElements;
  using SampleLayout::SetDataElements;
  using SampleLayout::SetSample;

  int GetSample(int x, int y, int b, const PixelBuffer &data) const override;
  void SetSample(int x, int y, int b, int s, PixelBuffer &data) const override;

  void GetDataElements(int x, int y, TransferArray &out,
                       const PixelBuffer &data) const override;
  void SetDataElements(int x, int y, const TransferArray &in,
                       PixelBuffer &data) const override;

  /**
   * A layout of the same data type and bands for a `w` x `h` image, re-packed
   * tightly: banded if every band has a bank of its own, otherwise
   * pixel-interleaved in bank 0 with the original band order kept.
   */
  std::shared_ptr<SampleLayout> CreateCompatibleSampleLayout(
      int w, int h) const override;
  std::shared_ptr<SampleLayout> CreateSubsetSampleLayout(
      const std::vector<int> &bands) const override;
  std::shared_ptr<PixelBuffer> CreatePixelBuffer() const override;

 private:
  bool IsBanded() const;
};

}  // namespace pix

#endif  // LIB_PIX_COMPONENT_SAMPLE_LAYOUT_HPP_
