#ifndef LIB_PIX_PACKED_SAMPLE_LAYOUT_HPP_
#define LIB_PIX_PACKED_SAMPLE_LAYOUT_HPP_

#include <cstdint>
#include <vector>

#include "SampleLayout.hpp"

namespace pix {

/**
 * Layout in which every pixel occupies exactly one element of a single bank,
 * and each band is a contiguous run of bits within that element, selected by
 * a bit mask.
 *
 * For example, 0x00RRGGBB pixels in INT storage use the masks
 * `{0xFF0000, 0x00FF00, 0x0000FF}`, giving bit offsets `{16, 8, 0}` and a
 * sample size of 8 for every band.
 *
 * Pixel (x, y) lives at element `y * ScanlineStride() + x`.
 */
class PackedSampleLayout : public SampleLayout {
 private:
  std::vector<uint32_t> bit_masks;
  std::vector<int> bit_offsets;
  std::vector<int> bit_sizes;
  int max_bit_size;
  int scanline_stride;

 public:
  /**
   * Construct a packed layout whose scanline stride equals its width.
   */
  PackedSampleLayout(DataType type, int width, int height,
                     const std::vector<uint32_t> &bit_masks);

  /**
   * Construct a packed layout.
   *
   * Throws InvalidArgument if `type` is not BYTE, USHORT or INT, if a mask is
   * not a contiguous run of set bits, or if a mask has bits beyond the width
   * of `type`. A zero mask describes a band with no bits.
   */
  PackedSampleLayout(DataType type, int width, int height,
                     int scanline_stride,
                     const std::vector<uint32_t> &bit_masks);

  int NumDataElements() const override { return 1; }

  const std::vector<uint32_t> &BitMasks() const { return bit_masks; }
  const std::vector<int> &BitOffsets() const { return bit_offsets; }
  int MaxBitSize() const { return max_bit_size; }
  int ScanlineStride() const { return scanline_stride; }

  /**
   * Index of the element holding pixel (x, y).
   */
  int Offset(int x, int y) const { return y * scanline_stride + x; }

  std::vector<int> SampleSize() const override { return bit_sizes; }
  int SampleSize(int band) const override { return bit_sizes[band]; }

  using SampleLayout::GetDataElements;
  using SampleLayout::GetPixel;
  using SampleLayout::GetPixels;
  using SampleLayout::GetSamples;
  using SampleLayout::SetDataElements;
  using SampleLayout::SetPixel;
  using SampleLayout::SetPixels;
  using SampleLayout::SetSample;
  using SampleLayout::SetSamples;

  int GetSample(int x, int y, int b, const PixelBuffer &data) const override;
  void SetSample(int x, int y, int b, int s, PixelBuffer &data) const override;

  void GetDataElements(int x, int y, TransferArray &out,
                       const PixelBuffer &data) const override;
  void SetDataElements(int x, int y, const TransferArray &in,
                       PixelBuffer &data) const override;

  void GetPixel(int x, int y, int32_t *pixel,
                const PixelBuffer &data) const override;
  void GetPixels(int x, int y, int w, int h, int32_t *pixels,
                 const PixelBuffer &data) const override;
  void GetSamples(int x, int y, int w, int h, int b, int32_t *samples,
                  const PixelBuffer &data) const override;

  void SetPixel(int x, int y, const int32_t *pixel,
                PixelBuffer &data) const override;
  void SetPixels(int x, int y, int w, int h, const int32_t *pixels,
                 PixelBuffer &data) const override;
  void SetSamples(int x, int y, int w, int h, int b, const int32_t *samples,
                  PixelBuffer &data) const override;

  std::shared_ptr<SampleLayout> CreateCompatibleSampleLayout(
      int w, int h) const override;
  std::shared_ptr<SampleLayout> CreateSubsetSampleLayout(
      const std::vector<int> &bands) const override;
  std::shared_ptr<PixelBuffer> CreatePixelBuffer() const override;

 private:
  uint32_t Extract(uint32_t element, int b) const {
    return (element & bit_masks[b]) >> bit_offsets[b];
  }

  uint32_t Insert(uint32_t element, int b, int s) const {
    return (element & ~bit_masks[b]) |
           ((static_cast<uint32_t>(s) << bit_offsets[b]) & bit_masks[b]);
  }
};

}  // namespace pix

#endif  // LIB_PIX_PACKED_SAMPLE_LAYOUT_HPP_
