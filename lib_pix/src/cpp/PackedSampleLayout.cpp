#include "PackedSampleLayout.hpp"

#include <cassert>
#include <sstream>

using namespace pix;

static void CheckPackedType(DataType type) {
  if (type != DataType::BYTE && type != DataType::USHORT &&
      type != DataType::INT) {
    std::stringstream msg;
    msg << "Unsupported data type " << type << " for a packed layout";
    throw InvalidArgument(msg.str());
  }
}

PackedSampleLayout::PackedSampleLayout(DataType type, int width, int height,
                                       const std::vector<uint32_t> &bit_masks)
    : PackedSampleLayout(type, width, height, width, bit_masks) {}

PackedSampleLayout::PackedSampleLayout(DataType type, int width, int height,
                                       int scanline_stride,
                                       const std::vector<uint32_t> &bit_masks)
    : SampleLayout(type, width, height, static_cast<int>(bit_masks.size())),
      bit_masks(bit_masks),
      max_bit_size(0),
      scanline_stride(scanline_stride) {
  CheckPackedType(type);

  if (scanline_stride < width)
    throw InvalidArgument("Scanline stride (" +
                          std::to_string(scanline_stride) +
                          ") must be >= width (" + std::to_string(width) +
                          ")");

  const int element_bits = DataTypeSize(type);
  uint32_t used_bits = 0;

  for (int i = 0; i < num_bands; ++i) {
    int bit_offset = 0, bit_size = 0;
    uint32_t mask = bit_masks[i];

    if (mask != 0) {
      while ((mask & 1) == 0) {
        mask >>= 1;
        bit_offset++;
      }
      while ((mask & 1) == 1) {
        mask >>= 1;
        bit_size++;
      }
      if (mask != 0) {
        std::stringstream msg;
        msg << "Mask 0x" << std::hex << bit_masks[i] << " must be contiguous";
        throw InvalidArgument(msg.str());
      }
      if (bit_offset + bit_size > element_bits) {
        std::stringstream msg;
        msg << "Mask 0x" << std::hex << bit_masks[i] << " does not fit in "
            << std::dec << element_bits << " bits";
        throw InvalidArgument(msg.str());
      }
      if (used_bits & bit_masks[i]) {
        std::stringstream msg;
        msg << "Mask 0x" << std::hex << bit_masks[i]
            << " overlaps the masks of earlier bands";
        throw InvalidArgument(msg.str());
      }
      used_bits |= bit_masks[i];
    }

    bit_offsets.push_back(bit_offset);
    bit_sizes.push_back(bit_size);
    if (bit_size > max_bit_size) max_bit_size = bit_size;
  }
}

/////////////////////////////////////////////////////////////////
//                    Scalar access
/////////////////////////////////////////////////////////////////
int PackedSampleLayout::GetSample(int x, int y, int b,
                                  const PixelBuffer &data) const {
  assert(IsWithin(x, y));
  assert(b >= 0 && b < num_bands);
  const uint32_t element = data.GetElement(Offset(x, y));
  return static_cast<int>(Extract(element, b));
}

void PackedSampleLayout::SetSample(int x, int y, int b, int s,
                                   PixelBuffer &data) const {
  assert(IsWithin(x, y));
  assert(b >= 0 && b < num_bands);
  const int offset = Offset(x, y);
  const uint32_t element = data.GetElement(offset);
  data.SetElement(offset, static_cast<int>(Insert(element, b, s)));
}

void PackedSampleLayout::GetDataElements(int x, int y, TransferArray &out,
                                         const PixelBuffer &data) const {
  assert(IsWithin(x, y));
  out.Reshape(TransferType(), 1);
  out.Set(0, data.GetElement(Offset(x, y)));
}

void PackedSampleLayout::SetDataElements(int x, int y, const TransferArray &in,
                                         PixelBuffer &data) const {
  assert(IsWithin(x, y));
  CheckTransfer(in, 1);
  data.SetElement(Offset(x, y), in.Get(0));
}

/////////////////////////////////////////////////////////////////
//                    Bulk access
/////////////////////////////////////////////////////////////////
void PackedSampleLayout::GetPixel(int x, int y, int32_t *pixel,
                                  const PixelBuffer &data) const {
  assert(IsWithin(x, y));
  const uint32_t element = data.GetElement(Offset(x, y));
  for (int b = 0; b < num_bands; ++b)
    pixel[b] = static_cast<int32_t>(Extract(element, b));
}

void PackedSampleLayout::GetPixels(int x, int y, int w, int h,
                                   int32_t *pixels,
                                   const PixelBuffer &data) const {
  int line_offset = Offset(x, y);
  int dst = 0;
  for (int row = 0; row < h; ++row) {
    for (int col = 0; col < w; ++col) {
      const uint32_t element = data.GetElement(line_offset + col);
      for (int b = 0; b < num_bands; ++b)
        pixels[dst++] = static_cast<int32_t>(Extract(element, b));
    }
    line_offset += scanline_stride;
  }
}

void PackedSampleLayout::GetSamples(int x, int y, int w, int h, int b,
                                    int32_t *samples,
                                    const PixelBuffer &data) const {
  int line_offset = Offset(x, y);
  int dst = 0;
  for (int row = 0; row < h; ++row) {
    for (int col = 0; col < w; ++col)
      samples[dst++] = static_cast<int32_t>(
          Extract(data.GetElement(line_offset + col), b));
    line_offset += scanline_stride;
  }
}

void PackedSampleLayout::SetPixel(int x, int y, const int32_t *pixel,
                                  PixelBuffer &data) const {
  assert(IsWithin(x, y));
  const int offset = Offset(x, y);
  uint32_t element = data.GetElement(offset);
  for (int b = 0; b < num_bands; ++b) element = Insert(element, b, pixel[b]);
  data.SetElement(offset, static_cast<int>(element));
}

void PackedSampleLayout::SetPixels(int x, int y, int w, int h,
                                   const int32_t *pixels,
                                   PixelBuffer &data) const {
  int line_offset = Offset(x, y);
  int src = 0;
  for (int row = 0; row < h; ++row) {
    for (int col = 0; col < w; ++col) {
      // Bits not covered by any band mask are preserved.
      uint32_t element = data.GetElement(line_offset + col);
      for (int b = 0; b < num_bands; ++b)
        element = Insert(element, b, pixels[src++]);
      data.SetElement(line_offset + col, static_cast<int>(element));
    }
    line_offset += scanline_stride;
  }
}

void PackedSampleLayout::SetSamples(int x, int y, int w, int h, int b,
                                    const int32_t *samples,
                                    PixelBuffer &data) const {
  int line_offset = Offset(x, y);
  int src = 0;
  for (int row = 0; row < h; ++row) {
    for (int col = 0; col < w; ++col) {
      const uint32_t element = data.GetElement(line_offset + col);
      data.SetElement(line_offset + col,
                      static_cast<int>(Insert(element, b, samples[src++])));
    }
    line_offset += scanline_stride;
  }
}

/////////////////////////////////////////////////////////////////
//                    Factories
/////////////////////////////////////////////////////////////////
std::shared_ptr<SampleLayout> PackedSampleLayout::CreateCompatibleSampleLayout(
    int w, int h) const {
  return std::make_shared<PackedSampleLayout>(data_type, w, h, bit_masks);
}

std::shared_ptr<SampleLayout> PackedSampleLayout::CreateSubsetSampleLayout(
    const std::vector<int> &bands) const {
  CheckSubset(bands);

  std::vector<uint32_t> masks;
  for (auto b : bands) masks.push_back(bit_masks[b]);

  return std::make_shared<PackedSampleLayout>(data_type, width, height,
                                              scanline_stride, masks);
}

std::shared_ptr<PixelBuffer> PackedSampleLayout::CreatePixelBuffer() const {
  const int size = scanline_stride * (height - 1) + width;
  return pix::CreatePixelBuffer(data_type, size);
}
