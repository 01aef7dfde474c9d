#include "SampleLayout.hpp"

#include <climits>
#include <limits>
#include <string>

using namespace pix;

namespace {

template <typename T>
T ReadSample(const SampleLayout &layout, int x, int y, int b,
             const PixelBuffer &data);

template <>
int32_t ReadSample<int32_t>(const SampleLayout &layout, int x, int y, int b,
                            const PixelBuffer &data) {
  return layout.GetSample(x, y, b, data);
}

template <>
float ReadSample<float>(const SampleLayout &layout, int x, int y, int b,
                        const PixelBuffer &data) {
  return layout.GetSampleFloat(x, y, b, data);
}

template <>
double ReadSample<double>(const SampleLayout &layout, int x, int y, int b,
                          const PixelBuffer &data) {
  return layout.GetSampleDouble(x, y, b, data);
}

template <typename T>
void ReadPixels(const SampleLayout &layout, int x, int y, int w, int h,
                T *pixels, const PixelBuffer &data) {
  const int bands = layout.NumBands();
  int offset = 0;
  for (int row = y; row < y + h; ++row)
    for (int col = x; col < x + w; ++col)
      for (int b = 0; b < bands; ++b)
        pixels[offset++] = ReadSample<T>(layout, col, row, b, data);
}

template <typename T>
void ReadSamples(const SampleLayout &layout, int x, int y, int w, int h, int b,
                 T *samples, const PixelBuffer &data) {
  int offset = 0;
  for (int row = y; row < y + h; ++row)
    for (int col = x; col < x + w; ++col)
      samples[offset++] = ReadSample<T>(layout, col, row, b, data);
}

template <typename T>
void WritePixels(const SampleLayout &layout, int x, int y, int w, int h,
                 const T *pixels, PixelBuffer &data) {
  const int bands = layout.NumBands();
  int offset = 0;
  for (int row = y; row < y + h; ++row)
    for (int col = x; col < x + w; ++col)
      for (int b = 0; b < bands; ++b)
        layout.SetSample(col, row, b, pixels[offset++], data);
}

template <typename T>
void WriteSamples(const SampleLayout &layout, int x, int y, int w, int h,
                  int b, const T *samples, PixelBuffer &data) {
  int offset = 0;
  for (int row = y; row < y + h; ++row)
    for (int col = x; col < x + w; ++col)
      layout.SetSample(col, row, b, samples[offset++], data);
}

}  // namespace

SampleLayout::SampleLayout(DataType type, int width, int height,
                           int num_bands)
    : width(width), height(height), num_bands(num_bands), data_type(type) {
  if (width <= 0 || height <= 0)
    throw InvalidArgument("Width (" + std::to_string(width) +
                          ") and height (" + std::to_string(height) +
                          ") must be > 0");

  if (static_cast<long long>(width) * height >= INT_MAX)
    throw InvalidArgument("Dimensions (width=" + std::to_string(width) +
                          " height=" + std::to_string(height) +
                          ") are too large");

  if (!HasStorage(type))
    throw InvalidArgument("Unsupported data type " +
                          std::to_string(static_cast<int>(type)));

  if (num_bands <= 0) throw InvalidArgument("Number of bands must be > 0");
}

/////////////////////////////////////////////////////////////////
//                    Scalar samples
/////////////////////////////////////////////////////////////////
float SampleLayout::GetSampleFloat(int x, int y, int b,
                                   const PixelBuffer &data) const {
  return static_cast<float>(GetSample(x, y, b, data));
}

double SampleLayout::GetSampleDouble(int x, int y, int b,
                                     const PixelBuffer &data) const {
  return static_cast<double>(GetSample(x, y, b, data));
}

void SampleLayout::SetSample(int x, int y, int b, float s,
                             PixelBuffer &data) const {
  SetSample(x, y, b, static_cast<int>(s), data);
}

void SampleLayout::SetSample(int x, int y, int b, double s,
                             PixelBuffer &data) const {
  SetSample(x, y, b, static_cast<int>(s), data);
}

/////////////////////////////////////////////////////////////////
//                    Transfer elements
/////////////////////////////////////////////////////////////////
TransferArray SampleLayout::GetDataElements(int x, int y,
                                            const PixelBuffer &data) const {
  TransferArray out;
  GetDataElements(x, y, out, data);
  return out;
}

void SampleLayout::GetDataElements(int x, int y, int w, int h,
                                   TransferArray &out,
                                   const PixelBuffer &data) const {
  const int elements = NumDataElements();
  out.Reshape(TransferType(), elements * w * h);

  TransferArray pixel;
  int cnt = 0;
  for (int row = y; row < y + h; ++row) {
    for (int col = x; col < x + w; ++col) {
      GetDataElements(col, row, pixel, data);
      for (int k = 0; k < elements; ++k) out.Set(cnt++, pixel.Get(k));
    }
  }
}

void SampleLayout::SetDataElements(int x, int y, int w, int h,
                                   const TransferArray &in,
                                   PixelBuffer &data) const {
  const int elements = NumDataElements();
  CheckTransfer(in, elements * w * h);

  TransferArray pixel(TransferType(), elements);
  int cnt = 0;
  for (int row = y; row < y + h; ++row) {
    for (int col = x; col < x + w; ++col) {
      for (int k = 0; k < elements; ++k) pixel.Set(k, in.Get(cnt++));
      SetDataElements(col, row, pixel, data);
    }
  }
}

/////////////////////////////////////////////////////////////////
//                    Pixels
/////////////////////////////////////////////////////////////////
void SampleLayout::GetPixel(int x, int y, int32_t *pixel,
                            const PixelBuffer &data) const {
  ReadPixels(*this, x, y, 1, 1, pixel, data);
}

void SampleLayout::GetPixel(int x, int y, float *pixel,
                            const PixelBuffer &data) const {
  ReadPixels(*this, x, y, 1, 1, pixel, data);
}

void SampleLayout::GetPixel(int x, int y, double *pixel,
                            const PixelBuffer &data) const {
  ReadPixels(*this, x, y, 1, 1, pixel, data);
}

std::vector<int32_t> SampleLayout::GetPixel(int x, int y,
                                            const PixelBuffer &data) const {
  std::vector<int32_t> pixel(num_bands);
  GetPixel(x, y, pixel.data(), data);
  return pixel;
}

void SampleLayout::GetPixels(int x, int y, int w, int h, int32_t *pixels,
                             const PixelBuffer &data) const {
  ReadPixels(*this, x, y, w, h, pixels, data);
}

void SampleLayout::GetPixels(int x, int y, int w, int h, float *pixels,
                             const PixelBuffer &data) const {
  ReadPixels(*this, x, y, w, h, pixels, data);
}

void SampleLayout::GetPixels(int x, int y, int w, int h, double *pixels,
                             const PixelBuffer &data) const {
  ReadPixels(*this, x, y, w, h, pixels, data);
}

std::vector<int32_t> SampleLayout::GetPixels(int x, int y, int w, int h,
                                             const PixelBuffer &data) const {
  std::vector<int32_t> pixels(num_bands * w * h);
  GetPixels(x, y, w, h, pixels.data(), data);
  return pixels;
}

void SampleLayout::SetPixel(int x, int y, const int32_t *pixel,
                            PixelBuffer &data) const {
  WritePixels(*this, x, y, 1, 1, pixel, data);
}

void SampleLayout::SetPixel(int x, int y, const float *pixel,
                            PixelBuffer &data) const {
  WritePixels(*this, x, y, 1, 1, pixel, data);
}

void SampleLayout::SetPixel(int x, int y, const double *pixel,
                            PixelBuffer &data) const {
  WritePixels(*this, x, y, 1, 1, pixel, data);
}

void SampleLayout::SetPixels(int x, int y, int w, int h, const int32_t *pixels,
                             PixelBuffer &data) const {
  WritePixels(*this, x, y, w, h, pixels, data);
}

void SampleLayout::SetPixels(int x, int y, int w, int h, const float *pixels,
                             PixelBuffer &data) const {
  WritePixels(*this, x, y, w, h, pixels, data);
}

void SampleLayout::SetPixels(int x, int y, int w, int h, const double *pixels,
                             PixelBuffer &data) const {
  WritePixels(*this, x, y, w, h, pixels, data);
}

/////////////////////////////////////////////////////////////////
//                    Samples
/////////////////////////////////////////////////////////////////
void SampleLayout::GetSamples(int x, int y, int w, int h, int b,
                              int32_t *samples,
                              const PixelBuffer &data) const {
  ReadSamples(*this, x, y, w, h, b, samples, data);
}

void SampleLayout::GetSamples(int x, int y, int w, int h, int b,
                              float *samples, const PixelBuffer &data) const {
  ReadSamples(*this, x, y, w, h, b, samples, data);
}

void SampleLayout::GetSamples(int x, int y, int w, int h, int b,
                              double *samples, const PixelBuffer &data) const {
  ReadSamples(*this, x, y, w, h, b, samples, data);
}

std::vector<int32_t> SampleLayout::GetSamples(int x, int y, int w, int h,
                                              int b,
                                              const PixelBuffer &data) const {
  std::vector<int32_t> samples(w * h);
  GetSamples(x, y, w, h, b, samples.data(), data);
  return samples;
}

void SampleLayout::SetSamples(int x, int y, int w, int h, int b,
                              const int32_t *samples,
                              PixelBuffer &data) const {
  WriteSamples(*this, x, y, w, h, b, samples, data);
}

void SampleLayout::SetSamples(int x, int y, int w, int h, int b,
                              const float *samples, PixelBuffer &data) const {
  WriteSamples(*this, x, y, w, h, b, samples, data);
}

void SampleLayout::SetSamples(int x, int y, int w, int h, int b,
                              const double *samples, PixelBuffer &data) const {
  WriteSamples(*this, x, y, w, h, b, samples, data);
}

/////////////////////////////////////////////////////////////////
//                    Checks
/////////////////////////////////////////////////////////////////
void SampleLayout::CheckSubset(const std::vector<int> &bands) const {
  if (static_cast<int>(bands.size()) > num_bands)
    throw FormatError("There are only " + std::to_string(num_bands) +
                      " bands");
  if (bands.empty()) throw FormatError("A band subset must name a band");
  for (auto b : bands)
    if (b < 0 || b >= num_bands)
      throw FormatError("Band " + std::to_string(b) + " is not in [0, " +
                        std::to_string(num_bands) + ")");
}

void SampleLayout::CheckTransfer(const TransferArray &in, int count) const {
  if (in.Type() != TransferType())
    throw InvalidArgument("Transfer array type does not match layout");
  if (in.Length() < count)
    throw InvalidArgument("Transfer array holds " +
                          std::to_string(in.Length()) + " elements, " +
                          std::to_string(count) + " required");
}

/////////////////////////////////////////////////////////////////
//                    SampleRange
/////////////////////////////////////////////////////////////////
SampleRange pix::RangeOf(const SampleLayout &layout, int b) {
  if (layout.Type() == DataType::SHORT)
    return SampleRange{std::numeric_limits<int16_t>::min(),
                       std::numeric_limits<int16_t>::max()};

  const int bits = layout.SampleSize(b);
  if (bits >= 32)
    return SampleRange{std::numeric_limits<int32_t>::min(),
                       std::numeric_limits<int32_t>::max()};

  return SampleRange{0, static_cast<int32_t>((1LL << bits) - 1)};
}
