#include "ComponentSampleLayout.hpp"

#include <algorithm>
#include <cassert>
#include <numeric>
#include <set>
#include <string>

using namespace pix;

ComponentSampleLayout::ComponentSampleLayout(
    DataType type, int width, int height, int pixel_stride,
    int scanline_stride, const std::vector<int> &band_offsets)
    : ComponentSampleLayout(type, width, height, pixel_stride,
                            scanline_stride,
                            std::vector<int>(band_offsets.size(), 0),
                            band_offsets) {}

ComponentSampleLayout::ComponentSampleLayout(
    DataType type, int width, int height, int pixel_stride,
    int scanline_stride, const std::vector<int> &bank_indices,
    const std::vector<int> &band_offsets)
    : SampleLayout(type, width, height, static_cast<int>(band_offsets.size())),
      pixel_stride(pixel_stride),
      scanline_stride(scanline_stride),
      bank_indices(bank_indices),
      band_offsets(band_offsets) {
  if (pixel_stride < 0)
    throw InvalidArgument("Pixel stride must be >= 0");
  if (scanline_stride < 0)
    throw InvalidArgument("Scanline stride must be >= 0");
  if (bank_indices.size() != band_offsets.size())
    throw InvalidArgument("Length of bank indices (" +
                          std::to_string(bank_indices.size()) +
                          ") must equal length of band offsets (" +
                          std::to_string(band_offsets.size()) + ")");
  for (int b = 0; b < num_bands; ++b) {
    if (bank_indices[b] < 0)
      throw InvalidArgument("Bank index of band " + std::to_string(b) +
                            " must be >= 0");
    if (band_offsets[b] < 0)
      throw InvalidArgument("Band offset of band " + std::to_string(b) +
                            " must be >= 0");
  }
}

std::shared_ptr<ComponentSampleLayout> ComponentSampleLayout::Interleaved(
    DataType type, int width, int height, int bands) {
  std::vector<int> offsets(bands > 0 ? bands : 0);
  std::iota(offsets.begin(), offsets.end(), 0);
  return std::make_shared<ComponentSampleLayout>(type, width, height, bands,
                                                 width * bands, offsets);
}

std::shared_ptr<ComponentSampleLayout> ComponentSampleLayout::Banded(
    DataType type, int width, int height, int bands) {
  std::vector<int> banks(bands > 0 ? bands : 0);
  std::iota(banks.begin(), banks.end(), 0);
  return std::make_shared<ComponentSampleLayout>(
      type, width, height, 1, width, banks, std::vector<int>(banks.size(), 0));
}

std::vector<int> ComponentSampleLayout::SampleSize() const {
  return std::vector<int>(num_bands, DataTypeSize(data_type));
}

int ComponentSampleLayout::SampleSize(int) const {
  return DataTypeSize(data_type);
}

/////////////////////////////////////////////////////////////////
//                    Access
/////////////////////////////////////////////////////////////////
int ComponentSampleLayout::GetSample(int x, int y, int b,
                                     const PixelBuffer &data) const {
  assert(IsWithin(x, y));
  assert(b >= 0 && b < num_bands);
  return data.GetElement(bank_indices[b], Offset(x, y, b));
}

void ComponentSampleLayout::SetSample(int x, int y, int b, int s,
                                      PixelBuffer &data) const {
  assert(IsWithin(x, y));
  assert(b >= 0 && b < num_bands);
  data.SetElement(bank_indices[b], Offset(x, y, b), s);
}

void ComponentSampleLayout::GetDataElements(int x, int y, TransferArray &out,
                                            const PixelBuffer &data) const {
  assert(IsWithin(x, y));
  out.Reshape(TransferType(), num_bands);
  for (int b = 0; b < num_bands; ++b)
    out.Set(b, data.GetElement(bank_indices[b], Offset(x, y, b)));
}

void ComponentSampleLayout::SetDataElements(int x, int y,
                                            const TransferArray &in,
                                            PixelBuffer &data) const {
  assert(IsWithin(x, y));
  CheckTransfer(in, num_bands);
  for (int b = 0; b < num_bands; ++b)
    data.SetElement(bank_indices[b], Offset(x, y, b), in.Get(b));
}

/////////////////////////////////////////////////////////////////
//                    Factories
/////////////////////////////////////////////////////////////////
bool ComponentSampleLayout::IsBanded() const {
  std::set<int> banks(bank_indices.begin(), bank_indices.end());
  return static_cast<int>(banks.size()) == num_bands && num_bands > 1;
}

std::shared_ptr<SampleLayout>
ComponentSampleLayout::CreateCompatibleSampleLayout(int w, int h) const {
  if (IsBanded())
    return std::make_shared<ComponentSampleLayout>(
        data_type, w, h, 1, w, bank_indices,
        std::vector<int>(num_bands, 0));

  // Rank the bands by their current offsets so the re-packed pixel keeps the
  // same band order in memory.
  std::vector<int> order(num_bands);
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [this](int a, int b) {
    if (bank_indices[a] != bank_indices[b])
      return bank_indices[a] < bank_indices[b];
    return band_offsets[a] < band_offsets[b];
  });

  std::vector<int> offsets(num_bands);
  for (int rank = 0; rank < num_bands; ++rank) offsets[order[rank]] = rank;

  return std::make_shared<ComponentSampleLayout>(data_type, w, h, num_bands,
                                                 w * num_bands, offsets);
}

std::shared_ptr<SampleLayout> ComponentSampleLayout::CreateSubsetSampleLayout(
    const std::vector<int> &bands) const {
  CheckSubset(bands);

  std::vector<int> banks, offsets;
  for (auto b : bands) {
    banks.push_back(bank_indices[b]);
    offsets.push_back(band_offsets[b]);
  }

  return std::make_shared<ComponentSampleLayout>(
      data_type, width, height, pixel_stride, scanline_stride, banks, offsets);
}

std::shared_ptr<PixelBuffer> ComponentSampleLayout::CreatePixelBuffer() const {
  const int last = scanline_stride * (height - 1) + pixel_stride * (width - 1);
  const int size =
      last + *std::max_element(band_offsets.begin(), band_offsets.end()) + 1;
  const int banks =
      *std::max_element(bank_indices.begin(), bank_indices.end()) + 1;
  return pix::CreatePixelBuffer(data_type, size, banks);
}
