#include <cstdint>
#include <memory>
#include <vector>

#include "Errors.hpp"
#include "PackedSampleLayout.hpp"
#include "Rand.hpp"
#include "gtest/gtest.h"

using namespace pix;

static const std::vector<uint32_t> kRgbMasks = {0xFF0000, 0x00FF00, 0x0000FF};
static const std::vector<uint32_t> kArgbMasks = {0x00FF0000, 0x0000FF00,
                                                 0x000000FF, 0xFF000000};

/////////////////////////////////////////////////////////////////////////
//
//
TEST(PackedSampleLayout_Test, RgbMaskDerivation) {
  PackedSampleLayout layout(DataType::INT, 4, 3, kRgbMasks);

  EXPECT_EQ(3, layout.NumBands());
  EXPECT_EQ(1, layout.NumDataElements());
  EXPECT_EQ(DataType::INT, layout.TransferType());
  EXPECT_EQ(std::vector<int>({8, 8, 8}), layout.SampleSize());
  EXPECT_EQ(std::vector<int>({16, 8, 0}), layout.BitOffsets());
  EXPECT_EQ(8, layout.MaxBitSize());
  EXPECT_EQ(4, layout.ScanlineStride());
}

TEST(PackedSampleLayout_Test, UnevenMasks) {
  // 5-6-5 in 16 bits, plus an empty band
  PackedSampleLayout layout(DataType::USHORT, 2, 2, {0xF800, 0x07E0, 0x001F, 0});
  EXPECT_EQ(std::vector<int>({5, 6, 5, 0}), layout.SampleSize());
  EXPECT_EQ(std::vector<int>({11, 5, 0, 0}), layout.BitOffsets());
  EXPECT_EQ(6, layout.MaxBitSize());
}

TEST(PackedSampleLayout_Test, InvalidMasks) {
  EXPECT_THROW(PackedSampleLayout(DataType::INT, 2, 2, {0xF0F0}),
               InvalidArgument);
  EXPECT_THROW(PackedSampleLayout(DataType::BYTE, 2, 2, {0x1FF}),
               InvalidArgument);
  EXPECT_THROW(PackedSampleLayout(DataType::USHORT, 2, 2, {0xFF00, 0x10000}),
               InvalidArgument);
  EXPECT_THROW(PackedSampleLayout(DataType::INT, 1, 1, {0xFF, 0x0F}),
               InvalidArgument);
  EXPECT_THROW(PackedSampleLayout(DataType::INT, 1, 1, {0xFF00, 0xF0, 0x180}),
               InvalidArgument);
  EXPECT_NO_THROW(PackedSampleLayout(DataType::INT, 1, 1, {0xFF, 0, 0xFF00}));
}

TEST(PackedSampleLayout_Test, InvalidConstruction) {
  EXPECT_THROW(PackedSampleLayout(DataType::SHORT, 2, 2, kRgbMasks),
               InvalidArgument);
  EXPECT_THROW(PackedSampleLayout(DataType::INT, 0, 2, kRgbMasks),
               InvalidArgument);
  EXPECT_THROW(PackedSampleLayout(DataType::INT, 2, -1, kRgbMasks),
               InvalidArgument);
  EXPECT_THROW(PackedSampleLayout(DataType::INT, 4, 2, 3, kRgbMasks),
               InvalidArgument);
  EXPECT_THROW(PackedSampleLayout(DataType::INT, 2, 2, {}), InvalidArgument);
}

/////////////////////////////////////////////////////////////////////////
//
//
TEST(PackedSampleLayout_Test, SampleAccess) {
  PackedSampleLayout layout(DataType::INT, 3, 2, kRgbMasks);
  auto buff = layout.CreatePixelBuffer();
  ASSERT_EQ(6, buff->Size());

  buff->SetElement(layout.Offset(1, 1), 0x123456);
  EXPECT_EQ(0x12, layout.GetSample(1, 1, 0, *buff));
  EXPECT_EQ(0x34, layout.GetSample(1, 1, 1, *buff));
  EXPECT_EQ(0x56, layout.GetSample(1, 1, 2, *buff));

  layout.SetSample(1, 1, 1, 0xAB, *buff);
  EXPECT_EQ(0x12AB56, buff->GetElement(layout.Offset(1, 1)));
}

TEST(PackedSampleLayout_Test, SetSampleKeepsLowBits) {
  PackedSampleLayout layout(DataType::INT, 2, 2, kRgbMasks);
  auto buff = layout.CreatePixelBuffer();

  layout.SetSample(0, 0, 2, 0x1FF, *buff);
  EXPECT_EQ(0xFF, layout.GetSample(0, 0, 2, *buff));
  EXPECT_EQ(0, layout.GetSample(0, 0, 1, *buff));

  layout.SetSample(1, 0, 0, 256 + 7, *buff);
  EXPECT_EQ(7, layout.GetSample(1, 0, 0, *buff));

  layout.SetSample(1, 1, 1, 9.9f, *buff);
  EXPECT_EQ(9, layout.GetSample(1, 1, 1, *buff));
  EXPECT_FLOAT_EQ(9.0f, layout.GetSampleFloat(1, 1, 1, *buff));
  EXPECT_DOUBLE_EQ(9.0, layout.GetSampleDouble(1, 1, 1, *buff));
}

TEST(PackedSampleLayout_Test, PixelsAndSamples) {
  PackedSampleLayout layout(DataType::INT, 3, 3, kRgbMasks);
  auto buff = layout.CreatePixelBuffer();

  const std::vector<int32_t> pixels = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};
  layout.SetPixels(1, 1, 2, 2, pixels.data(), *buff);

  EXPECT_EQ(pixels, layout.GetPixels(1, 1, 2, 2, *buff));
  EXPECT_EQ(std::vector<int32_t>({4, 5, 6}), layout.GetPixel(2, 1, *buff));
  EXPECT_EQ(std::vector<int32_t>({0, 0, 0}), layout.GetPixel(0, 0, *buff));
  EXPECT_EQ(0x070809, buff->GetElement(layout.Offset(1, 2)));

  EXPECT_EQ(std::vector<int32_t>({2, 5, 8, 11}),
            layout.GetSamples(1, 1, 2, 2, 1, *buff));

  const std::vector<int32_t> blue = {100, 101, 102};
  layout.SetSamples(0, 2, 3, 1, 2, blue.data(), *buff);
  EXPECT_EQ(std::vector<int32_t>({100, 101, 102}),
            layout.GetSamples(0, 2, 3, 1, 2, *buff));
  EXPECT_EQ(std::vector<int32_t>({7, 8, 101}), layout.GetPixel(1, 2, *buff));
}

TEST(PackedSampleLayout_Test, SetPixelPreservesUnmaskedBits) {
  PackedSampleLayout argb(DataType::INT, 2, 1, kArgbMasks);
  auto buff = argb.CreatePixelBuffer();
  buff->SetElement(0, static_cast<int>(0xFF000000u));

  auto rgb = argb.CreateSubsetSampleLayout({0, 1, 2});
  const int32_t pixel[] = {1, 2, 3};
  rgb->SetPixel(0, 0, pixel, *buff);

  EXPECT_EQ(static_cast<int>(0xFF010203u), buff->GetElement(0));
}

TEST(PackedSampleLayout_Test, DataElements) {
  PackedSampleLayout layout(DataType::INT, 2, 2, kRgbMasks);
  auto buff = layout.CreatePixelBuffer();

  const int32_t pixel[] = {0x11, 0x22, 0x33};
  layout.SetPixel(1, 0, pixel, *buff);

  TransferArray elems = layout.GetDataElements(1, 0, *buff);
  ASSERT_EQ(1, elems.Length());
  EXPECT_EQ(DataType::INT, elems.Type());
  EXPECT_EQ(0x112233, elems.Get(0));

  layout.SetDataElements(0, 1, elems, *buff);
  EXPECT_EQ(std::vector<int32_t>({0x11, 0x22, 0x33}),
            layout.GetPixel(0, 1, *buff));

  TransferArray wrong_type(DataType::BYTE, 1);
  EXPECT_THROW(layout.SetDataElements(0, 0, wrong_type, *buff),
               InvalidArgument);
  TransferArray too_short(DataType::INT, 0);
  EXPECT_THROW(layout.SetDataElements(0, 0, too_short, *buff),
               InvalidArgument);
}

TEST(PackedSampleLayout_Test, ByteStorage) {
  // 2-bit samples in a byte
  PackedSampleLayout layout(DataType::BYTE, 4, 1, {0xC0, 0x30, 0x0C, 0x03});
  auto buff = layout.CreatePixelBuffer();

  const int32_t pixel[] = {3, 2, 1, 0};
  layout.SetPixel(2, 0, pixel, *buff);
  EXPECT_EQ(0xE4, buff->GetElement(2));
  EXPECT_EQ(std::vector<int32_t>({3, 2, 1, 0}), layout.GetPixel(2, 0, *buff));
}

/////////////////////////////////////////////////////////////////////////
//
//
TEST(PackedSampleLayout_Test, CompatibleLayout) {
  PackedSampleLayout layout(DataType::INT, 4, 4, 8, kRgbMasks);
  auto compat = layout.CreateCompatibleSampleLayout(5, 2);

  auto packed = std::dynamic_pointer_cast<PackedSampleLayout>(compat);
  ASSERT_NE(nullptr, packed);
  EXPECT_EQ(5, packed->Width());
  EXPECT_EQ(2, packed->Height());
  EXPECT_EQ(5, packed->ScanlineStride());
  EXPECT_EQ(kRgbMasks, packed->BitMasks());
  EXPECT_EQ(10, packed->CreatePixelBuffer()->Size());
}

TEST(PackedSampleLayout_Test, SubsetLayout) {
  PackedSampleLayout layout(DataType::INT, 4, 4, 8, kArgbMasks);
  auto subset = std::dynamic_pointer_cast<PackedSampleLayout>(
      layout.CreateSubsetSampleLayout({3, 0}));

  ASSERT_NE(nullptr, subset);
  EXPECT_EQ(2, subset->NumBands());
  EXPECT_EQ(8, subset->ScanlineStride());
  EXPECT_EQ(std::vector<uint32_t>({0xFF000000, 0x00FF0000}),
            subset->BitMasks());

  auto buff = layout.CreatePixelBuffer();
  EXPECT_EQ(8 * 3 + 4, buff->Size());
  buff->SetElement(layout.Offset(2, 3), static_cast<int>(0x80402010u));
  EXPECT_EQ(0x80, subset->GetSample(2, 3, 0, *buff));
  EXPECT_EQ(0x40, subset->GetSample(2, 3, 1, *buff));

  EXPECT_THROW(layout.CreateSubsetSampleLayout({0, 1, 2, 3, 0}), FormatError);
  EXPECT_THROW(layout.CreateSubsetSampleLayout({4}), FormatError);
  EXPECT_THROW(layout.CreateSubsetSampleLayout({-1}), FormatError);
  EXPECT_THROW(layout.CreateSubsetSampleLayout({1, 1}), InvalidArgument);
}

/////////////////////////////////////////////////////////////////////////
//
//
TEST(PackedSampleLayout_Test, RandomPixels) {
  pix::test::Rand rng(3243);
  PackedSampleLayout layout(DataType::USHORT, 7, 5, {0xF800, 0x07E0, 0x001F});
  auto buff = layout.CreatePixelBuffer();

  auto pixels = rng.rand_pixels(layout, 7 * 5);
  layout.SetPixels(0, 0, 7, 5, pixels.data(), *buff);

  for (int y = 0; y < 5; ++y) {
    for (int x = 0; x < 7; ++x) {
      for (int b = 0; b < 3; ++b) {
        ASSERT_EQ(pixels[(y * 7 + x) * 3 + b], layout.GetSample(x, y, b, *buff))
            << "(" << x << "," << y << ") band " << b;
      }
    }
  }
}
