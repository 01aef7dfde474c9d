#include <cstdint>
#include <memory>
#include <vector>

#include "ComponentSampleLayout.hpp"
#include "Errors.hpp"
#include "Rand.hpp"
#include "gtest/gtest.h"

using namespace pix;

/////////////////////////////////////////////////////////////////////////
//
//
TEST(ComponentSampleLayout_Test, Interleaved) {
  auto layout = ComponentSampleLayout::Interleaved(DataType::BYTE, 4, 3, 3);

  EXPECT_EQ(3, layout->NumBands());
  EXPECT_EQ(3, layout->NumDataElements());
  EXPECT_EQ(3, layout->PixelStride());
  EXPECT_EQ(12, layout->ScanlineStride());
  EXPECT_EQ(std::vector<int>({0, 1, 2}), layout->BandOffsets());
  EXPECT_EQ(std::vector<int>({0, 0, 0}), layout->BankIndices());
  EXPECT_EQ(std::vector<int>({8, 8, 8}), layout->SampleSize());
  EXPECT_EQ(12 + 6 + 2, layout->Offset(2, 1, 2));

  auto buff = layout->CreatePixelBuffer();
  EXPECT_EQ(36, buff->Size());
  EXPECT_EQ(1, buff->NumBanks());
}

TEST(ComponentSampleLayout_Test, Banded) {
  auto layout = ComponentSampleLayout::Banded(DataType::USHORT, 4, 3, 2);

  EXPECT_EQ(1, layout->PixelStride());
  EXPECT_EQ(4, layout->ScanlineStride());
  EXPECT_EQ(std::vector<int>({0, 1}), layout->BankIndices());
  EXPECT_EQ(std::vector<int>({16, 16}), layout->SampleSize());

  auto buff = layout->CreatePixelBuffer();
  EXPECT_EQ(12, buff->Size());
  EXPECT_EQ(2, buff->NumBanks());

  layout->SetSample(3, 2, 1, 0x12345, *buff);
  EXPECT_EQ(0x2345, buff->GetElement(1, 11));
  EXPECT_EQ(0, buff->GetElement(0, 11));
  EXPECT_EQ(0x2345, layout->GetSample(3, 2, 1, *buff));
}

TEST(ComponentSampleLayout_Test, InvalidConstruction) {
  EXPECT_THROW(ComponentSampleLayout(DataType::BYTE, 2, 2, -1, 2, {0}),
               InvalidArgument);
  EXPECT_THROW(ComponentSampleLayout(DataType::BYTE, 2, 2, 1, 2, {0, 1}, {0}),
               InvalidArgument);
  EXPECT_THROW(ComponentSampleLayout(DataType::BYTE, 2, 2, 1, 2, {-1}, {0}),
               InvalidArgument);
  EXPECT_THROW(ComponentSampleLayout(DataType::BYTE, 2, 2, 1, 2, {0}, {-2}),
               InvalidArgument);
  EXPECT_THROW(ComponentSampleLayout(DataType::DOUBLE, 2, 2, 1, 2, {0}),
               InvalidArgument);
  EXPECT_THROW(ComponentSampleLayout(DataType::BYTE, 2, 2, 1, 2,
                                     std::vector<int>()),
               InvalidArgument);
}

/////////////////////////////////////////////////////////////////////////
//
//
TEST(ComponentSampleLayout_Test, ShortSamplesAreSigned) {
  auto layout = ComponentSampleLayout::Interleaved(DataType::SHORT, 2, 2, 1);
  auto buff = layout->CreatePixelBuffer();

  layout->SetSample(1, 1, 0, -5, *buff);
  EXPECT_EQ(-5, layout->GetSample(1, 1, 0, *buff));
  layout->SetSample(0, 1, 0, 40000, *buff);
  EXPECT_EQ(40000 - 65536, layout->GetSample(0, 1, 0, *buff));
}

TEST(ComponentSampleLayout_Test, DataElements) {
  auto layout = ComponentSampleLayout::Interleaved(DataType::BYTE, 3, 2, 4);
  auto buff = layout->CreatePixelBuffer();

  const int32_t pixel[] = {1, 2, 3, 255};
  layout->SetPixel(2, 1, pixel, *buff);

  TransferArray elems = layout->GetDataElements(2, 1, *buff);
  ASSERT_EQ(4, elems.Length());
  EXPECT_EQ(DataType::BYTE, elems.Type());
  EXPECT_EQ(255, elems.Get(3));

  layout->SetDataElements(0, 0, elems, *buff);
  EXPECT_EQ(std::vector<int32_t>({1, 2, 3, 255}),
            layout->GetPixel(0, 0, *buff));

  TransferArray rect;
  layout->GetDataElements(0, 0, 3, 2, rect, *buff);
  ASSERT_EQ(3 * 2 * 4, rect.Length());
  EXPECT_EQ(1, rect.Get(0));
  EXPECT_EQ(255, rect.Get(23));
  EXPECT_EQ(0, rect.Get(4));

  auto other = layout->CreatePixelBuffer();
  layout->SetDataElements(0, 0, 3, 2, rect, *other);
  EXPECT_EQ(layout->GetPixels(0, 0, 3, 2, *buff),
            layout->GetPixels(0, 0, 3, 2, *other));

  EXPECT_THROW(layout->SetDataElements(0, 0, 3, 2, elems, *other),
               InvalidArgument);
}

/////////////////////////////////////////////////////////////////////////
//
//
TEST(ComponentSampleLayout_Test, SubsetRenumbersBands) {
  auto layout = ComponentSampleLayout::Interleaved(DataType::BYTE, 2, 2, 4);
  auto buff = layout->CreatePixelBuffer();

  const int32_t pixel[] = {10, 20, 30, 40};
  layout->SetPixel(1, 0, pixel, *buff);

  auto subset = std::dynamic_pointer_cast<ComponentSampleLayout>(
      layout->CreateSubsetSampleLayout({3, 1}));
  ASSERT_NE(nullptr, subset);
  EXPECT_EQ(2, subset->NumBands());
  EXPECT_EQ(4, subset->PixelStride());
  EXPECT_EQ(std::vector<int>({3, 1}), subset->BandOffsets());
  EXPECT_EQ(std::vector<int32_t>({40, 20}), subset->GetPixel(1, 0, *buff));

  subset->SetSample(1, 0, 0, 99, *buff);
  EXPECT_EQ(99, layout->GetSample(1, 0, 3, *buff));

  EXPECT_THROW(layout->CreateSubsetSampleLayout({0, 1, 2, 3, 0}),
               FormatError);
  EXPECT_THROW(layout->CreateSubsetSampleLayout({5}), FormatError);
}

TEST(ComponentSampleLayout_Test, CompatibleRepacksInterleaved) {
  // BGR order with padding between pixels
  ComponentSampleLayout layout(DataType::BYTE, 4, 4, 4, 20, {2, 1, 0});
  auto compat = std::dynamic_pointer_cast<ComponentSampleLayout>(
      layout.CreateCompatibleSampleLayout(3, 2));

  ASSERT_NE(nullptr, compat);
  EXPECT_EQ(3, compat->Width());
  EXPECT_EQ(2, compat->Height());
  EXPECT_EQ(3, compat->PixelStride());
  EXPECT_EQ(9, compat->ScanlineStride());
  EXPECT_EQ(std::vector<int>({2, 1, 0}), compat->BandOffsets());
  EXPECT_EQ(18, compat->CreatePixelBuffer()->Size());
}

TEST(ComponentSampleLayout_Test, CompatibleKeepsBanks) {
  auto layout = ComponentSampleLayout::Banded(DataType::INT, 4, 4, 3);
  auto compat = std::dynamic_pointer_cast<ComponentSampleLayout>(
      layout->CreateCompatibleSampleLayout(2, 5));

  ASSERT_NE(nullptr, compat);
  EXPECT_EQ(1, compat->PixelStride());
  EXPECT_EQ(2, compat->ScanlineStride());
  EXPECT_EQ(std::vector<int>({0, 1, 2}), compat->BankIndices());
  EXPECT_EQ(std::vector<int>({0, 0, 0}), compat->BandOffsets());

  auto buff = compat->CreatePixelBuffer();
  EXPECT_EQ(10, buff->Size());
  EXPECT_EQ(3, buff->NumBanks());
}

/////////////////////////////////////////////////////////////////////////
//
//
TEST(ComponentSampleLayout_Test, RandomSamples) {
  pix::test::Rand rng(88);
  auto layout = ComponentSampleLayout::Banded(DataType::USHORT, 6, 5, 3);
  auto buff = layout->CreatePixelBuffer();

  for (int b = 0; b < 3; ++b) {
    auto samples = rng.rand_vector<int32_t>(6 * 5, 0, 0xFFFF);
    layout->SetSamples(0, 0, 6, 5, b, samples.data(), *buff);
    ASSERT_EQ(samples, layout->GetSamples(0, 0, 6, 5, b, *buff));
  }
}
