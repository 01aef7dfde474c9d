#include "ColorImage.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "Errors.hpp"

using namespace pix;

std::ostream &pix::operator<<(std::ostream &stream, ColorSpaceType space) {
  switch (space) {
    case ColorSpaceType::GRAY:
      return stream << "GRAY";
    case ColorSpaceType::RGB:
      return stream << "RGB";
    case ColorSpaceType::CMY:
      return stream << "CMY";
    case ColorSpaceType::CMYK:
      return stream << "CMYK";
    case ColorSpaceType::YCBCR:
      return stream << "YCBCR";
    case ColorSpaceType::HSV:
      return stream << "HSV";
  }
  return stream << "ColorSpaceType(" << static_cast<int>(space) << ")";
}

ColorModel::ColorModel(ColorSpaceType color_space, int num_color_components,
                       bool has_alpha, bool alpha_premultiplied)
    : color_space(color_space),
      num_color_components(num_color_components),
      has_alpha(has_alpha),
      alpha_premultiplied(alpha_premultiplied) {
  if (num_color_components <= 0)
    throw InvalidArgument("Number of colour components (" +
                          std::to_string(num_color_components) +
                          ") must be > 0");
  if (alpha_premultiplied && !has_alpha)
    throw InvalidArgument("A colour model without alpha cannot be premultiplied");
}

ColorModel ColorModel::Of(ColorSpaceType space, bool has_alpha,
                          bool alpha_premultiplied) {
  int components = 3;
  if (space == ColorSpaceType::GRAY)
    components = 1;
  else if (space == ColorSpaceType::CMYK)
    components = 4;
  return ColorModel(space, components, has_alpha, alpha_premultiplied);
}

ColorModel ColorModel::WithAlphaPremultiplied(bool premultiplied) const {
  if (!has_alpha) return *this;
  return ColorModel(color_space, num_color_components, true, premultiplied);
}

bool ColorModel::operator==(const ColorModel &other) const {
  return color_space == other.color_space &&
         num_color_components == other.num_color_components &&
         has_alpha == other.has_alpha &&
         alpha_premultiplied == other.alpha_premultiplied;
}

std::ostream &pix::operator<<(std::ostream &stream, const ColorModel &model) {
  stream << model.ColorSpace() << "[" << model.NumColorComponents();
  if (model.HasAlpha())
    stream << (model.IsAlphaPremultiplied() ? "+A(pre)" : "+A");
  return stream << "]";
}

ColorImage::ColorImage(const ColorModel &model, std::shared_ptr<Raster> raster)
    : model(model), raster(std::move(raster)) {
  if (!this->raster) throw InvalidArgument("ColorImage requires a raster");

  if (this->raster->NumBands() != model.NumComponents())
    throw MismatchedBands("Raster has " +
                          std::to_string(this->raster->NumBands()) +
                          " bands but the colour model needs " +
                          std::to_string(model.NumComponents()));
}

ColorImage ColorImage::CoerceData(bool premultiplied) const {
  auto copy = raster->CreateCompatibleRaster();
  copy->SetRect(*raster);

  if (model.HasAlpha() && premultiplied != model.IsAlphaPremultiplied()) {
    if (premultiplied)
      PremultiplyAlpha(*copy, model.AlphaBand());
    else
      DivideAlpha(*copy, model.AlphaBand());
  }

  return ColorImage(model.WithAlphaPremultiplied(premultiplied), copy);
}

namespace {

/**
 * Apply `op(colour, alpha, alpha_max, range)` to each colour sample of
 * `raster`, one row at a time.
 */
template <typename Op>
void ForEachColorSample(Raster &raster, int alpha_band, Op op) {
  const int bands = raster.NumBands();
  if (alpha_band < 0 || alpha_band >= bands)
    throw InvalidArgument("Alpha band " + std::to_string(alpha_band) +
                          " is out of range for a raster with " +
                          std::to_string(bands) + " bands");

  const SampleLayout &layout = *raster.Layout();
  const int64_t alpha_max = RangeOf(layout, alpha_band).max;
  // A 0-bit alpha band carries no coverage; the colours are left opaque.
  if (alpha_max <= 0) return;

  std::vector<SampleRange> ranges(bands);
  for (int b = 0; b < bands; ++b) ranges[b] = RangeOf(layout, b);

  const int w = raster.Width();
  std::vector<int32_t> row(w * bands);

  for (int y = raster.MinY(); y < raster.MinY() + raster.Height(); ++y) {
    raster.GetPixels(raster.MinX(), y, w, 1, row.data());

    for (int x = 0; x < w; ++x) {
      int32_t *pixel = &row[x * bands];
      const int64_t alpha = std::max<int64_t>(pixel[alpha_band], 0);

      for (int b = 0; b < bands; ++b) {
        if (b == alpha_band) continue;
        pixel[b] = op(pixel[b], alpha, alpha_max, ranges[b]);
      }
    }

    raster.SetPixels(raster.MinX(), y, w, 1, row.data());
  }
}

}  // namespace

void pix::PremultiplyAlpha(Raster &raster, int alpha_band) {
  ForEachColorSample(raster, alpha_band,
                     [](int64_t c, int64_t a, int64_t a_max,
                        const SampleRange &) -> int32_t {
                       return static_cast<int32_t>((c * a + a_max / 2) / a_max);
                     });
}

void pix::DivideAlpha(Raster &raster, int alpha_band) {
  ForEachColorSample(raster, alpha_band,
                     [](int64_t c, int64_t a, int64_t a_max,
                        const SampleRange &range) -> int32_t {
                       if (a == 0) return 0;
                       const int64_t v = (c * a_max + a / 2) / a;
                       return static_cast<int32_t>(
                           std::min<int64_t>(std::max<int64_t>(v, range.min),
                                             range.max));
                     });
}
