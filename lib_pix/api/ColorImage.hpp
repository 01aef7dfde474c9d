#ifndef LIB_PIX_COLOR_IMAGE_HPP_
#define LIB_PIX_COLOR_IMAGE_HPP_

#include <iostream>
#include <memory>

#include "Raster.hpp"
#include "RasterOp.hpp"

namespace pix {

/**
 * Family of colour spaces a ColorModel may describe. Only the type is
 * modelled; converting between spaces is the job of a ColorConverter.
 */
enum class ColorSpaceType { GRAY = 0, RGB, CMY, CMYK, YCBCR, HSV };

std::ostream &operator<<(std::ostream &stream, ColorSpaceType space);

/**
 * Interpretation of a Raster's bands as colour.
 *
 * The first `NumColorComponents()` bands hold colour components. If the model
 * has alpha, it is the single band that follows them.
 */
class ColorModel {
 private:
  ColorSpaceType color_space;
  int num_color_components;
  bool has_alpha;
  bool alpha_premultiplied;

 public:
  /**
   * Throws InvalidArgument if `num_color_components` is not positive, or if
   * `alpha_premultiplied` is requested without alpha.
   */
  ColorModel(ColorSpaceType color_space, int num_color_components,
             bool has_alpha = false, bool alpha_premultiplied = false);

  /**
   * Model for the usual number of components of `space`: 1 for GRAY, 4 for
   * CMYK, 3 otherwise.
   */
  static ColorModel Of(ColorSpaceType space, bool has_alpha = false,
                       bool alpha_premultiplied = false);

  ColorSpaceType ColorSpace() const { return color_space; }
  int NumColorComponents() const { return num_color_components; }
  int NumComponents() const { return num_color_components + (has_alpha ? 1 : 0); }
  bool HasAlpha() const { return has_alpha; }
  bool IsAlphaPremultiplied() const { return alpha_premultiplied; }

  /**
   * Index of the alpha band, or -1 if there is none.
   */
  int AlphaBand() const { return has_alpha ? num_color_components : -1; }

  /**
   * This model with its premultiplied flag replaced. A model without alpha is
   * returned unchanged.
   */
  ColorModel WithAlphaPremultiplied(bool premultiplied) const;

  bool operator==(const ColorModel &other) const;
  bool operator!=(const ColorModel &other) const { return !(*this == other); }
};

std::ostream &operator<<(std::ostream &stream, const ColorModel &model);

/**
 * A Raster paired with the ColorModel that interprets it.
 */
class ColorImage {
 private:
  ColorModel model;
  std::shared_ptr<Raster> raster;

 public:
  /**
   * Throws InvalidArgument for a null raster and MismatchedBands if the
   * raster's band count differs from `model.NumComponents()`.
   */
  ColorImage(const ColorModel &model, std::shared_ptr<Raster> raster);

  const ColorModel &Model() const { return model; }
  const std::shared_ptr<Raster> &GetRaster() const { return raster; }

  int Width() const { return raster->Width(); }
  int Height() const { return raster->Height(); }
  int NumBands() const { return raster->NumBands(); }

  /**
   * A copy of this image whose colour components are (or are not) multiplied
   * by alpha. The raster is always copied; the model differs only in its
   * premultiplied flag. Images without alpha are copied unchanged.
   */
  ColorImage CoerceData(bool premultiplied) const;
};

/**
 * Multiply the colour bands `[0, alpha_band)` of every pixel by
 * `alpha / alpha_max`, rounding to nearest, where `alpha_max` is the largest
 * value the alpha band holds.
 */
void PremultiplyAlpha(Raster &raster, int alpha_band);

/**
 * Inverse of `PremultiplyAlpha()`. Results are clamped to each colour band's
 * range, and pixels whose alpha is 0 get colour 0.
 */
void DivideAlpha(Raster &raster, int alpha_band);

/**
 * Boundary to an external colour conversion engine.
 */
class ColorConverter {
 public:
  virtual ~ColorConverter() = default;

  /**
   * Convert every pixel of `src` into the colour space of `dst`, writing the
   * result into `dst`'s raster.
   */
  virtual void Convert(const ColorImage &src, ColorImage &dst,
                       const RenderingHints &hints) = 0;
};

}  // namespace pix

#endif  // LIB_PIX_COLOR_IMAGE_HPP_
