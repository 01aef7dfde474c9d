#ifndef LIB_PIX_CONVOLUTION_FILTER_HPP_
#define LIB_PIX_CONVOLUTION_FILTER_HPP_

#include <memory>

#include "ColorImage.hpp"
#include "FilterBackend.hpp"
#include "Kernel.hpp"
#include "RasterOp.hpp"

namespace pix {

/**
 * Construction parameters of a ConvolutionFilter.
 */
struct ConvolveParams {
  EdgeCondition edge_condition = EdgeCondition::ZERO_FILL;

  /// Forwarded to `color_converter`.
  RenderingHints hints;

  /// Offered every convolution first. May be null.
  std::shared_ptr<FilterBackend> accelerated;

  /// Used when `accelerated` is null, declines or throws OperationFailed.
  std::shared_ptr<FilterBackend> fallback =
      std::make_shared<ScalarFilterBackend>();

  /// Needed only to filter between images of different colour spaces.
  std::shared_ptr<ColorConverter> color_converter;

  bool verbose = false;
};

/**
 * Convolves Rasters and ColorImages with a Kernel.
 *
 * The destination always has the bounds of the source. In-place filtering is
 * not supported: the source and destination must be different objects.
 *
 * A filter never mutates itself after construction and may be used from
 * several threads at once, provided its backends and converter allow it.
 */
class ConvolutionFilter : public RasterOp {
 private:
  Kernel kernel;
  ConvolveParams params;

  void Convolve(const Raster &src, Raster &dst) const;
  void WriteResult(const ColorImage &result, ColorImage &dst) const;

 public:
  explicit ConvolutionFilter(const Kernel &kernel,
                             const ConvolveParams &params = ConvolveParams());

  const Kernel &GetKernel() const { return kernel; }
  EdgeCondition GetEdgeCondition() const { return params.edge_condition; }
  const ConvolveParams &Params() const { return params; }
  const RenderingHints &Hints() const override { return params.hints; }

  /**
   * Convolve `src` into `dst`, or into a new compatible raster when `dst` is
   * null, and return the raster written to.
   *
   * Throws InvalidArgument if `dst` is `src`, MismatchedBands if their band
   * counts differ, and OperationFailed if no backend produced a result.
   */
  std::shared_ptr<Raster> Filter(
      const Raster &src, std::shared_ptr<Raster> dst = nullptr) const override;

  /**
   * Convolve a colour image. Colour is convolved premultiplied by alpha; the
   * result is converted to the destination's alpha state, and handed to the
   * ColorConverter if the colour spaces differ. When `dst` is null an image
   * with the source's model is created.
   *
   * In addition to the raster errors, throws MismatchedBands if the images'
   * colour component counts differ with no conversion in between, and
   * OperationFailed if a conversion is needed but no converter is configured.
   */
  std::shared_ptr<ColorImage> Filter(
      const ColorImage &src, std::shared_ptr<ColorImage> dst = nullptr) const;

  Rect Bounds(const Raster &src) const override { return src.Bounds(); }
  Rect Bounds(const ColorImage &src) const {
    return src.GetRaster()->Bounds();
  }

  std::shared_ptr<Raster> CreateCompatibleDestRaster(
      const Raster &src) const override;

  /**
   * A zero-filled image with the bounds of `src` and model `dst_model`, or the
   * source's model if `dst_model` is null.
   */
  std::shared_ptr<ColorImage> CreateCompatibleDestImage(
      const ColorImage &src, const ColorModel *dst_model = nullptr) const;

  Point TransformPoint(const Point &src_pt) const override { return src_pt; }
};

}  // namespace pix

#endif  // LIB_PIX_CONVOLUTION_FILTER_HPP_
