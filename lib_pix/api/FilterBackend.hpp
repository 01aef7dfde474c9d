#ifndef LIB_PIX_FILTER_BACKEND_HPP_
#define LIB_PIX_FILTER_BACKEND_HPP_

#include "Kernel.hpp"
#include "Raster.hpp"

namespace pix {

/**
 * How a convolution treats output pixels whose kernel footprint extends
 * beyond the source.
 */
enum class EdgeCondition {
  /// Border pixels are set to 0 in every band.
  ZERO_FILL = 0,
  /// Border pixels are copied unchanged from the source.
  NO_OP = 1
};

std::ostream &operator<<(std::ostream &stream, EdgeCondition edge);

/**
 * Interface implemented by convolution engines.
 *
 * A ConvolutionFilter offers each convolution to its accelerated backend
 * first and to its fallback if that declines. Every backend must produce the
 * same results as ScalarFilterBackend for integral sample types.
 */
class FilterBackend {
 public:
  virtual ~FilterBackend() = default;

  /**
   * Short name used in diagnostics.
   */
  virtual const char *Name() const = 0;

  /**
   * Convolve `src` with `kernel` into `dst`.
   *
   * The caller guarantees `src` and `dst` are distinct and have the same
   * number of bands. Returns `false`, leaving `dst` untouched, if the backend
   * does not handle this combination of kernel and rasters.
   */
  virtual bool Convolve(const Kernel &kernel, EdgeCondition edge,
                        const Raster &src, Raster &dst) = 0;
};

/**
 * Portable convolution engine that reads and writes through the rasters'
 * sample layouts.
 *
 * Destination pixel (dst.MinX() + i, dst.MinY() + j) is computed from the
 * source neighbourhood of (src.MinX() + i, src.MinY() + j), over the extent
 * common to both rasters. Pixels whose kernel footprint lies entirely inside
 * the source get the weighted sum
 *
 *   sum_{i,j} kernel(i, j) * src(x - XOrigin() + i, y - YOrigin() + j, b)
 *
 * accumulated in double precision, clamped to the destination band's
 * SampleRange and truncated toward zero. The remaining (border) pixels follow
 * the EdgeCondition.
 *
 * This backend never declines. It holds no state and may be shared between
 * threads.
 */
class ScalarFilterBackend : public FilterBackend {
 public:
  const char *Name() const override { return "scalar"; }

  bool Convolve(const Kernel &kernel, EdgeCondition edge, const Raster &src,
                Raster &dst) override;
};

}  // namespace pix

#endif  // LIB_PIX_FILTER_BACKEND_HPP_
