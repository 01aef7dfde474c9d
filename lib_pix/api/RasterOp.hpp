#ifndef LIB_PIX_RASTER_OP_HPP_
#define LIB_PIX_RASTER_OP_HPP_

#include <map>
#include <memory>
#include <string>

#include "Raster.hpp"
#include "geom/util.hpp"

namespace pix {

/**
 * Free-form key/value hints handed to collaborators (e.g. a ColorConverter)
 * by an operation. Operations forward them untouched.
 */
using RenderingHints = std::map<std::string, std::string>;

/**
 * Interface implemented by single-source, single-destination raster
 * operations.
 */
class RasterOp {
 public:
  virtual ~RasterOp() = default;

  /**
   * Process `src` into `dst`, allocating `dst` with
   * `CreateCompatibleDestRaster()` when it is null, and return the raster
   * written to.
   */
  virtual std::shared_ptr<Raster> Filter(
      const Raster &src, std::shared_ptr<Raster> dst = nullptr) const = 0;

  /**
   * The bounds of the raster `Filter()` would produce for `src`.
   */
  virtual Rect Bounds(const Raster &src) const = 0;

  /**
   * A zero-filled raster suitable as the destination for `src`.
   */
  virtual std::shared_ptr<Raster> CreateCompatibleDestRaster(
      const Raster &src) const = 0;

  /**
   * The destination location corresponding to source location `src_pt`.
   */
  virtual Point TransformPoint(const Point &src_pt) const = 0;

  virtual const RenderingHints &Hints() const = 0;
};

}  // namespace pix

#endif  // LIB_PIX_RASTER_OP_HPP_
