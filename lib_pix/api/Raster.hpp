#ifndef LIB_PIX_RASTER_HPP_
#define LIB_PIX_RASTER_HPP_

#include <cstdint>
#include <memory>
#include <vector>

#include "PixelBuffer.hpp"
#include "SampleLayout.hpp"
#include "TransferArray.hpp"
#include "geom/util.hpp"

namespace pix {

/**
 * A rectangle of pixels, addressed in its own coordinate space, whose samples
 * live in a (possibly shared) PixelBuffer arranged by a SampleLayout.
 *
 * Raster coordinates map onto layout coordinates by subtracting the
 * translation: pixel (x, y) of the raster is pixel
 * (x - TranslateX(), y - TranslateY()) of its layout. Children created with
 * `CreateChild()` alias their parent's PixelBuffer with a different bounds
 * rectangle and translation, so writes through either are visible through
 * both.
 *
 * Rasters are always held by `std::shared_ptr`. The PixelBuffer lives as long
 * as any raster referencing it. A child refers to its parent only weakly;
 * `Parent()` is null once the parent has been released.
 *
 * Rasters perform no locking. Concurrent writes to rasters sharing a
 * PixelBuffer must be synchronised by the caller.
 */
class Raster : public std::enable_shared_from_this<Raster> {
 protected:
  std::shared_ptr<const SampleLayout> layout;
  std::shared_ptr<PixelBuffer> buffer;
  Rect bounds;
  Point translate;
  std::weak_ptr<Raster> parent;

  Raster(std::shared_ptr<const SampleLayout> layout,
         std::shared_ptr<PixelBuffer> buffer, const Rect &bounds,
         const Point &translate, std::shared_ptr<Raster> parent);

 public:
  /**
   * Create a raster over a freshly allocated PixelBuffer, with its top-left
   * pixel at `origin`.
   */
  static std::shared_ptr<Raster> Create(
      std::shared_ptr<const SampleLayout> layout, const Point &origin = Point());

  /**
   * Create a raster over an existing PixelBuffer, with its top-left pixel at
   * `origin`.
   */
  static std::shared_ptr<Raster> Create(
      std::shared_ptr<const SampleLayout> layout,
      std::shared_ptr<PixelBuffer> buffer, const Point &origin = Point());

  /**
   * Create a raster covering `bounds`, whose layout origin sits at
   * `translate` in raster coordinates.
   *
   * Throws InvalidArgument if the layout or buffer is null, the bounds are
   * empty, or the buffer's type differs from the layout's, and FormatError if
   * `bounds` does not fit within the translated layout.
   */
  static std::shared_ptr<Raster> Create(
      std::shared_ptr<const SampleLayout> layout,
      std::shared_ptr<PixelBuffer> buffer, const Rect &bounds,
      const Point &translate, std::shared_ptr<Raster> parent = nullptr);

  virtual ~Raster() = default;

  int MinX() const { return bounds.x; }
  int MinY() const { return bounds.y; }
  int Width() const { return bounds.width; }
  int Height() const { return bounds.height; }
  const Rect &Bounds() const { return bounds; }

  int TranslateX() const { return translate.x; }
  int TranslateY() const { return translate.y; }

  int NumBands() const { return layout->NumBands(); }
  int NumDataElements() const { return layout->NumDataElements(); }
  DataType TransferType() const { return layout->TransferType(); }

  const std::shared_ptr<const SampleLayout> &Layout() const { return layout; }
  const std::shared_ptr<PixelBuffer> &Buffer() const { return buffer; }

  /**
   * The raster this one was created from, or null if it has none or the
   * parent no longer exists.
   */
  std::shared_ptr<Raster> Parent() const { return parent.lock(); }

  /////////////////////////
  // Reading
  /////////////////////////
  int GetSample(int x, int y, int b) const;
  float GetSampleFloat(int x, int y, int b) const;
  double GetSampleDouble(int x, int y, int b) const;

  void GetSamples(int x, int y, int w, int h, int b, int32_t *samples) const;
  void GetSamples(int x, int y, int w, int h, int b, float *samples) const;
  void GetSamples(int x, int y, int w, int h, int b, double *samples) const;
  std::vector<int32_t> GetSamples(int x, int y, int w, int h, int b) const;

  void GetPixel(int x, int y, int32_t *pixel) const;
  void GetPixel(int x, int y, float *pixel) const;
  void GetPixel(int x, int y, double *pixel) const;
  std::vector<int32_t> GetPixel(int x, int y) const;

  void GetPixels(int x, int y, int w, int h, int32_t *pixels) const;
  void GetPixels(int x, int y, int w, int h, float *pixels) const;
  void GetPixels(int x, int y, int w, int h, double *pixels) const;
  std::vector<int32_t> GetPixels(int x, int y, int w, int h) const;

  void GetDataElements(int x, int y, TransferArray &out) const;
  void GetDataElements(int x, int y, int w, int h, TransferArray &out) const;

  /////////////////////////
  // Writing
  /////////////////////////
  void SetSample(int x, int y, int b, int s);
  void SetSample(int x, int y, int b, float s);
  void SetSample(int x, int y, int b, double s);

  void SetSamples(int x, int y, int w, int h, int b, const int32_t *samples);
  void SetSamples(int x, int y, int w, int h, int b, const float *samples);
  void SetSamples(int x, int y, int w, int h, int b, const double *samples);

  void SetPixel(int x, int y, const int32_t *pixel);
  void SetPixel(int x, int y, const float *pixel);
  void SetPixel(int x, int y, const double *pixel);

  void SetPixels(int x, int y, int w, int h, const int32_t *pixels);
  void SetPixels(int x, int y, int w, int h, const float *pixels);
  void SetPixels(int x, int y, int w, int h, const double *pixels);

  void SetDataElements(int x, int y, const TransferArray &in);
  void SetDataElements(int x, int y, int w, int h, const TransferArray &in);

  /**
   * Copy the transfer elements of `src` into this raster, placing its pixel
   * (src.MinX(), src.MinY()) at (x + src.MinX(), y + src.MinY()). The copy is
   * clipped to this raster and done one row at a time.
   *
   * Both layouts must use the same transfer type and number of data elements
   * per pixel (else InvalidArgument); the elements are copied verbatim, so for
   * a meaningful result the layouts should also agree on bands and sample
   * sizes.
   */
  void SetDataElements(int x, int y, const Raster &src);

  /**
   * Copy the samples of `src` into this raster, band for band, shifted by
   * (dx, dy) and clipped to this raster, one row at a time.
   *
   * This is a sample copy: a destination band narrower than the source keeps
   * only the low-order bits, a wider one is zero-extended. Throws
   * MismatchedBands if the band counts differ.
   */
  void SetRect(int dx, int dy, const Raster &src);
  void SetRect(const Raster &src) { SetRect(0, 0, src); }

  /////////////////////////
  // Factories
  /////////////////////////

  /**
   * Create a raster sharing this raster's PixelBuffer, covering the `w` x `h`
   * rectangle at (parent_x, parent_y) of this raster, but addressed with its
   * top-left pixel at (child_min_x, child_min_y). If `band_list` is given the
   * child exposes only those bands, renumbered from 0.
   *
   * Throws FormatError if the rectangle is not within this raster.
   */
  std::shared_ptr<Raster> CreateChild(int parent_x, int parent_y, int w, int h,
                                      int child_min_x, int child_min_y,
                                      const std::vector<int> *band_list =
                                          nullptr);

  /**
   * Create a child covering all of this raster with its top-left pixel moved
   * to (child_min_x, child_min_y).
   */
  std::shared_ptr<Raster> CreateTranslatedChild(int child_min_x,
                                                int child_min_y);

  /**
   * Create a zero-filled raster with a compatible layout and the same bounds.
   */
  std::shared_ptr<Raster> CreateCompatibleRaster() const;

  /**
   * Create a zero-filled `w` x `h` raster with a compatible layout at (0, 0).
   */
  std::shared_ptr<Raster> CreateCompatibleRaster(int w, int h) const;

  /**
   * Create a zero-filled raster with a compatible layout covering the given
   * rectangle.
   */
  std::shared_ptr<Raster> CreateCompatibleRaster(int x, int y, int w,
                                                 int h) const;
};

}  // namespace pix

#endif  // LIB_PIX_RASTER_HPP_
