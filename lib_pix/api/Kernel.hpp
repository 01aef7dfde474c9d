#ifndef LIB_PIX_KERNEL_HPP_
#define LIB_PIX_KERNEL_HPP_

#include <iostream>
#include <vector>

namespace pix {

/**
 * A `width` x `height` matrix of convolution weights with an anchor cell.
 *
 * Weights are stored row-major: the weight in column `i`, row `j` is
 * `Data()[j * Width() + i]`. The anchor (`XOrigin()`, `YOrigin()`) is the cell
 * aligned with the output pixel being computed; by default it is
 * `((width - 1) / 2, (height - 1) / 2)`.
 */
class Kernel {
 private:
  int width;
  int height;
  int x_origin;
  int y_origin;
  std::vector<float> data;

 public:
  /**
   * Construct a kernel anchored at its centre. Only the first
   * `width * height` weights are used.
   *
   * Throws InvalidArgument if either dimension is not positive or fewer than
   * `width * height` weights are given.
   */
  Kernel(int width, int height, const std::vector<float> &data);

  /**
   * Construct a kernel with an explicit anchor, which must lie within the
   * kernel (else InvalidArgument).
   */
  Kernel(int width, int height, int x_origin, int y_origin,
         const std::vector<float> &data);

  int Width() const { return width; }
  int Height() const { return height; }
  int XOrigin() const { return x_origin; }
  int YOrigin() const { return y_origin; }

  const std::vector<float> &Data() const { return data; }

  /**
   * Weight in column `i`, row `j`.
   */
  float At(int i, int j) const { return data[j * width + i]; }

  bool operator==(const Kernel &other) const;
  bool operator!=(const Kernel &other) const { return !(*this == other); }
};

inline std::ostream &operator<<(std::ostream &stream, const Kernel &k) {
  return stream << k.Width() << "x" << k.Height() << "@(" << k.XOrigin() << ","
                << k.YOrigin() << ")";
}

}  // namespace pix

#endif  // LIB_PIX_KERNEL_HPP_
