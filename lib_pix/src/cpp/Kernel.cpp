#include "Kernel.hpp"

#include <string>

#include "Errors.hpp"

using namespace pix;

Kernel::Kernel(int width, int height, const std::vector<float> &data)
    : Kernel(width, height, (width - 1) >> 1, (height - 1) >> 1, data) {}

Kernel::Kernel(int width, int height, int x_origin, int y_origin,
               const std::vector<float> &data)
    : width(width), height(height), x_origin(x_origin), y_origin(y_origin) {
  if (width <= 0 || height <= 0)
    throw InvalidArgument("Kernel width (" + std::to_string(width) +
                          ") and height (" + std::to_string(height) +
                          ") must be > 0");

  const size_t len = static_cast<size_t>(width) * height;
  if (data.size() < len)
    throw InvalidArgument("Kernel data holds " + std::to_string(data.size()) +
                          " weights, fewer than width*height (" +
                          std::to_string(len) + ")");

  if (x_origin < 0 || x_origin >= width || y_origin < 0 || y_origin >= height)
    throw InvalidArgument("Kernel origin (" + std::to_string(x_origin) + "," +
                          std::to_string(y_origin) + ") lies outside the kernel");

  this->data.assign(data.begin(), data.begin() + len);
}

bool Kernel::operator==(const Kernel &other) const {
  return width == other.width && height == other.height &&
         x_origin == other.x_origin && y_origin == other.y_origin &&
         data == other.data;
}
