#ifndef LIB_PIX_TRANSFER_ARRAY_HPP_
#define LIB_PIX_TRANSFER_ARRAY_HPP_

#include <cstdint>
#include <vector>

#include "PixelBuffer.hpp"

namespace pix {

/**
 * Array of pixel data elements in a layout's transfer type.
 *
 * This is the unit exchanged by `GetDataElements()`/`SetDataElements()`. A
 * pixel may occupy fewer elements than it has bands (e.g. one element holds
 * every band of a packed pixel). Values are kept as they would read back from
 * storage of the array's type: `Set()` truncates, `Get()` returns the widened
 * element.
 */
class TransferArray {
 private:
  DataType data_type;
  std::vector<int32_t> elements;

 public:
  /**
   * Construct an empty array of undefined type. Layouts reshape it as needed.
   */
  TransferArray() : data_type(DataType::UNDEFINED) {}

  /**
   * Construct a zero-filled array of `length` elements of `type`.
   */
  TransferArray(DataType type, int length)
      : data_type(type), elements(length > 0 ? length : 0, 0) {}

  DataType Type() const { return data_type; }

  int Length() const { return static_cast<int>(elements.size()); }

  bool IsEmpty() const { return elements.empty(); }

  /**
   * Retag the array and resize it to `length` elements. Existing elements are
   * kept where they fit.
   */
  void Reshape(DataType type, int length) {
    data_type = type;
    elements.resize(length > 0 ? length : 0, 0);
  }

  int Get(int i) const { return elements[i]; }

  void Set(int i, int value) {
    elements[i] = NormalizeElement(data_type, value);
  }

  const int32_t *Data() const { return elements.data(); }

  bool operator==(const TransferArray &other) const {
    return data_type == other.data_type && elements == other.elements;
  }

  bool operator!=(const TransferArray &other) const {
    return !(*this == other);
  }
};

}  // namespace pix

#endif  // LIB_PIX_TRANSFER_ARRAY_HPP_
