#ifndef LIB_PIX_PIXEL_BUFFER_HPP_
#define LIB_PIX_PIXEL_BUFFER_HPP_

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "Errors.hpp"

namespace pix {

/**
 * Numeric type of the elements stored in a PixelBuffer (and exchanged in a
 * TransferArray).
 */
enum class DataType {
  BYTE = 0,
  USHORT = 1,
  SHORT = 2,
  INT = 3,
  FLOAT = 4,
  DOUBLE = 5,
  UNDEFINED = 32
};

/**
 * Number of bits in an element of the given type.
 *
 * Throws InvalidArgument for DataType::UNDEFINED.
 */
int DataTypeSize(DataType type);

/**
 * Whether PixelBuffer storage exists for the given type (the integral types).
 */
bool HasStorage(DataType type);

/**
 * Truncate `value` to the width of `type` and widen it back the way a stored
 * element of that type is read: zero-extended for BYTE and USHORT,
 * sign-extended for SHORT, unchanged otherwise.
 */
int NormalizeElement(DataType type, int value);

std::ostream &operator<<(std::ostream &stream, DataType type);

/**
 * Maps a storage element type onto its DataType tag.
 */
template <typename T>
struct StorageType;

template <>
struct StorageType<uint8_t> {
  static constexpr DataType value = DataType::BYTE;
};

template <>
struct StorageType<uint16_t> {
  static constexpr DataType value = DataType::USHORT;
};

template <>
struct StorageType<int16_t> {
  static constexpr DataType value = DataType::SHORT;
};

template <>
struct StorageType<int32_t> {
  static constexpr DataType value = DataType::INT;
};

/**
 * One or more equal-length banks of typed numeric pixel storage.
 *
 * Every element access adds the bank's offset to the supplied index. Element
 * accessors do no bounds checking; callers (the sample layouts) guarantee the
 * index lies in `[0, Size())`.
 */
class PixelBuffer {
 protected:
  DataType data_type;
  int size;
  std::vector<int> offsets;

  PixelBuffer(DataType type, int size, std::vector<int> offsets);

 public:
  virtual ~PixelBuffer() = default;

  DataType Type() const { return data_type; }

  /**
   * Logical number of elements per bank.
   */
  int Size() const { return size; }

  int NumBanks() const { return static_cast<int>(offsets.size()); }

  /**
   * Offset of the default bank (bank 0).
   */
  int Offset() const { return offsets[0]; }

  const std::vector<int> &Offsets() const { return offsets; }

  int GetElement(int i) const { return GetElement(0, i); }

  /**
   * Get element `i` of the specified bank, widened to int.
   */
  virtual int GetElement(int bank, int i) const = 0;

  void SetElement(int i, int val) { SetElement(0, i, val); }

  /**
   * Set element `i` of the specified bank, truncating `val` to the storage
   * width.
   */
  virtual void SetElement(int bank, int i, int val) = 0;

  float GetElementFloat(int i) const { return GetElementFloat(0, i); }
  float GetElementFloat(int bank, int i) const {
    return static_cast<float>(GetElement(bank, i));
  }

  double GetElementDouble(int i) const { return GetElementDouble(0, i); }
  double GetElementDouble(int bank, int i) const {
    return static_cast<double>(GetElement(bank, i));
  }

  void SetElementFloat(int i, float val) { SetElementFloat(0, i, val); }
  void SetElementFloat(int bank, int i, float val) {
    SetElement(bank, i, static_cast<int>(val));
  }

  void SetElementDouble(int i, double val) { SetElementDouble(0, i, val); }
  void SetElementDouble(int bank, int i, double val) {
    SetElement(bank, i, static_cast<int>(val));
  }
};

/**
 * PixelBuffer backed by banks of `T`.
 *
 * Banks are shared: the wrapping constructors alias the supplied vectors
 * without copying them, and a bank stays alive for as long as any buffer (or
 * the caller) holds it.
 */
template <typename T>
class PixelBufferOf : public PixelBuffer {
 public:
  using Bank = std::vector<T>;

 private:
  std::vector<std::shared_ptr<Bank>> banks;
  std::vector<T *> bank_data;

  void Bind();

 public:
  /**
   * Allocate a single zero-filled bank of `size` elements.
   */
  explicit PixelBufferOf(int size) : PixelBufferOf(size, 1) {}

  /**
   * Allocate `num_banks` zero-filled banks of `size` elements.
   */
  PixelBufferOf(int size, int num_banks);

  /**
   * Wrap an existing bank. `offset` is added to every index.
   */
  PixelBufferOf(std::shared_ptr<Bank> bank, int size, int offset = 0);

  /**
   * Wrap existing banks, all with offset 0.
   */
  PixelBufferOf(std::vector<std::shared_ptr<Bank>> banks, int size);

  /**
   * Wrap existing banks with per-bank offsets. The number of offsets must
   * match the number of banks.
   */
  PixelBufferOf(std::vector<std::shared_ptr<Bank>> banks, int size,
                std::vector<int> offsets);

  using PixelBuffer::GetElement;
  using PixelBuffer::SetElement;

  int GetElement(int bank, int i) const override {
    return static_cast<int>(bank_data[bank][i + offsets[bank]]);
  }

  void SetElement(int bank, int i, int val) override {
    bank_data[bank][i + offsets[bank]] = static_cast<T>(val);
  }

  /**
   * The shared storage of the specified bank (including any elements before
   * the bank offset).
   */
  const std::shared_ptr<Bank> &GetBank(int bank = 0) const {
    return banks[bank];
  }
};

using PixelBufferByte = PixelBufferOf<uint8_t>;
using PixelBufferUShort = PixelBufferOf<uint16_t>;
using PixelBufferShort = PixelBufferOf<int16_t>;
using PixelBufferInt = PixelBufferOf<int32_t>;

/**
 * Allocate a zero-filled PixelBuffer of the given storage type.
 *
 * Throws InvalidArgument if no storage exists for `type`.
 */
std::shared_ptr<PixelBuffer> CreatePixelBuffer(DataType type, int size,
                                               int num_banks = 1);

/////////////////////////
template <typename T>
PixelBufferOf<T>::PixelBufferOf(int size, int num_banks)
    : PixelBuffer(StorageType<T>::value, size,
                  std::vector<int>(num_banks > 0 ? num_banks : 0, 0)) {
  for (int b = 0; b < num_banks; ++b)
    banks.push_back(std::make_shared<Bank>(size, T(0)));
  Bind();
}

/////////////////////////
template <typename T>
PixelBufferOf<T>::PixelBufferOf(std::shared_ptr<Bank> bank, int size,
                                 int offset)
    : PixelBuffer(StorageType<T>::value, size, std::vector<int>(1, offset)),
      banks(1, bank) {
  Bind();
}

/////////////////////////
template <typename T>
PixelBufferOf<T>::PixelBufferOf(std::vector<std::shared_ptr<Bank>> banks,
                                 int size)
    : PixelBuffer(StorageType<T>::value, size,
                  std::vector<int>(banks.size(), 0)),
      banks(std::move(banks)) {
  Bind();
}

/////////////////////////
template <typename T>
PixelBufferOf<T>::PixelBufferOf(std::vector<std::shared_ptr<Bank>> banks,
                                 int size, std::vector<int> offsets)
    : PixelBuffer(StorageType<T>::value, size, std::move(offsets)),
      banks(std::move(banks)) {
  if (this->banks.size() != this->offsets.size())
    throw InvalidArgument("Number of banks (" +
                          std::to_string(this->banks.size()) +
                          ") does not match number of bank offsets (" +
                          std::to_string(this->offsets.size()) + ")");
  Bind();
}

/////////////////////////
template <typename T>
void PixelBufferOf<T>::Bind() {
  for (size_t b = 0; b < banks.size(); ++b) {
    if (!banks[b])
      throw InvalidArgument("Bank " + std::to_string(b) + " is null");
    if (offsets[b] < 0 ||
        static_cast<size_t>(offsets[b]) + size > banks[b]->size())
      throw InvalidArgument("Bank " + std::to_string(b) + " holds " +
                            std::to_string(banks[b]->size()) +
                            " elements, fewer than offset " +
                            std::to_string(offsets[b]) + " + size " +
                            std::to_string(size));
    bank_data.push_back(banks[b]->data());
  }
}

}  // namespace pix

#endif  // LIB_PIX_PIXEL_BUFFER_HPP_
