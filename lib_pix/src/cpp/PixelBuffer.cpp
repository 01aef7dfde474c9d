#include "PixelBuffer.hpp"

using namespace pix;

static const int data_type_bits[] = {8, 16, 16, 32, 32, 64};

int pix::DataTypeSize(DataType type) {
  const int t = static_cast<int>(type);
  if (t < 0 || t > static_cast<int>(DataType::DOUBLE))
    throw InvalidArgument("Unknown data type " + std::to_string(t));
  return data_type_bits[t];
}

bool pix::HasStorage(DataType type) {
  switch (type) {
    case DataType::BYTE:
    case DataType::USHORT:
    case DataType::SHORT:
    case DataType::INT:
      return true;
    default:
      return false;
  }
}

int pix::NormalizeElement(DataType type, int value) {
  switch (type) {
    case DataType::BYTE:
      return value & 0xff;
    case DataType::USHORT:
      return value & 0xffff;
    case DataType::SHORT:
      return static_cast<int16_t>(value);
    default:
      return value;
  }
}

std::ostream &pix::operator<<(std::ostream &stream, DataType type) {
  switch (type) {
    case DataType::BYTE:
      return stream << "BYTE";
    case DataType::USHORT:
      return stream << "USHORT";
    case DataType::SHORT:
      return stream << "SHORT";
    case DataType::INT:
      return stream << "INT";
    case DataType::FLOAT:
      return stream << "FLOAT";
    case DataType::DOUBLE:
      return stream << "DOUBLE";
    default:
      return stream << "UNDEFINED";
  }
}

PixelBuffer::PixelBuffer(DataType type, int size, std::vector<int> offsets)
    : data_type(type), size(size), offsets(std::move(offsets)) {
  if (size < 0)
    throw InvalidArgument("Buffer size (" + std::to_string(size) +
                          ") must be >= 0");
  if (this->offsets.empty())
    throw InvalidArgument("Number of banks must be > 0");
}

std::shared_ptr<PixelBuffer> pix::CreatePixelBuffer(DataType type, int size,
                                                    int num_banks) {
  switch (type) {
    case DataType::BYTE:
      return std::make_shared<PixelBufferByte>(size, num_banks);
    case DataType::USHORT:
      return std::make_shared<PixelBufferUShort>(size, num_banks);
    case DataType::SHORT:
      return std::make_shared<PixelBufferShort>(size, num_banks);
    case DataType::INT:
      return std::make_shared<PixelBufferInt>(size, num_banks);
    default:
      throw InvalidArgument("No pixel storage for data type " +
                            std::to_string(static_cast<int>(type)));
  }
}
