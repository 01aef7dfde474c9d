#ifndef LIB_PIX_ERRORS_HPP_
#define LIB_PIX_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace pix {

/**
 * Malformed construction parameters or arguments, e.g. a non-contiguous bit
 * mask, a bank/offset count mismatch, or a filter whose source and destination
 * are the same object.
 */
class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string &what)
      : std::invalid_argument(what) {}
};

/**
 * Structural incompatibility found while performing an operation, e.g. a child
 * rectangle lying outside its parent raster.
 */
class FormatError : public std::runtime_error {
 public:
  explicit FormatError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * Band count mismatch between cooperating rasters or images.
 */
class MismatchedBands : public std::runtime_error {
 public:
  explicit MismatchedBands(const std::string &what)
      : std::runtime_error(what) {}
};

/**
 * The underlying computation could not produce a result.
 */
class OperationFailed : public std::runtime_error {
 public:
  explicit OperationFailed(const std::string &what)
      : std::runtime_error(what) {}
};

}  // namespace pix

#endif  // LIB_PIX_ERRORS_HPP_
