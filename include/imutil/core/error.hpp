#pragma once

namespace imutil::core {

/// Image operation error codes; used with std::expected for contract violations.
enum class ImageError {
  None = 0,
  Classification,    // not a recognized image shape / element type
  UnsupportedValue,  // e.g. negative labels
  Argument,          // conflicting or malformed arguments
  Overflow,          // no allowed unsigned type can hold the label count
  LoadFailed,
  SaveFailed,
  InvalidConfig,
};

}  // namespace imutil::core
