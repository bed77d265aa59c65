#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace imutil::core {

/// Element types an image buffer may hold. The *BE variants are stored
/// big-endian; the rest are little-endian (or single byte).
enum class ImageType : std::uint8_t {
  Bit,
  Byte,
  SByte,
  Short,
  ShortBE,
  UShort,
  UShortBE,
  Int,
  IntBE,
  UInt,
  UIntBE,
  Long,
  LongBE,
  ULong,
  ULongBE,
  Float,
  Double,
  Rgb24,  // R,G,B byte record
};

/// Bytes per element.
[[nodiscard]] std::size_t element_size(ImageType type) noexcept;

/// Bit and every signed/unsigned integer type.
[[nodiscard]] bool is_integer_type(ImageType type) noexcept;
[[nodiscard]] bool is_float_type(ImageType type) noexcept;
[[nodiscard]] bool is_signed_type(ImageType type) noexcept;

/// Same-width unsigned type with the same byte order (SByte -> Byte, ShortBE -> UShortBE, ...).
/// nullopt for types without one.
[[nodiscard]] std::optional<ImageType> unsigned_counterpart(ImageType type) noexcept;

/// Largest label an unsigned label type can hold; 0 for non-label types.
[[nodiscard]] std::uint64_t label_capacity(ImageType type) noexcept;

/// Short name ("bool", "uint8", "int16be", "rgb24", ...).
[[nodiscard]] std::string_view type_name(ImageType type) noexcept;

/// Inverse of type_name.
[[nodiscard]] std::optional<ImageType> parse_type_name(std::string_view name) noexcept;

}  // namespace imutil::core
