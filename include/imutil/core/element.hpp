#pragma once

#include <imutil/core/image_type.hpp>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <type_traits>

namespace imutil::core::detail {

/// Typed accessor for one scalar element type stored with the given byte order.
template <typename T, std::endian Order>
struct Element {
  using value_type = T;

  [[nodiscard]] static T load(const std::byte* p) noexcept {
    T v;
    std::memcpy(&v, p, sizeof(T));
    if constexpr (std::is_integral_v<T> && sizeof(T) > 1 && Order != std::endian::native) {
      v = std::byteswap(v);
    }
    return v;
  }

  static void store(std::byte* p, T v) noexcept {
    if constexpr (std::is_integral_v<T> && sizeof(T) > 1 && Order != std::endian::native) {
      v = std::byteswap(v);
    }
    std::memcpy(p, &v, sizeof(T));
  }
};

/// Calls f(Element<T, Order>{}) for the scalar element type `type`.
/// Throws std::invalid_argument for Rgb24, which has no scalar value.
template <typename F>
decltype(auto) visit_scalar(ImageType type, F&& f) {
  using std::endian;
  switch (type) {
    case ImageType::Bit:
      return f(Element<bool, endian::little>{});
    case ImageType::Byte:
      return f(Element<std::uint8_t, endian::little>{});
    case ImageType::SByte:
      return f(Element<std::int8_t, endian::little>{});
    case ImageType::Short:
      return f(Element<std::int16_t, endian::little>{});
    case ImageType::ShortBE:
      return f(Element<std::int16_t, endian::big>{});
    case ImageType::UShort:
      return f(Element<std::uint16_t, endian::little>{});
    case ImageType::UShortBE:
      return f(Element<std::uint16_t, endian::big>{});
    case ImageType::Int:
      return f(Element<std::int32_t, endian::little>{});
    case ImageType::IntBE:
      return f(Element<std::int32_t, endian::big>{});
    case ImageType::UInt:
      return f(Element<std::uint32_t, endian::little>{});
    case ImageType::UIntBE:
      return f(Element<std::uint32_t, endian::big>{});
    case ImageType::Long:
      return f(Element<std::int64_t, endian::little>{});
    case ImageType::LongBE:
      return f(Element<std::int64_t, endian::big>{});
    case ImageType::ULong:
      return f(Element<std::uint64_t, endian::little>{});
    case ImageType::ULongBE:
      return f(Element<std::uint64_t, endian::big>{});
    case ImageType::Float:
      return f(Element<float, endian::little>{});
    case ImageType::Double:
      return f(Element<double, endian::little>{});
    case ImageType::Rgb24:
      break;
  }
  throw std::invalid_argument("visit_scalar: element type has no scalar value");
}

}  // namespace imutil::core::detail
