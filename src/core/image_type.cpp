#include <imutil/core/image_type.hpp>
#include <array>
#include <cstddef>
#include <limits>

namespace imutil::core {

namespace {

struct TypeInfo {
  ImageType type;
  std::string_view name;
  std::size_t size;
  bool integer;
  bool is_signed;
  bool floating;
  ImageType unsigned_type;
};

constexpr std::array<TypeInfo, 18> kTypes = {{
    {ImageType::Bit, "bool", 1, true, false, false, ImageType::Bit},
    {ImageType::Byte, "uint8", 1, true, false, false, ImageType::Byte},
    {ImageType::SByte, "int8", 1, true, true, false, ImageType::Byte},
    {ImageType::Short, "int16", 2, true, true, false, ImageType::UShort},
    {ImageType::ShortBE, "int16be", 2, true, true, false, ImageType::UShortBE},
    {ImageType::UShort, "uint16", 2, true, false, false, ImageType::UShort},
    {ImageType::UShortBE, "uint16be", 2, true, false, false, ImageType::UShortBE},
    {ImageType::Int, "int32", 4, true, true, false, ImageType::UInt},
    {ImageType::IntBE, "int32be", 4, true, true, false, ImageType::UIntBE},
    {ImageType::UInt, "uint32", 4, true, false, false, ImageType::UInt},
    {ImageType::UIntBE, "uint32be", 4, true, false, false, ImageType::UIntBE},
    {ImageType::Long, "int64", 8, true, true, false, ImageType::ULong},
    {ImageType::LongBE, "int64be", 8, true, true, false, ImageType::ULongBE},
    {ImageType::ULong, "uint64", 8, true, false, false, ImageType::ULong},
    {ImageType::ULongBE, "uint64be", 8, true, false, false, ImageType::ULongBE},
    {ImageType::Float, "float32", 4, false, true, true, ImageType::Float},
    {ImageType::Double, "float64", 8, false, true, true, ImageType::Double},
    {ImageType::Rgb24, "rgb24", 3, false, false, false, ImageType::Rgb24},
}};

const TypeInfo& info(ImageType type) noexcept {
  return kTypes[static_cast<std::size_t>(type)];
}

}  // namespace

std::size_t element_size(ImageType type) noexcept { return info(type).size; }

bool is_integer_type(ImageType type) noexcept { return info(type).integer; }

bool is_float_type(ImageType type) noexcept { return info(type).floating; }

bool is_signed_type(ImageType type) noexcept { return info(type).is_signed; }

std::optional<ImageType> unsigned_counterpart(ImageType type) noexcept {
  const TypeInfo& i = info(type);
  if (!i.integer || !i.is_signed) return std::nullopt;
  return i.unsigned_type;
}

std::uint64_t label_capacity(ImageType type) noexcept {
  switch (type) {
    case ImageType::Bit:
      return 1;
    case ImageType::Byte:
      return std::numeric_limits<std::uint8_t>::max();
    case ImageType::UShort:
      return std::numeric_limits<std::uint16_t>::max();
    case ImageType::UInt:
      return std::numeric_limits<std::uint32_t>::max();
    case ImageType::ULong:
      return std::numeric_limits<std::uint64_t>::max();
    default:
      return 0;
  }
}

std::string_view type_name(ImageType type) noexcept { return info(type).name; }

std::optional<ImageType> parse_type_name(std::string_view name) noexcept {
  for (const auto& i : kTypes) {
    if (i.name == name) return i.type;
  }
  return std::nullopt;
}

}  // namespace imutil::core
