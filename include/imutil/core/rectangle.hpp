#pragma once

#include <cstdint>
#include <ostream>

namespace imutil::core {

/// Inclusive pixel rectangle (top, left, bottom, right). Immutable.
class Rectangle {
 public:
  constexpr Rectangle(std::int64_t top, std::int64_t left, std::int64_t bottom, std::int64_t right) noexcept
      : top_(top), left_(left), bottom_(bottom), right_(right) {}

  [[nodiscard]] constexpr std::int64_t top() const noexcept { return top_; }
  [[nodiscard]] constexpr std::int64_t left() const noexcept { return left_; }
  [[nodiscard]] constexpr std::int64_t bottom() const noexcept { return bottom_; }
  [[nodiscard]] constexpr std::int64_t right() const noexcept { return right_; }

  [[nodiscard]] constexpr std::int64_t y() const noexcept { return top_; }
  [[nodiscard]] constexpr std::int64_t x() const noexcept { return left_; }
  /// bottom - top (one less than the number of rows covered).
  [[nodiscard]] constexpr std::int64_t height() const noexcept { return bottom_ - top_; }
  /// right - left (one less than the number of columns covered).
  [[nodiscard]] constexpr std::int64_t width() const noexcept { return right_ - left_; }

  constexpr bool operator==(const Rectangle&) const noexcept = default;

 private:
  std::int64_t top_;
  std::int64_t left_;
  std::int64_t bottom_;
  std::int64_t right_;
};

/// Prints "t,l,b,r".
inline std::ostream& operator<<(std::ostream& os, const Rectangle& r) {
  return os << r.top() << ',' << r.left() << ',' << r.bottom() << ',' << r.right();
}

}  // namespace imutil::core
