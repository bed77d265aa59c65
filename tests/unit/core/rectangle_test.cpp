#include <imutil/core/rectangle.hpp>
#include <gtest/gtest.h>
#include <sstream>

namespace ic = imutil::core;

TEST(Rectangle, Accessors) {
  constexpr ic::Rectangle r(2, 3, 10, 7);
  EXPECT_EQ(r.top(), 2);
  EXPECT_EQ(r.left(), 3);
  EXPECT_EQ(r.bottom(), 10);
  EXPECT_EQ(r.right(), 7);
  EXPECT_EQ(r.y(), 2);
  EXPECT_EQ(r.x(), 3);
  EXPECT_EQ(r.height(), 8);
  EXPECT_EQ(r.width(), 4);
}

TEST(Rectangle, Print) {
  std::ostringstream out;
  out << ic::Rectangle(1, 2, 3, 4);
  EXPECT_EQ(out.str(), "1,2,3,4");
}
