#include <imutil/app/config.hpp>
#include <imutil/app/pipeline_factory.hpp>
#include <imutil/core/error.hpp>
#include <imutil/core/image_type.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace ia = imutil::app;
namespace ic = imutil::core;

namespace {

std::string write_config(const std::string& name, const std::string& text) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream(path) << text;
  return path.string();
}

}  // namespace

TEST(Config, DefaultConfig) {
  ia::PipelineConfig c = ia::default_config();
  EXPECT_EQ(c.ops, (std::vector<std::string>{"relabel"}));
  EXPECT_EQ(c.nbins, 64u);
  EXPECT_DOUBLE_EQ(c.blur_sigma, 1.0);
  EXPECT_EQ(c.max_label_type, ic::ImageType::ULong);
  EXPECT_EQ(c.output_dir, "output");
  EXPECT_EQ(c.workers, 0u);
}

TEST(Config, ParseOpsTrimsAndSkipsEmpty) {
  EXPECT_EQ(ia::parse_ops(" crop, blur ,,histeq "),
            (std::vector<std::string>{"crop", "blur", "histeq"}));
  EXPECT_TRUE(ia::parse_ops("").empty());
}

TEST(Config, LoadFromFile) {
  const std::string path = write_config("imutil_config_test.cfg",
                                        "# comment\n"
                                        "ops = crop,number\n"
                                        "nbins=32\n"
                                        "blur_sigma = 2.5\n"
                                        "max_label_type = uint16\n"
                                        "output_dir = /tmp/labels\n"
                                        "workers = 3\n"
                                        "no equals sign here\n");
  ia::PipelineConfig c = ia::load_config(path);
  EXPECT_EQ(c.ops, (std::vector<std::string>{"crop", "number"}));
  EXPECT_EQ(c.nbins, 32u);
  EXPECT_DOUBLE_EQ(c.blur_sigma, 2.5);
  EXPECT_EQ(c.max_label_type, ic::ImageType::UShort);
  EXPECT_EQ(c.output_dir, "/tmp/labels");
  EXPECT_EQ(c.workers, 3u);
  std::filesystem::remove(path);
}

TEST(Config, MissingFileGivesDefaults) {
  ia::PipelineConfig c = ia::load_config("/nonexistent/imutil.cfg");
  EXPECT_EQ(c.ops, ia::default_config().ops);
}

TEST(PipelineFactory, BuildsOneStagePerOp) {
  ia::PipelineConfig c = ia::default_config();
  c.ops = {"crop", "blur", "histeq", "number", "relabel"};
  auto pipeline = ia::build_pipeline(c);
  ASSERT_TRUE(pipeline.has_value());
  EXPECT_EQ(pipeline->stage_count(), 5u);
}

TEST(PipelineFactory, UnknownOpRejected) {
  ia::PipelineConfig c = ia::default_config();
  c.ops = {"crop", "sharpen"};
  auto pipeline = ia::build_pipeline(c);
  ASSERT_FALSE(pipeline.has_value());
  EXPECT_EQ(pipeline.error(), ic::ImageError::InvalidConfig);
}

TEST(PipelineFactory, NonLabelMaxTypeRejected) {
  ia::PipelineConfig c = ia::default_config();
  c.max_label_type = ic::ImageType::Float;
  auto pipeline = ia::build_pipeline(c);
  ASSERT_FALSE(pipeline.has_value());
  EXPECT_EQ(pipeline.error(), ic::ImageError::InvalidConfig);
}
