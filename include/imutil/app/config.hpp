#pragma once

#include <imutil/core/image_type.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace imutil::app {

/// Pipeline configuration: operations in order and their parameters.
struct PipelineConfig {
  /// Operation names, applied in order: crop, blur, histeq, number, relabel.
  std::vector<std::string> ops;
  std::size_t nbins{64};
  double blur_sigma{1.0};
  /// Widest type label images may grow to.
  imutil::core::ImageType max_label_type{imutil::core::ImageType::ULong};
  std::string output_dir{"output"};
  std::size_t workers{0};  // 0 = hardware concurrency
};

/// Split a comma-separated operation list, trimming blanks and dropping empty entries.
std::vector<std::string> parse_ops(std::string_view list);

/// Load config from a simple key=value file (one per line, # comments) or use defaults.
PipelineConfig load_config(const std::string& path);

/// Default config when no file is provided.
PipelineConfig default_config();

}  // namespace imutil::app
