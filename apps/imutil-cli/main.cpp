/**
 * imutil-cli: runs an image pipeline (crop, blur, histeq, number, relabel) on image file(s).
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/imutil_cli [--config path] [--ops list] --input path [--input path ...]
 * Results are written to <output_dir>/<basename>.png.
 */

#include <imutil/app/config.hpp>
#include <imutil/app/pipeline_factory.hpp>
#include <imutil/app/pipeline_runner.hpp>
#ifdef IMUTIL_HAS_TBB
#include <imutil/app/pipeline_runner_tbb.hpp>
#endif
#include <imutil/core/error.hpp>
#include <imutil/core/image.hpp>
#include <imutil/core/image_type.hpp>
#include <imutil/core/pipeline.hpp>
#include <imutil/vision/image_io.hpp>

#include <cstddef>
#include <exception>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::string image_error_str(imutil::core::ImageError e) {
  switch (e) {
  case imutil::core::ImageError::Classification:
    return "unsupported image type";
  case imutil::core::ImageError::UnsupportedValue:
    return "unsupported pixel values";
  case imutil::core::ImageError::Argument:
    return "invalid argument";
  case imutil::core::ImageError::Overflow:
    return "label overflow";
  case imutil::core::ImageError::LoadFailed:
    return "load failed";
  case imutil::core::ImageError::SaveFailed:
    return "save failed";
  case imutil::core::ImageError::InvalidConfig:
    return "invalid config";
  default:
    return "unknown error";
  }
}

std::string describe(const imutil::core::Image &im) {
  std::ostringstream out;
  out << "type=" << imutil::core::type_name(im.type()) << " shape=";
  for (std::size_t i = 0; i < im.ndim(); ++i) {
    out << (i ? "x" : "") << im.shape()[i];
  }
  return out.str();
}

} // namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  std::vector<std::string> input_paths;
  std::string ops_override;
  std::string nbins_override;
  std::string workers_override;
  bool use_tbb = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_paths.emplace_back(argv[++i]);
    } else if (arg == "--ops" && i + 1 < argc) {
      ops_override = argv[++i];
    } else if (arg == "--nbins" && i + 1 < argc) {
      nbins_override = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      workers_override = argv[++i];
    } else if (arg == "--tbb") {
      use_tbb = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: imutil_cli [options] --input <path> [--input <path> ...]\n"
                << "  --config <path>   Pipeline config (key=value file); default: relabel only\n"
                << "  --ops <list>      Override operations: comma list of crop,blur,histeq,number,relabel\n"
                << "  --nbins <n>       Override histeq bin count (default 64)\n"
                << "  --workers <n>     Worker threads for several inputs (0 = hardware concurrency)\n"
                << "  --tbb             Use the TBB batch runner (if built with TBB)\n"
                << "  --input <path>    Image path; may be repeated\n";
      return 0;
    }
  }

  if (input_paths.empty()) {
    std::cerr << "No --input given (see --help)\n";
    return 1;
  }

  imutil::app::PipelineConfig cfg = config_path.empty() ? imutil::app::default_config()
                                                        : imutil::app::load_config(config_path);
  try {
    if (!ops_override.empty()) cfg.ops = imutil::app::parse_ops(ops_override);
    if (!nbins_override.empty()) cfg.nbins = static_cast<std::size_t>(std::stoul(nbins_override));
    if (!workers_override.empty()) cfg.workers = static_cast<std::size_t>(std::stoul(workers_override));
  } catch (const std::exception &e) {
    std::cerr << "Invalid numeric option: " << e.what() << "\n";
    return 1;
  }

  auto pipeline = imutil::app::build_pipeline(cfg);
  if (!pipeline) {
    std::cerr << "Pipeline error: " << image_error_str(pipeline.error()) << "\n";
    return 1;
  }

  std::vector<imutil::core::Image> images;
  images.reserve(input_paths.size());
  for (const auto &path : input_paths) {
    auto loaded = imutil::vision::imread(path);
    if (!loaded) {
      std::cerr << "Failed to load image: " << path << "\n";
      return 1;
    }
    images.push_back(std::move(*loaded));
  }

  const std::filesystem::path out_dir(cfg.output_dir);
  std::filesystem::create_directories(out_dir);

  std::mutex report_mutex;
  int failures = 0;
  auto on_result = [&](std::size_t idx, const imutil::app::ImageResult &result) {
    const std::string &path = input_paths[idx];
    std::lock_guard lock(report_mutex);
    if (!result) {
      std::cerr << path << ": " << image_error_str(result.error()) << "\n";
      ++failures;
      return;
    }
    const std::filesystem::path out_file =
        out_dir / (std::filesystem::path(path).stem().string() + ".png");
    auto saved = imutil::vision::imsave(out_file.string(), *result);
    if (!saved) {
      std::cerr << path << ": " << image_error_str(saved.error()) << " (" << out_file << ")\n";
      ++failures;
      return;
    }
    std::cout << path << " " << describe(*result) << " -> " << out_file.string() << "\n";
  };

  if (use_tbb) {
#ifdef IMUTIL_HAS_TBB
    imutil::app::run_pipeline_batch_tbb(*pipeline, images, on_result);
#else
    std::cerr << "TBB runner not available (build with TBB installed)\n";
    return 1;
#endif
  } else {
    imutil::app::run_pipeline_batch_parallel(*pipeline, images, on_result, cfg.workers);
  }

  return failures == 0 ? 0 : 1;
}
