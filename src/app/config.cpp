#include <imutil/app/config.hpp>
#include <fstream>
#include <sstream>
#include <string_view>

namespace imutil::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

}  // namespace

std::vector<std::string> parse_ops(std::string_view list) {
  std::vector<std::string> ops;
  std::istringstream in{std::string(list)};
  std::string op;
  while (std::getline(in, op, ',')) {
    trim(op);
    if (!op.empty()) ops.push_back(op);
  }
  return ops;
}

PipelineConfig default_config() {
  PipelineConfig c;
  c.ops = {"relabel"};
  c.nbins = 64;
  c.blur_sigma = 1.0;
  c.max_label_type = imutil::core::ImageType::ULong;
  c.output_dir = "output";
  c.workers = 0;
  return c;
}

PipelineConfig load_config(const std::string& path) {
  PipelineConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "ops") c.ops = parse_ops(value);
    else if (key == "nbins") c.nbins = static_cast<std::size_t>(std::stoul(value));
    else if (key == "blur_sigma") c.blur_sigma = std::stod(value);
    else if (key == "max_label_type") {
      if (auto type = imutil::core::parse_type_name(value)) c.max_label_type = *type;
    }
    else if (key == "output_dir") c.output_dir = value;
    else if (key == "workers") c.workers = static_cast<std::size_t>(std::stoul(value));
  }
  return c;
}

}  // namespace imutil::app
