#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace frame_diff::config {

namespace fs = std::filesystem;

struct DetectionConfig {
  double suppression_sigma = 15.0;    // Gaussian stddev in pixels
  double gaussian_truncate = 4.0;     // kernel radius = int(truncate * sigma + 0.5)
  double detection_multiplier = 5.0;  // threshold = stddev * k
  double promising_multiplier = 3.0;  // cutoff = threshold * k
  int magnitude_decimals = 2;
};

struct RunConfig {
  std::string signature_prefix = "FD"; // signature = "<prefix>-<year>"
};

struct RuntimeConfig {
  int parallel_workers = 1;
};

struct OutputConfig {
  bool write_differentials = false;
  bool write_zoom_windows = false;
  int zoom_half_size = 15;
  std::string results_file = "results.json";
};

struct Config {
  DetectionConfig detection;
  RunConfig run;
  RuntimeConfig runtime;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace frame_diff::config
