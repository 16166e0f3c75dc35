#include "frame_diff/config/configuration.hpp"
#include "frame_diff/core/errors.hpp"

#include <fstream>
#include <sstream>

namespace frame_diff::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["detection"]) {
            auto d = node["detection"];
            if (d["suppression_sigma"]) cfg.detection.suppression_sigma = d["suppression_sigma"].as<double>();
            if (d["gaussian_truncate"]) cfg.detection.gaussian_truncate = d["gaussian_truncate"].as<double>();
            if (d["detection_multiplier"]) cfg.detection.detection_multiplier = d["detection_multiplier"].as<double>();
            if (d["promising_multiplier"]) cfg.detection.promising_multiplier = d["promising_multiplier"].as<double>();
            if (d["magnitude_decimals"]) cfg.detection.magnitude_decimals = d["magnitude_decimals"].as<int>();
        }

        if (node["run"]) {
            auto r = node["run"];
            if (r["signature_prefix"]) cfg.run.signature_prefix = r["signature_prefix"].as<std::string>();
        }

        if (node["runtime"]) {
            auto rt = node["runtime"];
            if (rt["parallel_workers"]) cfg.runtime.parallel_workers = rt["parallel_workers"].as<int>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["write_differentials"]) cfg.output.write_differentials = o["write_differentials"].as<bool>();
            if (o["write_zoom_windows"]) cfg.output.write_zoom_windows = o["write_zoom_windows"].as<bool>();
            if (o["zoom_half_size"]) cfg.output.zoom_half_size = o["zoom_half_size"].as<int>();
            if (o["results_file"]) cfg.output.results_file = o["results_file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["detection"]["suppression_sigma"] = detection.suppression_sigma;
    node["detection"]["gaussian_truncate"] = detection.gaussian_truncate;
    node["detection"]["detection_multiplier"] = detection.detection_multiplier;
    node["detection"]["promising_multiplier"] = detection.promising_multiplier;
    node["detection"]["magnitude_decimals"] = detection.magnitude_decimals;

    node["run"]["signature_prefix"] = run.signature_prefix;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;

    node["output"]["write_differentials"] = output.write_differentials;
    node["output"]["write_zoom_windows"] = output.write_zoom_windows;
    node["output"]["zoom_half_size"] = output.zoom_half_size;
    node["output"]["results_file"] = output.results_file;

    return node;
}

void Config::save(const fs::path& path) const {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create config file: " + path.string());
    }
    YAML::Emitter emitter;
    emitter << to_yaml();
    file << emitter.c_str() << "\n";
}

void Config::validate() const {
    if (!(detection.suppression_sigma > 0.0)) {
        throw ValidationError("detection.suppression_sigma must be > 0");
    }
    if (!(detection.gaussian_truncate > 0.0)) {
        throw ValidationError("detection.gaussian_truncate must be > 0");
    }
    if (!(detection.detection_multiplier > 0.0)) {
        throw ValidationError("detection.detection_multiplier must be > 0");
    }
    if (!(detection.promising_multiplier > 0.0)) {
        throw ValidationError("detection.promising_multiplier must be > 0");
    }
    if (detection.magnitude_decimals < 0 || detection.magnitude_decimals > 12) {
        throw ValidationError("detection.magnitude_decimals must be in [0,12]");
    }

    if (runtime.parallel_workers < 1) {
        throw ValidationError("runtime.parallel_workers must be >= 1");
    }

    if (output.zoom_half_size < 1) {
        throw ValidationError("output.zoom_half_size must be >= 1");
    }
    if (output.results_file.empty()) {
        throw ValidationError("output.results_file must not be empty");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "detection": {
      "type": "object",
      "properties": {
        "suppression_sigma": {"type": "number", "exclusiveMinimum": 0},
        "gaussian_truncate": {"type": "number", "exclusiveMinimum": 0},
        "detection_multiplier": {"type": "number", "exclusiveMinimum": 0},
        "promising_multiplier": {"type": "number", "exclusiveMinimum": 0},
        "magnitude_decimals": {"type": "integer", "minimum": 0, "maximum": 12}
      }
    },
    "run": {
      "type": "object",
      "properties": {
        "signature_prefix": {"type": "string"}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "write_differentials": {"type": "boolean"},
        "write_zoom_windows": {"type": "boolean"},
        "zoom_half_size": {"type": "integer", "minimum": 1},
        "results_file": {"type": "string", "minLength": 1}
      }
    }
  }
})";
}

} // namespace frame_diff::config
