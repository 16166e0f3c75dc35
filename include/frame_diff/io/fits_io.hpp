#pragma once

#include "frame_diff/core/types.hpp"
#include <map>
#include <string>

namespace frame_diff::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
};

bool is_fits_image_path(const fs::path& path);

// Reads the first image plane of the primary HDU as doubles.
Matrix2Dd read_fits_double(const fs::path& path);

void write_fits_double(const fs::path& path, const Matrix2Dd& data, const FitsHeader& header);

} // namespace frame_diff::io
