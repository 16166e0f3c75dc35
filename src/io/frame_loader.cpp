#include "frame_diff/io/frame_loader.hpp"
#include "frame_diff/core/errors.hpp"
#include "frame_diff/io/fits_io.hpp"

#include <utility>

namespace frame_diff::io {

Frame FitsFrameLoader::load(const std::string& frame_id) const {
    const fs::path path(frame_id);
    if (!fs::exists(path)) {
        throw IOError("File not found: " + frame_id);
    }
    return read_fits_double(path);
}

void MemoryFrameLoader::add(const std::string& frame_id, Frame frame) {
    frames_[frame_id] = std::move(frame);
}

Frame MemoryFrameLoader::load(const std::string& frame_id) const {
    auto it = frames_.find(frame_id);
    if (it == frames_.end()) {
        throw IOError("Unknown frame: " + frame_id);
    }
    return it->second;
}

} // namespace frame_diff::io
