#pragma once

#include "frame_diff/core/types.hpp"
#include <map>
#include <string>

namespace frame_diff::io {

// Turns a frame identifier into decoded pixels. Implementations throw on
// any failure (missing file, unreadable format, corrupt data).
class FrameLoader {
public:
    virtual ~FrameLoader() = default;
    virtual Frame load(const std::string& frame_id) const = 0;
};

// Reads frame ids as FITS paths.
class FitsFrameLoader : public FrameLoader {
public:
    Frame load(const std::string& frame_id) const override;
};

// Serves frames registered in memory; unknown ids throw IOError.
class MemoryFrameLoader : public FrameLoader {
public:
    void add(const std::string& frame_id, Frame frame);
    Frame load(const std::string& frame_id) const override;

private:
    std::map<std::string, Frame> frames_;
};

} // namespace frame_diff::io
