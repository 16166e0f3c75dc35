#pragma once

#include <stdexcept>
#include <string>

namespace frame_diff {

class FrameDiffError : public std::runtime_error {
public:
    explicit FrameDiffError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public FrameDiffError {
public:
    explicit ConfigError(const std::string& message)
        : FrameDiffError("Config error: " + message) {}
};

class ValidationError : public FrameDiffError {
public:
    explicit ValidationError(const std::string& message)
        : FrameDiffError("Validation error: " + message) {}
};

class IOError : public FrameDiffError {
public:
    explicit IOError(const std::string& message)
        : FrameDiffError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

// Fewer than two frames supplied; the run produces no results.
class UsageError : public FrameDiffError {
public:
    explicit UsageError(const std::string& message)
        : FrameDiffError("Usage error: " + message) {}
};

// Reference frame could not be loaded; aborts the whole run.
class ReferenceLoadError : public FrameDiffError {
public:
    explicit ReferenceLoadError(const std::string& message)
        : FrameDiffError("Reference load error: " + message) {}
};

class PairingLoadError : public FrameDiffError {
public:
    explicit PairingLoadError(const std::string& message)
        : FrameDiffError("Pairing load error: " + message) {}
};

class ShapeMismatchError : public FrameDiffError {
public:
    explicit ShapeMismatchError(const std::string& message)
        : FrameDiffError("Shape mismatch: " + message) {}
};

} // namespace frame_diff
