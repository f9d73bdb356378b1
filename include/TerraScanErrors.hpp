#pragma once

#include <stdexcept>
#include <string>

namespace TerraScan {

// Missing or zero-sized raster, malformed request arguments, unusable codec setup.
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what) : std::invalid_argument(what) {}
};

// Image path unreadable or the file could not be decoded.
class ImageLoadError : public std::runtime_error {
public:
    explicit ImageLoadError(const std::string& what) : std::runtime_error(what) {}
};

// A feature class has no detector pipeline registered.
class UnsupportedClassError : public std::logic_error {
public:
    explicit UnsupportedClassError(const std::string& what) : std::logic_error(what) {}
};

// The annotated result image could not be written.
class OutputWriteError : public std::runtime_error {
public:
    explicit OutputWriteError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace TerraScan
