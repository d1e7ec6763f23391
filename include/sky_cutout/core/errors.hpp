#pragma once

#include <stdexcept>
#include <string>

namespace sky_cutout {

class SkyCutoutError : public std::runtime_error {
public:
    explicit SkyCutoutError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public SkyCutoutError {
public:
    explicit ConfigError(const std::string& message)
        : SkyCutoutError("Config error: " + message) {}
};

// Bad submission input: catalog columns, coordinates, row limits, selections.
class ValidationError : public SkyCutoutError {
public:
    explicit ValidationError(const std::string& message)
        : SkyCutoutError("Validation error: " + message) {}
};

class IOError : public SkyCutoutError {
public:
    explicit IOError(const std::string& message)
        : SkyCutoutError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class CacheWriteError : public IOError {
public:
    explicit CacheWriteError(const std::string& message)
        : IOError("Cache write error: " + message) {}
};

// A single artifact could not be produced. Never fatal to the batch.
class ProductionError : public SkyCutoutError {
public:
    explicit ProductionError(const std::string& message)
        : SkyCutoutError("Production error: " + message) {}
};

class PackagingError : public SkyCutoutError {
public:
    explicit PackagingError(const std::string& message)
        : SkyCutoutError("Packaging error: " + message) {}
};

class TaskStateError : public SkyCutoutError {
public:
    explicit TaskStateError(const std::string& message)
        : SkyCutoutError("Task state error: " + message) {}
};

} // namespace sky_cutout
