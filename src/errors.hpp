#pragma once

#include <stdexcept>
#include <string>

// Thrown for out-of-range simulation parameters (trial count, risk bounds,
// bisection precision, worker count).
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what)
        : std::invalid_argument("Invalid configuration: " + what) {}
};

// Thrown when an input asset (diagram template) does not exist.
class ResourceNotFound : public std::runtime_error {
public:
    explicit ResourceNotFound(const std::string& path)
        : std::runtime_error("Resource not found: " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
