#pragma once

#include <stdexcept>
#include <string>

namespace geo_overlay {

class GeoOverlayError : public std::runtime_error {
public:
    explicit GeoOverlayError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigurationError : public GeoOverlayError {
public:
    explicit ConfigurationError(const std::string& message)
        : GeoOverlayError("Configuration error: " + message) {}
};

class ValidationError : public GeoOverlayError {
public:
    explicit ValidationError(const std::string& message)
        : GeoOverlayError("Validation error: " + message) {}
};

class IOError : public GeoOverlayError {
public:
    explicit IOError(const std::string& message)
        : GeoOverlayError("I/O error: " + message) {}
};

class RenderTimeoutError : public GeoOverlayError {
public:
    explicit RenderTimeoutError(const std::string& message)
        : GeoOverlayError("Render timeout: " + message) {}
};

class CompositeError : public GeoOverlayError {
public:
    explicit CompositeError(const std::string& message)
        : GeoOverlayError("Composite error: " + message) {}
};

class NetworkError : public GeoOverlayError {
public:
    explicit NetworkError(const std::string& message, long status_code = 0)
        : GeoOverlayError("Network error: " + message), status_code_(status_code) {}

    // HTTP status of the failed response, 0 for transport failures.
    long status_code() const { return status_code_; }

private:
    long status_code_;
};

class BrowserError : public GeoOverlayError {
public:
    explicit BrowserError(const std::string& message)
        : GeoOverlayError("Browser error: " + message) {}
};

} // namespace geo_overlay
