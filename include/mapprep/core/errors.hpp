#pragma once

#include <stdexcept>
#include <string>

namespace mapprep {

class MapPrepError : public std::runtime_error {
public:
    explicit MapPrepError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public MapPrepError {
public:
    explicit ConfigError(const std::string& message)
        : MapPrepError("Config error: " + message) {}
};

class ValidationError : public MapPrepError {
public:
    explicit ValidationError(const std::string& message)
        : MapPrepError("Validation error: " + message) {}
};

class IOError : public MapPrepError {
public:
    explicit IOError(const std::string& message)
        : MapPrepError("I/O error: " + message) {}
};

class FitError : public MapPrepError {
public:
    enum class Reason {
        INSUFFICIENT_OR_DEGENERATE,
        UNSUPPORTED
    };

    FitError(Reason reason, const std::string& message)
        : MapPrepError("Fit error: " + message), reason_(reason) {}

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

class GeoreferenceError : public MapPrepError {
public:
    enum class Reason {
        TRANSFORM_FIT,
        IO,
        RESAMPLE
    };

    GeoreferenceError(Reason reason, const std::string& message)
        : MapPrepError("Georeference error: " + message), reason_(reason) {}

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

class SplitError : public MapPrepError {
public:
    enum class Reason {
        LINE_OUT_OF_BOUNDS,
        DEGENERATE_LINE,
        IO
    };

    SplitError(Reason reason, const std::string& message)
        : MapPrepError("Split error: " + message), reason_(reason) {}

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

class SessionError : public MapPrepError {
public:
    enum class Reason {
        LOCKED,
        INVALID_TRANSITION,
        NOT_FOUND
    };

    SessionError(Reason reason, const std::string& message)
        : MapPrepError("Session error: " + message), reason_(reason) {}

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

} // namespace mapprep
