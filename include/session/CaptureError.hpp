#pragma once
#include <stdexcept>
#include <string>

// Thrown by collaborators for documented, recoverable misuse
// (unknown channel, buffer not created yet, bad config value).
// CaptureSession catches these at its boundary and turns them into warnings.
class CaptureError : public std::runtime_error {
public:
    explicit CaptureError(const std::string& what)
        : std::runtime_error(what) {}
};
