#pragma once

#include <stdexcept>
#include <string>

class HotplugError : public std::runtime_error {
public:
    explicit HotplugError(const std::string &message) : std::runtime_error(message)
    {}
};

// Thrown when there is no suitable backend for scanning the USB bus on the
// current platform.
class NoBackendError : public HotplugError {
public:
    explicit NoBackendError(const std::string &message) : HotplugError(message)
    {}
};

// A single bus scan failed. Ends the event stream that observed it.
class ScanError : public HotplugError {
public:
    explicit ScanError(const std::string &message) : HotplugError(message)
    {}
};
