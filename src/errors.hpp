#pragma once

#include <stdexcept>
#include <string>

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// No response was obtained from the daemon (refused, reset, timed out).
// Only this kind drives the spawn-and-retry decision at startup.
class TransportError : public Error {
public:
    explicit TransportError(const std::string& msg) : Error(msg) {}
};

// The daemon answered with an error payload; what() carries its message verbatim.
class RpcError : public Error {
public:
    explicit RpcError(const std::string& msg) : Error(msg) {}
};

class StartupError : public Error {
public:
    explicit StartupError(const std::string& msg) : Error(msg) {}
};

class NoUrlAvailable : public Error {
public:
    explicit NoUrlAvailable(const std::string& id)
        : Error("No URL available for retry of " + id) {}
};

class NotFound : public Error {
public:
    explicit NotFound(const std::string& id) : Error("Download not found: " + id) {}
};

// Raised by delete_file after the table entry is already gone.
class FileDeleteError : public Error {
public:
    explicit FileDeleteError(const std::string& msg) : Error(msg) {}
};
