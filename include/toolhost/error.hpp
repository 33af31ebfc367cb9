#pragma once
#include <stdexcept>
#include <string>

namespace toolhost {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The frame was not a JSON object.
class ParseError : public Error {
public:
    using Error::Error;
};

class TransportError : public Error {
public:
    using Error::Error;
};

class TimeoutError : public Error {
public:
    using Error::Error;
};

/// Failure inside a tool handler. Reported to the client as isError=true.
class ToolError : public Error {
public:
    using Error::Error;
};

class UpstreamError : public ToolError {
public:
    int status;
    UpstreamError(int status, const std::string& msg)
        : ToolError(msg), status(status) {}
};

class ConfigError : public Error {
public:
    using Error::Error;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int MethodNotFound   = -32601;
    constexpr int InternalError    = -32603;
} // namespace error

} // namespace toolhost
