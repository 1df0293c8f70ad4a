#pragma once

#include <string>
#include <utility>

enum class ErrorKind {
    Config,
    Input,      // keyboard devices unavailable
    Device,     // microphone failed mid-stream
    Closed,     // stream closed locally, no more data
    Connect,
    Send,
    Injection,
};

struct Error {
    ErrorKind kind;
    std::string message;

    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Config: return "config";
        case ErrorKind::Input: return "input";
        case ErrorKind::Device: return "device";
        case ErrorKind::Closed: return "closed";
        case ErrorKind::Connect: return "connect";
        case ErrorKind::Send: return "send";
        case ErrorKind::Injection: return "injection";
    }
    return "unknown";
}
