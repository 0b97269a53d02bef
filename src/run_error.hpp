#pragma once

#include <string>

enum class ErrorKind {
    Input,      // input file missing or unreadable
    Dependency, // decoding executable missing or unhealthy
    Engine,     // transcription engine failed to load or transcribe
    Sampler,    // load sample unusable; never surfaces from a run
};

struct RunError {
    ErrorKind kind;
    std::string message;
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Input: return "input";
        case ErrorKind::Dependency: return "dependency";
        case ErrorKind::Engine: return "engine";
        case ErrorKind::Sampler: return "sampler";
    }
    return "unknown";
}
