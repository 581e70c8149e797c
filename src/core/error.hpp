#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    Configuration,
    Probe,
    SegmentExtraction,
    ExtractionUnavailable,
    Engine,
    Timeout,
    DiskSpace,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Probe: return "probe";
        case ErrorKind::SegmentExtraction: return "segment_extraction";
        case ErrorKind::ExtractionUnavailable: return "extraction_unavailable";
        case ErrorKind::Engine: return "engine";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::DiskSpace: return "disk_space";
    }
    return "unknown";
}
