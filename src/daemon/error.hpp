#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    PermissionDenied,
    AlreadyRecording,
    RecorderFailed,
    BundleMissing,
    EngineFailed,
    IoError,
    CleanupError,
    AccessibilityDenied,
    EventCreationFailed,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

std::string_view error_kind_name(ErrorKind kind);

// One-line, user-facing description of an error.
std::string describe(const Error& error);
