#include "error.hpp"

#include "text_util.hpp"

#include <format>

std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PermissionDenied: return "permission_denied";
        case ErrorKind::AlreadyRecording: return "already_recording";
        case ErrorKind::RecorderFailed: return "recorder_failed";
        case ErrorKind::BundleMissing: return "bundle_missing";
        case ErrorKind::EngineFailed: return "engine_failed";
        case ErrorKind::IoError: return "io_error";
        case ErrorKind::CleanupError: return "cleanup_error";
        case ErrorKind::AccessibilityDenied: return "accessibility_denied";
        case ErrorKind::EventCreationFailed: return "event_creation_failed";
    }
    return "unknown";
}

namespace {

std::string message_for(const Error& error) {
    switch (error.kind) {
        case ErrorKind::PermissionDenied:
            return "Microphone access denied. Allow holdscribe to use the microphone "
                   "(PipeWire / xdg-desktop-portal) and try again.";
        case ErrorKind::AlreadyRecording:
            return "A recording is already in progress.";
        case ErrorKind::RecorderFailed:
            return std::format("Audio recording failed: {}", error.message);
        case ErrorKind::BundleMissing:
            return std::format("Bundle configuration error: {}", error.message);
        case ErrorKind::EngineFailed:
            return std::format("whisper-cli exited with error: {}", error.message);
        case ErrorKind::IoError:
            return std::format("File error: {}", error.message);
        case ErrorKind::CleanupError:
            return std::format("Temporary recording cleanup failed: {}", error.message);
        case ErrorKind::AccessibilityDenied:
            return std::format("Automatic paste is not available in this session ({}). "
                               "Use `holdscribectl copy-last` instead.", error.message);
        case ErrorKind::EventCreationFailed:
            return std::format("Failed to create keyboard event for paste operation: {}",
                               error.message);
    }
    return error.message;
}

} // namespace

// Engine stderr and similar detail may span lines; notifications and IPC replies need one.
std::string describe(const Error& error) {
    return text::join_lines(message_for(error));
}
