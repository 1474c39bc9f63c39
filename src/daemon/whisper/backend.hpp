#pragma once

#include "error.hpp"

#include <expected>
#include <filesystem>
#include <string>

// Engine executable and model chosen for a session, fixed at press time.
struct EngineBinding {
    std::filesystem::path executable;
    std::filesystem::path model;
    std::string language;
    int threads = 0;
};

struct TranscriptionRequest {
    std::filesystem::path audio_file;
    std::filesystem::path model;
    std::filesystem::path executable;
    std::string language;
    int threads = 0;
};

struct TranscriptResult {
    std::string text;
    double processing_s = 0.0;
};

class WhisperBackend {
public:
    virtual ~WhisperBackend() = default;
    virtual std::expected<TranscriptResult, Error> transcribe(const TranscriptionRequest& request) = 0;
};
