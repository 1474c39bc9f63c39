#pragma once

#include "backend.hpp"
#include "secure_temp.hpp"

#include <filesystem>
#include <string>
#include <vector>

// Runs whisper-cli as a subprocess against a recorded WAV file. Each run
// writes its text output into its own fresh scratch location, which is wiped
// and removed before transcribe() returns.
class WhisperCliBackend : public WhisperBackend {
public:
    explicit WhisperCliBackend(const SecureTempStore& temp_store);

    std::expected<TranscriptResult, Error> transcribe(const TranscriptionRequest& request) override;

    static std::vector<std::string> build_arguments(const TranscriptionRequest& request,
                                                    const std::filesystem::path& output_base);

private:
    const SecureTempStore& temp_store_;
};
