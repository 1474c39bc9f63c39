#pragma once

#include "error.hpp"

#include <expected>
#include <filesystem>
#include <string>

// Layout of a packaged whisper.cpp bundle:
//   <root>/bin/whisper-cli
//   <root>/models/ggml-*.bin
struct WhisperBundle {
    std::filesystem::path root;
    std::filesystem::path binary;
    std::filesystem::path models_dir;
    std::filesystem::path default_model;
};

inline constexpr const char* default_model_name = "ggml-base.bin";

// Validates the bundle rooted at `root`: the directory must exist, the binary
// must be executable and the default model must be present.
std::expected<WhisperBundle, Error> resolve_bundle(const std::filesystem::path& root);

// Picks the model to run: a custom path wins over a selected file name in the
// bundle's models directory, which wins over the default model. An explicitly
// chosen model that does not exist is an error, never a silent fallback.
std::expected<std::filesystem::path, Error> resolve_model(const WhisperBundle& bundle,
                                                          const std::string& selected_model,
                                                          const std::string& custom_model_path);

bool is_executable_file(const std::filesystem::path& path);
