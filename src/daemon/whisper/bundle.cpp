#include "whisper/bundle.hpp"

#include <format>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

Error bundle_missing(std::string message) {
    return Error{ErrorKind::BundleMissing, std::move(message)};
}

} // namespace

bool is_executable_file(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

std::expected<WhisperBundle, Error> resolve_bundle(const fs::path& root) {
    WhisperBundle bundle{
        .root = root,
        .binary = root / "bin" / "whisper-cli",
        .models_dir = root / "models",
        .default_model = root / "models" / default_model_name,
    };

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return std::unexpected(bundle_missing(std::format(
            "{} not found. Install a whisper.cpp bundle (bin/whisper-cli, models/) there "
            "or set engine.bundle_dir.", root.string())));
    }
    if (!is_executable_file(bundle.binary)) {
        return std::unexpected(bundle_missing(std::format(
            "whisper-cli binary missing or not executable at {}", bundle.binary.string())));
    }
    if (!fs::exists(bundle.default_model, ec)) {
        return std::unexpected(bundle_missing(std::format(
            "Model file missing at {}", bundle.default_model.string())));
    }

    return bundle;
}

std::expected<fs::path, Error> resolve_model(const WhisperBundle& bundle,
                                             const std::string& selected_model,
                                             const std::string& custom_model_path) {
    std::error_code ec;

    if (!custom_model_path.empty()) {
        fs::path custom(custom_model_path);
        if (!fs::exists(custom, ec)) {
            return std::unexpected(bundle_missing(std::format(
                "Custom model not found at {}.", custom.string())));
        }
        return custom;
    }

    if (!selected_model.empty()) {
        auto candidate = bundle.models_dir / selected_model;
        if (!fs::exists(candidate, ec)) {
            return std::unexpected(bundle_missing(std::format(
                "Model not found at {}.", candidate.string())));
        }
        return candidate;
    }

    return bundle.default_model;
}
