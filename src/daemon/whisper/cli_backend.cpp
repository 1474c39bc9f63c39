#include "cli_backend.hpp"
#include "bundle.hpp"

#include "platform/subprocess.hpp"
#include "text_util.hpp"

#include <chrono>
#include <format>
#include <fstream>
#include <print>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

WhisperCliBackend::WhisperCliBackend(const SecureTempStore& temp_store)
    : temp_store_(temp_store) {}

std::vector<std::string> WhisperCliBackend::build_arguments(const TranscriptionRequest& request,
                                                            const fs::path& output_base) {
    std::vector<std::string> args = {
        request.executable.string(),
        "-m", request.model.string(),
        "-f", request.audio_file.string(),
        "-otxt",
        "-of", output_base.string(),
        "-np",
    };
    if (!request.language.empty()) {
        args.insert(args.end(), {"-l", request.language});
    }
    if (request.threads > 0) {
        args.insert(args.end(), {"-t", std::to_string(request.threads)});
    }
    return args;
}

std::expected<TranscriptResult, Error> WhisperCliBackend::transcribe(const TranscriptionRequest& request) {
    std::error_code ec;
    if (!is_executable_file(request.executable)) {
        return std::unexpected(Error{ErrorKind::BundleMissing, std::format(
            "whisper-cli binary missing or not executable at {}", request.executable.string())});
    }
    if (!fs::exists(request.model, ec)) {
        return std::unexpected(Error{ErrorKind::BundleMissing, std::format(
            "Model file missing at {}", request.model.string())});
    }
    if (!fs::exists(request.audio_file, ec)) {
        return std::unexpected(Error{ErrorKind::BundleMissing, std::format(
            "Recording missing at {}", request.audio_file.string())});
    }

    auto scratch = temp_store_.create_scratch_location("holdscribe-whisper");
    if (!scratch) {
        return std::unexpected(scratch.error());
    }
    auto output_base = *scratch / "transcript";

    auto start = std::chrono::steady_clock::now();

    auto run = [&]() -> std::expected<std::string, Error> {
        auto proc = platform::run_process(build_arguments(request, output_base), {
            .stdout_mode = platform::Stream::Discard,
            .stderr_mode = platform::Stream::Capture,
        });
        if (!proc) {
            return std::unexpected(Error{ErrorKind::EngineFailed, proc.error()});
        }
        if (proc->exit_code != 0) {
            auto message = text::trim(proc->stderr_text);
            if (message.empty()) message = std::format("exit code {}", proc->exit_code);
            return std::unexpected(Error{ErrorKind::EngineFailed, std::move(message)});
        }

        auto transcript_path = fs::path(output_base.string() + ".txt");
        std::ifstream f(transcript_path);
        if (!f.is_open()) {
            return std::unexpected(Error{ErrorKind::IoError, std::format(
                "transcript not found at {}", transcript_path.string())});
        }
        std::ostringstream contents;
        contents << f.rdbuf();
        if (f.bad()) {
            return std::unexpected(Error{ErrorKind::IoError, std::format(
                "unable to read {}", transcript_path.string())});
        }
        return text::trim(contents.str());
    };

    auto text = run();

    auto cleaned = SecureTempStore::wipe_and_remove_directory(*scratch);
    if (!cleaned) {
        std::println(stderr, "whisper: {}", describe(cleaned.error()));
    }

    if (!text) {
        return std::unexpected(text.error());
    }

    auto end = std::chrono::steady_clock::now();
    return TranscriptResult{
        .text = std::move(*text),
        .processing_s = std::chrono::duration<double>(end - start).count(),
    };
}
