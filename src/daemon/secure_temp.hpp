#pragma once

#include "error.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

// Private, backup-excluded scratch storage for raw audio and engine output.
//
// Scratch locations are created with mkdtemp() under a per-user root, forced to
// mode 0700 and tagged with CACHEDIR.TAG so backup tools that honour the Cache
// Directory Tagging standard skip them. Files inside are created exclusively
// with mode 0600. Cleanup always zeroes file contents before unlinking.
class SecureTempStore {
public:
    static constexpr size_t wipe_chunk_size = 64 * 1024;
    static constexpr std::string_view cachedir_signature = "Signature: 8a477f597d28d172789f06886806bc55";

    explicit SecureTempStore(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    // Creates `<root>/<prefix>-XXXXXX` with mode 0700, excluded from backups.
    std::expected<std::filesystem::path, Error> create_scratch_location(std::string_view prefix) const;

    // Creates an empty `<directory>/<name>.<extension>` with mode 0600.
    // Fails if the file already exists.
    std::expected<std::filesystem::path, Error> create_secure_file(const std::filesystem::path& directory,
                                                                  std::string_view name,
                                                                  std::string_view extension) const;

    // Fresh scratch location holding one empty `recording-<id>.wav`.
    std::expected<std::filesystem::path, Error> make_recording() const;

    // Overwrites the file's current length with zeros and syncs it to storage.
    // A missing file is a no-op.
    static std::expected<void, Error> wipe_file(const std::filesystem::path& path);

    static std::expected<void, Error> enforce_user_only_permissions(const std::filesystem::path& path);

    // Wipes `path`, then removes it together with its parent directory when
    // that directory is a scratch location. A wipe failure does not prevent
    // removal; the removal error wins when both fail. Missing target is a no-op.
    static std::expected<void, Error> wipe_and_remove(const std::filesystem::path& path);

    // Wipes every regular file in a scratch location, then removes it.
    static std::expected<void, Error> wipe_and_remove_directory(const std::filesystem::path& directory);

    static bool is_scratch_location(const std::filesystem::path& directory);

private:
    static std::expected<void, Error> mark_excluded_from_backup(const std::filesystem::path& directory);

    std::filesystem::path root_;
};
