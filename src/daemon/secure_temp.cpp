#include "secure_temp.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <fstream>
#include <optional>
#include <string>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

Error io_error(std::string message) {
    return Error{ErrorKind::IoError, std::move(message)};
}

Error errno_error(std::string_view what, const fs::path& path, int err) {
    return io_error(std::format("{} {}: {}", what, path.string(), std::strerror(err)));
}

// Closes the descriptor on scope exit.
struct FdGuard {
    int fd;
    explicit FdGuard(int f) : fd(f) {}
    ~FdGuard() {
        if (fd >= 0) ::close(fd);
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
};

} // namespace

SecureTempStore::SecureTempStore(fs::path root) : root_(std::move(root)) {}

std::expected<fs::path, Error> SecureTempStore::create_scratch_location(std::string_view prefix) const {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        return std::unexpected(io_error(std::format("cannot create {}: {}", root_.string(), ec.message())));
    }

    std::string tmpl = (root_ / std::format("{}-XXXXXX", prefix)).string();
    if (::mkdtemp(tmpl.data()) == nullptr) {
        return std::unexpected(errno_error("mkdtemp", tmpl, errno));
    }
    fs::path dir(tmpl);

    // mkdtemp already uses 0700, but an unusual umask must not loosen it.
    if (::chmod(dir.c_str(), S_IRWXU) < 0) {
        int err = errno;
        fs::remove(dir, ec);
        return std::unexpected(errno_error("chmod", dir, err));
    }

    auto tagged = mark_excluded_from_backup(dir);
    if (!tagged) {
        fs::remove_all(dir, ec);
        return std::unexpected(tagged.error());
    }

    return dir;
}

std::expected<fs::path, Error> SecureTempStore::create_secure_file(const fs::path& directory,
                                                                   std::string_view name,
                                                                   std::string_view extension) const {
    auto path = directory / std::format("{}.{}", name, extension);

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        return std::unexpected(errno_error("cannot create", path, errno));
    }
    FdGuard guard(fd);

    if (::fchmod(fd, S_IRUSR | S_IWUSR) < 0) {
        int err = errno;
        ::unlink(path.c_str());
        return std::unexpected(errno_error("fchmod", path, err));
    }

    return path;
}

std::expected<fs::path, Error> SecureTempStore::make_recording() const {
    auto dir = create_scratch_location("holdscribe-recording");
    if (!dir) {
        return std::unexpected(Error{ErrorKind::RecorderFailed, dir.error().message});
    }

    // Reuse the random mkdtemp suffix as the recording id.
    auto dir_name = dir->filename().string();
    auto id = dir_name.substr(dir_name.rfind('-') + 1);

    auto file = create_secure_file(*dir, "recording-" + id, "wav");
    if (!file) {
        std::error_code ec;
        fs::remove_all(*dir, ec);
        return std::unexpected(Error{
            ErrorKind::RecorderFailed,
            "Unable to create secure recording file: " + file.error().message});
    }
    return *file;
}

std::expected<void, Error> SecureTempStore::wipe_file(const fs::path& path) {
    int fd = ::open(path.c_str(), O_WRONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) return {};
        return std::unexpected(errno_error("unable to open for wiping", path, errno));
    }
    FdGuard guard(fd);

    struct stat st {};
    if (::fstat(fd, &st) < 0) {
        return std::unexpected(errno_error("fstat", path, errno));
    }
    if (!S_ISREG(st.st_mode)) return {};

    static const std::vector<char> zeros(wipe_chunk_size, 0);
    off_t offset = 0;
    off_t remaining = st.st_size;
    while (remaining > 0) {
        size_t chunk = static_cast<size_t>(std::min<off_t>(remaining, static_cast<off_t>(zeros.size())));
        ssize_t n = ::pwrite(fd, zeros.data(), chunk, offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_error("write failed while wiping", path, errno));
        }
        offset += n;
        remaining -= n;
    }

    if (::fsync(fd) < 0) {
        return std::unexpected(errno_error("fsync", path, errno));
    }
    return {};
}

std::expected<void, Error> SecureTempStore::enforce_user_only_permissions(const fs::path& path) {
    if (::chmod(path.c_str(), S_IRUSR | S_IWUSR) < 0) {
        if (errno == ENOENT) return {};
        return std::unexpected(errno_error("chmod", path, errno));
    }
    return {};
}

std::expected<void, Error> SecureTempStore::wipe_and_remove(const fs::path& path) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (!fs::exists(status)) return {};

    std::optional<Error> wipe_error;
    if (fs::is_regular_file(status)) {
        auto wiped = wipe_file(path);
        if (!wiped) wipe_error = wiped.error();
    }

    // Only scratch locations are removed wholesale; anything else loses just the file.
    auto dir = path.parent_path();
    std::string remove_error;
    if (is_scratch_location(dir)) {
        fs::remove_all(dir, ec);
        if (ec) remove_error = std::format("cannot remove {}: {}", dir.string(), ec.message());
    } else {
        fs::remove(path, ec);
        if (ec) remove_error = std::format("cannot remove {}: {}", path.string(), ec.message());
    }

    if (!remove_error.empty()) {
        return std::unexpected(Error{ErrorKind::CleanupError, remove_error});
    }
    if (wipe_error) {
        return std::unexpected(Error{ErrorKind::CleanupError, wipe_error->message});
    }
    return {};
}

std::expected<void, Error> SecureTempStore::wipe_and_remove_directory(const fs::path& directory) {
    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(directory, ec))) return {};

    std::optional<Error> wipe_error;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file(ec) || entry.is_symlink(ec)) continue;
        auto wiped = wipe_file(entry.path());
        if (!wiped && !wipe_error) wipe_error = wiped.error();
    }

    fs::remove_all(directory, ec);
    if (ec) {
        return std::unexpected(Error{
            ErrorKind::CleanupError,
            std::format("cannot remove {}: {}", directory.string(), ec.message())});
    }
    if (wipe_error) {
        return std::unexpected(Error{ErrorKind::CleanupError, wipe_error->message});
    }
    return {};
}

bool SecureTempStore::is_scratch_location(const fs::path& directory) {
    std::ifstream tag(directory / "CACHEDIR.TAG");
    if (!tag.is_open()) return false;

    std::string first_line;
    std::getline(tag, first_line);
    return first_line.starts_with(cachedir_signature);
}

std::expected<void, Error> SecureTempStore::mark_excluded_from_backup(const fs::path& directory) {
    auto tag_path = directory / "CACHEDIR.TAG";
    std::ofstream tag(tag_path, std::ios::trunc);
    if (!tag.is_open()) {
        return std::unexpected(io_error("cannot write " + tag_path.string()));
    }

    tag << cachedir_signature << "\n"
        << "# This file is a cache directory tag created by holdscribe.\n"
        << "# It holds private audio scratch data and must not be backed up.\n"
        << "# For information about cache directory tags, see https://bford.info/cachedir/\n";
    tag.flush();
    if (!tag) {
        return std::unexpected(io_error("cannot write " + tag_path.string()));
    }
    return {};
}
