#include <catch2/catch_test_macros.hpp>

#include "secure_temp.hpp"

#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct TmpDir {
    fs::path path;

    TmpDir() {
        std::string tmpl = (fs::temp_directory_path() / "hs_test_secure_XXXXXX").string();
        path = ::mkdtemp(tmpl.data());
    }

    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

fs::perms mode_of(const fs::path& p) {
    return fs::status(p).permissions() & fs::perms::all;
}

void fill_file(const fs::path& p, size_t size, char byte) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    std::string data(size, byte);
    f << data;
}

// Sets a mode for the scope and puts the old one back, so TmpDir can clean up.
struct ModeGuard {
    fs::path path;
    fs::perms saved;

    ModeGuard(fs::path p, fs::perms mode) : path(std::move(p)), saved(mode_of(path)) {
        fs::permissions(path, mode);
    }
    ~ModeGuard() {
        std::error_code ec;
        fs::permissions(path, saved, ec);
    }
};

// Permission bits do not stop root, so failure paths cannot be provoked.
bool running_as_root() {
    return ::geteuid() == 0;
}

std::string first_line(const fs::path& p) {
    std::ifstream f(p);
    std::string line;
    std::getline(f, line);
    return line;
}

} // namespace

TEST_CASE("SecureTempStore", "[secure_temp]") {
    TmpDir root;
    SecureTempStore store(root.path / "scratch");

    SECTION("ScratchLocationIsPrivateAndTagged") {
        auto dir = store.create_scratch_location("holdscribe-test");
        REQUIRE(dir.has_value());
        REQUIRE(fs::is_directory(*dir));
        REQUIRE(dir->parent_path() == store.root());
        REQUIRE(dir->filename().string().starts_with("holdscribe-test-"));
        REQUIRE(mode_of(*dir) == fs::perms::owner_all);

        REQUIRE(fs::exists(*dir / "CACHEDIR.TAG"));
        REQUIRE(first_line(*dir / "CACHEDIR.TAG") == SecureTempStore::cachedir_signature);
        REQUIRE(SecureTempStore::is_scratch_location(*dir));
    }

    SECTION("ScratchLocationsAreUnique") {
        auto a = store.create_scratch_location("holdscribe-whisper");
        auto b = store.create_scratch_location("holdscribe-whisper");
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(*a != *b);
    }

    SECTION("PrivateEvenWithPermissiveUmask") {
        auto old = ::umask(0);
        auto dir = store.create_scratch_location("holdscribe-umask");
        ::umask(old);
        REQUIRE(dir.has_value());
        REQUIRE(mode_of(*dir) == fs::perms::owner_all);
    }

    SECTION("SecureFileIsExclusiveAndUserOnly") {
        auto dir = store.create_scratch_location("holdscribe-test");
        REQUIRE(dir.has_value());

        auto file = store.create_secure_file(*dir, "recording-1", "wav");
        REQUIRE(file.has_value());
        REQUIRE(file->filename() == "recording-1.wav");
        REQUIRE(fs::file_size(*file) == 0);
        REQUIRE(mode_of(*file) == (fs::perms::owner_read | fs::perms::owner_write));

        auto again = store.create_secure_file(*dir, "recording-1", "wav");
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error().kind == ErrorKind::IoError);
    }

    SECTION("SecureFileInMissingDirectoryFails") {
        auto file = store.create_secure_file(root.path / "nope", "a", "txt");
        REQUIRE_FALSE(file.has_value());
        REQUIRE(file.error().kind == ErrorKind::IoError);
    }

    SECTION("MakeRecording") {
        auto rec = store.make_recording();
        REQUIRE(rec.has_value());
        REQUIRE(rec->extension() == ".wav");
        REQUIRE(rec->filename().string().starts_with("recording-"));
        REQUIRE(rec->parent_path().filename().string().starts_with("holdscribe-recording-"));
        REQUIRE(SecureTempStore::is_scratch_location(rec->parent_path()));
        REQUIRE(mode_of(*rec) == (fs::perms::owner_read | fs::perms::owner_write));
    }

    SECTION("WipeZeroesContents") {
        auto path = root.path / "data.bin";
        fill_file(path, 10000, 'A');

        REQUIRE(SecureTempStore::wipe_file(path).has_value());
        REQUIRE(fs::file_size(path) == 10000);

        std::ifstream f(path, std::ios::binary);
        std::vector<char> bytes(10000);
        f.read(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        REQUIRE(f.gcount() == 10000);
        for (char b : bytes) REQUIRE(b == 0);
    }

    SECTION("WipeSpansSeveralChunks") {
        auto path = root.path / "big.bin";
        size_t size = SecureTempStore::wipe_chunk_size * 2 + 123;
        fill_file(path, size, 'Z');

        REQUIRE(SecureTempStore::wipe_file(path).has_value());

        std::ifstream f(path, std::ios::binary);
        std::vector<char> bytes(size);
        f.read(bytes.data(), static_cast<std::streamsize>(size));
        REQUIRE(static_cast<size_t>(f.gcount()) == size);
        bool all_zero = true;
        for (char b : bytes) all_zero = all_zero && b == 0;
        REQUIRE(all_zero);
    }

    SECTION("WipeMissingFileIsNoop") {
        REQUIRE(SecureTempStore::wipe_file(root.path / "missing").has_value());
    }

    SECTION("WipeAndRemoveLeavesNothing") {
        auto rec = store.make_recording();
        REQUIRE(rec.has_value());
        fill_file(*rec, 10000, 'S');

        // Still-open descriptor sees the inode after unlink
        int fd = ::open(rec->c_str(), O_RDONLY | O_CLOEXEC);
        REQUIRE(fd >= 0);

        REQUIRE(SecureTempStore::wipe_and_remove(*rec).has_value());
        REQUIRE_FALSE(fs::exists(*rec));
        REQUIRE_FALSE(fs::exists(rec->parent_path()));

        std::vector<char> bytes(10000, 'x');
        ssize_t n = ::pread(fd, bytes.data(), bytes.size(), 0);
        ::close(fd);
        REQUIRE(n == 10000);
        bool all_zero = true;
        for (char b : bytes) all_zero = all_zero && b == 0;
        REQUIRE(all_zero);
    }

    SECTION("WipeAndRemoveIsIdempotent") {
        auto rec = store.make_recording();
        REQUIRE(rec.has_value());

        REQUIRE(SecureTempStore::wipe_and_remove(*rec).has_value());
        REQUIRE(SecureTempStore::wipe_and_remove(*rec).has_value());
    }

    SECTION("WipeAndRemoveKeepsUntaggedParent") {
        auto path = root.path / "loose.wav";
        fill_file(path, 100, 'L');

        REQUIRE(SecureTempStore::wipe_and_remove(path).has_value());
        REQUIRE_FALSE(fs::exists(path));
        REQUIRE(fs::is_directory(root.path));
    }

    SECTION("WipeFailureDoesNotBlockRemoval") {
        if (running_as_root()) {
            WARN("skipped: running as root");
            return;
        }
        auto rec = store.make_recording();
        REQUIRE(rec.has_value());
        fill_file(*rec, 100, 'W');
        fs::permissions(*rec, fs::perms::owner_read);

        auto result = SecureTempStore::wipe_and_remove(*rec);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::CleanupError);
        REQUIRE(result.error().message.starts_with("unable to open for wiping"));
        REQUIRE_FALSE(fs::exists(*rec));
        REQUIRE_FALSE(fs::exists(rec->parent_path()));
    }

    SECTION("RemovalFailureIsReported") {
        if (running_as_root()) {
            WARN("skipped: running as root");
            return;
        }
        auto rec = store.make_recording();
        REQUIRE(rec.has_value());
        fill_file(*rec, 100, 'R');
        auto scratch = rec->parent_path();

        {
            ModeGuard locked(store.root(), fs::perms::owner_read | fs::perms::owner_exec);
            auto result = SecureTempStore::wipe_and_remove(*rec);
            REQUIRE_FALSE(result.has_value());
            REQUIRE(result.error().kind == ErrorKind::CleanupError);
            REQUIRE(result.error().message.starts_with("cannot remove " + scratch.string()));
        }
        REQUIRE(fs::is_directory(scratch));
    }

    SECTION("RemovalErrorWinsOverWipeError") {
        if (running_as_root()) {
            WARN("skipped: running as root");
            return;
        }
        auto rec = store.make_recording();
        REQUIRE(rec.has_value());
        fill_file(*rec, 100, 'B');
        fs::permissions(*rec, fs::perms::owner_read);

        ModeGuard locked(store.root(), fs::perms::owner_read | fs::perms::owner_exec);
        auto result = SecureTempStore::wipe_and_remove(*rec);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::CleanupError);
        REQUIRE(result.error().message.starts_with("cannot remove"));
        REQUIRE(result.error().message.find("wiping") == std::string::npos);
    }

    SECTION("WipeAndRemoveDirectory") {
        auto dir = store.create_scratch_location("holdscribe-whisper");
        REQUIRE(dir.has_value());
        fill_file(*dir / "transcript.txt", 500, 't');
        fill_file(*dir / "transcript.srt", 500, 's');

        REQUIRE(SecureTempStore::wipe_and_remove_directory(*dir).has_value());
        REQUIRE_FALSE(fs::exists(*dir));
        REQUIRE(SecureTempStore::wipe_and_remove_directory(*dir).has_value());
    }

    SECTION("EnforceUserOnlyPermissions") {
        auto path = root.path / "shared.txt";
        fill_file(path, 10, 'p');
        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write |
                              fs::perms::group_read | fs::perms::others_read);

        REQUIRE(SecureTempStore::enforce_user_only_permissions(path).has_value());
        REQUIRE(mode_of(path) == (fs::perms::owner_read | fs::perms::owner_write));
        REQUIRE(SecureTempStore::enforce_user_only_permissions(root.path / "missing").has_value());
    }

    SECTION("PlainDirectoryIsNotScratch") {
        REQUIRE_FALSE(SecureTempStore::is_scratch_location(root.path));
    }
}
