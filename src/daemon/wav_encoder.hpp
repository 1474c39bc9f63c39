#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <expected>
#include <fcntl.h>
#include <filesystem>
#include <span>
#include <string>
#include <unistd.h>
#include <vector>

// RIFF/WAVE encoding for mono 16-bit PCM, the input format whisper-cli expects.
namespace wav {

inline constexpr size_t header_size = 44;

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(header_size + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + header_size, samples.data(), data_size);
    }

    return out;
}

// Writes an encoded WAV into an existing file, truncating it. The file is
// opened without O_CREAT so its secure permissions are kept as created.
inline std::expected<void, std::string> write_file(const std::filesystem::path& path,
                                                   std::span<const int16_t> samples,
                                                   uint32_t sample_rate) {
    auto data = encode(samples, sample_rate);

    int fd = ::open(path.c_str(), O_WRONLY | O_TRUNC | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) {
        return std::unexpected("open " + path.string() + ": " + std::strerror(errno));
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            return std::unexpected("write " + path.string() + ": " + std::strerror(err));
        }
        written += static_cast<size_t>(n);
    }

    if (::close(fd) < 0) {
        return std::unexpected("close " + path.string() + ": " + std::strerror(errno));
    }
    return {};
}

} // namespace wav
