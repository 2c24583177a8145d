#include "io/wav_reader.h"

#include <cstring>
#include <fstream>
#include <iterator>
#include <string>

namespace VoiceShaper {

namespace {

uint16_t readLE16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readLE32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0])
         | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16)
         | (static_cast<uint32_t>(p[3]) << 24);
}

bool hasTag(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

float decodeSample(const uint8_t* p, uint16_t bitsPerSample) {
    switch (bitsPerSample) {
        case 8:
            return (static_cast<float>(p[0]) - 128.0f) / 128.0f;
        case 16:
            return static_cast<float>(static_cast<int16_t>(readLE16(p))) / 32768.0f;
        case 24: {
            // Sign-extend through the top byte of a 32-bit word
            const int32_t v = static_cast<int32_t>(
                (static_cast<uint32_t>(p[0]) << 8)
              | (static_cast<uint32_t>(p[1]) << 16)
              | (static_cast<uint32_t>(p[2]) << 24)) >> 8;
            return static_cast<float>(v) / 8388608.0f;
        }
        case 32:
            return static_cast<float>(static_cast<int32_t>(readLE32(p))) / 2147483648.0f;
        default:
            return 0.0f;
    }
}

} // namespace

Result<WavData> parseWav(std::span<const uint8_t> bytes) {
    using R = Result<WavData>;

    if (bytes.size() < 12 || !hasTag(bytes.data(), "RIFF") || !hasTag(bytes.data() + 8, "WAVE")) {
        return R::failure(ErrorCode::UnsupportedFormat, "not a RIFF/WAVE file");
    }

    WavData wav;
    bool haveFormat = false;
    const uint8_t* data = nullptr;
    size_t dataSize = 0;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        const size_t chunkSize = readLE32(chunk + 4);
        const size_t bodyStart = pos + 8;
        const size_t available = bytes.size() - bodyStart;

        if (hasTag(chunk, "fmt ")) {
            if (chunkSize < 16 || available < 16) {
                return R::failure(ErrorCode::IoError, "truncated fmt chunk");
            }
            const uint8_t* fmt = chunk + 8;
            wav.formatTag = readLE16(fmt);
            wav.channels = readLE16(fmt + 2);
            wav.sampleRate = static_cast<int>(readLE32(fmt + 4));
            wav.bitsPerSample = readLE16(fmt + 14);

            if (wav.formatTag == kWaveFormatExtensible) {
                // cbSize(2) validBits(2) channelMask(4) subFormat GUID(16)
                if (chunkSize < 40 || available < 40) {
                    return R::failure(ErrorCode::IoError, "truncated extensible fmt chunk");
                }
                wav.formatTag = readLE16(fmt + 24);
            }
            haveFormat = true;
        } else if (hasTag(chunk, "data")) {
            if (chunkSize > available) {
                return R::failure(ErrorCode::IoError, "truncated data chunk");
            }
            data = chunk + 8;
            dataSize = chunkSize;
        }

        // Chunks are word aligned
        pos = bodyStart + chunkSize + (chunkSize & 1u);
    }

    if (!haveFormat) {
        return R::failure(ErrorCode::UnsupportedFormat, "missing fmt chunk");
    }
    if (wav.formatTag != kWaveFormatPcm) {
        return R::failure(ErrorCode::UnsupportedFormat,
                          "format tag " + std::to_string(wav.formatTag) + " is not integer PCM");
    }
    if (wav.bitsPerSample != 8 && wav.bitsPerSample != 16
        && wav.bitsPerSample != 24 && wav.bitsPerSample != 32) {
        return R::failure(ErrorCode::UnsupportedFormat,
                          "unsupported sample width " + std::to_string(wav.bitsPerSample) + " bits");
    }
    if (wav.channels == 0 || wav.sampleRate <= 0) {
        return R::failure(ErrorCode::UnsupportedFormat, "invalid channel count or sample rate");
    }
    if (data == nullptr) {
        return R::failure(ErrorCode::IoError, "missing data chunk");
    }

    const size_t bytesPerSample = wav.bitsPerSample / 8u;
    const size_t frameBytes = bytesPerSample * wav.channels;
    const size_t sampleCount = (dataSize / frameBytes) * wav.channels;

    wav.samples.resize(sampleCount);
    for (size_t i = 0; i < sampleCount; ++i) {
        wav.samples[i] = decodeSample(data + i * bytesPerSample, wav.bitsPerSample);
    }

    return R::success(std::move(wav));
}

Result<WavData> readWavFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<WavData>::failure(ErrorCode::IoError, "cannot open " + path.string());
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<WavData>::failure(ErrorCode::IoError, "read error on " + path.string());
    }
    return parseWav(bytes);
}

} // namespace VoiceShaper
