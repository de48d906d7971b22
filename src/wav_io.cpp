#include "wav_io.hpp"

#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

#include <cstring>
#include <filesystem>
#include <iostream>

namespace sobotta {

namespace {

drwav_data_format float_mono_format(int sample_rate) {
    drwav_data_format format;
    format.container = drwav_container_riff;
    format.format = DR_WAVE_FORMAT_IEEE_FLOAT;
    format.channels = 1;
    format.sampleRate = static_cast<drwav_uint32>(sample_rate);
    format.bitsPerSample = 32;
    return format;
}

} // namespace

Error encode_wav(const std::vector<float>& samples, int sample_rate, std::vector<uint8_t>& out) {
    drwav_data_format format = float_mono_format(sample_rate);

    void* data = nullptr;
    size_t data_size = 0;
    drwav wav;
    if (!drwav_init_memory_write(&wav, &data, &data_size, &format, nullptr)) {
        return Error::make(ErrorCode::IoError, "Failed to initialise WAV encoder");
    }

    drwav_uint64 written = drwav_write_pcm_frames(&wav, samples.size(), samples.data());
    drwav_uninit(&wav);  // Finalises the header and the size fields

    if (written != samples.size()) {
        drwav_free(data, nullptr);
        return Error::make(ErrorCode::IoError, "Short write while encoding WAV");
    }

    out.resize(data_size);
    if (data_size > 0) {
        std::memcpy(out.data(), data, data_size);
    }
    drwav_free(data, nullptr);
    return {};
}

Error save_wav(const std::string& path, const std::vector<float>& samples, int sample_rate) {
    std::filesystem::path dir = std::filesystem::path(path).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return Error::make(ErrorCode::IoError,
                               "Failed to create " + dir.string() + ": " + ec.message());
        }
    }

    drwav_data_format format = float_mono_format(sample_rate);
    drwav wav;
    if (!drwav_init_file_write(&wav, path.c_str(), &format, nullptr)) {
        return Error::make(ErrorCode::IoError, "Cannot open WAV for writing: " + path);
    }

    drwav_uint64 written = drwav_write_pcm_frames(&wav, samples.size(), samples.data());
    drwav_uninit(&wav);

    if (written != samples.size()) {
        return Error::make(ErrorCode::IoError, "Short write to " + path);
    }
    return {};
}

Error read_wav(const std::string& path, WavData& out) {
    drwav wav;
    if (!drwav_init_file(&wav, path.c_str(), nullptr)) {
        return Error::make(ErrorCode::IoError, "Cannot read WAV file: " + path);
    }

    if (wav.channels == 0 || wav.sampleRate == 0) {
        drwav_uninit(&wav);
        return Error::make(ErrorCode::IoError, "Invalid WAV header: " + path);
    }

    const drwav_uint64 frames = wav.totalPCMFrameCount;
    out.samples.resize(static_cast<size_t>(frames) * wav.channels);
    out.sample_rate = static_cast<int>(wav.sampleRate);
    out.channels = static_cast<int>(wav.channels);

    // dr_wav converts integer PCM to float by dividing by 2^(bits-1)
    drwav_uint64 read = drwav_read_pcm_frames_f32(&wav, frames, out.samples.data());
    drwav_uninit(&wav);

    if (read < frames) {
        std::cerr << "[wav] " << path << ": read " << read << " of " << frames
                  << " frames" << std::endl;
        out.samples.resize(static_cast<size_t>(read) * out.channels);
    }

    return {};
}

} // namespace sobotta
