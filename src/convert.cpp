// SPHERE <-> WAV <-> RAW conversion.
//
// WAV I/O uses dr_wav (mackron/dr_libs).

#define DR_WAV_IMPLEMENTATION

#include "dr_wav.h"

#include "sphere/convert.hpp"

#include "sphere/error.hpp"
#include "sphere/params.hpp"
#include "sphere/sample.hpp"
#include "sphere/session.hpp"

#include <cctype>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace sphere {

// ─── Format Detection ────────────────────────────────────────────────────────

std::string format_suffix(AudioFormat fmt) {
    switch (fmt) {
    case AudioFormat::SPHERE:
        return "sph";
    case AudioFormat::WAV:
        return "wav";
    case AudioFormat::RAW:
        return "raw";
    default:
        throw std::runtime_error("No suffix for unknown audio format");
    }
}

AudioFormat parse_format_name(const std::string &name) {
    std::string lower = name;
    for (auto &c : lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "sph" || lower == "sphere" || lower == "nist")
        return AudioFormat::SPHERE;
    if (lower == "wav" || lower == "wave")
        return AudioFormat::WAV;
    if (lower == "raw" || lower == "pcm")
        return AudioFormat::RAW;
    return AudioFormat::Unknown;
}

AudioFormat detect_format_by_extension(const std::string &path) {
    auto dot = path.rfind('.');
    auto slash = path.find_last_of("/\\");
    if (dot == std::string::npos ||
        (slash != std::string::npos && dot < slash))
        return AudioFormat::Unknown;
    return parse_format_name(path.substr(dot + 1));
}

AudioFormat detect_format_by_magic(const uint8_t *data, size_t len) {
    if (len >= NIST_MAGIC_SIZE &&
        std::memcmp(data, NIST_MAGIC, NIST_MAGIC_SIZE) == 0) {
        return AudioFormat::SPHERE;
    }

    // RIFF....WAVE
    if (len >= 12 && data[0] == 'R' && data[1] == 'I' && data[2] == 'F' &&
        data[3] == 'F' && data[8] == 'W' && data[9] == 'A' &&
        data[10] == 'V' && data[11] == 'E') {
        return AudioFormat::WAV;
    }

    return AudioFormat::Unknown;
}

AudioFormat detect_file_format(const std::string &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open audio file: " + path);
    }
    uint8_t header[12];
    file.read(reinterpret_cast<char *>(header), sizeof(header));
    size_t bytes_read = static_cast<size_t>(file.gcount());
    return detect_format_by_magic(header, bytes_read);
}

// ─── Readers ─────────────────────────────────────────────────────────────────

PcmBuffer read_sphere_pcm(const std::string &path) {
    Session in(path, Mode::Read);
    auto params = in.getparams();

    PcmBuffer pcm;
    pcm.channels = params.channel_count;
    pcm.sample_rate = params.sample_rate;
    pcm.sample_n_bytes = params.sample_n_bytes;
    pcm.samples = in.readsamples(params.sample_count);
    pcm.sphere_header = in.header();
    in.close();
    return pcm;
}

PcmBuffer read_wav_pcm(const std::string &path) {
    drwav wav;
    if (!drwav_init_file(&wav, path.c_str(), nullptr)) {
        throw std::runtime_error("Cannot open WAV file: " + path);
    }

    int format = wav.translatedFormatTag;
    int bits = wav.bitsPerSample;
    int channels = wav.channels;
    int sample_rate = static_cast<int>(wav.sampleRate);
    size_t total_frames = static_cast<size_t>(wav.totalPCMFrameCount);

    if (format != DR_WAVE_FORMAT_PCM || (bits != 8 && bits != 16 && bits != 32)) {
        drwav_uninit(&wav);
        throw UnsupportedWidthError(
            "Unsupported WAV format: format=" + std::to_string(format) +
            " bits=" + std::to_string(bits));
    }

    std::vector<int32_t> interleaved(total_frames * channels);
    size_t frames_read = static_cast<size_t>(
        drwav_read_pcm_frames_s32(&wav, total_frames, interleaved.data()));
    drwav_uninit(&wav);
    interleaved.resize(frames_read * channels);

    // dr_wav left-justifies every width into 32 bits; 8-bit WAV is unsigned
    // and comes back re-centred on zero.
    int shift = 32 - bits;
    for (auto &s : interleaved)
        s >>= shift;

    PcmBuffer pcm;
    pcm.channels = channels;
    pcm.sample_rate = sample_rate;
    pcm.sample_n_bytes = bits / 8;
    pcm.samples = std::move(interleaved);
    return pcm;
}

// ─── Writers ─────────────────────────────────────────────────────────────────

void write_sphere_pcm(const std::string &path, const PcmBuffer &pcm) {
    Session out(path, Mode::Write);
    if (pcm.sphere_header) {
        out.setparams(*pcm.sphere_header);
    }
    Header fields;
    fields.set(field::CHANNEL_COUNT, int64_t{pcm.channels});
    fields.set(field::SAMPLE_N_BYTES, int64_t{pcm.sample_n_bytes});
    fields.set(field::SAMPLE_COUNT, pcm.frames());
    fields.set(field::SAMPLE_RATE, int64_t{pcm.sample_rate});
    out.setparams(fields);
    out.writesamples(pcm.samples);
    out.close();
}

void write_wav_pcm(const std::string &path, const PcmBuffer &pcm) {
    check_sample_width(pcm.sample_n_bytes);

    drwav_data_format format;
    format.container = drwav_container_riff;
    format.format = DR_WAVE_FORMAT_PCM;
    format.channels = static_cast<drwav_uint32>(pcm.channels);
    format.sampleRate = static_cast<drwav_uint32>(pcm.sample_rate);
    format.bitsPerSample = static_cast<drwav_uint32>(pcm.sample_n_bytes * 8);

    // 8-bit WAV is unsigned; wider widths are signed little-endian.
    std::vector<uint8_t> data;
    if (pcm.sample_n_bytes == 1) {
        data.resize(pcm.samples.size());
        for (size_t i = 0; i < pcm.samples.size(); ++i)
            data[i] = static_cast<uint8_t>(pcm.samples[i] + 128);
    } else {
        data = encode_samples(pcm.samples, pcm.sample_n_bytes,
                              native_byte_format(pcm.sample_n_bytes),
                              pcm.channels);
    }

    drwav wav;
    if (!drwav_init_file_write(&wav, path.c_str(), &format, nullptr)) {
        throw std::runtime_error("Cannot create WAV file: " + path);
    }
    drwav_uint64 frames = static_cast<drwav_uint64>(pcm.frames());
    drwav_uint64 written = drwav_write_pcm_frames(&wav, frames, data.data());
    drwav_uninit(&wav);

    if (written != frames) {
        throw std::runtime_error("Short write to WAV file: " + path);
    }
}

void write_raw_pcm(const std::string &path, const PcmBuffer &pcm) {
    auto data = encode_samples(pcm.samples, pcm.sample_n_bytes,
                               native_byte_format(pcm.sample_n_bytes),
                               pcm.channels);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot create RAW file: " + path);
    }
    file.write(reinterpret_cast<const char *>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw std::runtime_error("Write error on " + path);
    }
}

// ─── File Conversion ─────────────────────────────────────────────────────────

AudioFormat convert_file(const std::string &input, const std::string &output,
                         AudioFormat out_format) {
    auto in_format = detect_file_format(input);

    PcmBuffer pcm;
    switch (in_format) {
    case AudioFormat::SPHERE:
        pcm = read_sphere_pcm(input);
        break;
    case AudioFormat::WAV:
        pcm = read_wav_pcm(input);
        break;
    default:
        throw std::runtime_error("Input file type is not supported: " + input);
    }

    switch (out_format) {
    case AudioFormat::SPHERE:
        write_sphere_pcm(output, pcm);
        break;
    case AudioFormat::WAV:
        write_wav_pcm(output, pcm);
        break;
    case AudioFormat::RAW:
        write_raw_pcm(output, pcm);
        break;
    default:
        throw std::runtime_error("Unsupported output format for " + output);
    }
    return in_format;
}

} // namespace sphere
