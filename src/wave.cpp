#include "sphere/wave.hpp"

#include "sphere/error.hpp"

namespace sphere {

WaveParams WaveView::getparams() const {
    auto sph = session_.getparams();
    auto wave = to_wave_params(sph);
    if (sph.sample_coding && *sph.sample_coding != "pcm") {
        // Compressed payloads pass through untouched; name the coding.
        wave.comptype = *sph.sample_coding;
        wave.compname = *sph.sample_coding;
    }
    return wave;
}

void WaveView::setparams(const WaveParams &params) {
    if (params.comptype != "NONE") {
        throw InvalidParameterError("Unsupported compression type: " +
                                    params.comptype);
    }
    session_.setparams(header_from_wave_params(params));
}

} // namespace sphere
