// sample array handed from the synthesizer to segment download
#ifndef ARBGEN_WAVEFORM_HH
#define ARBGEN_WAVEFORM_HH

#include <stddef.h>
#include <complex>
#include <string>
#include <vector>

namespace arbgen{

typedef enum {
    WFM_FORMAT_IQ=0,    // complex baseband
    WFM_FORMAT_REAL     // real samples, carrier mixed in directly
} wfm_format_t;

// "iq" / "real", throws invalid_parameter("format") otherwise
wfm_format_t wfm_format_from_name(const std::string &_name);
const char * wfm_format_name(wfm_format_t _format);

struct waveform_s {
    wfm_format_t                      format;
    double                            sample_rate;
    std::vector<std::complex<float> > iq;       // populated for WFM_FORMAT_IQ
    std::vector<float>                real;     // populated for WFM_FORMAT_REAL
    size_t                            requested_length; // before length correction
    bool                              corrected;        // correction changed the length

    size_t size() const { return format == WFM_FORMAT_IQ ? iq.size() : real.size(); }
};

waveform_s waveform_create(wfm_format_t _format, double _sample_rate, size_t _len);

// largest |sample|
float waveform_peak(const waveform_s &_w);

// scale so the largest |sample| equals _peak, no-op on an all-zero waveform
void waveform_normalize(waveform_s &_w, float _peak=1.0f);

}

#endif /* ARBGEN_WAVEFORM_HH */
