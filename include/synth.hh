// waveform synthesis: primitive generators composed into device-ready
// sample arrays
#ifndef ARBGEN_SYNTH_HH
#define ARBGEN_SYNTH_HH

#include <stddef.h>
#include <stdint.h>
#include <complex>
#include <string>
#include <vector>

#include "constellation.hh"
#include "device_profile.hh"
#include "pulse_shape.hh"
#include "waveform.hh"

namespace arbgen{

class logger_client;

//********************** SYNTH ******************************
//
// Every generator
//   - checks the sample rate against the device profile, then every
//     other argument, before anything is allocated
//   - builds the signal at complex baseband, or for WFM_FORMAT_REAL
//     mixes the baseband I/Q onto the carrier sample by sample
//   - finishes with correct_length(): periodic signals are tiled
//     (LENGTH_REPEAT), pulsed ones are zero padded (LENGTH_ZERO_PAD)
//
// zero_last leaves the final sample at exactly 0 so a looping
// instrument does not hold a non-zero level between plays. Periodic
// signals are tiled first and then lose their last sample to the zero;
// digital modulation resamples to one sample short of the target instead.
//
//////////////////////////////////////////////////////////////////

typedef enum {
    PHASE_REL_UNKNOWN=0,
    PHASE_REL_RANDOM,           // uniform on [0, 2pi)
    PHASE_REL_ZERO,             // all tones in phase
    PHASE_REL_INCREASING,       // 2*pi*k/n
    PHASE_REL_PARABOLIC         // pi*k^2/n, low crest factor
} phase_relationship_t;

struct phase_relationship_type_s {
    const char *         name;
    phase_relationship_t kind;
};

#define PHASE_RELATIONSHIP_TYPE_COUNT (5)

extern const struct phase_relationship_type_s phase_relationship_types[PHASE_RELATIONSHIP_TYPE_COUNT];

// throws unsupported_modulation("phase")
phase_relationship_t phase_relationship_from_name(const std::string &_name);
const char * phase_relationship_name(phase_relationship_t _kind);

struct barker_code_s {
    const char * name;
    unsigned int len;
    int          chips[13];
};

#define BARKER_CODE_COUNT (8)

// b2, b3, b41, b42, b5, b7, b11, b13
extern const struct barker_code_s barker_codes[BARKER_CODE_COUNT];

// throws unsupported_modulation("code")
const barker_code_s & barker_code_lookup(const std::string &_name);

// I*cos(2*pi*fc*n/fs) - Q*sin(2*pi*fc*n/fs)
std::vector<float> mix_to_real(const std::vector<std::complex<float> > &_baseband,
                               double _sample_rate,
                               double _carrier);

waveform_s zero(double                  _sample_rate,
                size_t                  _length,
                wfm_format_t            _format,
                const device_profile_s &_profile,
                logger_client *         _log=nullptr);

// tone with a whole number of cycles so the segment loops seamlessly
waveform_s sine(double                  _sample_rate,
                double                  _frequency,
                double                  _phase_deg,
                wfm_format_t            _format,
                bool                    _zero_last,
                const device_profile_s &_profile,
                logger_client *         _log=nullptr);

waveform_s am(double                  _sample_rate,
              double                  _depth_pct,
              double                  _mod_rate,
              double                  _carrier,
              wfm_format_t            _format,
              bool                    _zero_last,
              const device_profile_s &_profile,
              logger_client *         _log=nullptr);

// rectangular pulse, never shorter than _pulse_width, followed by dead
// time up to _pri
waveform_s cw_pulse(double                  _sample_rate,
                    double                  _pulse_width,
                    double                  _pri,
                    double                  _freq_offset,
                    double                  _carrier,
                    wfm_format_t            _format,
                    bool                    _zero_last,
                    double                  _amp_scale_pct,
                    const device_profile_s &_profile,
                    logger_client *         _log=nullptr);

// linear FM sweeping -bw/2..bw/2 about the carrier, a negative
// bandwidth sweeps down
waveform_s chirp(double                  _sample_rate,
                 double                  _pulse_width,
                 double                  _pri,
                 double                  _bandwidth,
                 double                  _carrier,
                 wfm_format_t            _format,
                 bool                    _zero_last,
                 const device_profile_s &_profile,
                 logger_client *         _log=nullptr);

waveform_s barker(double                  _sample_rate,
                  double                  _pulse_width,
                  double                  _pri,
                  const std::string &     _code,
                  double                  _carrier,
                  wfm_format_t            _format,
                  bool                    _zero_last,
                  const device_profile_s &_profile,
                  logger_client *         _log=nullptr);

// equal-amplitude tones placed on FFT bins and inverse transformed;
// _seed seeds PHASE_REL_RANDOM, 0 draws one from std::random_device
waveform_s multitone(double                  _sample_rate,
                     double                  _spacing,
                     unsigned int            _num_tones,
                     phase_relationship_t    _phase_rel,
                     double                  _carrier,
                     wfm_format_t            _format,
                     const device_profile_s &_profile,
                     logger_client *         _log=nullptr,
                     uint64_t                _seed=0);

// PRBS symbols, pulse shaped, resampled to a granularity-friendly length
// while keeping the waveform periodic
waveform_s digital_modulation(double                  _sample_rate,
                              double                  _symbol_rate,
                              modulation_t            _scheme,
                              unsigned int            _num_symbols,
                              pulse_shape_t           _filter,
                              float                   _alpha,
                              double                  _carrier,
                              wfm_format_t            _format,
                              bool                    _zero_last,
                              const device_profile_s &_profile,
                              logger_client *         _log=nullptr);

}

#endif /* ARBGEN_SYNTH_HH */
