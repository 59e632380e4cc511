#include <math.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <algorithm>
#include <cmath>
#include <complex>
#include <mutex>
#include <new>
#include <random>
#include <fftw3.h>
#include "liquid.h"
#include <omp.h>
#include "synth.hh"
#include "errors.hh"
#include "logger.hh"

namespace arbgen{

// largest cycle count searched for a seamless loop
#define SYNTH_MAX_LOOP_CYCLES (1U << 20)
#define SYNTH_FILTER_SPAN     (10U)
#define SYNTH_PRBS_ORDER      (9U)

const struct phase_relationship_type_s phase_relationship_types[PHASE_RELATIONSHIP_TYPE_COUNT] = {
    {"unknown",     PHASE_REL_UNKNOWN},
    {"random",      PHASE_REL_RANDOM},
    {"zero",        PHASE_REL_ZERO},
    {"increasing",  PHASE_REL_INCREASING},
    {"parabolic",   PHASE_REL_PARABOLIC},
};

const struct barker_code_s barker_codes[BARKER_CODE_COUNT] = {
    {"b2",  2,  {1, -1}},
    {"b3",  3,  {1, 1, -1}},
    {"b41", 4,  {1, 1, -1, 1}},
    {"b42", 4,  {1, 1, 1, -1}},
    {"b5",  5,  {1, 1, 1, -1, 1}},
    {"b7",  7,  {1, 1, 1, -1, -1, 1, -1}},
    {"b11", 11, {1, 1, 1, -1, -1, -1, 1, -1, -1, 1, -1}},
    {"b13", 13, {1, 1, 1, 1, 1, -1, -1, 1, 1, -1, 1, -1, 1}},
};

phase_relationship_t phase_relationship_from_name(const std::string &_name)
{
    for(unsigned int i = 1; i < PHASE_RELATIONSHIP_TYPE_COUNT; i++){
        if(strcasecmp(_name.c_str(), phase_relationship_types[i].name) == 0)
            return phase_relationship_types[i].kind;
    }
    throw unsupported_modulation("phase", "unknown phase relationship '" + _name + "'");
}

const char * phase_relationship_name(phase_relationship_t _kind)
{
    for(unsigned int i = 0; i < PHASE_RELATIONSHIP_TYPE_COUNT; i++){
        if(phase_relationship_types[i].kind == _kind) return phase_relationship_types[i].name;
    }
    return phase_relationship_types[0].name;
}

const barker_code_s & barker_code_lookup(const std::string &_name)
{
    for(unsigned int i = 0; i < BARKER_CODE_COUNT; i++){
        if(strcasecmp(_name.c_str(), barker_codes[i].name) == 0) return barker_codes[i];
    }
    throw unsupported_modulation("code", "unknown barker code '" + _name + "'");
}

// FFTW's planner is not re-entrant, execution on distinct plans is
static std::mutex fftw_planner_lock;

// in-place unnormalized DFT, _sign is FFTW_FORWARD or FFTW_BACKWARD
static void transform(std::vector<std::complex<float> > &_x, int _sign)
{
    size_t n = _x.size();
    std::complex<float> * buf_in  = (std::complex<float>*) fftwf_malloc(sizeof(fftwf_complex)*n);
    std::complex<float> * buf_out = (std::complex<float>*) fftwf_malloc(sizeof(fftwf_complex)*n);
    if(buf_in == nullptr || buf_out == nullptr){
        fftwf_free(buf_in);
        fftwf_free(buf_out);
        throw std::bad_alloc();
    }

    fftwf_plan plan;
    {
        std::lock_guard<std::mutex> lock(fftw_planner_lock);
        plan = fftwf_plan_dft_1d(int(n), (fftwf_complex*)buf_in, (fftwf_complex*)buf_out,
                                 _sign, FFTW_ESTIMATE);
    }
    memmove(buf_in, _x.data(), n*sizeof(std::complex<float>));
    fftwf_execute(plan);
    memmove(_x.data(), buf_out, n*sizeof(std::complex<float>));
    {
        std::lock_guard<std::mutex> lock(fftw_planner_lock);
        fftwf_destroy_plan(plan);
    }
    fftwf_free(buf_in);
    fftwf_free(buf_out);
}

// periodic band-limited resample of _x to _m samples
static std::vector<std::complex<float> > resample_periodic(std::vector<std::complex<float> > _x, size_t _m)
{
    size_t L = _x.size();
    if(L == _m) return _x;

    transform(_x, FFTW_FORWARD);
    std::vector<std::complex<float> > y(_m, std::complex<float>(0.0f, 0.0f));
    size_t n = std::min(L, _m);
    size_t h = (n - 1)/2;
    y[0] = _x[0];
    for(size_t i = 1; i <= h; i++){
        y[i]      = _x[i];
        y[_m - i] = _x[L - i];
    }
    if(n % 2 == 0){
        // Nyquist bin of the shorter spectrum
        size_t ny = n/2;
        if(L < _m){
            y[ny]      = 0.5f*_x[ny];
            y[_m - ny] = 0.5f*_x[ny];
        }
        else{
            y[ny] = _x[ny] + _x[L - ny];
        }
    }
    transform(y, FFTW_BACKWARD);
    float g = 1.0f/float(L);
    for(auto &v : y) v *= g;
    return y;
}

std::vector<float> mix_to_real(const std::vector<std::complex<float> > &_baseband,
                               double _sample_rate,
                               double _carrier)
{
    std::vector<float> out(_baseband.size());
    double w = 2.0*M_PI*_carrier/_sample_rate;
    long n = long(_baseband.size());
    long i;
#pragma omp parallel for private(i) schedule(static)
    for(i = 0; i < n; i++){
        // reduce the phase in double before the trig calls
        double theta = fmod(w*double(i), 2.0*M_PI);
        out[i] = float(double(_baseband[i].real())*cos(theta) - double(_baseband[i].imag())*sin(theta));
    }
    return out;
}

static void check_frequency(double _sample_rate, double _f, const char *_name)
{
    if(!std::isfinite(_f) || fabs(_f) >= _sample_rate/2.0)
        throw invalid_parameter(_name, std::to_string(_f) + " Hz outside the first Nyquist zone");
}

// carrier for a REAL waveform whose baseband occupies +-_half_bw
static void check_carrier(double _sample_rate, double _carrier, double _half_bw)
{
    if(!std::isfinite(_carrier) || _carrier - _half_bw <= 0.0 || _carrier + _half_bw >= _sample_rate/2.0)
        throw invalid_parameter("carrier", "carrier " + std::to_string(_carrier) +
                                " Hz cannot hold the signal within (0, fs/2)");
}

// smallest sample count holding a whole number of cycles of every
// frequency in _freqs, 0 if none within SYNTH_MAX_LOOP_CYCLES of _freqs[0]
static size_t loop_length(double _sample_rate, const std::vector<double> &_freqs)
{
    double f0 = fabs(_freqs[0]);
    for(unsigned int c = 1; c <= SYNTH_MAX_LOOP_CYCLES; c++){
        double n = round(double(c)*_sample_rate/f0);
        if(n < 1.0) continue;
        if(n > double(ARBGEN_MAX_CORRECTED_LENGTH)) return 0;
        bool whole = true;
        for(auto f : _freqs){
            double cycles = n*fabs(f)/_sample_rate;
            if(fabs(cycles - round(cycles)) > 1e-9){
                whole = false;
                break;
            }
        }
        if(whole) return size_t(n);
    }
    return 0;
}

// samples needed to cover _seconds without coming up short
static size_t cover_samples(double _sample_rate, double _seconds)
{
    return size_t(ceil(_seconds*_sample_rate - 1e-6));
}

static void check_pulse(double _sample_rate, double _pulse_width, double _pri)
{
    if(!std::isfinite(_pulse_width) || _pulse_width <= 0.0)
        throw invalid_parameter("pulse_width", "pulse width must be positive");
    size_t np = cover_samples(_sample_rate, _pulse_width);
    if(np == 0 || np > ARBGEN_MAX_CORRECTED_LENGTH)
        throw invalid_parameter("pulse_width", "pulse width must span 1 to " +
                                std::to_string(ARBGEN_MAX_CORRECTED_LENGTH) + " samples");
    if(!std::isfinite(_pri) || _pri < 0.0 || _pri*_sample_rate > double(ARBGEN_MAX_CORRECTED_LENGTH))
        throw invalid_parameter("pri", "pri must be non-negative and fit in memory");
}

// baseband pulse + dead time, mixed for REAL, zero_last handled, corrected
static waveform_s finish_pulse(std::vector<std::complex<float> > &_pulse,
                               double                  _sample_rate,
                               double                  _pulse_width,
                               double                  _pri,
                               double                  _carrier,
                               wfm_format_t            _format,
                               bool                    _zero_last,
                               const device_profile_s &_profile,
                               logger_client *         _log)
{
    size_t np = _pulse.size();
    size_t total = np;
    if(_pri > _pulse_width) total = std::max(np, size_t(llround(_pri*_sample_rate)));
    if(_zero_last && total == np) total++;
    _pulse.resize(total, std::complex<float>(0.0f, 0.0f));

    waveform_s w;
    w.format = _format;
    w.sample_rate = _sample_rate;
    w.corrected = false;
    if(_format == WFM_FORMAT_IQ){
        w.iq.swap(_pulse);
    }
    else{
        w.real = mix_to_real(_pulse, _sample_rate, _carrier);
    }
    w.requested_length = w.size();

    if(_log != nullptr){
        *_log << logger::set_level(logger::DEBUG) << "pulse: " << np << " samples on, "
              << (total - np) << " off\n";
        _log->commit();
    }
    correct_length(w, _profile, LENGTH_ZERO_PAD, _log);
    return w;
}

// wrap a periodic baseband segment and tile it to a length the device
// takes; zero_last then overwrites the final sample, so the length stays
// valid and no zero run follows
static waveform_s finish_periodic(std::vector<std::complex<float> > &_bb,
                                  double                  _sample_rate,
                                  double                  _carrier,
                                  wfm_format_t            _format,
                                  bool                    _zero_last,
                                  const device_profile_s &_profile,
                                  logger_client *         _log)
{
    waveform_s w;
    w.format = _format;
    w.sample_rate = _sample_rate;
    w.corrected = false;
    if(_format == WFM_FORMAT_IQ) w.iq.swap(_bb);
    else                         w.real = mix_to_real(_bb, _sample_rate, _carrier);

    w.requested_length = w.size();
    correct_length(w, _profile, LENGTH_REPEAT, _log);
    if(_zero_last){
        if(_format == WFM_FORMAT_IQ) w.iq.back() = std::complex<float>(0.0f, 0.0f);
        else                         w.real.back() = 0.0f;
    }
    return w;
}

waveform_s zero(double                  _sample_rate,
                size_t                  _length,
                wfm_format_t            _format,
                const device_profile_s &_profile,
                logger_client *         _log)
{
    validate_sample_rate(_profile, _sample_rate);
    if(_length == 0 || _length > ARBGEN_MAX_CORRECTED_LENGTH)
        throw invalid_parameter("length", "length must be in [1, " +
                                std::to_string(ARBGEN_MAX_CORRECTED_LENGTH) + "]");

    waveform_s w = waveform_create(_format, _sample_rate, _length);
    correct_length(w, _profile, LENGTH_ZERO_PAD, _log);
    return w;
}

// last sample phase lands on an odd multiple of pi/2
static bool lands_on_zero(double _sample_rate, double _frequency, double _phi, size_t _n)
{
    double x = (2.0*_frequency*double(_n - 1)/_sample_rate + _phi/M_PI) - 0.5;
    return fabs(x - round(x)) < 2e-9;
}

waveform_s sine(double                  _sample_rate,
                double                  _frequency,
                double                  _phase_deg,
                wfm_format_t            _format,
                bool                    _zero_last,
                const device_profile_s &_profile,
                logger_client *         _log)
{
    validate_sample_rate(_profile, _sample_rate);
    if(_frequency == 0.0)
        throw invalid_parameter("frequency", "frequency must be non-zero");
    check_frequency(_sample_rate, _frequency, "frequency");
    if(!std::isfinite(_phase_deg))
        throw invalid_parameter("phase", "phase must be finite");

    size_t n = loop_length(_sample_rate, {_frequency});
    if(n == 0)
        throw invalid_parameter("frequency", "no whole number of cycles fits within " +
                                std::to_string(ARBGEN_MAX_CORRECTED_LENGTH) + " samples");
    double phi = _phase_deg*M_PI/180.0;

    if(_zero_last && _format == WFM_FORMAT_REAL){
        size_t m = n;
        while(m <= 2*n && !lands_on_zero(_sample_rate, _frequency, phi, m)) m++;
        if(m > 2*n)
            throw invalid_parameter("phase", "no sample count in [" + std::to_string(n) + ", " +
                                    std::to_string(2*n) + "] ends on a zero crossing");
        n = m;
    }

    waveform_s w = waveform_create(_format, _sample_rate, n);
    double dw = 2.0*M_PI*_frequency/_sample_rate;
    long len = long(n);
    long i;
    if(_format == WFM_FORMAT_IQ){
#pragma omp parallel for private(i) schedule(static)
        for(i = 0; i < len; i++){
            double theta = fmod(dw*double(i), 2.0*M_PI) + phi;
            w.iq[i] = std::complex<float>(cos(theta), sin(theta));
        }
    }
    else{
#pragma omp parallel for private(i) schedule(static)
        for(i = 0; i < len; i++){
            double theta = fmod(dw*double(i), 2.0*M_PI) + phi;
            w.real[i] = float(cos(theta));
        }
        if(_zero_last) w.real[n - 1] = 0.0f;
    }
    w.requested_length = w.size();

    if(_log != nullptr){
        *_log << logger::set_level(logger::DEBUG) << "sine: " << _frequency << " Hz, "
              << w.size() << " samples\n";
        _log->commit();
    }
    if(_zero_last && _format == WFM_FORMAT_REAL){
        // the zero crossing ends the tone, zeros may follow it
        correct_length(w, _profile, LENGTH_ZERO_PAD, _log);
    }
    else{
        correct_length(w, _profile, LENGTH_REPEAT, _log);
        if(_zero_last) w.iq.back() = std::complex<float>(0.0f, 0.0f);
    }
    return w;
}

waveform_s am(double                  _sample_rate,
              double                  _depth_pct,
              double                  _mod_rate,
              double                  _carrier,
              wfm_format_t            _format,
              bool                    _zero_last,
              const device_profile_s &_profile,
              logger_client *         _log)
{
    validate_sample_rate(_profile, _sample_rate);
    if(!(_depth_pct >= 0.0 && _depth_pct <= 100.0))
        throw invalid_parameter("depth", "depth must be in [0,100] %");
    if(!(_mod_rate > 0.0))
        throw invalid_parameter("mod_rate", "modulation rate must be positive");
    check_frequency(_sample_rate, _mod_rate, "mod_rate");
    std::vector<double> freqs = {_mod_rate};
    if(_format == WFM_FORMAT_REAL){
        check_carrier(_sample_rate, _carrier, _mod_rate);
        freqs.push_back(_carrier);
    }

    size_t n = loop_length(_sample_rate, freqs);
    if(n == 0)
        throw invalid_parameter("mod_rate", "no whole number of modulation periods fits in memory");

    double d = _depth_pct/100.0;
    double dw = 2.0*M_PI*_mod_rate/_sample_rate;
    std::vector<std::complex<float> > bb(n);
    long len = long(n);
    long i;
#pragma omp parallel for private(i) schedule(static)
    for(i = 0; i < len; i++){
        double env = (1.0 + d*cos(fmod(dw*double(i), 2.0*M_PI)))/(1.0 + d);
        bb[i] = std::complex<float>(float(env), 0.0f);
    }

    if(_log != nullptr){
        *_log << logger::set_level(logger::DEBUG) << "am: depth " << _depth_pct << " %, "
              << n << " samples\n";
        _log->commit();
    }
    return finish_periodic(bb, _sample_rate, _carrier, _format, _zero_last, _profile, _log);
}

waveform_s cw_pulse(double                  _sample_rate,
                    double                  _pulse_width,
                    double                  _pri,
                    double                  _freq_offset,
                    double                  _carrier,
                    wfm_format_t            _format,
                    bool                    _zero_last,
                    double                  _amp_scale_pct,
                    const device_profile_s &_profile,
                    logger_client *         _log)
{
    validate_sample_rate(_profile, _sample_rate);
    check_pulse(_sample_rate, _pulse_width, _pri);
    check_frequency(_sample_rate, _freq_offset, "freq_offset");
    if(!(_amp_scale_pct > 0.0 && _amp_scale_pct <= 100.0))
        throw invalid_parameter("amp_scale", "amplitude scale must be in (0,100] %");
    if(_format == WFM_FORMAT_REAL)
        check_carrier(_sample_rate, _carrier + _freq_offset, 0.0);

    size_t np = cover_samples(_sample_rate, _pulse_width);
    float a = float(_amp_scale_pct/100.0);
    // REAL mixes the offset in with the carrier
    double dw = _format == WFM_FORMAT_IQ ? 2.0*M_PI*_freq_offset/_sample_rate : 0.0;
    std::vector<std::complex<float> > pulse(np);
    long len = long(np);
    long i;
#pragma omp parallel for private(i) schedule(static)
    for(i = 0; i < len; i++)
        pulse[i] = std::polar(a, float(fmod(dw*double(i), 2.0*M_PI)));

    return finish_pulse(pulse, _sample_rate, _pulse_width, _pri, _carrier + _freq_offset,
                        _format, _zero_last, _profile, _log);
}

waveform_s chirp(double                  _sample_rate,
                 double                  _pulse_width,
                 double                  _pri,
                 double                  _bandwidth,
                 double                  _carrier,
                 wfm_format_t            _format,
                 bool                    _zero_last,
                 const device_profile_s &_profile,
                 logger_client *         _log)
{
    validate_sample_rate(_profile, _sample_rate);
    check_pulse(_sample_rate, _pulse_width, _pri);
    if(!std::isfinite(_bandwidth) || fabs(_bandwidth) > _sample_rate)
        throw invalid_parameter("bandwidth", "chirp bandwidth must not exceed the sample rate");
    if(_format == WFM_FORMAT_REAL)
        check_carrier(_sample_rate, _carrier, fabs(_bandwidth)/2.0);

    size_t np = cover_samples(_sample_rate, _pulse_width);
    double k = _bandwidth/_pulse_width;
    double t0 = -double(np)/_sample_rate/2.0;
    std::vector<std::complex<float> > pulse(np);
    long len = long(np);
    long i;
#pragma omp parallel for private(i) schedule(static)
    for(i = 0; i < len; i++){
        double t = t0 + double(i)/_sample_rate;
        double theta = fmod(M_PI*k*t*t, 2.0*M_PI);
        pulse[i] = std::complex<float>(cos(theta), sin(theta));
    }

    return finish_pulse(pulse, _sample_rate, _pulse_width, _pri, _carrier,
                        _format, _zero_last, _profile, _log);
}

waveform_s barker(double                  _sample_rate,
                  double                  _pulse_width,
                  double                  _pri,
                  const std::string &     _code,
                  double                  _carrier,
                  wfm_format_t            _format,
                  bool                    _zero_last,
                  const device_profile_s &_profile,
                  logger_client *         _log)
{
    validate_sample_rate(_profile, _sample_rate);
    const barker_code_s &code = barker_code_lookup(_code);
    check_pulse(_sample_rate, _pulse_width, _pri);
    if(_format == WFM_FORMAT_REAL)
        check_carrier(_sample_rate, _carrier, 0.0);

    size_t chip = size_t(floor(_pulse_width*_sample_rate/double(code.len) + 1e-6));
    if(chip == 0)
        throw invalid_parameter("pulse_width", "pulse width shorter than one sample per chip");

    std::vector<std::complex<float> > pulse(chip*code.len);
    for(unsigned int c = 0; c < code.len; c++)
        std::fill(pulse.begin() + c*chip, pulse.begin() + (c + 1)*chip,
                  std::complex<float>(float(code.chips[c]), 0.0f));

    if(_log != nullptr){
        *_log << logger::set_level(logger::DEBUG) << "barker " << code.name << ": "
              << chip << " samples per chip\n";
        _log->commit();
    }
    return finish_pulse(pulse, _sample_rate, _pulse_width, _pri, _carrier,
                        _format, _zero_last, _profile, _log);
}

waveform_s multitone(double                  _sample_rate,
                     double                  _spacing,
                     unsigned int            _num_tones,
                     phase_relationship_t    _phase_rel,
                     double                  _carrier,
                     wfm_format_t            _format,
                     const device_profile_s &_profile,
                     logger_client *         _log,
                     uint64_t                _seed)
{
    validate_sample_rate(_profile, _sample_rate);
    if(_phase_rel == PHASE_REL_UNKNOWN || _phase_rel > PHASE_REL_PARABOLIC)
        throw unsupported_modulation("phase", "phase relationship is not enumerated");
    if(_num_tones == 0)
        throw invalid_parameter("num_tones", "at least one tone is required");
    if(!std::isfinite(_spacing) || _spacing <= 0.0)
        throw invalid_parameter("spacing", "tone spacing must be positive");

    // even tone counts sit on half-integer multiples of the spacing
    bool even = (_num_tones % 2) == 0;
    double bins = (even ? 2.0 : 1.0)*_sample_rate/_spacing;
    if(fabs(bins - round(bins)) > 1e-6 || round(bins) > double(ARBGEN_MAX_CORRECTED_LENGTH))
        throw invalid_parameter("spacing", "sample rate is not a whole multiple of the tone spacing");
    size_t n = size_t(round(bins));
    // offset of tone k in bins, relative to the centre
    auto offset = [even, _num_tones](unsigned int _k){
        return even ? 2*long(_k) - long(_num_tones) + 1 : long(_k) - long(_num_tones - 1)/2;
    };
    long edge = std::abs(offset(0));
    if(2*edge >= long(n))
        throw invalid_parameter("num_tones", "tones extend beyond the first Nyquist zone");

    long cbin = 0;
    if(_format == WFM_FORMAT_REAL){
        double cb = _carrier*double(n)/_sample_rate;
        if(!std::isfinite(cb) || fabs(cb - round(cb)) > 1e-6)
            throw invalid_parameter("carrier", "carrier does not fall on a tone grid bin");
        cbin = long(round(cb));
        if(cbin - edge <= 0 || 2*(cbin + edge) >= long(n))
            throw invalid_parameter("carrier", "tones around the carrier leave (0, fs/2)");
    }

    std::vector<double> phase(_num_tones, 0.0);
    if(_phase_rel == PHASE_REL_RANDOM){
        uint64_t seed = _seed;
        if(seed == 0){
            std::random_device rd;
            seed = (uint64_t(rd()) << 32) | rd();
        }
        std::mt19937_64 rng(seed);
        std::uniform_real_distribution<double> dist(0.0, 2.0*M_PI);
        for(auto &p : phase) p = dist(rng);
    }
    else if(_phase_rel == PHASE_REL_INCREASING){
        for(unsigned int k = 0; k < _num_tones; k++) phase[k] = 2.0*M_PI*double(k)/double(_num_tones);
    }
    else if(_phase_rel == PHASE_REL_PARABOLIC){
        for(unsigned int k = 0; k < _num_tones; k++) phase[k] = M_PI*double(k)*double(k)/double(_num_tones);
    }

    std::vector<std::complex<float> > spec(n, std::complex<float>(0.0f, 0.0f));
    for(unsigned int k = 0; k < _num_tones; k++){
        std::complex<float> tone = std::polar(1.0f, float(fmod(phase[k], 2.0*M_PI)));
        long b = cbin + offset(k);
        if(_format == WFM_FORMAT_IQ){
            spec[size_t((b + long(n)) % long(n))] = tone;
        }
        else{
            spec[size_t(b)]     = 0.5f*tone;
            spec[n - size_t(b)] = 0.5f*std::conj(tone);
        }
    }
    transform(spec, FFTW_BACKWARD);

    waveform_s w;
    w.format = _format;
    w.sample_rate = _sample_rate;
    w.corrected = false;
    if(_format == WFM_FORMAT_IQ){
        w.iq.swap(spec);
    }
    else{
        // Hermitian spectrum, the imaginary part is rounding noise
        w.real.resize(n);
        for(size_t i = 0; i < n; i++) w.real[i] = spec[i].real();
    }
    waveform_normalize(w);
    w.requested_length = w.size();

    if(_log != nullptr){
        *_log << logger::set_level(logger::DEBUG) << "multitone: " << _num_tones << " tones, "
              << phase_relationship_name(_phase_rel) << " phase, " << n << " point ifft\n";
        _log->commit();
    }
    correct_length(w, _profile, LENGTH_REPEAT, _log);
    return w;
}

// pseudo-random symbol values from a maximal length sequence
static std::vector<unsigned int> prbs_symbols(unsigned int _count, unsigned int _bps)
{
    std::vector<unsigned int> out(_count);
    msequence ms = msequence_create_default(SYNTH_PRBS_ORDER);
    for(auto &s : out) s = msequence_generate_symbol(ms, _bps);
    msequence_destroy(ms);
    return out;
}

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
                              logger_client *         _log)
{
    validate_sample_rate(_profile, _sample_rate);
    if(!std::isfinite(_symbol_rate) || _symbol_rate <= 0.0)
        throw invalid_parameter("symbol_rate", "symbol rate must be positive");
    unsigned int k = (unsigned int)(llround(_sample_rate/_symbol_rate));
    if(_sample_rate/_symbol_rate > double(ARBGEN_MAX_CORRECTED_LENGTH) || k < 2)
        throw invalid_parameter("symbol_rate", "need at least 2 samples per symbol");
    if(_num_symbols == 0)
        throw invalid_parameter("num_symbols", "at least one symbol is required");
    constellation_s c = constellation_create(_scheme);
    std::vector<float> h = design_filter(_filter, _alpha, k, SYNTH_FILTER_SPAN);
    if(_format == WFM_FORMAT_REAL)
        check_carrier(_sample_rate, _carrier, _symbol_rate*(1.0 + _alpha)/2.0);

    // ideal length, tiled up to the minimum, then snapped to the granularity
    double ideal = double(_num_symbols)*_sample_rate/_symbol_rate;
    unsigned int reps = 1;
    if(ideal < double(_profile.min_length))
        reps = (unsigned int)(ceil(double(_profile.min_length)/ideal));
    size_t gran = std::max<size_t>(1, _profile.granularity);
    size_t target = size_t(llround(ideal*double(reps)/double(gran)))*gran;
    while(target < _profile.min_length || target == 0) target += gran;
    if(target > ARBGEN_MAX_CORRECTED_LENGTH)
        throw waveform_constraint_violation("granularity", "modulated waveform of " +
                                            std::to_string(target) + " samples is too long");

    unsigned int bps = modulation_bits_per_symbol(_scheme);
    std::vector<unsigned int> block = prbs_symbols(_num_symbols, bps);
    std::vector<unsigned int> syms;
    syms.reserve(size_t(_num_symbols)*reps);
    for(unsigned int r = 0; r < reps; r++) syms.insert(syms.end(), block.begin(), block.end());
    std::vector<std::complex<float> > points = constellation_map(c, syms);
    size_t nsym = points.size();

    // circular extension: half a filter span either side
    unsigned int half = SYNTH_FILTER_SPAN/2;
    std::vector<std::complex<float> > ext;
    ext.reserve(nsym + 2*half);
    for(unsigned int j = 0; j < half; j++) ext.push_back(points[(nsym - (half - j) % nsym) % nsym]);
    ext.insert(ext.end(), points.begin(), points.end());
    for(unsigned int j = 0; j < half; j++) ext.push_back(points[j % nsym]);

    std::vector<std::complex<float> > shaped(ext.size()*k);
    firinterp_crcf interp = firinterp_crcf_create(k, h.data(), (unsigned int)h.size());
    for(size_t j = 0; j < ext.size(); j++)
        firinterp_crcf_execute(interp, ext[j], &shaped[j*k]);
    firinterp_crcf_destroy(interp);

    // the filter delay is half a span, the first full symbol sits at span*k
    size_t start = size_t(SYNTH_FILTER_SPAN)*k;
    std::vector<std::complex<float> > bb(shaped.begin() + start, shaped.begin() + start + nsym*k);
    // zero_last keeps one sample of the target for the final zero
    size_t periodic = _zero_last ? target - 1 : target;
    bb = resample_periodic(bb, periodic);
    if(_zero_last) bb.push_back(std::complex<float>(0.0f, 0.0f));

    double rate = double(nsym)*_sample_rate/double(periodic);
    if(_log != nullptr){
        *_log << logger::set_level(logger::INFO) << modulation_name(_scheme) << ": "
              << nsym << " symbols in " << target << " samples, symbol rate " << rate
              << " (requested " << _symbol_rate << ", error " << (rate - _symbol_rate) << " Hz)\n";
        _log->commit();
    }

    waveform_s w = finish_periodic(bb, _sample_rate, _carrier, _format, _zero_last, _profile, _log);
    waveform_normalize(w);
    return w;
}

}
