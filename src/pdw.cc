#include <math.h>
#include <algorithm>
#include <cmath>
#include "pdw.hh"
#include "errors.hh"

namespace arbgen{

static void check_range(unsigned int _v, unsigned int _max, const char *_name)
{
    if(_v > _max)
        throw pdw_field_out_of_range(_name, std::to_string(_v) + " exceeds " + std::to_string(_max));
}

static void check_operation(unsigned int _op)
{
    if(_op > PDW_OP_RESET)
        throw pdw_field_out_of_range("operation", "operation must be 0 (none), 1 (first) or 2 (reset), got " +
                                     std::to_string(_op));
}

static uint64_t encode_frequency(double _f)
{
    double code = round(_f*PDW_FREQ_SCALE);
    if(!std::isfinite(code) || code < 0.0 || code >= ldexp(1.0, PDW_FREQ_BITS))
        throw pdw_field_out_of_range("frequency", std::to_string(_f) + " Hz outside [0, 2^47/1024)");
    return uint64_t(code);
}

static void check_phase(double _p)
{
    if(!(_p >= 0.0 && _p <= 360.0))
        throw pdw_field_out_of_range("phase", std::to_string(_p) + " degrees outside [0,360]");
}

// analog records carry phase as a signed 12 bit fraction of a turn
static uint32_t encode_phase_signed(double _p)
{
    check_phase(_p);
    if(_p > 180.0) _p -= 360.0;
    return uint32_t(llround(_p*4096.0/360.0)) & 0xFFF;
}

static uint32_t encode_phase_unsigned(double _p)
{
    check_phase(_p);
    return uint32_t(llround(_p*4096.0/360.0)) & 0xFFF;
}

static double decode_phase_signed(uint32_t _code)
{
    int c = int(_code & 0xFFF);
    if(c >= 2048) c -= 4096;
    double p = double(c)*360.0/4096.0;
    return p < 0.0 ? p + 360.0 : p;
}

static uint64_t encode_time(double _t)
{
    double ps = round(_t*1e12);
    if(!std::isfinite(ps) || ps < 0.0 || ps >= 18446744073709551616.0)
        throw pdw_field_out_of_range("start_time", "start time must be in [0, 2^64) ps");
    return uint64_t(ps);
}

static double decode_time(uint32_t _lo, uint32_t _hi)
{
    return double((uint64_t(_hi) << 32) | _lo)*1e-12;
}

// 15 bit code in 0.005 dB steps above -140 dBm
static uint32_t encode_vector_power(double _dbm, const char *_name)
{
    if(!(_dbm >= PDW_VECTOR_POWER_MIN && _dbm <= PDW_VECTOR_POWER_MAX + 1e-9))
        throw pdw_field_out_of_range(_name, std::to_string(_dbm) + " dBm outside [-140, 23.835]");
    long long code = llround((_dbm - PDW_VECTOR_POWER_MIN)/PDW_VECTOR_POWER_STEP);
    if(code > 0x7FFF) code = 0x7FFF;
    return uint32_t(code);
}

static double decode_vector_power(uint32_t _code)
{
    return double(_code & 0x7FFF)*PDW_VECTOR_POWER_STEP + PDW_VECTOR_POWER_MIN;
}

// word 0 and word 1 share a layout across every variant
static void pack_head(std::vector<uint32_t> &_w, uint32_t _format, uint32_t _op,
                      uint64_t _freq, uint32_t _phase)
{
    _w[0] = (_format & 0x7) | (_op & 0x3) << 3 | uint32_t(_freq & 0x7FFFFFF) << 5;
    _w[1] = uint32_t((_freq >> 27) & 0xFFFFF) | (_phase & 0xFFF) << 20;
}

static uint32_t unpack_head(const std::vector<uint32_t> &_w, size_t _words, uint32_t _format,
                            double &_freq, uint32_t &_phase)
{
    if(_w.size() != _words || (_w[0] & 0x7) != _format)
        throw pdw_field_out_of_range("format", "expected a format " + std::to_string(_format) + " record of " +
                                     std::to_string(_words) + " words");
    uint32_t op = (_w[0] >> 3) & 0x3;
    check_operation(op);
    uint64_t f = uint64_t((_w[0] >> 5) & 0x7FFFFFF) | uint64_t(_w[1] & 0xFFFFF) << 27;
    _freq = double(f)/PDW_FREQ_SCALE;
    _phase = _w[1] >> 20;
    return op;
}

uint32_t pdw_power_float_encode(double _linear)
{
    const int exponent_offset = -26;
    const uint32_t max_exponent = 31;
    const uint32_t max_mantissa = 1023;
    if(!(_linear > 0.0)) return 0;

    int e = int(floor(log2(_linear) - exponent_offset));
    uint32_t exponent = 0;
    uint32_t mantissa = 0;
    if(e > int(max_exponent)){
        // too big, saturate
        exponent = max_exponent;
        mantissa = max_mantissa;
    }
    else if(e >= 0){
        exponent = uint32_t(e);
        mantissa = uint32_t((ldexp(_linear, -(exponent_offset + e)) - 1.0)*1024.0 + 0.5);
        if(mantissa > max_mantissa){
            // rounding carried into the exponent
            if(exponent < max_exponent){
                mantissa = 0;
                exponent++;
            }
            else{
                mantissa = max_mantissa;
            }
        }
    }
    return exponent << 10 | mantissa;
}

double pdw_power_float_decode(uint32_t _code)
{
    uint32_t exponent = (_code >> 10) & 0x1F;
    uint32_t mantissa = _code & 0x3FF;
    return (1.0 + double(mantissa)/1024.0)*ldexp(1.0, int(exponent) - 26);
}

uint32_t pdw_chirp_rate_encode(double _rate)
{
    const uint32_t mantissa_bits = 13;
    const uint32_t max_mantissa = (1U << mantissa_bits) - 1;
    if(!std::isfinite(_rate) || _rate < 0.0)
        throw pdw_field_out_of_range("chirp_rate", "chirp rate must be finite and non-negative");

    double v = _rate/PDW_CHIRP_RATE_RES;
    uint32_t exponent = 0;
    uint32_t mantissa = 0;
    if(v < double(max_mantissa) + 0.5){
        mantissa = std::min(uint32_t(v + 0.5), max_mantissa);
    }
    else{
        int e;
        frexp(v, &e);
        e -= int(mantissa_bits);
        double frac = ldexp(v, -e);
        if(frac > double(max_mantissa) + 0.5 - 1e-9){
            mantissa = 1U << (mantissa_bits - 1);
            e++;
        }
        else{
            mantissa = std::min(uint32_t(frac + 0.5), max_mantissa);
        }
        exponent = uint32_t(e);
    }

    // the hardware exponent is base 4
    if(exponent & 0x1){
        exponent = (exponent + 1) >> 1;
        mantissa /= 2;
    }
    else{
        exponent >>= 1;
    }
    if(exponent > 0xF)
        throw pdw_field_out_of_range("chirp_rate", std::to_string(_rate) + " Hz/us is beyond the exponent range");
    return exponent << mantissa_bits | (mantissa & max_mantissa);
}

double pdw_chirp_rate_decode(uint32_t _code)
{
    uint32_t exponent = (_code >> 13) & 0xF;
    uint32_t mantissa = _code & 0x1FFF;
    return double(mantissa)*ldexp(1.0, 2*int(exponent))*PDW_CHIRP_RATE_RES;
}

std::vector<uint32_t> analog_pdw_encode(const analog_pdw_s &_pdw)
{
    check_operation(_pdw.operation);
    std::vector<uint32_t> w(ANALOG_PDW_WORDS, 0);
    if(_pdw.operation == PDW_OP_RESET){
        pack_head(w, ANALOG_PDW_FORMAT, PDW_OP_RESET, 0, 0);
        return w;
    }

    uint64_t freq  = encode_frequency(_pdw.frequency);
    uint32_t phase = encode_phase_signed(_pdw.phase);
    uint64_t ps    = encode_time(_pdw.start_time);

    double ns = round(_pdw.width*1e9);
    if(!std::isfinite(ns) || ns < 0.0 || ns > 4294967295.0)
        throw pdw_field_out_of_range("width", "width must be in [0, 2^32) ns");
    if(!(_pdw.power >= PDW_ANALOG_POWER_MIN && _pdw.power <= PDW_ANALOG_POWER_MAX))
        throw pdw_field_out_of_range("power", std::to_string(_pdw.power) + " dB outside [-150, 36]");
    uint32_t power = pdw_power_float_encode(pow(10.0, _pdw.power/20.0));

    check_range(_pdw.markers,       0xFFF, "markers");
    check_range(_pdw.pulse_mode,    2,     "pulse_mode");
    check_range(_pdw.phase_control, 1,     "phase_control");
    check_range(_pdw.band_adjust,   2,     "band_adjust");
    check_range(_pdw.chirp_control, 3,     "chirp_control");
    check_range(_pdw.code,          0x1FF, "code");
    check_range(_pdw.freq_map,      7,     "freq_map");
    uint32_t chirp = pdw_chirp_rate_encode(_pdw.chirp_rate);

    pack_head(w, ANALOG_PDW_FORMAT, _pdw.operation, freq, phase);
    w[2] = uint32_t(ps & 0xFFFFFFFF);
    w[3] = uint32_t(ps >> 32);
    w[4] = uint32_t(ns);
    w[5] = power | _pdw.markers << 15 | _pdw.pulse_mode << 27 |
           _pdw.phase_control << 29 | _pdw.band_adjust << 30;
    w[6] = _pdw.chirp_control | _pdw.code << 3 | chirp << 12 | _pdw.freq_map << 29;
    return w;
}

analog_pdw_s analog_pdw_decode(const std::vector<uint32_t> &_words)
{
    analog_pdw_s p;
    uint32_t phase;
    double freq;
    p.operation = unpack_head(_words, ANALOG_PDW_WORDS, ANALOG_PDW_FORMAT, freq, phase);
    if(p.operation == PDW_OP_RESET) return p;

    p.frequency     = freq;
    p.phase         = decode_phase_signed(phase);
    p.start_time    = decode_time(_words[2], _words[3]);
    p.width         = double(_words[4])*1e-9;
    p.power         = 20.0*log10(pdw_power_float_decode(_words[5] & 0x7FFF));
    p.markers       = (_words[5] >> 15) & 0xFFF;
    p.pulse_mode    = (_words[5] >> 27) & 0x3;
    p.phase_control = (_words[5] >> 29) & 0x1;
    p.band_adjust   = (_words[5] >> 30) & 0x3;
    p.chirp_control = _words[6] & 0x7;
    p.code          = (_words[6] >> 3) & 0x1FF;
    p.chirp_rate    = pdw_chirp_rate_decode((_words[6] >> 12) & 0x1FFFF);
    p.freq_map      = (_words[6] >> 29) & 0x7;
    return p;
}

std::vector<uint32_t> vector_pdw_encode(const vector_pdw_s &_pdw)
{
    check_operation(_pdw.operation);
    std::vector<uint32_t> w(VECTOR_PDW_WORDS, 0);
    if(_pdw.operation == PDW_OP_RESET){
        pack_head(w, VECTOR_PDW_FORMAT, PDW_OP_RESET, 0, 0);
        return w;
    }

    uint64_t freq  = encode_frequency(_pdw.frequency);
    uint32_t phase = encode_phase_unsigned(_pdw.phase);
    uint64_t ps    = encode_time(_pdw.start_time);
    uint32_t power = encode_vector_power(_pdw.power, "power");
    check_range(_pdw.markers,        0xFFF,  "markers");
    check_range(_pdw.phase_control,  1,      "phase_control");
    check_range(_pdw.rf_off,         1,      "rf_off");
    check_range(_pdw.waveform_index, 0xFFFF, "waveform_index");
    check_range(_pdw.wfm_markers,    0xF,    "wfm_markers");

    pack_head(w, VECTOR_PDW_FORMAT, _pdw.operation, freq, phase);
    w[2] = uint32_t(ps & 0xFFFFFFFF);
    w[3] = uint32_t(ps >> 32);
    w[4] = power | _pdw.markers << 15 | _pdw.phase_control << 27 | _pdw.rf_off << 28;
    w[5] = _pdw.waveform_index | _pdw.wfm_markers << 28;
    return w;
}

vector_pdw_s vector_pdw_decode(const std::vector<uint32_t> &_words)
{
    vector_pdw_s p;
    uint32_t phase;
    double freq;
    p.operation = unpack_head(_words, VECTOR_PDW_WORDS, VECTOR_PDW_FORMAT, freq, phase);
    if(p.operation == PDW_OP_RESET) return p;

    p.frequency      = freq;
    p.phase          = double(phase)*360.0/4096.0;
    p.start_time     = decode_time(_words[2], _words[3]);
    p.power          = decode_vector_power(_words[4]);
    p.markers        = (_words[4] >> 15) & 0xFFF;
    p.phase_control  = (_words[4] >> 27) & 0x1;
    p.rf_off         = (_words[4] >> 28) & 0x1;
    p.waveform_index = _words[5] & 0xFFFF;
    p.wfm_markers    = (_words[5] >> 28) & 0xF;
    return p;
}

std::vector<uint32_t> vector3_pdw_encode(const vector3_pdw_s &_pdw)
{
    check_operation(_pdw.operation);
    std::vector<uint32_t> w(VECTOR3_PDW_WORDS, 0);
    if(_pdw.operation == PDW_OP_RESET){
        pack_head(w, VECTOR3_PDW_FORMAT, PDW_OP_RESET, 0, 0);
        return w;
    }

    uint64_t freq  = encode_frequency(_pdw.frequency);
    uint32_t phase = encode_phase_unsigned(_pdw.phase);
    uint64_t ps    = encode_time(_pdw.start_time);

    // half nanoseconds, 37 bits
    double hn = round(_pdw.width*2e9);
    if(!std::isfinite(hn) || hn < 0.0 || hn >= ldexp(1.0, 37))
        throw pdw_field_out_of_range("width", "width must be in [0, 2^37) half ns");
    uint64_t width = uint64_t(hn);

    uint32_t max_power  = encode_vector_power(_pdw.max_power,  "max_power");
    uint32_t power      = encode_vector_power(_pdw.power,      "power");
    uint32_t power2     = encode_vector_power(_pdw.power2,     "power2");
    uint32_t max_power2 = encode_vector_power(_pdw.max_power2, "max_power2");

    double lead = round(_pdw.lo_lead/4e-9);
    if(!std::isfinite(lead) || lead < 0.0 || lead > 255.0)
        throw pdw_field_out_of_range("lo_lead", "LO lead must be in [0, 1020] ns");
    double doppler = round(_pdw.doppler);
    if(!std::isfinite(doppler) || doppler < 0.0 || doppler >= ldexp(1.0, 21))
        throw pdw_field_out_of_range("doppler", "doppler must be in [0, 2^21) Hz");
    uint32_t dop = uint32_t(doppler);

    check_range(_pdw.markers,        0xFFF,  "markers");
    check_range(_pdw.phase_control,  1,      "phase_control");
    check_range(_pdw.rf_off,         1,      "rf_off");
    check_range(_pdw.auto_blank,     1,      "auto_blank");
    check_range(_pdw.new_waveform,   1,      "new_waveform");
    check_range(_pdw.zero_hold,      1,      "zero_hold");
    check_range(_pdw.wfm_markers,    0xF,    "wfm_markers");
    check_range(_pdw.waveform_index, 0xFFFF, "waveform_index");

    pack_head(w, VECTOR3_PDW_FORMAT, _pdw.operation, freq, phase);
    w[2]  = uint32_t(ps & 0xFFFFFFFF);
    w[3]  = uint32_t(ps >> 32);
    w[4]  = uint32_t(width & 0xFFFFFFFF);
    w[5]  = uint32_t((width >> 32) & 0x1F) | max_power << 5 | _pdw.markers << 20;
    w[6]  = power | _pdw.phase_control << 15 | _pdw.rf_off << 16 | _pdw.auto_blank << 17 |
            _pdw.new_waveform << 18 | _pdw.zero_hold << 19 | uint32_t(lead) << 20 |
            _pdw.wfm_markers << 28;
    // waveform type (bits 8-9) is always 0
    w[7]  = _pdw.waveform_index << 10 | (power2 & 0x3F) << 26;
    w[8]  = power2 >> 6 | max_power2 << 9;
    w[9]  = 0;
    w[10] = (dop & 0x1FF) << 23;
    w[11] = dop >> 9;
    return w;
}

vector3_pdw_s vector3_pdw_decode(const std::vector<uint32_t> &_words)
{
    vector3_pdw_s p;
    uint32_t phase;
    double freq;
    p.operation = unpack_head(_words, VECTOR3_PDW_WORDS, VECTOR3_PDW_FORMAT, freq, phase);
    if(p.operation == PDW_OP_RESET) return p;

    p.frequency      = freq;
    p.phase          = double(phase)*360.0/4096.0;
    p.start_time     = decode_time(_words[2], _words[3]);
    p.width          = double(uint64_t(_words[5] & 0x1F) << 32 | _words[4])*0.5e-9;
    p.max_power      = decode_vector_power(_words[5] >> 5);
    p.markers        = (_words[5] >> 20) & 0xFFF;
    p.power          = decode_vector_power(_words[6]);
    p.phase_control  = (_words[6] >> 15) & 0x1;
    p.rf_off         = (_words[6] >> 16) & 0x1;
    p.auto_blank     = (_words[6] >> 17) & 0x1;
    p.new_waveform   = (_words[6] >> 18) & 0x1;
    p.zero_hold      = (_words[6] >> 19) & 0x1;
    p.lo_lead        = double((_words[6] >> 20) & 0xFF)*4e-9;
    p.wfm_markers    = (_words[6] >> 28) & 0xF;
    p.waveform_index = (_words[7] >> 10) & 0xFFFF;
    p.power2         = decode_vector_power((_words[7] >> 26) | (_words[8] & 0x1FF) << 6);
    p.max_power2     = decode_vector_power(_words[8] >> 9);
    p.doppler        = double((_words[10] >> 23) | (_words[11] & 0xFFF) << 9);
    return p;
}

void pdw_append_words(std::vector<uint8_t> &_out, const std::vector<uint32_t> &_words)
{
    for(auto v : _words){
        _out.push_back(uint8_t(v));
        _out.push_back(uint8_t(v >> 8));
        _out.push_back(uint8_t(v >> 16));
        _out.push_back(uint8_t(v >> 24));
    }
}

std::vector<uint32_t> pdw_read_words(const std::vector<uint8_t> &_in, size_t _offset, size_t _count)
{
    if(_offset > _in.size() || (_in.size() - _offset)/4 < _count)
        throw invalid_parameter("offset", "buffer too short for " + std::to_string(_count) + " words");
    std::vector<uint32_t> w(_count);
    for(size_t i = 0; i < _count; i++){
        const uint8_t *b = &_in[_offset + 4*i];
        w[i] = uint32_t(b[0]) | uint32_t(b[1]) << 8 | uint32_t(b[2]) << 16 | uint32_t(b[3]) << 24;
    }
    return w;
}

}
