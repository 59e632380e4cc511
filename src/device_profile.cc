#include <math.h>
#include <algorithm>
#include "device_profile.hh"
#include "errors.hh"
#include "logger.hh"

namespace arbgen{

const device_profile_s device_profiles[DEVICE_PROFILE_COUNT] = {
    // name            min    gran   min fs     max fs      max len  mult   shift bytes big endian
    {"m8190a_12bit",   240,   48,    125e6,     12e9,       0,       8191,  2,    2,    false},
    {"m8190a_14bit",   320,   64,    125e6,     8e9,        0,       2047,  4,    2,    false},
    {"m8190a_duc",     120,   24,    125e6/48,  7.2e9/3,    0,       16383, 1,    2,    false},
    {"m8195a",         256,   256,   53.76e9,   65e9,       0,       127,   0,    1,    false},
    {"m8196a",         128,   128,   82.24e9,   93.4e9,     524288,  127,   0,    1,    false},
    {"vsg",            60,    2,     1e3,       200e6,      0,       32767, 0,    2,    true},
    {"vsg_m938x",      60,    4,     1e3,       1.2e9,      0,       32767, 0,    2,    true},
    // quantum and minimum length are read back from the instrument, callers
    // overwrite these
    {"vector_uxg",     1,     1,     1e3,       2.5e9,      0,       32767, 0,    2,    true},
    {"generic",        1,     1,     1.0,       1e12,       0,       32767, 0,    2,    false},
};

const device_profile_s & device_profile_lookup(const std::string &_name)
{
    for(unsigned int i = 0; i < DEVICE_PROFILE_COUNT; i++){
        if(device_profiles[i].name == _name) return device_profiles[i];
    }
    throw invalid_parameter("device", "no device profile named '" + _name + "'");
}

void validate_sample_rate(const device_profile_s &_p, double _sample_rate)
{
    if(!(_sample_rate >= _p.min_sample_rate && _sample_rate <= _p.max_sample_rate))
        throw waveform_constraint_violation("sample_rate",
            std::to_string(_sample_rate) + " Sa/s outside [" + std::to_string(_p.min_sample_rate) +
            ", " + std::to_string(_p.max_sample_rate) + "] for " + _p.name);
}

static size_t gcd(size_t _a, size_t _b)
{
    while(_b){
        size_t t = _a % _b;
        _a = _b;
        _b = t;
    }
    return _a;
}

static size_t round_up(size_t _v, size_t _m)
{
    return ((_v + _m - 1)/_m)*_m;
}

bool length_satisfies(size_t _len, const device_profile_s &_p)
{
    size_t gran = std::max<size_t>(1, _p.granularity);
    if(_len == 0 || _len < _p.min_length || _len % gran) return false;
    if(_p.max_length && _len > _p.max_length) return false;
    return true;
}

size_t corrected_length(size_t _len, const device_profile_s &_p, length_policy_t _policy)
{
    if(_len == 0)
        throw waveform_constraint_violation("length", "cannot correct an empty waveform");

    size_t gran = std::max<size_t>(1, _p.granularity);
    size_t l0 = std::max(_len, _p.min_length);
    size_t target = 0;
    if(_policy == LENGTH_ZERO_PAD){
        target = round_up(l0, gran);
        // padding may never more than double the signal; growth up to the
        // minimum length does not count against it
        if(target > 2*l0)
            throw waveform_constraint_violation("granularity",
                "zero padding " + std::to_string(l0) + " samples to " + std::to_string(target) +
                " would more than double them");
    }
    else{
        // smallest whole number of copies that lands on the granularity
        size_t period = (_len/gcd(_len, gran))*gran;
        if(period > ARBGEN_MAX_CORRECTED_LENGTH)
            throw waveform_constraint_violation("granularity",
                "repeating " + std::to_string(_len) + " samples to a multiple of " +
                std::to_string(gran) + " needs " + std::to_string(period) + " samples");
        target = round_up(l0, period);
    }

    if(target > ARBGEN_MAX_CORRECTED_LENGTH)
        throw waveform_constraint_violation("granularity",
            "corrected length " + std::to_string(target) + " exceeds the supported maximum");
    if(_p.max_length && target > _p.max_length)
        throw waveform_constraint_violation("max_length",
            "corrected length " + std::to_string(target) + " exceeds " +
            std::to_string(_p.max_length) + " for " + _p.name);
    return target;
}

void correct_length(waveform_s &_w,
                    const device_profile_s &_p,
                    length_policy_t _policy,
                    logger_client *_log)
{
    size_t len = _w.size();
    size_t target = corrected_length(len, _p, _policy);
    _w.requested_length = len;
    if(target == len) return;

    if(_w.format == WFM_FORMAT_IQ){
        if(_policy == LENGTH_ZERO_PAD){
            _w.iq.resize(target, std::complex<float>(0.0f, 0.0f));
        }
        else{
            _w.iq.resize(target);
            for(size_t i = len; i < target; i++) _w.iq[i] = _w.iq[i - len];
        }
    }
    else{
        if(_policy == LENGTH_ZERO_PAD){
            _w.real.resize(target, 0.0f);
        }
        else{
            _w.real.resize(target);
            for(size_t i = len; i < target; i++) _w.real[i] = _w.real[i - len];
        }
    }
    _w.corrected = true;

    if(_log != nullptr){
        *_log << logger::set_level(logger::INFO) << "length corrected for " << _p.name
              << ": " << len << " -> " << target << " samples ("
              << (_policy == LENGTH_ZERO_PAD ? "zero pad" : "repeat") << ")\n";
        _log->commit();
    }
}

static void pack_code(std::vector<uint8_t> &_out, int _code, const device_profile_s &_p)
{
    if(_p.sample_bytes == 1){
        _out.push_back(uint8_t(int8_t(_code)));
        return;
    }
    uint16_t u = uint16_t(int16_t(_code));
    if(_p.big_endian){
        _out.push_back(uint8_t(u >> 8));
        _out.push_back(uint8_t(u & 0xFF));
    }
    else{
        _out.push_back(uint8_t(u & 0xFF));
        _out.push_back(uint8_t(u >> 8));
    }
}

std::vector<uint8_t> format_samples(const waveform_s &_w, const device_profile_s &_p)
{
    size_t len = _w.size();
    if(len == 0 || len < _p.min_length)
        throw waveform_constraint_violation("min_length",
            std::to_string(len) + " samples, " + _p.name + " needs at least " + std::to_string(_p.min_length));
    if(!length_satisfies(len, _p))
        throw waveform_constraint_violation(_p.max_length && len > _p.max_length ? "max_length" : "granularity",
            std::to_string(len) + " samples do not fit " + _p.name);
    if(_p.sample_bytes != 1 && _p.sample_bytes != 2)
        throw invalid_parameter("sample_bytes", "DAC samples must be 1 or 2 bytes");

    const float limit = 1.0f + 1e-6f;
    std::vector<uint8_t> out;
    size_t values = (_w.format == WFM_FORMAT_IQ ? 2 : 1)*len;
    out.reserve(values*_p.sample_bytes);

    // truncate toward zero, as the instruments' own formatting does
    auto code = [&_p](float x){ return int(float(_p.bin_mult)*std::min(1.0f, std::max(-1.0f, x))) << _p.bin_shift; };
    if(_w.format == WFM_FORMAT_IQ){
        for(auto &v : _w.iq){
            if(fabsf(v.real()) > limit || fabsf(v.imag()) > limit)
                throw invalid_parameter("amplitude", "IQ samples must lie within [-1,1]");
            pack_code(out, code(v.real()), _p);
            pack_code(out, code(v.imag()), _p);
        }
    }
    else{
        for(auto &v : _w.real){
            if(fabsf(v) > limit)
                throw invalid_parameter("amplitude", "real samples must lie within [-1,1]");
            pack_code(out, code(v), _p);
        }
    }
    return out;
}

}
