#include <math.h>
#include <strings.h>
#include "liquid.h"
#include "constellation.hh"
#include "errors.hh"

namespace arbgen{

const struct modulation_type_s modulation_types[MODULATION_TYPE_COUNT] = {
    // name      fullname        scheme        bps
    {"unknown",  "unknown_mod",  MOD_UNKNOWN,  0},
    {"bpsk",     "psk2",         MOD_BPSK,     1},
    {"qpsk",     "psk4",         MOD_QPSK,     2},
    {"8psk",     "psk8",         MOD_8PSK,     3},
    {"16qam",    "qam16",        MOD_QAM16,    4},
    {"32qam",    "qam32",        MOD_QAM32,    5},
    {"64qam",    "qam64",        MOD_QAM64,    6},
    {"128qam",   "qam128",       MOD_QAM128,   7},
    {"256qam",   "qam256",       MOD_QAM256,   8},
    {"16apsk",   "apsk16",       MOD_APSK16,   4},
    {"32apsk",   "apsk32",       MOD_APSK32,   5},
    {"64apsk",   "apsk64",       MOD_APSK64,   6},
};

modulation_t modulation_from_name(const std::string &_name)
{
    for(unsigned int i = 1; i < MODULATION_TYPE_COUNT; i++){
        if(strcasecmp(_name.c_str(), modulation_types[i].name) == 0 ||
           strcasecmp(_name.c_str(), modulation_types[i].fullname) == 0)
            return modulation_types[i].scheme;
    }
    throw unsupported_modulation("scheme", "unknown modulation '" + _name + "'");
}

const char * modulation_name(modulation_t _scheme)
{
    for(unsigned int i = 0; i < MODULATION_TYPE_COUNT; i++){
        if(modulation_types[i].scheme == _scheme) return modulation_types[i].name;
    }
    return modulation_types[0].name;
}

unsigned int modulation_bits_per_symbol(modulation_t _scheme)
{
    for(unsigned int i = 1; i < MODULATION_TYPE_COUNT; i++){
        if(modulation_types[i].scheme == _scheme) return modulation_types[i].bps;
    }
    throw unsupported_modulation("scheme", "modulation is not enumerated");
}

std::vector<apsk_ring_s> apsk_rings(modulation_t _scheme)
{
    switch(_scheme){
        case MOD_APSK16: return {{4, 1.0f}, {12, 2.53f}};
        case MOD_APSK32: return {{4, 1.0f}, {12, 2.53f}, {16, 4.30f}};
        case MOD_APSK64: return {{4, 1.0f}, {12, 2.4f}, {20, 4.3f}, {28, 7.0f}};
        default: break;
    }
    return std::vector<apsk_ring_s>();
}

// liquid modem behind every PSK and QAM scheme; the cross 32 and 128 point
// constellations are liquid's "square" QAM variants
static modulation_scheme liquid_scheme(modulation_t _scheme)
{
    switch(_scheme){
        case MOD_BPSK:   return LIQUID_MODEM_BPSK;
        case MOD_QPSK:   return LIQUID_MODEM_QPSK;
        case MOD_8PSK:   return LIQUID_MODEM_PSK8;
        case MOD_QAM16:  return LIQUID_MODEM_QAM16;
        case MOD_QAM32:  return LIQUID_MODEM_SQAM32;
        case MOD_QAM64:  return LIQUID_MODEM_QAM64;
        case MOD_QAM128: return LIQUID_MODEM_SQAM128;
        case MOD_QAM256: return LIQUID_MODEM_QAM256;
        default: break;
    }
    return LIQUID_MODEM_UNKNOWN;
}

static void build_liquid(std::vector<std::complex<float> > &_p, modulation_t _scheme, unsigned int _bps)
{
    modemcf mod = modemcf_create(liquid_scheme(_scheme));
    if(mod == NULL)
        throw unsupported_modulation("scheme", std::string("liquid has no modem for ") + modulation_name(_scheme));
    _p.resize(1U << _bps);
    int rc = LIQUID_OK;
    for(unsigned int s = 0; s < _p.size() && rc == LIQUID_OK; s++)
        rc = modemcf_modulate(mod, s, &_p[s]);
    modemcf_destroy(mod);
    if(rc != LIQUID_OK)
        throw unsupported_modulation("scheme", std::string("liquid failed to map ") + modulation_name(_scheme));
}

static void build_apsk(std::vector<std::complex<float> > &_p, const std::vector<apsk_ring_s> &_rings)
{
    _p.clear();
    for(auto &ring : _rings){
        for(unsigned int i = 0; i < ring.points; i++){
            double theta = M_PI/double(ring.points) + 2.0*M_PI*double(i)/double(ring.points);
            _p.push_back(std::polar(ring.radius, float(theta)));
        }
    }
}

double constellation_energy(const constellation_s &_c)
{
    if(_c.points.empty()) return 0.0;
    double e = 0.0;
    for(auto &p : _c.points) e += std::norm(std::complex<double>(p));
    return e/double(_c.points.size());
}

constellation_s constellation_create(modulation_t _scheme)
{
    constellation_s c;
    c.scheme = _scheme;
    switch(_scheme){
        case MOD_BPSK:
        case MOD_QPSK:
        case MOD_8PSK:
        case MOD_QAM16:
        case MOD_QAM32:
        case MOD_QAM64:
        case MOD_QAM128:
        case MOD_QAM256:
            build_liquid(c.points, _scheme, modulation_bits_per_symbol(_scheme));
            break;
        case MOD_APSK16:
        case MOD_APSK32:
        case MOD_APSK64:
            build_apsk(c.points, apsk_rings(_scheme));
            break;
        default:
            throw unsupported_modulation("scheme", "modulation is not enumerated");
    }

    float scale = float(1.0/sqrt(constellation_energy(c)));
    for(auto &p : c.points) p *= scale;
    return c;
}

std::vector<std::complex<float> > constellation_map(const constellation_s &_c,
                                                    const std::vector<unsigned int> &_symbols)
{
    std::vector<std::complex<float> > out(_symbols.size());
    for(size_t i = 0; i < _symbols.size(); i++){
        if(_symbols[i] >= _c.points.size())
            throw invalid_parameter("symbol", "symbol value " + std::to_string(_symbols[i]) +
                                    " outside a " + std::to_string(_c.points.size()) + "-point alphabet");
        out[i] = _c.points[_symbols[i]];
    }
    return out;
}

}
