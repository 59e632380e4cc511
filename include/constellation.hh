// symbol index to constellation point mapping
#ifndef ARBGEN_CONSTELLATION_HH
#define ARBGEN_CONSTELLATION_HH

#include <stdint.h>
#include <complex>
#include <string>
#include <vector>

namespace arbgen{

typedef enum {
    MOD_UNKNOWN=0,
    MOD_BPSK,
    MOD_QPSK,
    MOD_8PSK,
    MOD_QAM16,
    MOD_QAM32,
    MOD_QAM64,
    MOD_QAM128,
    MOD_QAM256,
    MOD_APSK16,
    MOD_APSK32,
    MOD_APSK64
} modulation_t;

struct modulation_type_s {
    const char * name;
    const char * fullname;
    modulation_t scheme;
    unsigned int bps;           // bits per symbol
};

#define MODULATION_TYPE_COUNT (12)

extern const struct modulation_type_s modulation_types[MODULATION_TYPE_COUNT];

// accepts either label ("16qam" or "qam16"), case-insensitive; throws
// unsupported_modulation for anything not in the table
modulation_t modulation_from_name(const std::string &_name);
const char * modulation_name(modulation_t _scheme);
unsigned int modulation_bits_per_symbol(modulation_t _scheme);

// APSK ring layout, innermost ring first
struct apsk_ring_s {
    unsigned int points;
    float        radius;
};

struct constellation_s {
    modulation_t                      scheme;
    std::vector<std::complex<float> > points;   // indexed by symbol value
};

// Point tables, every one scaled to unit average energy:
//   PSK and QAM come from liquid-dsp's modemcf, symbol s at
//           modemcf_modulate(s); square QAM is Gray coded per axis, 32QAM
//           and 128QAM are the cross shaped grids minus their corners
//   APSK    rings filled innermost first, point i of an n-point ring at
//           angle pi/n + 2*pi*i/n
constellation_s constellation_create(modulation_t _scheme);

// map symbol values in [0,M) to points; throws invalid_parameter("symbol")
// on a value outside the alphabet
std::vector<std::complex<float> > constellation_map(const constellation_s &_c,
                                                    const std::vector<unsigned int> &_symbols);

// ring table for an APSK scheme, empty for anything else
std::vector<apsk_ring_s> apsk_rings(modulation_t _scheme);

// mean |x|^2 over the point table
double constellation_energy(const constellation_s &_c);

}

#endif /* ARBGEN_CONSTELLATION_HH */
