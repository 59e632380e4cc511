// raised-cosine family pulse shaping filter design
#ifndef ARBGEN_PULSE_SHAPE_HH
#define ARBGEN_PULSE_SHAPE_HH

#include <math.h>
#include <string>
#include <vector>

namespace arbgen{

typedef enum {
    PULSE_SHAPE_UNKNOWN=0,
    PULSE_SHAPE_RC,             // raised cosine
    PULSE_SHAPE_RRC             // root raised cosine
} pulse_shape_t;

struct pulse_shape_type_s {
    const char *  name;
    const char *  fullname;
    pulse_shape_t kind;
};

#define PULSE_SHAPE_TYPE_COUNT (3)

extern const struct pulse_shape_type_s pulse_shape_types[PULSE_SHAPE_TYPE_COUNT];

// "rc" / "rrc" (case-insensitive), throws unsupported_modulation otherwise
pulse_shape_t pulse_shape_from_name(const std::string &_name);
const char * pulse_shape_name(pulse_shape_t _kind);

struct filter_descriptor_s {
    pulse_shape_t kind;
    float         alpha;    // roll-off, [0,1]
    unsigned int  sps;      // samples per symbol
    unsigned int  span;     // filter length in symbols, even
};

// liquid-dsp prototype design of span*sps+1 taps centred on the middle tap
// (span must be even), rescaled so the sum of squared taps equals sps: a
// zero-stuffed unit-energy symbol stream comes out of the filter with unit
// average power
std::vector<float> design_filter(const filter_descriptor_s &_fd);
std::vector<float> design_filter(pulse_shape_t _kind,
                                 float         _alpha,
                                 unsigned int  _sps,
                                 unsigned int  _span=10);

}

#endif /* ARBGEN_PULSE_SHAPE_HH */
