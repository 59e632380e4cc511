// target device memory constraints, length correction and DAC formatting
#ifndef ARBGEN_DEVICE_PROFILE_HH
#define ARBGEN_DEVICE_PROFILE_HH

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include "waveform.hh"

namespace arbgen{

class logger_client;

// hard ceiling on a corrected waveform, in samples
#define ARBGEN_MAX_CORRECTED_LENGTH (size_t(1) << 28)

struct device_profile_s {
    std::string  name;
    size_t       min_length;        // samples
    size_t       granularity;       // length must be a multiple of this
    double       min_sample_rate;   // Sa/s
    double       max_sample_rate;   // Sa/s
    size_t       max_length;        // samples, 0 for unbounded
    int          bin_mult;          // full scale DAC code
    unsigned int bin_shift;         // DAC code left shift
    unsigned int sample_bytes;      // 1 or 2
    bool         big_endian;
};

typedef enum {
    LENGTH_ZERO_PAD=0,  // append zeros, for pulsed signals
    LENGTH_REPEAT       // tile whole copies, for periodic signals
} length_policy_t;

#define DEVICE_PROFILE_COUNT (9)

// m8190a_12bit, m8190a_14bit, m8190a_duc, m8195a, m8196a, vsg, vsg_m938x,
// vector_uxg, generic
extern const device_profile_s device_profiles[DEVICE_PROFILE_COUNT];

// throws invalid_parameter("device") for a name not in the table
const device_profile_s & device_profile_lookup(const std::string &_name);

// throws waveform_constraint_violation("sample_rate")
void validate_sample_rate(const device_profile_s &_p, double _sample_rate);

// length a _len sample waveform becomes under _policy, throws
// waveform_constraint_violation naming the constraint that cannot be met
size_t corrected_length(size_t _len, const device_profile_s &_p, length_policy_t _policy);

// extend _w in place (never truncates), sets corrected and logs at INFO
// when the length changes
void correct_length(waveform_s &_w,
                    const device_profile_s &_p,
                    length_policy_t _policy,
                    logger_client *_log=nullptr);

// true if the length already satisfies _p
bool length_satisfies(size_t _len, const device_profile_s &_p);

// quantize to DAC codes (bin_mult*x << bin_shift), interleave I/Q and pack
// sample_bytes per value in the profile's byte order
std::vector<uint8_t> format_samples(const waveform_s &_w, const device_profile_s &_p);

}

#endif /* ARBGEN_DEVICE_PROFILE_HH */
