// pulse descriptor word records and their binary wire forms
#ifndef ARBGEN_PDW_HH
#define ARBGEN_PDW_HH

#include <stddef.h>
#include <stdint.h>
#include <vector>

namespace arbgen{

//********************** PDW ******************************
//
// Three unrelated record layouts, each with its own struct so
// fields of one can never be packed with the layout of another:
//
//  analog_pdw_s   -- agile source, format 1, 7 words
//  vector_pdw_s   -- vector source, format 1, 6 words
//  vector3_pdw_s  -- vector source, format 3 revision B, 12 words
//
// Words are 32 bits, written little endian. Word 0 always opens
// with format (3 bits) and operation (2 bits) followed by the low
// 27 bits of the frequency; word 1 carries the remaining 20
// frequency bits and 12 bits of phase.
//
// Units in the structs are SI (Hz, s, degrees) except where noted.
//
//////////////////////////////////////////////////////////////////

typedef enum {
    PDW_OP_NONE=0,
    PDW_OP_FIRST=1,     // first record after a reset
    PDW_OP_RESET=2
} pdw_operation_t;

#define ANALOG_PDW_FORMAT   (1)
#define VECTOR_PDW_FORMAT   (1)
#define VECTOR3_PDW_FORMAT  (3)

#define ANALOG_PDW_WORDS    (7)
#define VECTOR_PDW_WORDS    (6)
#define VECTOR3_PDW_WORDS   (12)

// 1/1024 Hz steps, 47 bits
#define PDW_FREQ_SCALE      (1024.0)
#define PDW_FREQ_BITS       (47)
// 0.005 dB steps above -140 dBm, 15 bits
#define PDW_VECTOR_POWER_MIN  (-140.0)
#define PDW_VECTOR_POWER_MAX  (23.835)
#define PDW_VECTOR_POWER_STEP (0.005)
// relative power of an analog record, dB
#define PDW_ANALOG_POWER_MIN  (-150.0)
#define PDW_ANALOG_POWER_MAX  (36.0)
// Hz/us per chirp rate count
#define PDW_CHIRP_RATE_RES    (21.822)

struct analog_pdw_s {
    unsigned int operation     = PDW_OP_NONE;
    double       frequency     = 1e9;   // Hz
    double       phase         = 0.0;   // degrees, [0,360]
    double       start_time    = 0.0;   // s, 1 ps resolution
    double       width         = 0.0;   // s, 1 ns resolution
    double       power         = 0.0;   // dB relative to full scale
    unsigned int markers       = 0;     // 12 bit mask
    unsigned int pulse_mode    = 2;     // 0 CW, 1 RF off, 2 pulsed
    unsigned int phase_control = 0;     // 0 coherent, 1 continuous
    unsigned int band_adjust   = 0;     // 0 CW switch points, 1 upper, 2 lower
    unsigned int chirp_control = 0;     // 0 stitched ramp, 1 triangle, 2 ramp, 3 reserved
    unsigned int code          = 0;     // phase/frequency coding table index
    double       chirp_rate    = 0.0;   // Hz/us
    unsigned int freq_map      = 0;     // frequency band map
};

struct vector_pdw_s {
    unsigned int operation      = PDW_OP_NONE;
    double       frequency      = 1e9;
    double       phase          = 0.0;
    double       start_time     = 0.0;
    double       power          = 0.0;  // dBm
    unsigned int markers        = 0;
    unsigned int phase_control  = 0;
    unsigned int rf_off         = 0;    // 1 turns the output off
    unsigned int waveform_index = 0;    // 16 bits
    unsigned int wfm_markers    = 0;    // 4 bit mask
};

struct vector3_pdw_s {
    unsigned int operation      = PDW_OP_NONE;
    double       frequency      = 1e9;
    double       phase          = 0.0;
    double       start_time     = 0.0;
    double       width          = 0.0;  // s, 0.5 ns resolution
    double       max_power      = 0.0;  // dBm
    unsigned int markers        = 0;
    double       power          = 0.0;  // dBm
    unsigned int phase_control  = 0;
    unsigned int rf_off         = 0;
    unsigned int auto_blank     = 1;
    unsigned int new_waveform   = 1;    // 0 continues with the prior record's settings
    unsigned int zero_hold      = 0;    // 0 zero, 1 hold last value
    double       lo_lead        = 0.0;  // s, 4 ns resolution, 8 bits
    unsigned int wfm_markers    = 0;
    unsigned int waveform_index = 0;
    double       power2         = 0.0;  // dBm
    double       max_power2     = 0.0;  // dBm
    double       doppler        = 0.0;  // Hz, 21 bits
};

// 5 bit exponent / 10 bit mantissa: (1 + m/1024) * 2^(e-26)
uint32_t pdw_power_float_encode(double _linear);
double   pdw_power_float_decode(uint32_t _code);

// 4 bit exponent / 13 bit mantissa: m * 4^e * 21.822 Hz/us; throws
// pdw_field_out_of_range("chirp_rate") when the exponent overflows
uint32_t pdw_chirp_rate_encode(double _rate);
double   pdw_chirp_rate_decode(uint32_t _code);

// encode validates every field and throws pdw_field_out_of_range naming
// the first offender; a reset record packs only format and operation
std::vector<uint32_t> analog_pdw_encode(const analog_pdw_s &_pdw);
std::vector<uint32_t> vector_pdw_encode(const vector_pdw_s &_pdw);
std::vector<uint32_t> vector3_pdw_encode(const vector3_pdw_s &_pdw);

// decode a record; the wrong word count or format field throws
// pdw_field_out_of_range("format"), a reset record decodes to the
// struct defaults with only the operation set. Phase comes back in
// [0,360): 360 degrees, and anything rounding to a full turn on the
// 12 bit grid, wraps to 0
analog_pdw_s  analog_pdw_decode(const std::vector<uint32_t> &_words);
vector_pdw_s  vector_pdw_decode(const std::vector<uint32_t> &_words);
vector3_pdw_s vector3_pdw_decode(const std::vector<uint32_t> &_words);

// append words to a byte buffer, little endian
void pdw_append_words(std::vector<uint8_t> &_out, const std::vector<uint32_t> &_words);
// read _count words at _offset, little endian
std::vector<uint32_t> pdw_read_words(const std::vector<uint8_t> &_in, size_t _offset, size_t _count);

}

#endif /* ARBGEN_PDW_HH */
