// streaming file assembly: header, optional coding table, padding, and
// the PDW block starting at a fixed offset
#ifndef ARBGEN_PDW_FILE_HH
#define ARBGEN_PDW_FILE_HH

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include "pdw.hh"

namespace arbgen{

//
// byte offset   block
//    0          file header, 48 bytes ("STRM" ... "KEYS" ... data id)
//   48          frequency/phase coding block (analog files, optional)
//    .          padding block: id 1, reserved, u64 filler size, zeros
// 4080          PDW block header: id 16, record size, u64 byte count
// 4096          records, in input order
//
// Analog files then zero fill to a 16 byte boundary and close with a
// 16 byte zero end block.
//

#define PDW_FILE_HEADER_SIZE     (48)
#define PDW_BLOCK_HEADER_SIZE    (16)
#define PDW_PADDING_HEADER_SIZE  (16)
#define PDW_DATA_OFFSET          (4096)

#define PDW_BLOCK_ID_PADDING     (1)
#define PDW_BLOCK_ID_FPC         (13)
#define PDW_BLOCK_ID_PDW         (16)

#define PDW_DATA_ID_ANALOG       (16)
#define PDW_DATA_ID_VECTOR       (64)

#define FPC_VERSION              (2)
#define FPC_MAX_PATTERN_BYTES    (8192)
#define FPC_MAX_COMMENT          (60)

typedef enum {
    FPC_CODING_PHASE=0,
    FPC_CODING_FREQUENCY=1
} fpc_coding_t;

// one frequency/phase coding table entry
struct fpc_entry_s {
    uint8_t             state;              // 0 off, 1 on
    uint8_t             bits_per_subpulse;  // only 1 is supported
    uint8_t             coding_type;        // fpc_coding_t
    std::vector<double> state_mapping;      // 2^bits phases (deg) or offsets (Hz)
    std::string         pattern_hex;        // even number of hex digits
    std::string         comment;            // at most 60 characters
};

// no coding / 32 bit PSK / 16 bit FSK, indices 0..2 of the coding table
std::vector<fpc_entry_s> fpc_default_entries();

std::vector<uint8_t> fpc_entry_encode(const fpc_entry_s &_entry);
// block id 13, zero padded to a multiple of 16 bytes
std::vector<uint8_t> fpc_block_encode(const std::vector<fpc_entry_s> &_entries);

std::vector<uint8_t> file_header_encode(uint32_t _data_id);
// _size counts the 16 byte header and the filler
std::vector<uint8_t> padding_block_encode(size_t _size);
// id 16, record size, then the record section length in bytes rather than
// a record count (count = bytes / record size); vector format 3 files write
// all ones there, meaning "to the end of the file"
std::vector<uint8_t> pdw_block_header_encode(uint32_t _record_size, uint64_t _byte_count);

// non-empty, opens with first-after-reset or reset, and every reset is
// immediately followed by first-after-reset; throws invalid_pdw_sequence
void validate_pdw_operations(const std::vector<unsigned int> &_ops);
void validate_pdw_sequence(const std::vector<analog_pdw_s> &_list);
void validate_pdw_sequence(const std::vector<vector_pdw_s> &_list);
void validate_pdw_sequence(const std::vector<vector3_pdw_s> &_list);

std::vector<uint8_t> build_analog_pdw_file(const std::vector<analog_pdw_s> &_list,
                                           bool _include_fpc=true);
std::vector<uint8_t> build_analog_pdw_file(const std::vector<analog_pdw_s> &_list,
                                           const std::vector<fpc_entry_s> &_entries);
std::vector<uint8_t> build_vector_pdw_file(const std::vector<vector_pdw_s> &_list);
// byte count is written as all ones: records run to the end of the file
std::vector<uint8_t> build_vector3_pdw_file(const std::vector<vector3_pdw_s> &_list);

// records only, for LAN streaming where the header travels separately;
// per-record validation only, a stream may continue mid-sequence
std::vector<uint8_t> build_raw_pdw_block(const std::vector<analog_pdw_s> &_list);
std::vector<uint8_t> build_raw_pdw_block(const std::vector<vector_pdw_s> &_list);
std::vector<uint8_t> build_raw_pdw_block(const std::vector<vector3_pdw_s> &_list);

}

#endif /* ARBGEN_PDW_FILE_HH */
