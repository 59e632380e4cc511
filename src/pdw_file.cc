#include <ctype.h>
#include <string.h>
#include "pdw_file.hh"
#include "errors.hh"

namespace arbgen{

static void put_u8(std::vector<uint8_t> &_out, uint8_t _v)
{
    _out.push_back(_v);
}

static void put_u32(std::vector<uint8_t> &_out, uint32_t _v)
{
    for(unsigned int i = 0; i < 4; i++) _out.push_back(uint8_t(_v >> (8*i)));
}

static void put_u64(std::vector<uint8_t> &_out, uint64_t _v)
{
    for(unsigned int i = 0; i < 8; i++) _out.push_back(uint8_t(_v >> (8*i)));
}

static void put_f64(std::vector<uint8_t> &_out, double _v)
{
    uint64_t bits;
    memcpy(&bits, &_v, sizeof(bits));
    put_u64(_out, bits);
}

static void put_zeros(std::vector<uint8_t> &_out, size_t _n)
{
    _out.insert(_out.end(), _n, 0);
}

static int hex_digit(char _c)
{
    if(_c >= '0' && _c <= '9') return _c - '0';
    _c = char(tolower(_c));
    if(_c >= 'a' && _c <= 'f') return _c - 'a' + 10;
    return -1;
}

static std::vector<uint8_t> hex_to_bytes(const std::string &_hex)
{
    if(_hex.size() % 2)
        throw invalid_parameter("pattern", "hex pattern length must be even, got " + std::to_string(_hex.size()));
    std::vector<uint8_t> out(_hex.size()/2);
    for(size_t i = 0; i < out.size(); i++){
        int hi = hex_digit(_hex[2*i]);
        int lo = hex_digit(_hex[2*i + 1]);
        if(hi < 0 || lo < 0)
            throw invalid_parameter("pattern", "'" + _hex + "' is not a hex string");
        out[i] = uint8_t(hi << 4 | lo);
    }
    return out;
}

std::vector<fpc_entry_s> fpc_default_entries()
{
    std::vector<fpc_entry_s> e(3);
    e[0] = {0, 1, FPC_CODING_PHASE,     {0.0, 180.0},     "",         "NoCodingFirstEntry"};
    e[1] = {1, 1, FPC_CODING_PHASE,     {0.0, 180.0},     "2A61D327", "PSKcode32bits"};
    e[2] = {1, 1, FPC_CODING_FREQUENCY, {-10e6, 10e6},    "5AC4",     "FSKcodeTest16bits"};
    return e;
}

std::vector<uint8_t> fpc_entry_encode(const fpc_entry_s &_entry)
{
    if(_entry.state > 1)
        throw invalid_parameter("state", "coding entry state must be 0 or 1");
    if(_entry.bits_per_subpulse != 1)
        throw invalid_parameter("bits_per_subpulse", "only one bit per subpulse is supported");
    if(_entry.coding_type != FPC_CODING_PHASE && _entry.coding_type != FPC_CODING_FREQUENCY)
        throw invalid_parameter("coding_type", "coding type must be 0 (phase) or 1 (frequency)");
    if(_entry.state_mapping.size() != (1U << _entry.bits_per_subpulse))
        throw invalid_parameter("state_mapping", "need 2^bits state mapping values");
    std::vector<uint8_t> pattern = hex_to_bytes(_entry.pattern_hex);
    if(pattern.size() > FPC_MAX_PATTERN_BYTES)
        throw invalid_parameter("pattern", "pattern longer than 8192 bytes");
    if(_entry.comment.size() > FPC_MAX_COMMENT)
        throw invalid_parameter("comment", "comment longer than 60 characters");

    std::vector<uint8_t> out;
    put_u8(out, _entry.state);
    put_u8(out, _entry.bits_per_subpulse);
    put_u8(out, _entry.coding_type);
    put_u8(out, uint8_t(_entry.comment.size()));
    put_u32(out, uint32_t(8*pattern.size()));
    for(auto v : _entry.state_mapping) put_f64(out, v);
    out.insert(out.end(), pattern.begin(), pattern.end());
    out.insert(out.end(), _entry.comment.begin(), _entry.comment.end());
    return out;
}

std::vector<uint8_t> fpc_block_encode(const std::vector<fpc_entry_s> &_entries)
{
    std::vector<uint8_t> body;
    put_u32(body, FPC_VERSION);
    put_u32(body, uint32_t(_entries.size()));
    for(auto &e : _entries){
        std::vector<uint8_t> b = fpc_entry_encode(e);
        body.insert(body.end(), b.begin(), b.end());
    }

    std::vector<uint8_t> out;
    put_u32(out, PDW_BLOCK_ID_FPC);
    put_u32(out, 0);
    // size excludes the id and reserved words
    put_u64(out, body.size());
    out.insert(out.end(), body.begin(), body.end());
    put_zeros(out, (16 - out.size() % 16) % 16);
    return out;
}

std::vector<uint8_t> file_header_encode(uint32_t _data_id)
{
    std::vector<uint8_t> out;
    out.insert(out.end(), {'S', 'T', 'R', 'M'});
    put_u32(out, 1);                            // version
    put_u32(out, (1U << 1) & 0x3fffff);         // data in the first 4096 byte block
    out.insert(out.end(), {'K', 'E', 'Y', 'S'});
    put_zeros(out, 16);
    put_u32(out, 0);                            // flags
    put_u32(out, 0);                            // unique id
    put_u32(out, _data_id);
    put_u32(out, 0);
    return out;
}

std::vector<uint8_t> padding_block_encode(size_t _size)
{
    if(_size < PDW_PADDING_HEADER_SIZE)
        throw invalid_parameter("padding", "padding block needs at least 16 bytes");
    std::vector<uint8_t> out;
    put_u32(out, PDW_BLOCK_ID_PADDING);
    put_u32(out, 0);
    put_u64(out, _size - PDW_PADDING_HEADER_SIZE);
    put_zeros(out, _size - PDW_PADDING_HEADER_SIZE);
    return out;
}

std::vector<uint8_t> pdw_block_header_encode(uint32_t _record_size, uint64_t _byte_count)
{
    std::vector<uint8_t> out;
    put_u32(out, PDW_BLOCK_ID_PDW);
    put_u32(out, _record_size);
    put_u64(out, _byte_count);
    return out;
}

void validate_pdw_operations(const std::vector<unsigned int> &_ops)
{
    if(_ops.empty())
        throw invalid_pdw_sequence("operation", "a PDW sequence needs at least one record");
    if(_ops[0] != PDW_OP_FIRST && _ops[0] != PDW_OP_RESET)
        throw invalid_pdw_sequence("operation", "record 0 must be first-after-reset (1) or reset (2), got " +
                                   std::to_string(_ops[0]));
    for(size_t i = 0; i < _ops.size(); i++){
        if(_ops[i] != PDW_OP_RESET) continue;
        if(i + 1 == _ops.size())
            throw invalid_pdw_sequence("operation", "reset at record " + std::to_string(i) +
                                       " is not followed by first-after-reset");
        if(_ops[i + 1] != PDW_OP_FIRST)
            throw invalid_pdw_sequence("operation", "record " + std::to_string(i + 1) +
                                       " after a reset must be first-after-reset, got " +
                                       std::to_string(_ops[i + 1]));
    }
}

template<class T>
static std::vector<unsigned int> operations(const std::vector<T> &_list)
{
    std::vector<unsigned int> ops(_list.size());
    for(size_t i = 0; i < _list.size(); i++) ops[i] = _list[i].operation;
    return ops;
}

void validate_pdw_sequence(const std::vector<analog_pdw_s> &_list)  { validate_pdw_operations(operations(_list)); }
void validate_pdw_sequence(const std::vector<vector_pdw_s> &_list)  { validate_pdw_operations(operations(_list)); }
void validate_pdw_sequence(const std::vector<vector3_pdw_s> &_list) { validate_pdw_operations(operations(_list)); }

std::vector<uint8_t> build_raw_pdw_block(const std::vector<analog_pdw_s> &_list)
{
    std::vector<uint8_t> out;
    out.reserve(4*ANALOG_PDW_WORDS*_list.size());
    for(auto &p : _list) pdw_append_words(out, analog_pdw_encode(p));
    return out;
}

std::vector<uint8_t> build_raw_pdw_block(const std::vector<vector_pdw_s> &_list)
{
    std::vector<uint8_t> out;
    out.reserve(4*VECTOR_PDW_WORDS*_list.size());
    for(auto &p : _list) pdw_append_words(out, vector_pdw_encode(p));
    return out;
}

std::vector<uint8_t> build_raw_pdw_block(const std::vector<vector3_pdw_s> &_list)
{
    std::vector<uint8_t> out;
    out.reserve(4*VECTOR3_PDW_WORDS*_list.size());
    for(auto &p : _list) pdw_append_words(out, vector3_pdw_encode(p));
    return out;
}

// header, optional coding table and padding up to the PDW block header
static std::vector<uint8_t> file_preamble(uint32_t _data_id, const std::vector<uint8_t> &_fpc)
{
    std::vector<uint8_t> out = file_header_encode(_data_id);
    size_t used = out.size() + _fpc.size();
    if(used + PDW_PADDING_HEADER_SIZE + PDW_BLOCK_HEADER_SIZE > PDW_DATA_OFFSET)
        throw invalid_parameter("fpc", "coding block of " + std::to_string(_fpc.size()) +
                                " bytes does not fit ahead of the PDW data");
    out.insert(out.end(), _fpc.begin(), _fpc.end());
    std::vector<uint8_t> pad = padding_block_encode(PDW_DATA_OFFSET - PDW_BLOCK_HEADER_SIZE - used);
    out.insert(out.end(), pad.begin(), pad.end());
    return out;
}

static std::vector<uint8_t> analog_file(const std::vector<analog_pdw_s> &_list,
                                        const std::vector<uint8_t> &_fpc)
{
    validate_pdw_sequence(_list);
    std::vector<uint8_t> records = build_raw_pdw_block(_list);

    std::vector<uint8_t> out = file_preamble(PDW_DATA_ID_ANALOG, _fpc);
    std::vector<uint8_t> bh = pdw_block_header_encode(4*ANALOG_PDW_WORDS, records.size());
    out.insert(out.end(), bh.begin(), bh.end());
    out.insert(out.end(), records.begin(), records.end());
    put_zeros(out, (16 - out.size() % 16) % 16);
    put_zeros(out, 16);
    return out;
}

std::vector<uint8_t> build_analog_pdw_file(const std::vector<analog_pdw_s> &_list, bool _include_fpc)
{
    if(_include_fpc) return analog_file(_list, fpc_block_encode(fpc_default_entries()));
    return analog_file(_list, std::vector<uint8_t>());
}

std::vector<uint8_t> build_analog_pdw_file(const std::vector<analog_pdw_s> &_list,
                                           const std::vector<fpc_entry_s> &_entries)
{
    return analog_file(_list, fpc_block_encode(_entries));
}

std::vector<uint8_t> build_vector_pdw_file(const std::vector<vector_pdw_s> &_list)
{
    validate_pdw_sequence(_list);
    std::vector<uint8_t> records = build_raw_pdw_block(_list);

    std::vector<uint8_t> out = file_preamble(PDW_DATA_ID_VECTOR, std::vector<uint8_t>());
    std::vector<uint8_t> bh = pdw_block_header_encode(4*VECTOR_PDW_WORDS, records.size());
    out.insert(out.end(), bh.begin(), bh.end());
    out.insert(out.end(), records.begin(), records.end());
    return out;
}

std::vector<uint8_t> build_vector3_pdw_file(const std::vector<vector3_pdw_s> &_list)
{
    validate_pdw_sequence(_list);
    std::vector<uint8_t> records = build_raw_pdw_block(_list);

    std::vector<uint8_t> out = file_preamble(PDW_DATA_ID_VECTOR, std::vector<uint8_t>());
    std::vector<uint8_t> bh = pdw_block_header_encode(4*VECTOR3_PDW_WORDS, UINT64_MAX);
    out.insert(out.end(), bh.begin(), bh.end());
    out.insert(out.end(), records.begin(), records.end());
    return out;
}

}
