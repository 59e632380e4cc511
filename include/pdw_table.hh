// comma separated PDW description with named, optional fields
#ifndef ARBGEN_PDW_TABLE_HH
#define ARBGEN_PDW_TABLE_HH

#include <stdint.h>
#include <string>
#include <vector>

#include "pdw.hh"

namespace arbgen{

class logger_client;

typedef enum {
    PDW_FIELD_UNKNOWN=0,
    PDW_FIELD_OPERATION,
    PDW_FIELD_TIME,
    PDW_FIELD_FREQUENCY,
    PDW_FIELD_PHASE,
    PDW_FIELD_POWER,
    PDW_FIELD_WIDTH,
    PDW_FIELD_MARKERS,
    PDW_FIELD_PULSE_MODE,
    PDW_FIELD_PHASE_MODE,
    PDW_FIELD_BAND_ADJUST,
    PDW_FIELD_CHIRP_CONTROL,
    PDW_FIELD_CODE,
    PDW_FIELD_CHIRP_RATE,
    PDW_FIELD_FREQ_BAND_MAP,
    PDW_FIELD_RF_OFF,
    PDW_FIELD_WAVEFORM_INDEX,
    PDW_FIELD_NAME,
    PDW_FIELD_WFM_MARKERS,
    PDW_FIELD_ZERO_HOLD,
    PDW_FIELD_AUTO_BLANK,
    PDW_FIELD_NEW_WFM,
    PDW_FIELD_LO_LEAD,
    PDW_FIELD_MAX_POWER,
    PDW_FIELD_MAX_POWER_2,
    PDW_FIELD_POWER_2,
    PDW_FIELD_DOPPLER
} pdw_field_t;

// which record layouts carry a field
#define PDW_VARIANT_ANALOG  (0x1)
#define PDW_VARIANT_VECTOR  (0x2)
#define PDW_VARIANT_VECTOR3 (0x4)

struct pdw_field_type_s {
    const char * name;
    pdw_field_t  id;
    const char * default_value;
    uint8_t      variants;
};

#define PDW_FIELD_TYPE_COUNT (27)

extern const struct pdw_field_type_s pdw_field_types[PDW_FIELD_TYPE_COUNT];

// case-insensitive; an unknown name throws invalid_parameter(_name)
pdw_field_t pdw_field_from_name(const std::string &_name);
const char * pdw_field_name(pdw_field_t _id);
const char * pdw_field_default(pdw_field_t _id);

struct pdw_table_s {
    std::vector<std::string>               fields;  // canonical names
    std::vector<std::vector<std::string> > rows;
};

// header row then data rows; blank lines and '#' comments skipped; a
// row whose cell count differs from the header throws
// invalid_parameter("row")
pdw_table_s parse_pdw_table(const std::string &_text);
std::string write_pdw_table(const pdw_table_s &_table);

// waveform names in index order
struct windex_s {
    std::vector<std::string> names;
};

// "Id,Filename" followed by one row per waveform, ids counting from 0
windex_s    parse_windex(const std::string &_text);
std::string windex_to_csv(const windex_s &_windex);
// throws invalid_parameter("Name") for a name not in the index
unsigned int windex_lookup(const windex_s &_windex, const std::string &_name);

// absent fields take their defaults; fields the target layout has no
// slot for are skipped with a DEBUG line
std::vector<analog_pdw_s>  pdw_table_to_analog(const pdw_table_s &_table,
                                               logger_client *    _log=nullptr);
std::vector<vector_pdw_s>  pdw_table_to_vector(const pdw_table_s &_table,
                                               const windex_s &   _windex,
                                               logger_client *    _log=nullptr);
std::vector<vector3_pdw_s> pdw_table_to_vector3(const pdw_table_s &_table,
                                                const windex_s &   _windex,
                                                logger_client *    _log=nullptr);

}

#endif /* ARBGEN_PDW_TABLE_HH */
