#include <math.h>
#include <stdlib.h>
#include <errno.h>
#include <strings.h>
#include <sstream>
#include "pdw_table.hh"
#include "errors.hh"
#include "logger.hh"

namespace arbgen{

#define A  PDW_VARIANT_ANALOG
#define V  PDW_VARIANT_VECTOR
#define V3 PDW_VARIANT_VECTOR3

const struct pdw_field_type_s pdw_field_types[PDW_FIELD_TYPE_COUNT] = {
    // name              id                          default     variants
    {"Unknown",          PDW_FIELD_UNKNOWN,          "",         0},
    {"Operation",        PDW_FIELD_OPERATION,        "0",        A|V|V3},
    {"Time",             PDW_FIELD_TIME,             "0",        A|V|V3},
    {"Frequency",        PDW_FIELD_FREQUENCY,        "1e9",      A|V|V3},
    {"Phase",            PDW_FIELD_PHASE,            "0",        A|V|V3},
    {"Power",            PDW_FIELD_POWER,            "0",        A|V|V3},
    {"Width",            PDW_FIELD_WIDTH,            "0",        A|V3},
    {"Markers",          PDW_FIELD_MARKERS,          "0x0",      A|V|V3},
    {"Pulse Mode",       PDW_FIELD_PULSE_MODE,       "2",        A},
    {"Phase Mode",       PDW_FIELD_PHASE_MODE,       "0",        A|V|V3},
    {"Band Adjust",      PDW_FIELD_BAND_ADJUST,      "0",        A},
    {"Chirp Control",    PDW_FIELD_CHIRP_CONTROL,    "0",        A},
    {"Code",             PDW_FIELD_CODE,             "0",        A},
    {"Chirp Rate",       PDW_FIELD_CHIRP_RATE,       "0",        A},
    {"Freq Band Map",    PDW_FIELD_FREQ_BAND_MAP,    "0",        A},
    {"RF Off",           PDW_FIELD_RF_OFF,           "0",        V|V3},
    {"Waveform Index",   PDW_FIELD_WAVEFORM_INDEX,   "0",        V|V3},
    {"Name",             PDW_FIELD_NAME,             "",         V|V3},
    {"Wfm Markers",      PDW_FIELD_WFM_MARKERS,      "0x0",      V|V3},
    {"Zero/Hold",        PDW_FIELD_ZERO_HOLD,        "0",        V3},
    {"Auto Blank",       PDW_FIELD_AUTO_BLANK,       "1",        V3},
    {"New Wfm",          PDW_FIELD_NEW_WFM,          "1",        V3},
    {"LO Lead",          PDW_FIELD_LO_LEAD,          "0",        V3},
    {"Max Power",        PDW_FIELD_MAX_POWER,        "0",        V3},
    {"Max Power 2",      PDW_FIELD_MAX_POWER_2,      "0",        V3},
    {"Power 2",          PDW_FIELD_POWER_2,          "0",        V3},
    {"Doppler",          PDW_FIELD_DOPPLER,          "0",        V3},
};

#undef A
#undef V
#undef V3

pdw_field_t pdw_field_from_name(const std::string &_name)
{
    for(unsigned int i = 1; i < PDW_FIELD_TYPE_COUNT; i++){
        if(strcasecmp(_name.c_str(), pdw_field_types[i].name) == 0) return pdw_field_types[i].id;
    }
    throw invalid_parameter(_name, "not a PDW table field");
}

const char * pdw_field_name(pdw_field_t _id)
{
    return pdw_field_types[unsigned(_id) < PDW_FIELD_TYPE_COUNT ? _id : 0].name;
}

const char * pdw_field_default(pdw_field_t _id)
{
    return pdw_field_types[unsigned(_id) < PDW_FIELD_TYPE_COUNT ? _id : 0].default_value;
}

static std::string trim(const std::string &_s)
{
    size_t b = _s.find_first_not_of(" \t\r");
    if(b == std::string::npos) return std::string();
    size_t e = _s.find_last_not_of(" \t\r");
    return _s.substr(b, e - b + 1);
}

static std::vector<std::string> split_cells(const std::string &_line)
{
    std::vector<std::string> cells;
    std::stringstream ss(_line);
    std::string cell;
    while(std::getline(ss, cell, ',')) cells.push_back(trim(cell));
    // a trailing comma leaves an empty last cell
    if(!_line.empty() && _line.back() == ',') cells.push_back(std::string());
    return cells;
}

// non-blank, non-comment lines
static std::vector<std::string> content_lines(const std::string &_text)
{
    std::vector<std::string> lines;
    std::stringstream ss(_text);
    std::string line;
    while(std::getline(ss, line)){
        line = trim(line);
        if(line.empty() || line[0] == '#') continue;
        lines.push_back(line);
    }
    return lines;
}

pdw_table_s parse_pdw_table(const std::string &_text)
{
    pdw_table_s t;
    std::vector<std::string> lines = content_lines(_text);
    if(lines.empty())
        throw invalid_parameter("row", "PDW table has no header row");

    std::vector<bool> seen(PDW_FIELD_TYPE_COUNT, false);
    for(auto &name : split_cells(lines[0])){
        pdw_field_t id = pdw_field_from_name(name);
        if(seen[id])
            throw invalid_parameter(name, "field appears twice in the header");
        seen[id] = true;
        t.fields.push_back(pdw_field_name(id));
    }

    for(size_t i = 1; i < lines.size(); i++){
        std::vector<std::string> cells = split_cells(lines[i]);
        if(cells.size() != t.fields.size())
            throw invalid_parameter("row", "row " + std::to_string(i) + " has " + std::to_string(cells.size()) +
                                    " cells, the header has " + std::to_string(t.fields.size()));
        t.rows.push_back(cells);
    }
    return t;
}

static void write_row(std::ostream &_os, const std::vector<std::string> &_cells)
{
    for(size_t i = 0; i < _cells.size(); i++) _os << (i ? "," : "") << _cells[i];
    _os << "\n";
}

std::string write_pdw_table(const pdw_table_s &_table)
{
    std::stringstream ss;
    write_row(ss, _table.fields);
    for(auto &r : _table.rows) write_row(ss, r);
    return ss.str();
}

windex_s parse_windex(const std::string &_text)
{
    std::vector<std::string> lines = content_lines(_text);
    if(lines.empty())
        throw invalid_parameter("windex", "waveform index is empty");
    std::vector<std::string> head = split_cells(lines[0]);
    if(head.size() != 2 || strcasecmp(head[0].c_str(), "Id") || strcasecmp(head[1].c_str(), "Filename"))
        throw invalid_parameter("windex", "waveform index must start with 'Id,Filename'");

    windex_s w;
    for(size_t i = 1; i < lines.size(); i++){
        std::vector<std::string> cells = split_cells(lines[i]);
        if(cells.size() != 2)
            throw invalid_parameter("row", "waveform index rows are 'id,name'");
        if(cells[0] != std::to_string(i - 1))
            throw invalid_parameter("Id", "expected id " + std::to_string(i - 1) + ", got '" + cells[0] + "'");
        w.names.push_back(cells[1]);
    }
    return w;
}

std::string windex_to_csv(const windex_s &_windex)
{
    std::stringstream ss;
    ss << "Id,Filename\n";
    for(size_t i = 0; i < _windex.names.size(); i++) ss << i << "," << _windex.names[i] << "\n";
    return ss.str();
}

unsigned int windex_lookup(const windex_s &_windex, const std::string &_name)
{
    for(size_t i = 0; i < _windex.names.size(); i++){
        if(_windex.names[i] == _name) return (unsigned int)i;
    }
    throw invalid_parameter("Name", "waveform '" + _name + "' is not in the waveform index");
}

static double parse_real(const std::string &_s, pdw_field_t _field)
{
    char *end = nullptr;
    errno = 0;
    double v = strtod(_s.c_str(), &end);
    if(_s.empty() || *end != '\0' || errno == ERANGE)
        throw invalid_parameter(pdw_field_name(_field), "'" + _s + "' is not a number");
    return v;
}

// decimal or 0x hex; an integral real ("1.0") is accepted too
static unsigned int parse_uint(const std::string &_s, pdw_field_t _field)
{
    int base = (_s.size() > 2 && _s[0] == '0' && (_s[1] == 'x' || _s[1] == 'X')) ? 16 : 10;
    char *end = nullptr;
    errno = 0;
    unsigned long v = strtoul(_s.c_str(), &end, base);
    if(!_s.empty() && _s[0] != '-' && *end == '\0' && errno == 0 && v <= 0xFFFFFFFFUL)
        return (unsigned int)v;

    double d = parse_real(_s, _field);
    if(d < 0.0 || d > 4294967295.0 || d != floor(d))
        throw invalid_parameter(pdw_field_name(_field), "'" + _s + "' is not a non-negative integer");
    return (unsigned int)d;
}

// two-state field spelled as a word or a number
static unsigned int parse_choice(const std::string &_s, pdw_field_t _field,
                                 const char *_zero, const char *_one)
{
    if(strcasecmp(_s.c_str(), _zero) == 0) return 0;
    if(strcasecmp(_s.c_str(), _one) == 0) return 1;
    return parse_uint(_s, _field);
}

// every field of one row, defaults filled in
struct row_values_s {
    std::string value[PDW_FIELD_TYPE_COUNT];

    double       as_real(pdw_field_t _f) const { return parse_real(value[_f], _f); }
    unsigned int as_uint(pdw_field_t _f) const { return parse_uint(value[_f], _f); }
};

static std::vector<row_values_s> resolve_rows(const pdw_table_s &_table,
                                              uint8_t            _variant,
                                              const char *       _variant_name,
                                              logger_client *    _log)
{
    std::vector<pdw_field_t> ids;
    for(auto &name : _table.fields){
        pdw_field_t id = pdw_field_from_name(name);
        ids.push_back(id);
        if(!(pdw_field_types[id].variants & _variant) && _log != nullptr){
            *_log << logger::set_level(logger::DEBUG) << "ignoring field '" << pdw_field_name(id)
                  << "' for " << _variant_name << " records\n";
            _log->commit();
        }
    }

    std::vector<row_values_s> rows(_table.rows.size());
    for(size_t r = 0; r < _table.rows.size(); r++){
        if(_table.rows[r].size() != ids.size())
            throw invalid_parameter("row", "row " + std::to_string(r) + " does not match the header");
        for(unsigned int f = 0; f < PDW_FIELD_TYPE_COUNT; f++)
            rows[r].value[f] = pdw_field_types[f].default_value;
        for(size_t c = 0; c < ids.size(); c++)
            rows[r].value[ids[c]] = _table.rows[r][c];
    }
    return rows;
}

static unsigned int resolve_index(const row_values_s &_row, const windex_s &_windex)
{
    if(!_row.value[PDW_FIELD_NAME].empty()) return windex_lookup(_windex, _row.value[PDW_FIELD_NAME]);
    return _row.as_uint(PDW_FIELD_WAVEFORM_INDEX);
}

std::vector<analog_pdw_s> pdw_table_to_analog(const pdw_table_s &_table, logger_client *_log)
{
    std::vector<analog_pdw_s> out;
    for(auto &r : resolve_rows(_table, PDW_VARIANT_ANALOG, "analog", _log)){
        analog_pdw_s p;
        p.operation     = r.as_uint(PDW_FIELD_OPERATION);
        p.start_time    = r.as_real(PDW_FIELD_TIME);
        p.frequency     = r.as_real(PDW_FIELD_FREQUENCY);
        p.phase         = r.as_real(PDW_FIELD_PHASE);
        p.power         = r.as_real(PDW_FIELD_POWER);
        p.width         = r.as_real(PDW_FIELD_WIDTH);
        p.markers       = r.as_uint(PDW_FIELD_MARKERS);
        p.pulse_mode    = r.as_uint(PDW_FIELD_PULSE_MODE);
        p.phase_control = parse_choice(r.value[PDW_FIELD_PHASE_MODE], PDW_FIELD_PHASE_MODE, "Coherent", "Continuous");
        p.band_adjust   = r.as_uint(PDW_FIELD_BAND_ADJUST);
        p.chirp_control = r.as_uint(PDW_FIELD_CHIRP_CONTROL);
        p.code          = r.as_uint(PDW_FIELD_CODE);
        p.chirp_rate    = r.as_real(PDW_FIELD_CHIRP_RATE);
        p.freq_map      = r.as_uint(PDW_FIELD_FREQ_BAND_MAP);
        out.push_back(p);
    }
    return out;
}

std::vector<vector_pdw_s> pdw_table_to_vector(const pdw_table_s &_table,
                                              const windex_s &   _windex,
                                              logger_client *    _log)
{
    std::vector<vector_pdw_s> out;
    for(auto &r : resolve_rows(_table, PDW_VARIANT_VECTOR, "vector", _log)){
        vector_pdw_s p;
        p.operation      = r.as_uint(PDW_FIELD_OPERATION);
        p.start_time     = r.as_real(PDW_FIELD_TIME);
        p.frequency      = r.as_real(PDW_FIELD_FREQUENCY);
        p.phase          = r.as_real(PDW_FIELD_PHASE);
        p.power          = r.as_real(PDW_FIELD_POWER);
        p.markers        = r.as_uint(PDW_FIELD_MARKERS);
        p.phase_control  = parse_choice(r.value[PDW_FIELD_PHASE_MODE], PDW_FIELD_PHASE_MODE, "Coherent", "Continuous");
        p.rf_off         = parse_choice(r.value[PDW_FIELD_RF_OFF], PDW_FIELD_RF_OFF, "On", "Off");
        p.waveform_index = resolve_index(r, _windex);
        p.wfm_markers    = r.as_uint(PDW_FIELD_WFM_MARKERS);
        out.push_back(p);
    }
    return out;
}

std::vector<vector3_pdw_s> pdw_table_to_vector3(const pdw_table_s &_table,
                                                const windex_s &   _windex,
                                                logger_client *    _log)
{
    std::vector<vector3_pdw_s> out;
    for(auto &r : resolve_rows(_table, PDW_VARIANT_VECTOR3, "vector3", _log)){
        vector3_pdw_s p;
        p.operation      = r.as_uint(PDW_FIELD_OPERATION);
        p.start_time     = r.as_real(PDW_FIELD_TIME);
        p.frequency      = r.as_real(PDW_FIELD_FREQUENCY);
        p.phase          = r.as_real(PDW_FIELD_PHASE);
        p.width          = r.as_real(PDW_FIELD_WIDTH);
        p.max_power      = r.as_real(PDW_FIELD_MAX_POWER);
        p.markers        = r.as_uint(PDW_FIELD_MARKERS);
        p.power          = r.as_real(PDW_FIELD_POWER);
        p.phase_control  = parse_choice(r.value[PDW_FIELD_PHASE_MODE], PDW_FIELD_PHASE_MODE, "Coherent", "Continuous");
        p.rf_off         = parse_choice(r.value[PDW_FIELD_RF_OFF], PDW_FIELD_RF_OFF, "On", "Off");
        p.auto_blank     = r.as_uint(PDW_FIELD_AUTO_BLANK);
        p.new_waveform   = r.as_uint(PDW_FIELD_NEW_WFM);
        p.zero_hold      = parse_choice(r.value[PDW_FIELD_ZERO_HOLD], PDW_FIELD_ZERO_HOLD, "Zero", "Hold");
        p.lo_lead        = r.as_real(PDW_FIELD_LO_LEAD);
        p.wfm_markers    = r.as_uint(PDW_FIELD_WFM_MARKERS);
        p.waveform_index = resolve_index(r, _windex);
        p.power2         = r.as_real(PDW_FIELD_POWER_2);
        p.max_power2     = r.as_real(PDW_FIELD_MAX_POWER_2);
        p.doppler        = r.as_real(PDW_FIELD_DOPPLER);
        out.push_back(p);
    }
    return out;
}

}
