
#include <stdio.h>
#include <math.h>
#include <string>
#include "pdw_table.hh"
#include "errors.hh"

using namespace arbgen;

static const char *analog_csv =
    "# agile source pulse train\n"
    "Operation, Time, Frequency, Power, Width, Markers, Phase Mode\n"
    "1, 0, 1e9, -10, 1e-6, 0x5, Coherent\n"
    "\n"
    "0, 20e-6, 1.1e9, -12.5, 2e-6, 0, Continuous\n";

int test_parse(){
    pdw_table_s t = parse_pdw_table(analog_csv);
    if(t.fields.size() != 7 || t.rows.size() != 2) return 1;
    if(t.fields[3] != "Power" || t.rows[1][6] != "Continuous") return 2;
    // canonical names come back out
    pdw_table_s u = parse_pdw_table("operation,TIME\n1,0\n");
    if(u.fields[0] != "Operation" || u.fields[1] != "Time") return 3;
    return 0;
}

int test_to_analog(){
    std::vector<analog_pdw_s> l = pdw_table_to_analog(parse_pdw_table(analog_csv));
    if(l.size() != 2) return 1;
    if(l[0].operation != 1 || l[0].markers != 5 || l[0].phase_control != 0) return 2;
    if(fabs(l[1].start_time - 20e-6) > 1e-15 || fabs(l[1].power + 12.5) > 1e-12) return 3;
    if(l[1].phase_control != 1) return 4;
    // absent fields take their defaults
    if(l[0].pulse_mode != 2 || l[0].chirp_rate != 0.0 || l[0].code != 0) return 5;
    return 0;
}

int test_header_rejects(){
    int res = 3;
    try{ parse_pdw_table("Operation,Power,Power\n1,0,0\n"); }
    catch(const invalid_parameter &e){ if(e.name() == "Power") res--; }
    try{ parse_pdw_table("Operation,Amplitude\n1,0\n"); }
    catch(const invalid_parameter &e){ if(e.name() == "Amplitude") res--; }
    try{ parse_pdw_table("Operation,Power\n1,0,5\n"); }
    catch(const invalid_parameter &e){ if(e.name() == "row") res--; }
    return res;
}

int test_value_rejects(){
    int res = 2;
    try{ pdw_table_to_analog(parse_pdw_table("Operation,Power\n1,loud\n")); }
    catch(const invalid_parameter &e){ if(e.name() == "Power") res--; }
    try{ pdw_table_to_analog(parse_pdw_table("Operation,Markers\n1,-3\n")); }
    catch(const invalid_parameter &e){ if(e.name() == "Markers") res--; }
    return res;
}

int test_windex(){
    windex_s w = parse_windex("Id,Filename\n0,CW\n1,BARKER13\n2,CHIRP\n");
    if(w.names.size() != 3 || w.names[1] != "BARKER13") return 1;
    if(windex_lookup(w, "CHIRP") != 2) return 2;
    windex_s r = parse_windex(windex_to_csv(w));
    if(r.names != w.names) return 3;

    int res = 3;
    try{ windex_lookup(w, "LFM"); }
    catch(const invalid_parameter &e){ if(e.name() == "Name") res--; }
    try{ parse_windex("Index,Name\n0,CW\n"); }
    catch(const invalid_parameter &e){ if(e.name() == "windex") res--; }
    try{ parse_windex("Id,Filename\n0,CW\n2,CHIRP\n"); }
    catch(const invalid_parameter &e){ if(e.name() == "Id") res--; }
    return res ? 10 + res : 0;
}

int test_to_vector(){
    windex_s w = parse_windex("Id,Filename\n0,CW\n1,BARKER13\n");
    pdw_table_s t = parse_pdw_table(
        "Operation,Time,Frequency,Power,Name,Waveform Index,RF Off,Width\n"
        "1,0,2e9,-20,BARKER13,0,On,1e-6\n"
        "0,1e-3,2e9,-20,,1,Off,1e-6\n");
    std::vector<vector_pdw_s> l = pdw_table_to_vector(t, w);
    if(l.size() != 2) return 1;
    // a name wins over the numeric index
    if(l[0].waveform_index != 1) return 2;
    if(l[1].waveform_index != 1) return 3;
    if(l[0].rf_off != 0 || l[1].rf_off != 1) return 4;
    return 0;
}

int test_to_vector3(){
    windex_s w;
    pdw_table_s t = parse_pdw_table(
        "Operation,Frequency,Power,Max Power,Zero/Hold,LO Lead,Doppler,Auto Blank\n"
        "1,3e9,-5,0,Hold,40e-9,2500,0\n");
    std::vector<vector3_pdw_s> l = pdw_table_to_vector3(t, w);
    if(l.size() != 1) return 1;
    if(l[0].zero_hold != 1 || l[0].auto_blank != 0 || l[0].new_waveform != 1) return 2;
    if(l[0].doppler != 2500.0 || fabs(l[0].lo_lead - 40e-9) > 1e-15) return 3;
    if(l[0].waveform_index != 0) return 4;
    return 0;
}

int test_write_round_trip(){
    pdw_table_s t = parse_pdw_table(analog_csv);
    pdw_table_s u = parse_pdw_table(write_pdw_table(t));
    if(u.fields != t.fields || u.rows != t.rows) return 1;
    return 0;
}

int test_field_table(){
    if(pdw_field_from_name("zero/hold") != PDW_FIELD_ZERO_HOLD) return 1;
    if(std::string(pdw_field_default(PDW_FIELD_AUTO_BLANK)) != "1") return 2;
    if(std::string(pdw_field_name(PDW_FIELD_DOPPLER)) != "Doppler") return 3;
    if(pdw_field_types[PDW_FIELD_WIDTH].variants & PDW_VARIANT_VECTOR) return 4;
    return 0;
}

int main(){
    int res = 0;
    if((res+=test_parse())){
        printf("Test Parse -- Failed(%d)\n",res);
    }
    else{
        printf("Test Parse -- Passed\n");
    }
    if((res+=test_to_analog())){
        printf("Test To Analog -- Failed(%d)\n",res);
    }
    else{
        printf("Test To Analog -- Passed\n");
    }
    if((res+=test_header_rejects())){
        printf("Test Header Rejects -- Failed(%d)\n",res);
    }
    else{
        printf("Test Header Rejects -- Passed\n");
    }
    if((res+=test_value_rejects())){
        printf("Test Value Rejects -- Failed(%d)\n",res);
    }
    else{
        printf("Test Value Rejects -- Passed\n");
    }
    if((res+=test_windex())){
        printf("Test Waveform Index -- Failed(%d)\n",res);
    }
    else{
        printf("Test Waveform Index -- Passed\n");
    }
    if((res+=test_to_vector())){
        printf("Test To Vector -- Failed(%d)\n",res);
    }
    else{
        printf("Test To Vector -- Passed\n");
    }
    if((res+=test_to_vector3())){
        printf("Test To Vector3 -- Failed(%d)\n",res);
    }
    else{
        printf("Test To Vector3 -- Passed\n");
    }
    if((res+=test_write_round_trip())){
        printf("Test Write Round Trip -- Failed(%d)\n",res);
    }
    else{
        printf("Test Write Round Trip -- Passed\n");
    }
    if((res+=test_field_table())){
        printf("Test Field Table -- Failed(%d)\n",res);
    }
    else{
        printf("Test Field Table -- Passed\n");
    }
    return res;
}
