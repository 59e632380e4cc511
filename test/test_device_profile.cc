
#include <stdio.h>
#include <math.h>
#include "device_profile.hh"
#include "errors.hh"

using namespace arbgen;

int test_lookup(){
    const device_profile_s &p = device_profile_lookup("m8190a_12bit");
    if(p.granularity != 48 || p.min_length != 240) return 1;
    try{
        device_profile_lookup("m9999");
    }
    catch(const invalid_parameter &e){
        return e.name() == "device" ? 0 : 3;
    }
    return 2;
}

int test_sample_rate_bounds(){
    const device_profile_s &p = device_profile_lookup("m8195a");
    validate_sample_rate(p, 64e9);
    try{
        validate_sample_rate(p, 100e6);
    }
    catch(const waveform_constraint_violation &e){
        return e.name() == "sample_rate" ? 0 : 2;
    }
    return 1;
}

int test_zero_pad_length(){
    const device_profile_s &p = device_profile_lookup("m8190a_12bit");
    if(corrected_length(10, p, LENGTH_ZERO_PAD) != 240) return 1;
    if(corrected_length(241, p, LENGTH_ZERO_PAD) != 288) return 2;
    if(corrected_length(288, p, LENGTH_ZERO_PAD) != 288) return 3;
    return 0;
}

int test_zero_pad_bound(){
    device_profile_s p = device_profile_lookup("generic");
    p.granularity = 1000000;
    try{
        corrected_length(1, p, LENGTH_ZERO_PAD);
        return 1;
    }
    catch(const waveform_constraint_violation &e){
        if(e.name() != "granularity") return 2;
    }
    // at most doubling is fine
    if(corrected_length(500000, p, LENGTH_ZERO_PAD) != 1000000) return 3;
    try{
        corrected_length(499999, p, LENGTH_ZERO_PAD);
        return 4;
    }
    catch(const waveform_constraint_violation &e){
        if(e.name() != "granularity") return 5;
    }
    // a minimum length floor absorbs the growth
    p.min_length = 600000;
    if(corrected_length(1, p, LENGTH_ZERO_PAD) != 1000000) return 6;
    return 0;
}

int test_repeat_length(){
    const device_profile_s &p = device_profile_lookup("m8190a_12bit");
    // 100 samples tile to lcm(100,48) = 1200
    if(corrected_length(100, p, LENGTH_REPEAT) != 1200) return 1;
    // 96 already satisfies the granularity, repeated up to the minimum
    if(corrected_length(96, p, LENGTH_REPEAT) != 288) return 2;
    return 0;
}

int test_max_length(){
    const device_profile_s &p = device_profile_lookup("m8196a");
    try{
        corrected_length(524288 + 1, p, LENGTH_ZERO_PAD);
    }
    catch(const waveform_constraint_violation &e){
        if(e.name() != "max_length") return 2;
    }
    if(corrected_length(524288, p, LENGTH_ZERO_PAD) != 524288) return 1;
    try{
        corrected_length(0, p, LENGTH_ZERO_PAD);
    }
    catch(const waveform_constraint_violation &e){
        return e.name() == "length" ? 0 : 4;
    }
    return 3;
}

int test_correct_in_place(){
    const device_profile_s &p = device_profile_lookup("vsg_m938x");
    waveform_s w = waveform_create(WFM_FORMAT_REAL, 1e6, 61);
    for(size_t i = 0; i < w.real.size(); i++) w.real[i] = 0.5f;
    correct_length(w, p, LENGTH_ZERO_PAD);
    if(w.size() != 64 || !w.corrected || w.requested_length != 61) return 1;
    if(w.real[60] != 0.5f || w.real[61] != 0.0f || w.real[63] != 0.0f) return 2;

    waveform_s r = waveform_create(WFM_FORMAT_IQ, 1e6, 3);
    r.iq[0] = {1.0f, 0.0f};
    r.iq[1] = {0.0f, 1.0f};
    r.iq[2] = {-1.0f, 0.0f};
    correct_length(r, p, LENGTH_REPEAT);
    if(r.size() != 60 || r.iq[3] != r.iq[0] || r.iq[59] != r.iq[2]) return 3;
    return 0;
}

int test_every_length_satisfies(){
    // the invariant holds for every preset and policy
    for(unsigned int i = 0; i < DEVICE_PROFILE_COUNT; i++){
        const device_profile_s &p = device_profiles[i];
        for(size_t len = 1; len < 700; len += 37){
            if(!length_satisfies(corrected_length(len, p, LENGTH_ZERO_PAD), p)) return int(1 + i);
            if(!length_satisfies(corrected_length(len, p, LENGTH_REPEAT), p)) return int(100 + i);
        }
    }
    return 0;
}

int test_format_big_endian(){
    const device_profile_s &p = device_profile_lookup("vsg");
    waveform_s w = waveform_create(WFM_FORMAT_IQ, 1e6, 60);
    w.iq[0] = {1.0f, -1.0f};
    std::vector<uint8_t> b = format_samples(w, p);
    if(b.size() != 60*2*2) return 1;
    // 32767 = 0x7fff, -32767 = 0x8001, most significant byte first
    if(b[0] != 0x7f || b[1] != 0xff || b[2] != 0x80 || b[3] != 0x01) return 2;
    if(b[4] != 0 || b[5] != 0) return 3;
    return 0;
}

int test_format_shift(){
    const device_profile_s &p = device_profile_lookup("m8190a_14bit");
    waveform_s w = waveform_create(WFM_FORMAT_REAL, 1e9, 320);
    w.real[0] = 1.0f;
    w.real[1] = -0.5f;
    std::vector<uint8_t> b = format_samples(w, p);
    if(b.size() != 640) return 1;
    // 2047 << 4 = 0x7ff0, little endian
    if(b[0] != 0xf0 || b[1] != 0x7f) return 2;
    // int(2047*-0.5) = -1023, << 4 = -16368 = 0xc010
    if(b[2] != 0x10 || b[3] != 0xc0) return 3;
    return 0;
}

int test_format_rejects(){
    const device_profile_s &p = device_profile_lookup("m8190a_12bit");
    int res = 3;
    waveform_s w = waveform_create(WFM_FORMAT_REAL, 1e9, 100);
    try{ format_samples(w, p); }
    catch(const waveform_constraint_violation &e){ if(e.name() == "min_length") res--; }
    w.real.resize(250);
    try{ format_samples(w, p); }
    catch(const waveform_constraint_violation &e){ if(e.name() == "granularity") res--; }
    w.real.resize(288);
    w.real[5] = 1.5f;
    try{ format_samples(w, p); }
    catch(const invalid_parameter &e){ if(e.name() == "amplitude") res--; }
    return res;
}

int main(){
    int res = 0;
    if((res+=test_lookup())){
        printf("Test Lookup -- Failed(%d)\n",res);
    }
    else{
        printf("Test Lookup -- Passed\n");
    }
    if((res+=test_sample_rate_bounds())){
        printf("Test Sample Rate Bounds -- Failed(%d)\n",res);
    }
    else{
        printf("Test Sample Rate Bounds -- Passed\n");
    }
    if((res+=test_zero_pad_length())){
        printf("Test Zero Pad Length -- Failed(%d)\n",res);
    }
    else{
        printf("Test Zero Pad Length -- Passed\n");
    }
    if((res+=test_zero_pad_bound())){
        printf("Test Zero Pad Bound -- Failed(%d)\n",res);
    }
    else{
        printf("Test Zero Pad Bound -- Passed\n");
    }
    if((res+=test_repeat_length())){
        printf("Test Repeat Length -- Failed(%d)\n",res);
    }
    else{
        printf("Test Repeat Length -- Passed\n");
    }
    if((res+=test_max_length())){
        printf("Test Max Length -- Failed(%d)\n",res);
    }
    else{
        printf("Test Max Length -- Passed\n");
    }
    if((res+=test_correct_in_place())){
        printf("Test Correct In Place -- Failed(%d)\n",res);
    }
    else{
        printf("Test Correct In Place -- Passed\n");
    }
    if((res+=test_every_length_satisfies())){
        printf("Test Every Length Satisfies -- Failed(%d)\n",res);
    }
    else{
        printf("Test Every Length Satisfies -- Passed\n");
    }
    if((res+=test_format_big_endian())){
        printf("Test Format Big Endian -- Failed(%d)\n",res);
    }
    else{
        printf("Test Format Big Endian -- Passed\n");
    }
    if((res+=test_format_shift())){
        printf("Test Format Shift -- Failed(%d)\n",res);
    }
    else{
        printf("Test Format Shift -- Passed\n");
    }
    if((res+=test_format_rejects())){
        printf("Test Format Rejects -- Failed(%d)\n",res);
    }
    else{
        printf("Test Format Rejects -- Passed\n");
    }
    return res;
}
