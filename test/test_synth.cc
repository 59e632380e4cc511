
#include <stdio.h>
#include <math.h>
#include <algorithm>
#include <complex>
#include <vector>
#include "synth.hh"
#include "errors.hh"

using namespace arbgen;

static bool fits(const waveform_s &_w, const device_profile_s &_p)
{
    return _w.size() >= _p.min_length && _w.size() % _p.granularity == 0;
}

// direct DFT bin magnitude
static double bin_magnitude(const std::vector<std::complex<float> > &_x, long _k)
{
    double n = double(_x.size());
    std::complex<double> acc(0.0, 0.0);
    for(size_t i = 0; i < _x.size(); i++)
        acc += std::complex<double>(_x[i]) * std::polar(1.0, -2.0*M_PI*double(_k)*double(i)/n);
    return std::abs(acc);
}

int test_length_invariant(){
    const device_profile_s &p = device_profile_lookup("m8190a_12bit");
    double fs = 1e9;
    int res = 0;
    res += !fits(zero(fs, 10, WFM_FORMAT_IQ, p), p);
    res += !fits(sine(fs, 10e6, 0.0, WFM_FORMAT_IQ, false, p), p);
    res += !fits(sine(fs, 10e6, 0.0, WFM_FORMAT_REAL, true, p), p);
    res += !fits(am(fs, 50.0, 1e6, 100e6, WFM_FORMAT_REAL, false, p), p);
    res += !fits(cw_pulse(fs, 1e-6, 5e-6, 0.0, 0.0, WFM_FORMAT_IQ, false, 100.0, p), p);
    res += !fits(chirp(fs, 1e-6, 5e-6, 20e6, 100e6, WFM_FORMAT_REAL, true, p), p);
    res += !fits(barker(fs, 1.3e-6, 0.0, "b13", 0.0, WFM_FORMAT_IQ, false, p), p);
    res += !fits(multitone(fs, 1e6, 11, PHASE_REL_PARABOLIC, 0.0, WFM_FORMAT_IQ, p), p);
    res += !fits(digital_modulation(fs, 100e6, MOD_QPSK, 128, PULSE_SHAPE_RRC, 0.35f, 0.0,
                                    WFM_FORMAT_IQ, false, p), p);
    res += !fits(digital_modulation(fs, 30e6, MOD_QAM16, 100, PULSE_SHAPE_RC, 0.5f, 200e6,
                                    WFM_FORMAT_REAL, false, p), p);
    return res;
}

int test_cw_dead_time(){
    const device_profile_s &p = device_profile_lookup("generic");
    waveform_s w = cw_pulse(100e6, 10e-6, 100e-6, 0.0, 1e9, WFM_FORMAT_IQ, false, 100.0, p);
    if(w.size() != 10000) return 1;
    for(size_t i = 0; i < 1000; i++){
        if(fabsf(std::abs(w.iq[i]) - 1.0f) > 1e-5f) return 2;
    }
    for(size_t i = 1000; i < w.size(); i++){
        if(std::abs(w.iq[i]) != 0.0f) return 3;
    }
    return 0;
}

int test_multitone_spacing(){
    const device_profile_s &p = device_profile_lookup("generic");
    waveform_s w = multitone(100e6, 1e6, 11, PHASE_REL_ZERO, 0.0, WFM_FORMAT_IQ, p);
    if(w.size() != 100) return 1;
    double ref = bin_magnitude(w.iq, 0);
    if(ref < 1.0) return 2;
    for(long k = -50; k < 50; k++){
        double m = bin_magnitude(w.iq, k);
        bool tone = k >= -5 && k <= 5;
        if(tone && fabs(m - ref) > 1e-3*ref) return 3;
        if(!tone && m > 1e-3*ref) return 4;
    }
    if(fabsf(waveform_peak(w) - 1.0f) > 1e-6f) return 5;
    return 0;
}

int test_multitone_real(){
    const device_profile_s &p = device_profile_lookup("generic");
    waveform_s w = multitone(100e6, 1e6, 4, PHASE_REL_INCREASING, 20e6, WFM_FORMAT_REAL, p);
    if(w.size() != 200) return 1;
    // even count: tones at carrier +-0.5, +-1.5 spacings, bins of 0.5 MHz
    std::vector<std::complex<float> > x(w.real.begin(), w.real.end());
    double ref = bin_magnitude(x, 41);
    if(ref < 1.0) return 2;
    const long tones[4] = {37, 39, 41, 43};
    for(auto b : tones){
        if(fabs(bin_magnitude(x, b) - ref) > 1e-3*ref) return 3;
    }
    if(bin_magnitude(x, 40) > 1e-3*ref) return 4;
    try{
        multitone(100e6, 1e6, 4, PHASE_REL_ZERO, 20.25e6, WFM_FORMAT_REAL, p);
    }
    catch(const invalid_parameter &e){
        return e.name() == "carrier" ? 0 : 6;
    }
    return 5;
}

int test_multitone_seed(){
    const device_profile_s &p = device_profile_lookup("generic");
    waveform_s a = multitone(100e6, 1e6, 7, PHASE_REL_RANDOM, 0.0, WFM_FORMAT_IQ, p, nullptr, 42);
    waveform_s b = multitone(100e6, 1e6, 7, PHASE_REL_RANDOM, 0.0, WFM_FORMAT_IQ, p, nullptr, 42);
    return a.iq != b.iq;
}

int test_barker_chips(){
    const device_profile_s &p = device_profile_lookup("generic");
    waveform_s w = barker(100e6, 130e-6, 0.0, "b13", 0.0, WFM_FORMAT_IQ, false, p);
    if(w.size() != 13000) return 1;
    const int expect[13] = {1, 1, 1, 1, 1, -1, -1, 1, 1, -1, 1, -1, 1};
    for(unsigned int c = 0; c < 13; c++){
        float v = w.iq[500 + 1000*c].real();
        if((v > 0.0f ? 1 : -1) != expect[c]) return 2 + int(c);
    }
    return 0;
}

int test_pulse_zero_last(){
    const device_profile_s &p = device_profile_lookup("generic");
    // no dead time, a zero is appended
    waveform_s w = cw_pulse(100e6, 1e-6, 0.0, 1e6, 0.0, WFM_FORMAT_IQ, true, 50.0, p);
    if(w.size() != 101) return 1;
    if(std::abs(w.iq[100]) != 0.0f) return 2;
    if(fabsf(std::abs(w.iq[0]) - 0.5f) > 1e-6f) return 3;
    // dead time already ends on zero
    waveform_s d = cw_pulse(100e6, 1e-6, 2e-6, 1e6, 0.0, WFM_FORMAT_IQ, true, 100.0, p);
    if(d.size() != 200) return 4;
    return 0;
}

int test_sine_loop(){
    const device_profile_s &p = device_profile_lookup("generic");
    waveform_s w = sine(100e6, 1e6, 90.0, WFM_FORMAT_IQ, false, p);
    if(w.size() != 100) return 1;
    // the sample after the last one is the first
    std::complex<float> next = std::polar(1.0f, float(2.0*M_PI*1e6*100.0/100e6 + M_PI/2.0));
    if(std::abs(next - w.iq[0]) > 1e-5f) return 2;
    if(fabsf(w.iq[0].imag() - 1.0f) > 1e-6f) return 3;

    waveform_s z = sine(100e6, 1e6, 0.0, WFM_FORMAT_REAL, true, p);
    if(z.real.back() != 0.0f) return 4;
    if(z.size() < 100 || z.size() > 200) return 5;
    return 0;
}

int test_sine_rejects(){
    const device_profile_s &p = device_profile_lookup("generic");
    int res = 3;
    try{ sine(100e6, 60e6, 0.0, WFM_FORMAT_IQ, false, p); }
    catch(const invalid_parameter &e){ if(e.name() == "frequency") res--; }
    try{ sine(100e6, 0.0, 0.0, WFM_FORMAT_IQ, false, p); }
    catch(const invalid_parameter &e){ if(e.name() == "frequency") res--; }
    const device_profile_s &v = device_profile_lookup("vsg");
    try{ sine(1e9, 1e6, 0.0, WFM_FORMAT_IQ, false, v); }
    catch(const waveform_constraint_violation &e){ if(e.name() == "sample_rate") res--; }
    return res;
}

int test_am_depth(){
    const device_profile_s &p = device_profile_lookup("generic");
    waveform_s w = am(100e6, 100.0, 1e6, 0.0, WFM_FORMAT_IQ, false, p);
    if(w.size() != 100) return 1;
    if(fabsf(w.iq[0].real() - 1.0f) > 1e-6f) return 2;
    if(fabsf(w.iq[50].real()) > 1e-6f) return 3;
    try{
        am(100e6, 120.0, 1e6, 0.0, WFM_FORMAT_IQ, false, p);
    }
    catch(const invalid_parameter &e){
        return e.name() == "depth" ? 0 : 5;
    }
    return 4;
}

int test_chirp_sweep(){
    const device_profile_s &p = device_profile_lookup("generic");
    waveform_s w = chirp(100e6, 10e-6, 0.0, 20e6, 0.0, WFM_FORMAT_IQ, false, p);
    if(w.size() != 1000) return 1;
    // starts near -bw/2, ends near +bw/2
    double f0 = std::arg(w.iq[1]*std::conj(w.iq[0]))*100e6/(2.0*M_PI);
    double f1 = std::arg(w.iq[999]*std::conj(w.iq[998]))*100e6/(2.0*M_PI);
    if(fabs(f0 + 10e6) > 0.1e6) return 2;
    if(fabs(f1 - 10e6) > 0.1e6) return 3;
    for(auto &v : w.iq){
        if(fabsf(std::abs(v) - 1.0f) > 1e-5f) return 4;
    }
    return 0;
}

int test_mix_to_real(){
    std::vector<std::complex<float> > bb(4, std::complex<float>(0.0f, 1.0f));
    // fc = fs/4: -sin(pi/2*n)
    std::vector<float> r = mix_to_real(bb, 4.0, 1.0);
    const float expect[4] = {0.0f, -1.0f, 0.0f, 1.0f};
    for(unsigned int i = 0; i < 4; i++){
        if(fabsf(r[i] - expect[i]) > 1e-6f) return 1 + int(i);
    }
    return 0;
}

int test_digmod_wraparound(){
    const device_profile_s &p = device_profile_lookup("generic");
    waveform_s w = digital_modulation(100e6, 10e6, MOD_QPSK, 64, PULSE_SHAPE_RRC, 0.35f, 0.0,
                                      WFM_FORMAT_IQ, false, p);
    if(w.size() != 640) return 1;
    if(fabsf(waveform_peak(w) - 1.0f) > 1e-5f) return 2;
    // the loop seam is no rougher than the waveform itself
    float step = 0.0f;
    for(size_t i = 1; i < w.size(); i++) step = std::max(step, std::abs(w.iq[i] - w.iq[i - 1]));
    if(std::abs(w.iq[0] - w.iq[w.size() - 1]) > 1.5f*step) return 3;
    return 0;
}

int test_digmod_granularity(){
    const device_profile_s &p = device_profile_lookup("m8190a_12bit");
    // 100 symbols at 1e9/30e6 samples each: 3333.3 snaps to 3312
    waveform_s w = digital_modulation(1e9, 30e6, MOD_8PSK, 100, PULSE_SHAPE_RRC, 0.35f, 0.0,
                                      WFM_FORMAT_IQ, false, p);
    if(w.size() != 3312) return 1;
    // short bursts are tiled up to the minimum
    waveform_s s = digital_modulation(1e9, 250e6, MOD_BPSK, 8, PULSE_SHAPE_RC, 0.5f, 0.0,
                                      WFM_FORMAT_IQ, false, p);
    if(s.size() != 240) return 2;
    return 0;
}

// exactly one zero, in the final sample
static int zero_tail(const std::vector<std::complex<float> > &_x)
{
    if(_x.back() != std::complex<float>(0.0f, 0.0f)) return 1;
    for(size_t i = 0; i + 1 < _x.size(); i++){
        if(_x[i] == std::complex<float>(0.0f, 0.0f)) return 2;
    }
    return 0;
}

int test_periodic_zero_last(){
    const device_profile_s &p = device_profile_lookup("m8190a_12bit");
    double fs = 1e9;

    // 100 sample tone tiled to lcm(100,48), no zero run after the loop
    waveform_s s = sine(fs, 10e6, 0.0, WFM_FORMAT_IQ, true, p);
    if(s.size() != 1200 || !fits(s, p)) return 1;
    if(zero_tail(s.iq)) return 2;
    if(s.iq[1099] != s.iq[99]) return 3;

    waveform_s a = am(fs, 50.0, 10e6, 0.0, WFM_FORMAT_IQ, true, p);
    if(a.size() != 1200) return 4;
    if(zero_tail(a.iq)) return 5;
    for(size_t i = 0; i + 100 < a.size() - 1; i++){
        if(a.iq[i + 100] != a.iq[i]) return 6;
    }

    waveform_s r = am(fs, 50.0, 10e6, 100e6, WFM_FORMAT_REAL, true, p);
    if(r.size() != 1200 || r.real.back() != 0.0f) return 7;
    if(r.real[1098] != r.real[98]) return 8;

    // one sample short of 3312 is resampled, the zero completes it
    waveform_s d = digital_modulation(fs, 30e6, MOD_8PSK, 100, PULSE_SHAPE_RRC, 0.35f, 0.0,
                                      WFM_FORMAT_IQ, true, p);
    if(d.size() != 3312) return 9;
    if(zero_tail(d.iq)) return 10;
    size_t last = d.size() - 2;
    float step = 0.0f;
    for(size_t i = 1; i <= last; i++) step = std::max(step, std::abs(d.iq[i] - d.iq[i - 1]));
    if(std::abs(d.iq[0] - d.iq[last]) > 1.5f*step) return 11;
    return 0;
}

int test_digmod_rejects(){
    const device_profile_s &p = device_profile_lookup("generic");
    int res = 3;
    try{ digital_modulation(100e6, 80e6, MOD_QPSK, 64, PULSE_SHAPE_RRC, 0.35f, 0.0, WFM_FORMAT_IQ, false, p); }
    catch(const invalid_parameter &e){ if(e.name() == "symbol_rate") res--; }
    try{ digital_modulation(100e6, 10e6, MOD_UNKNOWN, 64, PULSE_SHAPE_RRC, 0.35f, 0.0, WFM_FORMAT_IQ, false, p); }
    catch(const unsupported_modulation &e){ if(e.name() == "scheme") res--; }
    try{ digital_modulation(100e6, 10e6, MOD_QPSK, 64, PULSE_SHAPE_RRC, 0.35f, 1e6, WFM_FORMAT_REAL, false, p); }
    catch(const invalid_parameter &e){ if(e.name() == "carrier") res--; }
    return res;
}

int test_lookup_rejects(){
    const device_profile_s &p = device_profile_lookup("generic");
    int res = 2;
    try{ barker(100e6, 1e-6, 0.0, "b6", 0.0, WFM_FORMAT_IQ, false, p); }
    catch(const unsupported_modulation &e){ if(e.name() == "code") res--; }
    try{ phase_relationship_from_name("quadratic"); }
    catch(const unsupported_modulation &e){ if(e.name() == "phase") res--; }
    return res;
}

int main(){
    int res = 0;
    if((res+=test_length_invariant())){
        printf("Test Length Invariant -- Failed(%d)\n",res);
    }
    else{
        printf("Test Length Invariant -- Passed\n");
    }
    if((res+=test_cw_dead_time())){
        printf("Test CW Dead Time -- Failed(%d)\n",res);
    }
    else{
        printf("Test CW Dead Time -- Passed\n");
    }
    if((res+=test_multitone_spacing())){
        printf("Test Multitone Spacing -- Failed(%d)\n",res);
    }
    else{
        printf("Test Multitone Spacing -- Passed\n");
    }
    if((res+=test_multitone_real())){
        printf("Test Multitone Real -- Failed(%d)\n",res);
    }
    else{
        printf("Test Multitone Real -- Passed\n");
    }
    if((res+=test_multitone_seed())){
        printf("Test Multitone Seed -- Failed(%d)\n",res);
    }
    else{
        printf("Test Multitone Seed -- Passed\n");
    }
    if((res+=test_barker_chips())){
        printf("Test Barker Chips -- Failed(%d)\n",res);
    }
    else{
        printf("Test Barker Chips -- Passed\n");
    }
    if((res+=test_pulse_zero_last())){
        printf("Test Pulse Zero Last -- Failed(%d)\n",res);
    }
    else{
        printf("Test Pulse Zero Last -- Passed\n");
    }
    if((res+=test_sine_loop())){
        printf("Test Sine Loop -- Failed(%d)\n",res);
    }
    else{
        printf("Test Sine Loop -- Passed\n");
    }
    if((res+=test_sine_rejects())){
        printf("Test Sine Rejects -- Failed(%d)\n",res);
    }
    else{
        printf("Test Sine Rejects -- Passed\n");
    }
    if((res+=test_am_depth())){
        printf("Test AM Depth -- Failed(%d)\n",res);
    }
    else{
        printf("Test AM Depth -- Passed\n");
    }
    if((res+=test_chirp_sweep())){
        printf("Test Chirp Sweep -- Failed(%d)\n",res);
    }
    else{
        printf("Test Chirp Sweep -- Passed\n");
    }
    if((res+=test_mix_to_real())){
        printf("Test Mix To Real -- Failed(%d)\n",res);
    }
    else{
        printf("Test Mix To Real -- Passed\n");
    }
    if((res+=test_digmod_wraparound())){
        printf("Test Digmod Wraparound -- Failed(%d)\n",res);
    }
    else{
        printf("Test Digmod Wraparound -- Passed\n");
    }
    if((res+=test_digmod_granularity())){
        printf("Test Digmod Granularity -- Failed(%d)\n",res);
    }
    else{
        printf("Test Digmod Granularity -- Passed\n");
    }
    if((res+=test_periodic_zero_last())){
        printf("Test Periodic Zero Last -- Failed(%d)\n",res);
    }
    else{
        printf("Test Periodic Zero Last -- Passed\n");
    }
    if((res+=test_digmod_rejects())){
        printf("Test Digmod Rejects -- Failed(%d)\n",res);
    }
    else{
        printf("Test Digmod Rejects -- Passed\n");
    }
    if((res+=test_lookup_rejects())){
        printf("Test Lookup Rejects -- Failed(%d)\n",res);
    }
    else{
        printf("Test Lookup Rejects -- Passed\n");
    }
    return res;
}
