
#include <stdio.h>
#include <math.h>
#include "pulse_shape.hh"
#include "errors.hh"

using namespace arbgen;

static const float alphas[4] = {0.0f, 0.35f, 0.5f, 1.0f};
static const unsigned int sps_list[3] = {4, 8, 16};

int test_rrc_normalized(){
    for(auto a : alphas){
        for(auto k : sps_list){
            std::vector<float> h = design_filter(PULSE_SHAPE_RRC, a, k);
            if(h.size() != 10*k + 1) return 1;
            double e = 0.0;
            for(auto v : h){
                if(!std::isfinite(v)) return 2;
                e += double(v)*double(v);
            }
            if(fabs(e - double(k)) > 1e-3*k) return 3;
        }
    }
    return 0;
}

int test_rc_normalized(){
    for(auto a : alphas){
        for(auto k : sps_list){
            std::vector<float> h = design_filter(PULSE_SHAPE_RC, a, k);
            double e = 0.0;
            for(auto v : h){
                if(!std::isfinite(v)) return 1;
                e += double(v)*double(v);
            }
            if(fabs(e - double(k)) > 1e-3*k) return 2;
        }
    }
    return 0;
}

int test_symmetry(){
    std::vector<float> h = design_filter(PULSE_SHAPE_RRC, 0.35f, 8, 6);
    size_t n = h.size();
    for(size_t i = 0; i < n/2; i++){
        if(fabsf(h[i] - h[n - 1 - i]) > 1e-5f) return 1;
    }
    // peak on the centre tap
    for(size_t i = 0; i < n; i++){
        if(fabsf(h[i]) > fabsf(h[n/2])) return 2;
    }
    return 0;
}

int test_rc_nyquist_zeros(){
    // raised cosine crosses zero at every non-zero symbol instant, singular
    // point at alpha=0.5 included
    unsigned int k = 8;
    std::vector<float> h = design_filter(PULSE_SHAPE_RC, 0.5f, k);
    size_t c = h.size()/2;
    for(unsigned int m = 1; m <= 5; m++){
        if(fabsf(h[c + m*k]) > 1e-4f) return int(m);
        if(fabsf(h[c - m*k]) > 1e-4f) return int(10 + m);
    }
    return 0;
}

int test_singular_limits(){
    // taps landing on a 0/0 position carry the analytic limit
    double a = 0.25;
    unsigned int k = 8;
    std::vector<float> h = design_filter(PULSE_SHAPE_RRC, float(a), k);
    size_t c = h.size()/2;
    double x = M_PI/(4.0*a);
    double lim = a/sqrt(2.0)*((1.0 + 2.0/M_PI)*sin(x) + (1.0 - 2.0/M_PI)*cos(x));
    double peak = 1.0 + a*(4.0/M_PI - 1.0);
    if(fabs(h[c + k]/h[c] - lim/peak) > 1e-3) return 1;
    if(fabs(h[c - k]/h[c] - lim/peak) > 1e-3) return 2;

    // raised cosine at t = 1/(2*alpha) = 1.25 symbols, five taps out at sps 4
    std::vector<float> g = design_filter(PULSE_SHAPE_RC, 0.4f, 4);
    c = g.size()/2;
    double rc_lim = M_PI/4.0 * sin(1.25*M_PI)/(1.25*M_PI);
    if(fabs(g[c + 5]/g[c] - rc_lim) > 1e-3) return 3;
    return 0;
}

int test_bad_arguments(){
    int res = 5;
    try{ design_filter(PULSE_SHAPE_UNKNOWN, 0.35f, 8); }
    catch(const unsupported_modulation &e){ if(e.name() == "filter") res--; }
    try{ design_filter(PULSE_SHAPE_RRC, 1.5f, 8); }
    catch(const invalid_parameter &e){ if(e.name() == "alpha") res--; }
    try{ design_filter(PULSE_SHAPE_RRC, 0.35f, 0); }
    catch(const invalid_parameter &e){ if(e.name() == "sps") res--; }
    try{ design_filter(PULSE_SHAPE_RC, 0.35f, 8, 7); }
    catch(const invalid_parameter &e){ if(e.name() == "span") res--; }
    try{ pulse_shape_from_name("gaussian"); }
    catch(const unsupported_modulation &e){ if(e.name() == "filter") res--; }
    return res;
}

int test_names(){
    if(pulse_shape_from_name("RRC") != PULSE_SHAPE_RRC) return 1;
    if(pulse_shape_from_name("raised_cosine") != PULSE_SHAPE_RC) return 2;
    if(std::string(pulse_shape_name(PULSE_SHAPE_RC)) != "rc") return 3;
    return 0;
}

int main(){
    int res = 0;
    if((res+=test_rrc_normalized())){
        printf("Test RRC Normalized -- Failed(%d)\n",res);
    }
    else{
        printf("Test RRC Normalized -- Passed\n");
    }
    if((res+=test_rc_normalized())){
        printf("Test RC Normalized -- Failed(%d)\n",res);
    }
    else{
        printf("Test RC Normalized -- Passed\n");
    }
    if((res+=test_symmetry())){
        printf("Test Symmetry -- Failed(%d)\n",res);
    }
    else{
        printf("Test Symmetry -- Passed\n");
    }
    if((res+=test_rc_nyquist_zeros())){
        printf("Test RC Nyquist Zeros -- Failed(%d)\n",res);
    }
    else{
        printf("Test RC Nyquist Zeros -- Passed\n");
    }
    if((res+=test_singular_limits())){
        printf("Test Singular Limits -- Failed(%d)\n",res);
    }
    else{
        printf("Test Singular Limits -- Passed\n");
    }
    if((res+=test_bad_arguments())){
        printf("Test Bad Arguments -- Failed(%d)\n",res);
    }
    else{
        printf("Test Bad Arguments -- Passed\n");
    }
    if((res+=test_names())){
        printf("Test Names -- Failed(%d)\n",res);
    }
    else{
        printf("Test Names -- Passed\n");
    }
    return res;
}
