#include <cmath>
#include <strings.h>
#include "liquid.h"
#include "pulse_shape.hh"
#include "errors.hh"

namespace arbgen{

const struct pulse_shape_type_s pulse_shape_types[PULSE_SHAPE_TYPE_COUNT] = {
    // name     fullname                 kind
    {"unknown", "unknown_pulse_shape",   PULSE_SHAPE_UNKNOWN},
    {"rc",      "raised_cosine",         PULSE_SHAPE_RC},
    {"rrc",     "root_raised_cosine",    PULSE_SHAPE_RRC},
};

pulse_shape_t pulse_shape_from_name(const std::string &_name)
{
    for(unsigned int i = 1; i < PULSE_SHAPE_TYPE_COUNT; i++){
        if(strcasecmp(_name.c_str(), pulse_shape_types[i].name) == 0 ||
           strcasecmp(_name.c_str(), pulse_shape_types[i].fullname) == 0)
            return pulse_shape_types[i].kind;
    }
    throw unsupported_modulation("filter", "unknown pulse shape '" + _name + "'");
}

const char * pulse_shape_name(pulse_shape_t _kind)
{
    for(unsigned int i = 0; i < PULSE_SHAPE_TYPE_COUNT; i++){
        if(pulse_shape_types[i].kind == _kind) return pulse_shape_types[i].name;
    }
    return pulse_shape_types[0].name;
}

std::vector<float> design_filter(const filter_descriptor_s &_fd)
{
    if(!std::isfinite(_fd.alpha) || _fd.alpha < 0.0f || _fd.alpha > 1.0f)
        throw invalid_parameter("alpha", "roll-off must be within [0,1]");
    if(_fd.sps == 0)
        throw invalid_parameter("sps", "samples per symbol must be at least 1");
    if(_fd.span == 0 || _fd.span % 2)
        throw invalid_parameter("span", "filter span must be an even number of symbols");

    // liquid designs 2*k*m+1 taps, m symbols either side of the centre
    unsigned int m = _fd.span/2;
    std::vector<float> h(_fd.span*_fd.sps + 1);
    int rc = LIQUID_OK;
    switch(_fd.kind){
        case PULSE_SHAPE_RC:  rc = liquid_firdes_rcos(_fd.sps, m, _fd.alpha, 0.0f, h.data());  break;
        case PULSE_SHAPE_RRC: rc = liquid_firdes_rrcos(_fd.sps, m, _fd.alpha, 0.0f, h.data()); break;
        default:
            throw unsupported_modulation("filter", "pulse shape must be rc or rrc");
    }
    if(rc != LIQUID_OK)
        throw invalid_parameter("filter", std::string("liquid could not design the ") +
                                pulse_shape_name(_fd.kind) + " filter");

    double energy = 0.0;
    for(auto v : h){
        if(!std::isfinite(v))
            throw invalid_parameter("filter", "non-finite filter tap");
        energy += double(v)*double(v);
    }
    float scale = float(sqrt(double(_fd.sps)/energy));
    for(auto &v : h) v *= scale;
    return h;
}

std::vector<float> design_filter(pulse_shape_t _kind,
                                 float         _alpha,
                                 unsigned int  _sps,
                                 unsigned int  _span)
{
    filter_descriptor_s fd = {_kind, _alpha, _sps, _span};
    return design_filter(fd);
}

}
