#include <math.h>
#include <algorithm>
#include <strings.h>
#include "waveform.hh"
#include "errors.hh"

namespace arbgen{

wfm_format_t wfm_format_from_name(const std::string &_name)
{
    if(strcasecmp(_name.c_str(), "iq") == 0) return WFM_FORMAT_IQ;
    if(strcasecmp(_name.c_str(), "real") == 0) return WFM_FORMAT_REAL;
    throw invalid_parameter("format", "waveform format must be 'iq' or 'real', got '" + _name + "'");
}

const char * wfm_format_name(wfm_format_t _format)
{
    return _format == WFM_FORMAT_IQ ? "iq" : "real";
}

waveform_s waveform_create(wfm_format_t _format, double _sample_rate, size_t _len)
{
    waveform_s w;
    w.format = _format;
    w.sample_rate = _sample_rate;
    if(_format == WFM_FORMAT_IQ) w.iq.assign(_len, std::complex<float>(0.0f, 0.0f));
    else                         w.real.assign(_len, 0.0f);
    w.requested_length = _len;
    w.corrected = false;
    return w;
}

float waveform_peak(const waveform_s &_w)
{
    float peak = 0.0f;
    if(_w.format == WFM_FORMAT_IQ){
        for(auto &v : _w.iq) peak = std::max(peak, std::abs(v));
    }
    else{
        for(auto &v : _w.real) peak = std::max(peak, fabsf(v));
    }
    return peak;
}

void waveform_normalize(waveform_s &_w, float _peak)
{
    float peak = waveform_peak(_w);
    if(peak <= 0.0f) return;
    float g = _peak/peak;
    for(auto &v : _w.iq) v *= g;
    for(auto &v : _w.real) v *= g;
}

}
