// synthesize one waveform and write it as float32 samples or DAC codes
#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <iostream>
#include <string>
#include <vector>

#include "device_profile.hh"
#include "errors.hh"
#include "logger.hh"
#include "synth.hh"

using namespace arbgen;

static int write_file(const std::string &_name, const void *_data, size_t _bytes)
{
    FILE *fp = fopen(_name.c_str(), "wb");
    if(fp == NULL){
        perror(_name.c_str());
        return 1;
    }
    size_t written = fwrite(_data, 1, _bytes, fp);
    fclose(fp);
    return written != _bytes;
}

static void usage(const char *_app)
{
    printf("Usage of %s [options]\n", _app);
    printf("  [ -t <type: zero|sine|am|cw|chirp|barker|multitone|digmod> ]\n");
    printf("  [ -d <device preset> ] [ -r <sample rate Sa/s> ] [ -T <format: iq|real> ]\n");
    printf("  [ -f <tone frequency / pulse offset Hz> ] [ -c <carrier Hz> ] [ -P <phase deg> ]\n");
    printf("  [ -w <pulse width s> ] [ -p <pri s> ] [ -b <chirp bandwidth Hz> ] [ -k <barker code> ]\n");
    printf("  [ -A <pulse amplitude %%> ] [ -D <am depth %%> ] [ -M <am rate Hz> ]\n");
    printf("  [ -S <tone spacing Hz> ] [ -n <tones / symbols / zero length> ] [ -R <phase relationship> ]\n");
    printf("  [ -m <modulation> ] [ -s <symbol rate> ] [ -F <filter: rc|rrc> ] [ -a <alpha> ]\n");
    printf("  [ -Z (zero last sample) ] [ -B (write DAC codes) ] [ -o <output file> ]\n");
    printf("  [ -l <logger address> ] [ -L <log level> ]\n");
    printf("\n  devices:");
    for(unsigned int i = 0; i < DEVICE_PROFILE_COUNT; i++) printf(" %s", device_profiles[i].name.c_str());
    printf("\n  modulations:");
    for(unsigned int i = 1; i < MODULATION_TYPE_COUNT; i++) printf(" %s", modulation_types[i].name);
    printf("\n  barker codes:");
    for(unsigned int i = 0; i < BARKER_CODE_COUNT; i++) printf(" %s", barker_codes[i].name);
    printf("\n  phase relationships:");
    for(unsigned int i = 1; i < PHASE_RELATIONSHIP_TYPE_COUNT; i++) printf(" %s", phase_relationship_types[i].name);
    printf("\n");
}

int main(int argc, char **argv)
{
    std::string type{"sine"};
    std::string device{"generic"};
    std::string format{"iq"};
    double      sample_rate = 100e6;
    double      frequency   = 1e6;
    double      carrier     = 0.0;
    double      phase_deg   = 0.0;
    double      pulse_width = 10e-6;
    double      pri         = 100e-6;
    double      bandwidth   = 10e6;
    std::string code{"b13"};
    double      amp_scale   = 100.0;
    double      depth       = 50.0;
    double      mod_rate    = 100e3;
    double      spacing     = 1e6;
    unsigned int count      = 11;
    std::string phase_rel{"random"};
    std::string mod_scheme{"qpsk"};
    double      symbol_rate = 10e6;
    std::string filter{"rrc"};
    double      alpha       = 0.35;
    bool        zero_last   = false;
    bool        dac_codes   = false;
    std::string output{"arbgen.bin"};
    std::string log_addr{""};
    std::string log_level{"INFO"};

    int dopt;
    char *strend = NULL;
    while ((dopt = getopt(argc,argv,"ht:d:r:T:f:c:P:w:p:b:k:A:D:M:S:n:R:m:s:F:a:ZBo:l:L:")) != EOF) {
        strend = NULL;
        switch (dopt) {
        case 'h': usage(argv[0]); return 0;
        case 't': type        .assign(optarg); break;
        case 'd': device      .assign(optarg); break;
        case 'r': sample_rate = strtod(optarg, &strend); break;
        case 'T': format      .assign(optarg); break;
        case 'f': frequency   = strtod(optarg, &strend); break;
        case 'c': carrier     = strtod(optarg, &strend); break;
        case 'P': phase_deg   = strtod(optarg, &strend); break;
        case 'w': pulse_width = strtod(optarg, &strend); break;
        case 'p': pri         = strtod(optarg, &strend); break;
        case 'b': bandwidth   = strtod(optarg, &strend); break;
        case 'k': code        .assign(optarg); break;
        case 'A': amp_scale   = strtod(optarg, &strend); break;
        case 'D': depth       = strtod(optarg, &strend); break;
        case 'M': mod_rate    = strtod(optarg, &strend); break;
        case 'S': spacing     = strtod(optarg, &strend); break;
        case 'n': count       = strtoul(optarg, &strend, 10); break;
        case 'R': phase_rel   .assign(optarg); break;
        case 'm': mod_scheme  .assign(optarg); break;
        case 's': symbol_rate = strtod(optarg, &strend); break;
        case 'F': filter      .assign(optarg); break;
        case 'a': alpha       = strtod(optarg, &strend); break;
        case 'Z': zero_last   = true; break;
        case 'B': dac_codes   = true; break;
        case 'o': output      .assign(optarg); break;
        case 'l': log_addr    .assign(optarg); break;
        case 'L': log_level   .assign(optarg); break;
        default: exit(1);
        }
        if(strend != NULL && (strend == optarg || *strend != '\0')){
            fprintf(stderr, "option -%c: '%s' is not a number\n", dopt, optarg);
            exit(1);
        }
    }

    logger_client *log = log_addr.empty() ? new logger_client()
                                          : new logger_client("ARBGEN WFM", log_addr, true, true);
    logger::level_t threshold = logger::level_from_name(log_level);
    if(threshold == logger::INVALID){
        fprintf(stderr, "unknown log level '%s'\n", log_level.c_str());
        delete log;
        return 1;
    }
    log->set_threshold(threshold);

    int rc = 0;
    try{
        const device_profile_s &profile = device_profile_lookup(device);
        wfm_format_t fmt = wfm_format_from_name(format);

        waveform_s w;
        if(strcasecmp(type.c_str(), "zero") == 0){
            w = zero(sample_rate, count, fmt, profile, log);
        }
        else if(strcasecmp(type.c_str(), "sine") == 0){
            w = sine(sample_rate, frequency, phase_deg, fmt, zero_last, profile, log);
        }
        else if(strcasecmp(type.c_str(), "am") == 0){
            w = am(sample_rate, depth, mod_rate, carrier, fmt, zero_last, profile, log);
        }
        else if(strcasecmp(type.c_str(), "cw") == 0){
            w = cw_pulse(sample_rate, pulse_width, pri, frequency, carrier, fmt, zero_last, amp_scale, profile, log);
        }
        else if(strcasecmp(type.c_str(), "chirp") == 0){
            w = chirp(sample_rate, pulse_width, pri, bandwidth, carrier, fmt, zero_last, profile, log);
        }
        else if(strcasecmp(type.c_str(), "barker") == 0){
            w = barker(sample_rate, pulse_width, pri, code, carrier, fmt, zero_last, profile, log);
        }
        else if(strcasecmp(type.c_str(), "multitone") == 0){
            w = multitone(sample_rate, spacing, count, phase_relationship_from_name(phase_rel),
                          carrier, fmt, profile, log);
        }
        else if(strcasecmp(type.c_str(), "digmod") == 0){
            w = digital_modulation(sample_rate, symbol_rate, modulation_from_name(mod_scheme), count,
                                   pulse_shape_from_name(filter), float(alpha), carrier, fmt,
                                   zero_last, profile, log);
        }
        else{
            throw unsupported_modulation("type", "unknown waveform type '" + type + "'");
        }

        *log << logger::set_level(logger::INFO) << type << ": " << w.size() << " samples at "
             << w.sample_rate << " Sa/s, " << wfm_format_name(w.format)
             << (w.corrected ? " (length corrected from " + std::to_string(w.requested_length) + ")" : "")
             << "\n";
        log->commit();

        if(dac_codes){
            std::vector<uint8_t> bytes = format_samples(w, profile);
            rc = write_file(output, bytes.data(), bytes.size());
        }
        else if(w.format == WFM_FORMAT_IQ){
            rc = write_file(output, w.iq.data(), w.iq.size()*sizeof(std::complex<float>));
        }
        else{
            rc = write_file(output, w.real.data(), w.real.size()*sizeof(float));
        }
        if(rc){
            *log << logger::set_level(logger::ERROR) << "failed writing " << output << "\n";
            log->commit();
        }
    }
    catch(const arbgen::error &e){
        *log << logger::set_level(logger::ERROR) << e.kind() << " (" << e.name() << "): " << e.what() << "\n";
        log->commit();
        rc = 1;
    }

    log->flush();
    delete log;
    return rc;
}
