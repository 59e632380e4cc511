// convert a comma separated PDW table into a streaming file or raw block
#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>
#include <strings.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "errors.hh"
#include "logger.hh"
#include "pdw_file.hh"
#include "pdw_table.hh"

using namespace arbgen;

static bool read_text(const std::string &_name, std::string &_text)
{
    std::ifstream fin(_name, std::ios::in | std::ios::binary);
    if(!fin.is_open()) return false;
    std::stringstream ss;
    ss << fin.rdbuf();
    _text = ss.str();
    return true;
}

int main(int argc, char **argv)
{
    std::string input{""};
    std::string windex_file{""};
    std::string variant{"analog"};
    std::string output{"arbgen.pdw"};
    bool        no_fpc = false;
    bool        raw    = false;
    std::string log_addr{""};
    std::string log_level{"INFO"};

    int dopt;
    while ((dopt = getopt(argc,argv,"hi:x:v:cRo:l:L:")) != EOF) {
        switch (dopt) {
        case 'h':
            printf("Usage of %s [options]\n",argv[0]);
            printf("  -i <pdw table csv> [ -v <variant:%s> analog|vector|vector3 ] [ -x <waveform index csv> ]\n", variant.c_str());
            printf("  [ -c (analog: leave out the coding table) ] [ -R (records only, no file header) ]\n");
            printf("  [ -o <output:%s> ] [ -l <logger address> ] [ -L <log level:%s> ]\n", output.c_str(), log_level.c_str());
            printf("\n  fields:");
            for(unsigned int i = 1; i < PDW_FIELD_TYPE_COUNT; i++) printf(" \"%s\"", pdw_field_types[i].name);
            printf("\n");
            return 0;
        case 'i': input       .assign(optarg); break;
        case 'x': windex_file .assign(optarg); break;
        case 'v': variant     .assign(optarg); break;
        case 'c': no_fpc      = true; break;
        case 'R': raw         = true; break;
        case 'o': output      .assign(optarg); break;
        case 'l': log_addr    .assign(optarg); break;
        case 'L': log_level   .assign(optarg); break;
        default: exit(1);
        }
    }
    if(input.empty()){
        fprintf(stderr, "missing -i <pdw table csv>, see -h\n");
        return 1;
    }

    logger_client *log = log_addr.empty() ? new logger_client()
                                          : new logger_client("ARBGEN PDW", log_addr, true, true);
    logger::level_t threshold = logger::level_from_name(log_level);
    if(threshold == logger::INVALID){
        fprintf(stderr, "unknown log level '%s'\n", log_level.c_str());
        delete log;
        return 1;
    }
    log->set_threshold(threshold);

    int rc = 0;
    try{
        std::string text;
        if(!read_text(input, text))
            throw invalid_parameter("input", "cannot read '" + input + "'");
        pdw_table_s table = parse_pdw_table(text);

        windex_s windex;
        if(!windex_file.empty()){
            std::string wtext;
            if(!read_text(windex_file, wtext))
                throw invalid_parameter("windex", "cannot read '" + windex_file + "'");
            windex = parse_windex(wtext);
        }

        std::vector<uint8_t> bytes;
        size_t records = 0;
        if(strcasecmp(variant.c_str(), "analog") == 0){
            std::vector<analog_pdw_s> list = pdw_table_to_analog(table, log);
            records = list.size();
            bytes = raw ? build_raw_pdw_block(list) : build_analog_pdw_file(list, !no_fpc);
        }
        else if(strcasecmp(variant.c_str(), "vector") == 0){
            std::vector<vector_pdw_s> list = pdw_table_to_vector(table, windex, log);
            records = list.size();
            bytes = raw ? build_raw_pdw_block(list) : build_vector_pdw_file(list);
        }
        else if(strcasecmp(variant.c_str(), "vector3") == 0){
            std::vector<vector3_pdw_s> list = pdw_table_to_vector3(table, windex, log);
            records = list.size();
            bytes = raw ? build_raw_pdw_block(list) : build_vector3_pdw_file(list);
        }
        else{
            throw invalid_parameter("variant", "unknown PDW variant '" + variant + "'");
        }

        std::ofstream fout(output, std::ios::out | std::ios::binary | std::ios::trunc);
        fout.write(reinterpret_cast<const char *>(bytes.data()), bytes.size());
        if(!fout.good()){
            *log << logger::set_level(logger::ERROR) << "failed writing " << output << "\n";
            log->commit();
            rc = 1;
        }
        else{
            *log << logger::set_level(logger::INFO) << variant << ": " << records << " records, "
                 << bytes.size() << " bytes -> " << output << "\n";
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
