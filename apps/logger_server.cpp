// collect log lines from arbgen_wfm / arbgen_pdw clients
#include <getopt.h>
#include <iostream>
#include <stdio.h>
#include <stdlib.h>
#include <string>
#include <csignal>
#include <atomic>
#include <chrono>
#include <functional>
#include <fstream>

#include "logger.hh"

using namespace arbgen;

static std::atomic<bool> continue_running(true);
void signal_interrupt_handler(int) {
    std::cout << "\nLOGGER_SERVER ---> ctrl+c received --> exiting\n";
    continue_running = false;
}

int main(int argc, char **argv){
    std::string filename{""};
    std::string frontend{"tcp://127.0.0.1:40000"};
    std::string backend{"tcp://127.0.1.1:40001"};
    double flush_period = 1.0;

    int dopt;
    char *strend = NULL;
    while ((dopt = getopt(argc,argv,"ho:f:b:p:")) != EOF) {
        switch (dopt) {
        case 'h':
            printf("Usage of %s [options]\n",argv[0]);
            printf("  [ -o <log file, stdout if empty:%s> ] [ -f <frontend:%s> ]\n", filename.c_str(), frontend.c_str());
            printf("  [ -b <backend:%s> ] [ -p <flush period:%.1f s> ]\n", backend.c_str(), flush_period);
            return 0;
        case 'o': filename     .assign(optarg); break;
        case 'f': frontend     .assign(optarg); break;
        case 'b': backend      .assign(optarg); break;
        case 'p':
            flush_period = strtod(optarg, &strend);
            if(strend == optarg || *strend != '\0'){
                fprintf(stderr, "option -p: '%s' is not a number\n", optarg);
                exit(1);
            }
            break;
        default: exit(1);
        }
    }

    std::ofstream fout;
    if(!filename.empty()){
        fout.open(filename, std::ios::out | std::ios::binary | std::ios::trunc);
        if(!fout.is_open()){
            std::cerr << "cannot open " << filename << "\n";
            return 1;
        }
    }
    std::ostream &sink = filename.empty() ? std::cout : fout;

    std::signal(SIGINT, &signal_interrupt_handler);
    std::cout << "Starting the logger server -- spinning up workers\n";
    logger_server log_s("", sink, frontend, backend);
    log_s << logger::set_level(logger::INFO) << "logger server -- started @ " << frontend << "\n";
    log_s.commit();log_s.flush();

    auto last_flush = std::chrono::high_resolution_clock::now();
    std::function<bool()> pending = std::function<bool()>([&log_s]()
        {return !log_s.empty();});

    while(continue_running){
        bool can_flush = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::high_resolution_clock::now()-last_flush).count()/1e6 > flush_period;
        if(log_s.hold_for(0.1, pending) && can_flush){
            log_s.flush();
            last_flush = std::chrono::high_resolution_clock::now();
        }
    }

    log_s << logger::set_level(logger::INFO) << "Stopping the logger server workers\n";
    log_s.commit();log_s.flush();
    log_s.stop();
    std::cout << "logger server -- stopped\n";
    log_s.wait();
    std::cout << "logger server -- finished\n";

    return 0;
}
