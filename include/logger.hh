#ifndef ARBGEN_LOGGER_HH_INCLUDED
#define ARBGEN_LOGGER_HH_INCLUDED

#include <string>
#include <iostream>
#include <sstream>
#include <thread>
#include <mutex>
#include <queue>
#include <chrono>
#include <zmq.hpp>
#include <vector>
#include <map>
#include <condition_variable>
#include <functional>
#include <atomic>

namespace arbgen{

// one log line as it travels from client to server
typedef struct{
  double timestamp;
  uint8_t level;
  std::string text;
} log_record;

// wire form: key | timestamp (f64) | level (u8) | length (u64) | text
std::string serialize_record(const log_record &r);
// returns 0 on success, 1 on bad key, 2 on short buffer
uint8_t deserialize_record(log_record &r, const std::string &s);

class logger_server;
class logger_client;

namespace logger{
  class null_buff : public std::streambuf{
   public:
    int overflow(int c) { return c; }
  };
  enum level_t{
    OFF,
    CRITICAL,
    ERROR,
    WARNING,
    INFO,
    DEBUG,
    INVALID
  };
  typedef std::map<level_t, const char*> level_map_t;
  extern level_map_t level_map;
  level_t set_level(level_t l);
  // "INFO" -> INFO, anything unknown -> INVALID
  level_t level_from_name(const std::string &name);
}

std::ostream& operator<<(logger_client &log, const logger::level_t &t);
std::ostream& operator<<(logger_server &log, const logger::level_t &t);


class logger_client{//don't fork/share
 private:
  std::string header_tag;
  std::string z_frontend_addr;
  std::stringstream streamer;
  logger::level_t level;
  logger::level_t threshold;
  double last_timestamp;

  uint8_t server_timeout_count;
  uint8_t pending;

  zmq::context_t z_context;
  zmq::socket_t z_frontend_socket;
  uint8_t z_open;
  uint8_t z_connected;

  uint8_t use_cout;
  uint8_t enabled;

  logger::null_buff void_buff;
  std::ostream null_stream;

  void add_header(std::ostream &os);
  void clear_line();

  void setup_network();
  void shutdown_network();

 public:
  logger_client();
  logger_client(std::string tag, std::string frontend_addr,
                bool auto_connect=true, bool cout_fallback=false);
  ~logger_client();

  void connect();
  void disable();

  // messages above this level are dropped before formatting
  void set_threshold(logger::level_t t){ threshold = t; }
  logger::level_t get_threshold() const { return threshold; }

  uint8_t commit();
  void flush();
  uint8_t is_connected() const { return z_connected; }
  uint8_t is_cout() const { return use_cout; }

  std::string debug_me(double &ts);

  friend std::ostream& operator<<( logger_client &log, const logger::level_t &t );
};

class logger_server{//don't fork/share
 private:
  std::string tag;
  std::ostream &dumper;
  std::string z_frontend_addr;
  std::string z_backend_addr;
  std::mutex q_mutex;
  std::mutex qe_mutex;
  std::condition_variable q_event;
  std::vector<log_record> holder;

  std::atomic<bool> z_running;
  uint8_t z_workers;
  zmq::context_t z_context;
  zmq::socket_t z_frontend;
  zmq::socket_t z_backend;
  std::vector<std::thread> z_threads;
  std::thread z_broker_thread;

  logger::null_buff void_buff;
  std::ostream null_stream;
  logger_client *log_c;

  void setup_network();
  void broker();
  void enqueue_worker(uint8_t rank);

 public:
  logger_server();
  logger_server(std::string tag, std::ostream &s,
                std::string frontend_addr,
                std::string backend_addr,
                uint8_t workers=4);
  ~logger_server();

  uint8_t commit();
  void flush();

  void stop();
  void wait();
  bool empty();
  uint8_t hold_for(double timeout, std::function<bool()> pred);

  // push a line straight into the holder, bypassing the network
  void debug_me(const std::string &s, double ts);

  friend std::ostream& operator<<( logger_server &log, const logger::level_t &t);
};

}

#endif // ARBGEN_LOGGER_HH_INCLUDED
