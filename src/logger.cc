#include <iostream>
#include <algorithm>
#include <iomanip>
#include <ios>
#include <ctime>
#include <cstring>
#include <unistd.h>

#include "logger.hh"

namespace arbgen{

constexpr const char* file_name(const char* path){
  const char *file = path;
  while(*path){
    if(*path++ == '/'){
      file = path;
    }
  }
  return file;
}

static const char serial_key[] = "arbgen:";
static const size_t serial_key_len = sizeof(serial_key) - 1;

logger::level_map_t logger::level_map = {
    {logger::OFF,       "OFF"},
    {logger::CRITICAL,  "CRITICAL"},
    {logger::ERROR,     "ERROR"},
    {logger::WARNING,   "WARNING"},
    {logger::INFO,      "INFO"},
    {logger::DEBUG,     "DEBUG"},
};

logger::level_t logger::set_level(level_t l){
  if(level_map.find(l) != level_map.end()) return l;
  return logger::OFF;
}

logger::level_t logger::level_from_name(const std::string &name){
  for(auto it = level_map.begin(); it != level_map.end(); it++){
    if(name == it->second) return it->first;
  }
  return logger::INVALID;
}

std::string serialize_record(const log_record &r){
  uint64_t len = r.text.size();
  std::string s;
  s.reserve(serial_key_len + sizeof(double) + sizeof(uint8_t) + sizeof(uint64_t) + len);
  s.append(serial_key, serial_key_len);
  s.append(reinterpret_cast<const char*>(&r.timestamp), sizeof(double));
  s.append(reinterpret_cast<const char*>(&r.level), sizeof(uint8_t));
  s.append(reinterpret_cast<const char*>(&len), sizeof(uint64_t));
  s.append(r.text);
  return s;
}

uint8_t deserialize_record(log_record &r, const std::string &s){
  const size_t fixed = serial_key_len + sizeof(double) + sizeof(uint8_t) + sizeof(uint64_t);
  if(s.size() < serial_key_len) return 2U;
  if(s.compare(0, serial_key_len, serial_key) != 0) return 1U;
  if(s.size() < fixed) return 2U;
  const char *buf = s.data() + serial_key_len;
  uint64_t len;
  memcpy(&r.timestamp, buf, sizeof(double));
  buf += sizeof(double);
  memcpy(&r.level, buf, sizeof(uint8_t));
  buf += sizeof(uint8_t);
  memcpy(&len, buf, sizeof(uint64_t));
  if(s.size() - fixed < len) return 2U;
  r.text.assign(s, fixed, len);
  return 0U;
}


logger_client::logger_client()
  : z_frontend_addr("tcp://127.0.0.1:40000"),
    streamer(std::string()),
    level(logger::OFF),
    threshold(logger::INFO),
    last_timestamp(0.0),
    server_timeout_count(0),
    pending(0),
    z_context(),
    z_frontend_socket(z_context, ZMQ_REQ),
    z_open(1),
    z_connected(0),
    use_cout(1),
    enabled(0),
    void_buff(),
    null_stream(&void_buff)
{
  std::stringstream temp;
  temp << file_name(__FILE__) << "(" << ::getpid() << ")";
  header_tag = temp.str();
}
logger_client::logger_client(std::string tag, std::string frontend_addr, bool auto_connect, bool cout_fallback)
  : header_tag(tag),
    z_frontend_addr(frontend_addr),
    streamer(std::string()),
    level(logger::OFF),
    threshold(logger::INFO),
    last_timestamp(0.0),
    server_timeout_count(0),
    pending(0),
    z_context(),
    z_frontend_socket(z_context, ZMQ_REQ),
    z_open(1),
    z_connected(0),
    use_cout(0),
    enabled(0),
    void_buff(),
    null_stream(&void_buff)
{
  if(header_tag.empty()){
    std::stringstream temp;
    temp << file_name(__FILE__) << "(" << ::getpid() << ")";
    header_tag = temp.str();
  }
  if(z_frontend_addr.empty()){
    z_frontend_addr = "tcp://127.0.0.1:40000";
  }
  if(auto_connect){
    connect();
  }
  else{
    use_cout = cout_fallback;
  }
}
logger_client::~logger_client()
{
  if(enabled && z_connected){
    *this << logger::set_level(logger::INFO) << "Disconnecting\n";
    commit();
  }
  shutdown_network();
}

void logger_client::add_header(std::ostream &os){
  auto now = std::chrono::system_clock::now();
  auto micro = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch());
  unsigned int frac = micro.count() % 1000000;
  last_timestamp = micro.count()/1e6;
  std::time_t timer = std::chrono::system_clock::to_time_t(now);
  std::tm lt = *std::localtime(&timer);

  auto old_flags = os.flags();
  os << "[" << header_tag << " :: "
     << std::put_time(&lt, "%H:%M:%S")
     << "." << std::setfill('0') << std::setw(6) << frac << std::setfill(' ')
     << " ] " << std::setw(8) << logger::level_map[level] << " - ";
  os.flags(old_flags);
}
void logger_client::clear_line(){
  streamer.str(std::string());
  streamer.clear();
}

std::ostream& operator<<(logger_client &log, const logger::level_t &t){
  log.pending = 0;
  if(!log.enabled && !log.use_cout) return log.null_stream;
  if(t == logger::OFF || t >= logger::INVALID || t > log.threshold) return log.null_stream;
  log.level = t;
  log.pending = 1;
  if(log.use_cout){
    log.add_header(std::cout);
    return std::cout;
  }
  log.add_header(log.streamer);
  return log.streamer;
}

void logger_client::connect(){
  if(enabled) return;
  setup_network();
  if(!z_connected) return;
  use_cout = 0;
  enabled = 1;
  *this << logger::set_level(logger::INFO) << "Connecting\n";
  commit();
}
void logger_client::setup_network(){
  if(server_timeout_count >= 100U || z_connected) return;
  if(!z_open){
    z_context = zmq::context_t();
    z_frontend_socket = zmq::socket_t(z_context, ZMQ_REQ);
    z_open = 1;
  }
  int linger = 100;
  z_frontend_socket.setsockopt(ZMQ_LINGER, &linger, sizeof(linger));
  z_frontend_socket.connect(z_frontend_addr);
  z_connected = 1;
}
void logger_client::shutdown_network(){
  if(!z_open) return;
  z_frontend_socket.close();
  z_context.close();
  z_open = 0;
  z_connected = 0;
}
void logger_client::disable(){ enabled = 0; use_cout = 0; shutdown_network(); }
void logger_client::flush(){
  std::cout << streamer.str() << std::flush;
  clear_line();
}
std::string logger_client::debug_me(double &ts){
  ts = last_timestamp;
  return streamer.str();
}
uint8_t logger_client::commit(){
  if(!pending){
    clear_line();
    return 0;
  }
  pending = 0;
  if(use_cout){
    std::cout << std::flush;
    return 0;
  }
  if(!enabled || !z_connected){
    clear_line();
    return 1;
  }
  log_record r = {last_timestamp, static_cast<uint8_t>(level), streamer.str()};
  clear_line();
  std::string buf = serialize_record(r);
  zmq::message_t z_msg(buf.data(), buf.size());
  zmq::message_t r_msg;

  zmq::pollitem_t z_items[] = {{static_cast<void*>(z_frontend_socket), 0, ZMQ_POLLIN | ZMQ_POLLOUT, 0}};
  zmq::poll(z_items, 1, 100);
  if(z_items[0].revents & ZMQ_POLLIN){
    // late reply from the previous request
    z_frontend_socket.recv(&r_msg);
    zmq::poll(z_items, 1, 100);
  }
  if(!(z_items[0].revents & ZMQ_POLLOUT)){
    // stuck waiting on a reply that never came, rebuild the socket
    shutdown_network();
    server_timeout_count++;
    setup_network();
    return 1;
  }
  if(!z_frontend_socket.send(z_msg)) return 1;
  z_items[0].events = ZMQ_POLLIN;
  zmq::poll(z_items, 1, 100);
  if(z_items[0].revents & ZMQ_POLLIN)
    z_frontend_socket.recv(&r_msg);
  return 0;
}


logger_server::logger_server()
  : tag(std::string()),
    dumper(std::cout),
    z_frontend_addr("tcp://127.0.0.1:40000"),
    z_backend_addr("tcp://127.0.0.1:40001"),
    z_running(false),
    z_workers(4),
    z_context(),
    z_frontend(z_context, ZMQ_ROUTER),
    z_backend(z_context, ZMQ_DEALER),
    void_buff(),
    null_stream(&void_buff),
    log_c(nullptr)
{
  setup_network();
  log_c = new logger_client("logger_server", z_frontend_addr);
}
logger_server::logger_server(std::string tag, std::ostream &s, std::string frontend_addr,
                             std::string backend_addr, uint8_t workers)
  : tag(tag),
    dumper(s),
    z_frontend_addr(frontend_addr),
    z_backend_addr(backend_addr),
    z_running(false),
    z_workers(workers),
    z_context(),
    z_frontend(z_context, ZMQ_ROUTER),
    z_backend(z_context, ZMQ_DEALER),
    void_buff(),
    null_stream(&void_buff),
    log_c(nullptr)
{
  if(z_frontend_addr.empty()){
    z_frontend_addr = "tcp://127.0.0.1:40000";
  }
  if(z_backend_addr.empty()){
    z_backend_addr = "tcp://127.0.0.1:40001";
  }
  if(z_workers == 0) z_workers = 1;
  setup_network();
  log_c = new logger_client(tag.empty() ? "logger_server" : tag, z_frontend_addr);
}
logger_server::~logger_server()
{
  if(log_c != nullptr){
    *this << logger::set_level(logger::INFO) << "Disconnecting\n";
    commit();
    delete log_c;
    log_c = nullptr;
  }
  stop();
  wait();
  flush();
  z_frontend.close();
  z_backend.close();
  z_context.close();
}

std::ostream& operator<<(logger_server &log, const logger::level_t &t){
  if(log.log_c == nullptr) return log.null_stream;
  return (*(log.log_c) << t);
}

void logger_server::setup_network(){
  int timeout = 100;
  z_frontend.setsockopt(ZMQ_LINGER, &timeout, sizeof(timeout));
  z_backend.setsockopt(ZMQ_LINGER, &timeout, sizeof(timeout));
  z_frontend.bind(z_frontend_addr);//throws if fail
  z_backend.bind(z_backend_addr);//throws if fail

  z_running = true;
  z_broker_thread = std::thread(&logger_server::broker, this);
  for(uint8_t idx = 0; idx < z_workers; idx++){
    z_threads.emplace_back(&logger_server::enqueue_worker, this, idx);
  }
}
void logger_server::broker(){
  zmq::pollitem_t to_poll[] = {
    {static_cast<void*>(z_frontend), 0, ZMQ_POLLIN, 0},
    {static_cast<void*>(z_backend), 0, ZMQ_POLLIN, 0}
  };
  int more;
  size_t more_size = sizeof(more);
  zmq::message_t z_msg;
  while(z_running){
    try{
      zmq::poll(to_poll, 2, 100);
    }
    catch (zmq::error_t &ex){
      if(ex.num() == ETERM) break;
      if(ex.num() != EINTR) throw;
      continue;
    }
    if(to_poll[0].revents & ZMQ_POLLIN){
      do{
        z_frontend.recv(&z_msg);
        z_frontend.getsockopt(ZMQ_RCVMORE, &more, &more_size);
        z_backend.send(z_msg, more ? ZMQ_SNDMORE : 0);
      }while(more);
    }
    if(to_poll[1].revents & ZMQ_POLLIN){
      do{
        z_backend.recv(&z_msg);
        z_backend.getsockopt(ZMQ_RCVMORE, &more, &more_size);
        z_frontend.send(z_msg, more ? ZMQ_SNDMORE : 0);
      }while(more);
    }
  }
}
void logger_server::enqueue_worker(uint8_t rank){
  zmq::context_t local_context;
  zmq::socket_t sock(local_context, ZMQ_REP);
  int timeout = 100;
  sock.setsockopt(ZMQ_LINGER, &timeout, sizeof(timeout));
  sock.connect(z_backend_addr);

  zmq::pollitem_t z_poll_items[] = {{static_cast<void*>(sock), 0, ZMQ_POLLIN, 0}};
  int more;
  size_t more_size = sizeof(more);
  std::string buf;
  log_record r;
  while(z_running){
    try{
      zmq::poll(z_poll_items, 1, 100);
    }
    catch (zmq::error_t &ex){
      if(ex.num() == ETERM) break;
      if(ex.num() != EINTR) throw;
      continue;
    }
    if(!(z_poll_items[0].revents & ZMQ_POLLIN)) continue;

    zmq::message_t z_message;
    sock.recv(&z_message);
    sock.getsockopt(ZMQ_RCVMORE, &more, &more_size);
    buf.append(static_cast<const char*>(z_message.data()), z_message.size());
    if(more) continue;

    uint8_t rc = deserialize_record(r, buf);
    zmq::message_t z_reply = rc ? zmq::message_t("bad",4) : zmq::message_t("good",5);
    sock.send(z_reply);
    if(rc == 0){
      std::unique_lock<std::mutex> p_lock(q_mutex);
      holder.push_back(r);
      p_lock.unlock();
      q_event.notify_all();
    }
    else{
      std::cerr << "logger_server worker " << int(rank) << " dropped malformed record\n";
    }
    buf.clear();
  }
  sock.close();
  local_context.close();
}
void logger_server::stop(){
  z_running = false;
}
void logger_server::wait(){
  for(auto &t : z_threads){
    if(t.joinable()) t.join();
  }
  if(z_broker_thread.joinable()) z_broker_thread.join();
}
bool logger_server::empty(){
  std::lock_guard<std::mutex> p_lock(q_mutex);
  return holder.empty();
}
void logger_server::flush(){
  // records arrive through several workers, restore time order first
  std::unique_lock<std::mutex> p_lock(q_mutex);
  std::stable_sort(holder.begin(), holder.end(),
          [](const log_record &a, const log_record &b){ return a.timestamp < b.timestamp; });
  for(auto &r : holder){
    dumper << r.text;
  }
  dumper << std::flush;
  holder.clear();
}
void logger_server::debug_me(const std::string &s, double ts){
  log_record r = {ts, static_cast<uint8_t>(logger::DEBUG), s};
  std::lock_guard<std::mutex> p_lock(q_mutex);
  holder.push_back(r);
}
uint8_t logger_server::commit(){
  if(log_c == nullptr) return 1;
  return log_c->commit();
}
uint8_t logger_server::hold_for(double timeout, std::function<bool()> pred){
  std::unique_lock<std::mutex> local_lock(qe_mutex);
  auto now = std::chrono::steady_clock::now();
  auto until = now + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                        std::chrono::duration<double>(timeout));
  return q_event.wait_until(local_lock, until, pred) ? 1 : 0;
}

}
