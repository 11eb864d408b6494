#include "log.hpp"
#include "misc.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <time.h>
#include <stdio.h>
#include <atomic>
#include <thread>
#include <mutex>
#include <vector>
#include <iostream>

namespace lp
{

  class log_impl
  {
  public:
    log_impl();
    ~log_impl();
    void start();
    void stop();
    void run();
    void add( std::string& line );
    bool set_file( const std::string& );

  private:
    void write( const std::string& );
    typedef std::vector<std::string> buf_vec_t;
    typedef std::atomic<bool> atomic_t;
    atomic_t    is_run_;
    atomic_t    is_wtr_;
    std::mutex  mtx_;
    std::thread thrd_;
    buf_vec_t   logv_;
    int         fd_;
  };

}

using namespace lp;

static void run_log( log_impl *iptr )
{
  iptr->run();
}

log_impl::log_impl()
: is_run_( true ),
  is_wtr_( false ),
  fd_( -1 )
{
}

log_impl::~log_impl()
{
  stop();
  if ( fd_ >= 0 ) {
    ::close( fd_ );
    fd_ = -1;
  }
}

void log_impl::start()
{
  std::lock_guard<std::mutex> lck( mtx_ );
  if ( !thrd_.joinable() ) {
    is_run_ = true;
    thrd_ = std::thread( run_log, this );
  }
}

void log_impl::stop()
{
  is_run_ = false;
  if ( thrd_.joinable() ) {
    thrd_.join();
  }
}

bool log_impl::set_file( const std::string& file )
{
  int fd = ::open( file.c_str(), O_CREAT | O_APPEND | O_WRONLY, 0644 );
  if ( fd < 0 ) {
    return false;
  }
  std::lock_guard<std::mutex> lck( mtx_ );
  if ( fd_ >= 0 ) {
    ::close( fd_ );
  }
  fd_ = fd;
  return true;
}

void log_impl::add( std::string& line )
{
  std::lock_guard<std::mutex> lck( mtx_ );
  logv_.push_back( std::string() );
  logv_.back().swap( line );
  is_wtr_ = true;
}

void log_impl::write( const std::string& line )
{
  if ( fd_ < 0 ) {
    std::cerr << line << std::endl;
    return;
  }
  const char *buf = line.c_str();
  size_t len = line.length();
  while( len ) {
    ssize_t num = ::write( fd_, buf, len );
    if ( num <= 0 ) {
      break;
    }
    buf += num;
    len -= (size_t)num;
  }
  if ( ::write( fd_, "\n", 1 ) != 1 ) {
    std::cerr << "log: failed to write log file" << std::endl;
  }
}

void log_impl::run()
{
  struct timespec ts[1];
  ts->tv_sec  = 0;
  ts->tv_nsec = 1000000;
  buf_vec_t logv;
  for(;;) {
    if ( is_wtr_ ) {
      // get lines to log
      {
        std::lock_guard<std::mutex> lck( mtx_ );
        is_wtr_ = false;
        logv_.swap( logv );
      }
      for( const std::string& line: logv ) {
        write( line );
      }
      logv.clear();
    } else if ( !is_run_ ) {
      break;
    } else {
      // sleep a bit
      clock_nanosleep( CLOCK_REALTIME, 0, ts, NULL );
    }
  }
}

int log::level_ = 0;
static log_impl impl_;

void log::set_level( int t )
{
  level_ = 1;
  while( level_ < (int)t ) {
    level_ <<= 1;
    level_ |= 1;
  }
  impl_.start();
}

bool log::set_log_file( const std::string& file )
{
  return impl_.set_file( file );
}

log_line log::add( str topic, int level )
{
  return log_line( topic, level );
}

static const char spaces[] =
"                                                                         ";

static int log_pid = getpid();

void log_line::add_i64( int64_t val )
{
  char buf[32], *end = &buf[sizeof(buf)];
  char *cptr = int_to_str( val, end );
  wtr_.append( cptr, end - cptr );
}

void log_line::add_u64( uint64_t val )
{
  char buf[32], *end = &buf[sizeof(buf)];
  char *cptr = uint_to_str( val, end );
  wtr_.append( cptr, end - cptr );
}

log_line::log_line( str topic, int lvl )
: is_first_( true )
{
  char tbuf[32];
  nsecs_to_utc6( get_now(), tbuf );
  wtr_ += '[';
  wtr_.append( tbuf, 27 );
  wtr_ += ' ';
  add_i64( log_pid );
  wtr_ += ' ';
  switch(lvl) {
    case LP_LOG_DBG_LVL: wtr_ += "DBG";break;
    case LP_LOG_INF_LVL: wtr_ += "INF";break;
    case LP_LOG_WRN_LVL: wtr_ += "WRN";break;
    case LP_LOG_ERR_LVL: wtr_ += "ERR";break;
  }
  wtr_ += ' ';
  const size_t topic_len = 32;
  size_t len = topic.len_ < topic_len ? topic.len_ : topic_len;
  wtr_.append( topic.str_, len );
  if ( len < topic_len ) {
    wtr_.append( spaces, topic_len-len );
  }
  wtr_ += "] ";
}

void log_line::add_key( str key )
{
  if ( !is_first_ ) {
    wtr_ += ',';
  } else {
    is_first_ = false;
  }
  wtr_.append( key.str_, key.len_ );
  wtr_ += '=';
}

log_line& log_line::add( str key, str val )
{
  add_key( key );
  wtr_.append( val.str_, val.len_ );
  return *this;
}

log_line& log_line::add( str key, const char *val )
{
  return add( key, str( val ) );
}

log_line& log_line::add( str key, const std::string& val )
{
  return add( key, str( val ) );
}

log_line& log_line::add( str key, int32_t val )
{
  add_key( key );
  add_i64( val );
  return *this;
}

log_line& log_line::add( str key, int64_t val )
{
  add_key( key );
  add_i64( val );
  return *this;
}

log_line& log_line::add( str key, uint64_t val )
{
  add_key( key );
  add_u64( val );
  return *this;
}

log_line& log_line::add( str key, uint32_t val )
{
  add_key( key );
  add_u64( val );
  return *this;
}

log_line& log_line::add( str key, double val )
{
  add_key( key );
  char buf[32];
  int n = snprintf( buf, sizeof( buf ), "%f", val );
  wtr_.append( buf, n > 0 ? (size_t)n : 0 );
  return *this;
}

log_line& log_line::add( str key, const hash& pk )
{
  add_key( key );
  char buf[64];
  int n = pk.enc_base58( buf, sizeof( buf ) );
  wtr_.append( buf, n > 0 ? (size_t)n : 0 );
  return *this;
}

log_line& log_line::add( str key, const signature& sig )
{
  add_key( key );
  char buf[128];
  int n = sig.enc_base58( buf, sizeof( buf ) );
  wtr_.append( buf, n > 0 ? (size_t)n : 0 );
  return *this;
}

log_line& log_line::add( str key, err_code code )
{
  return add( key, err_code_to_str( code ) );
}

void log_line::end()
{
  impl_.add( wtr_ );
  wtr_.clear();
}
