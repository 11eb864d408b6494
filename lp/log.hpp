#pragma once

#include <lp/key_pair.hpp>
#include <lp/error.hpp>
#include <string>

#define LP_LOG_DBG_LVL (1U<<3)
#define LP_LOG_INF_LVL (1U<<2)
#define LP_LOG_WRN_LVL (1U<<1)
#define LP_LOG_ERR_LVL (1U<<0)

#define LP_LOG_TXT(X,LVL) \
if (lp::log::has_level(LVL)) lp::log::add(X,LVL)
#define LP_LOG_DBG(X) LP_LOG_TXT(X,LP_LOG_DBG_LVL)
#define LP_LOG_INF(X) LP_LOG_TXT(X,LP_LOG_INF_LVL)
#define LP_LOG_WRN(X) LP_LOG_TXT(X,LP_LOG_WRN_LVL)
#define LP_LOG_ERR(X) LP_LOG_TXT(X,LP_LOG_ERR_LVL)

namespace lp
{

  // log line
  class log_line
  {
  public:
    log_line& add( str key, str val );
    log_line& add( str key, const char *val );
    log_line& add( str key, const std::string& val );
    log_line& add( str key, const hash& val );
    log_line& add( str key, const signature& val );
    log_line& add( str key, err_code val );
    log_line& add( str key, int32_t );
    log_line& add( str key, int64_t );
    log_line& add( str key, uint64_t );
    log_line& add( str key, uint32_t );
    log_line& add( str key, double );
    void end();
    friend class log;
  private:
    log_line( str, int lvl );
    void add_key( str );
    void add_i64( int64_t );
    void add_u64( uint64_t );
    bool        is_first_;
    std::string wtr_;
  };

  // asynchronous log reporting to stderr or a log file
  class log
  {
  public:

    static void set_level( int level );
    static bool has_level( int level );
    static bool set_log_file( const std::string& file );
    static log_line add( str topic, int level );
  private:
    static int level_;
  };

  inline bool log::has_level( int level )
  {
    return level&level_;
  }

}
