#pragma once

#include <lp/error.hpp>
#include <zlib.h>

namespace lp
{

  // gzip-compressed ledger snapshot file
  // writes go to a temporary file that replaces the snapshot on commit
  class snapshot : public error
  {
  public:

    snapshot();
    ~snapshot();

    void set_file( const std::string& );
    std::string get_file() const;

    // start new snapshot
    bool init_write();

    // append bytes to snapshot
    bool write( const char *buf, size_t len );

    // flush and atomically replace previous snapshot
    bool commit();

    // read complete uncompressed snapshot
    bool read( std::string& buf );

  private:
    snapshot( const snapshot& );
    snapshot& operator=( const snapshot& );
    void close();
    gzFile      zfd_;
    std::string file_;
    std::string tmp_;
  };

}
