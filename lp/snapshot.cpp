#include "snapshot.hpp"
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <stdio.h>
#include <errno.h>

using namespace lp;

static const size_t gzb_sz = 128*1024;

snapshot::snapshot()
: zfd_( nullptr )
{
}

snapshot::~snapshot()
{
  close();
  if ( !tmp_.empty() ) {
    ::unlink( tmp_.c_str() );
  }
}

void snapshot::close()
{
  if ( zfd_ ) {
    ::gzclose( zfd_ );
    zfd_ = nullptr;
  }
}

void snapshot::set_file( const std::string& file )
{
  file_ = file;
}

std::string snapshot::get_file() const
{
  return file_;
}

bool snapshot::init_write()
{
  close();
  tmp_ = file_ + ".tmp";
  int fd = ::open( tmp_.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0600 );
  if ( fd < 0 ) {
    tmp_.clear();
    return set_err_msg(
        "failed to create snapshot file=" + file_, errno  );
  }
  zfd_ = ::gzdopen( fd, "w" );
  if ( !zfd_ ) {
    ::close( fd );
    return set_err_msg(
        "failed to create snapshot file=" + file_, errno  );
  }
  if ( 0 != gzbuffer( zfd_, gzb_sz ) ) {
    return set_err_msg(
        "failed to set compression buffer file=" + file_ );
  }
  return true;
}

bool snapshot::write( const char *buf, size_t len )
{
  if ( !zfd_ ) {
    return set_err_msg( "snapshot not open for write file=" + file_ );
  }
  while( len ) {
    unsigned num = len > gzb_sz ? (unsigned)gzb_sz : (unsigned)len;
    int numw = ::gzwrite( zfd_, buf, num );
    if ( numw <= 0 ) {
      return set_err_msg( "failed to write snapshot file=" + file_ );
    }
    buf += numw;
    len -= (size_t)numw;
  }
  return true;
}

bool snapshot::commit()
{
  if ( !zfd_ ) {
    return set_err_msg( "snapshot not open for write file=" + file_ );
  }
  int rc = ::gzclose( zfd_ );
  zfd_ = nullptr;
  if ( rc != Z_OK ) {
    return set_err_msg( "failed to flush snapshot file=" + file_ );
  }
  if ( 0 != ::rename( tmp_.c_str(), file_.c_str() ) ) {
    return set_err_msg( "failed to replace snapshot file=" + file_, errno );
  }
  tmp_.clear();
  return true;
}

bool snapshot::read( std::string& buf )
{
  close();
  buf.clear();
  zfd_ = ::gzopen( file_.c_str(), "r" );
  if ( !zfd_ ) {
    return set_err_msg( "failed to open file=" + file_, errno );
  }
  if ( 0 != gzbuffer( zfd_, gzb_sz ) ) {
    close();
    return set_err_msg(
        "failed to set compression buffer file=" + file_ );
  }
  char tmp[16*1024];
  for(;;) {
    int numread = ::gzread( zfd_, tmp, sizeof( tmp ) );
    if ( numread > 0 ) {
      buf.append( tmp, static_cast< size_t >( numread ) );
    } else if ( numread == 0 ) {
      break;
    } else {
      close();
      return set_err_msg( "failed to read snapshot file=" + file_ );
    }
  }
  close();
  return true;
}
