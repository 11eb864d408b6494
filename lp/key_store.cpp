#include "key_store.hpp"
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <ctype.h>

using namespace lp;

static bool write_key_file(
    const std::string& key_file, const key_pair& kp )
{
  std::string buf;
  kp.enc_json( buf );
  int fd = ::open( key_file.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0600 );
  if ( fd<0 ) {
    return false;
  }
  const char *cptr = buf.c_str();
  size_t len = buf.length();
  do {
    ssize_t num = ::write( fd, cptr, len );
    if ( num < 0 ) {
      ::close( fd );
      return false;
    }
    len -= (size_t)num;
    cptr += num;
  } while( len );
  fchmod( fd, 0400 );
  ::close( fd );
  return true;
}

void key_store::set_dir( const std::string& dirn )
{
  dir_ = dirn;
}

std::string key_store::get_dir() const
{
  return dir_;
}

bool key_store::create()
{
  struct stat fst[1];
  if ( 0 == ::stat( dir_.c_str(), fst ) ) {
    if ( 0 != chmod( dir_.c_str(), 0700 ) ) {
      return set_err_msg( "failed to chmod key_store directory", errno );
    }
  } else {
    if ( 0 != mkdir( dir_.c_str(), 0700 ) ) {
      return set_err_msg( "failed to create key_store directory", errno );
    }
  }
  return true;
}

bool key_store::init()
{
  struct stat fst[1];
  if ( dir_.empty() ) {
    return set_err_msg( "missing key_store directory" );
  }
  if ( 0 != ::stat( dir_.c_str(), fst ) ) {
    return set_err_msg( "cant find key_store directory", errno );
  }
  if ( !S_ISDIR(fst->st_mode) ) {
    return set_err_msg( "key_store path not a directory" );
  }
  if ( fst->st_uid != getuid() || fst->st_uid != geteuid() ) {
    return set_err_msg( "user must own the key_store directory" );
  }
  if ( ! (fst->st_mode & S_IRUSR ) ) {
    return set_err_msg(
        "user must have read access to key_store directory");
  }
  if ( ! (fst->st_mode & S_IWUSR ) ) {
    return set_err_msg(
        "user must have write access to key_store directory");
  }
  if ( fst->st_mode & ( S_IRWXG | S_IRWXO ) ) {
    return set_err_msg( "key store directory must be restricted to user "
       "read/write permissions" );
  }
  if ( dir_.back() != '/' ) {
    dir_ += '/';
  }
  return true;
}

bool key_store::is_valid_name( const std::string& name )
{
  if ( name.empty() ) {
    return set_err_msg( "empty key name" );
  }
  for( char ch: name ) {
    if ( !isalnum( ch ) && ch != '_' && ch != '-' ) {
      return set_err_msg( "invalid key name [" + name + "]" );
    }
  }
  return true;
}

std::string key_store::get_key_pair_file( const std::string& name ) const
{
  return dir_ + name + "_key_pair.json";
}

bool key_store::create_key_pair( const std::string& name, key_pair& kp )
{
  if ( !is_valid_name( name ) ) {
    return false;
  }
  if ( !kp.gen() ) {
    return set_err_msg( "failed to generate key pair" );
  }
  std::string file = get_key_pair_file( name );
  if ( !write_key_file( file, kp ) ) {
    return set_err_msg( "failed to write key file [" + file + "]", errno );
  }
  return true;
}

bool key_store::get_key_pair( const std::string& name, key_pair& kp )
{
  if ( !is_valid_name( name ) ) {
    return false;
  }
  std::string file = get_key_pair_file( name );
  if ( !kp.init_from_file( file ) ) {
    return set_err_msg( "failed to read key file [" + file + "]" );
  }
  return true;
}
