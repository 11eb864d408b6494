#include "jtree.hpp"
#include <ctype.h>

using namespace lp;

jtree::jtree()
: key_( 0 ), err_( false ), buf_( nullptr )
{
}

void jtree::parse( const char *cptr, size_t sz )
{
  buf_ = cptr;
  key_ = 0;
  err_ = false;
  nv_.resize(1);
  st_.clear();

  const char *end = &cptr[sz];
  while( cptr != end && !err_ ) {
    char ch = *cptr;
    if ( ch == '{' ) {
      start( e_obj );
      ++cptr;
    } else if ( ch == '[' ) {
      start( e_arr );
      ++cptr;
    } else if ( ch == '}' || ch == ']' ) {
      finish();
      ++cptr;
    } else if ( ch == '"' ) {
      const char *txt = ++cptr;
      while( cptr != end && *cptr != '"' ) {
        cptr += ( *cptr == '\\' && cptr+1 != end ) ? 2 : 1;
      }
      if ( cptr == end ) {
        err_ = true;
        break;
      }
      const char *etxt = cptr++;
      // peek if this is a key
      while( cptr != end && isspace( *cptr ) ) ++cptr;
      if ( cptr != end && *cptr == ':' ) {
        add_key( txt, etxt );
        ++cptr;
      } else {
        add_text( txt, etxt );
      }
    } else if ( ch == '-' || isdigit( ch ) || isalpha( ch ) ) {
      // number or keyword
      const char *txt = cptr;
      while( cptr != end && ( isalnum( *cptr ) || *cptr == '.' ||
             *cptr == '-' || *cptr == '+' ) ) ++cptr;
      add_text( txt, cptr );
    } else {
      ++cptr;
    }
  }
}

bool jtree::is_valid() const
{
  return !err_ && nv_.size()>1 && st_.empty();
}

uint32_t jtree::new_node( type_t t, uint32_t i, uint32_t j )
{
  uint32_t nxt = nv_.size();
  nv_.resize( 1 + nxt );
  node& nd = nv_[nxt];
  nd.type_ = t;
  nd.next_ = 0;
  nd.h_    = i;
  nd.t_    = j;
  return nxt;
}

void jtree::add( uint32_t val )
{
  if ( st_.empty() ) {
    // only a single top-level value is allowed
    err_ = nv_.size() > 2;
    return;
  }
  if ( key_ ) {
    val = new_node( e_keyval, key_, val );
    key_ = 0;
  }
  node& obj = nv_[st_.back()];
  if ( obj.t_ ) {
    nv_[obj.t_].next_ = val;
    obj.t_ = val;
  } else {
    obj.h_ = obj.t_ = val;
  }
}

void jtree::start( type_t t )
{
  uint32_t idx = new_node( t, 0, 0 );
  add( idx );
  st_.push_back( idx );
}

void jtree::finish()
{
  if ( st_.empty() ) {
    err_ = true;
  } else {
    st_.pop_back();
  }
}

void jtree::add_key( const char *txt, const char *end )
{
  key_ = new_node( e_val, txt-buf_, end-txt );
}

void jtree::add_text( const char *txt, const char *end )
{
  add( new_node( e_val, txt-buf_, end-txt ) );
}

uint32_t jtree::find_val( uint32_t obj, str key ) const
{
  for( uint32_t it=get_first(obj); it; it = get_next(it) ) {
    if ( e_keyval == get_type( it ) ) {
      if ( key == get_str( get_key( it ) ) ) {
        return get_val( it );
      }
    } else {
      break;
    }
  }
  return 0;
}
