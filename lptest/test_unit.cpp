#include <lp/key_pair.hpp>
#include <lp/key_store.hpp>
#include <lp/digest.hpp>
#include <lp/bincode.hpp>
#include <lp/jtree.hpp>
#include <lp/misc.hpp>
#include <lp/log.hpp>
#include <lp/snapshot.hpp>
#include <lp/market_types.hpp>
#include "test_error.hpp"
#include <stdlib.h>
#include <unistd.h>
#include <fcntl.h>
#include <iostream>
#include <vector>

using namespace lp;

void test_key()
{
  // check key_pair encoding
  static const uint8_t kp_val[] = {
    1,255,171,208,173,142,62,253,217,43,175,186,121,205,69,158,81,20,106,216,112,153,91,128,111,144,115,208,226,228,180,230,54,224,118,105,238,95,215,221,52,118,41,49,241,73,160,221,225,36,45,167,11,203,7,232,201,166,138,219,218,113,232,229
  };
  static const char kptxt[] = "[1,255,171,208,173,142,62,253,217,43,175,186,121,205,69,158,81,20,106,216,112,153,91,128,111,144,115,208,226,228,180,230,54,224,118,105,238,95,215,221,52,118,41,49,241,73,160,221,225,36,45,167,11,203,7,232,201,166,138,219,218,113,232,229 ]";
  key_pair kp;
  LP_TEST_CHECK( kp.init_from_json( std::string( kptxt ) ) );
  for(unsigned i=0; i != key_pair::len; ++i ) {
    LP_TEST_CHECK( kp.data()[i] == kp_val[i] );
  }

  // json encoding reads back
  {
    std::string json;
    kp.enc_json( json );
    key_pair kp2;
    LP_TEST_CHECK( kp2.init_from_json( json ) );
    for(unsigned i=0; i != key_pair::len; ++i ) {
      LP_TEST_CHECK( kp2.data()[i] == kp_val[i] );
    }
  }

  // check public key encoding
  static const char pktxt[] = "4hDXpxxchPLHUH4aCgr8Ec9B82Aztjy2w4xRc4NFhqCg";
  pub_key pk( kp );
  std::string res;
  pk.enc_base58( res );
  LP_TEST_CHECK( res == pktxt );
  LP_TEST_CHECK( pk.as_string() == pktxt );

  pub_key pk2;
  LP_TEST_CHECK( pk2.init_from_text( str( pktxt ) ) );
  LP_TEST_CHECK( pk == pk2 );
  LP_TEST_CHECK( !pk2.init_from_text( str( "4hDXpxxchPLHUH4aCgr8Ec9B82Az0" ) ) );

  // check message signing and encoding
  static const char sigtxt[] = "3LEWGZ5K88RqFnftjqyzaFm4AdYkwnGvJhKb13dVEa9uLnoDUif5B3esZyQ8dwxtx44PQZqkvhqH4HZUMi5PjTHQ";

  const char *msg = "hello world";
  size_t msglen = __builtin_strlen( msg );
  {
    std::string res;
    signature sig;
    LP_TEST_CHECK( sig.sign( (const uint8_t*)msg, msglen, kp ) );
    sig.enc_base58( res );
    LP_TEST_CHECK( res == sigtxt );
  }
  {
    signature sig;
    LP_TEST_CHECK( sig.init_from_text( sigtxt ) );
    LP_TEST_CHECK( sig.verify( (const uint8_t*)msg, msglen, pk ) );
    LP_TEST_CHECK( !sig.verify( (const uint8_t*)msg, msglen - 1, pk ) );
  }

  // check key generation
  {
    key_pair gk;
    LP_TEST_CHECK( gk.gen() );
    signature sig;
    LP_TEST_CHECK( sig.sign( (const uint8_t*)msg, msglen, gk ) );
    pub_key gp( gk );
    LP_TEST_CHECK( sig.verify( (const uint8_t*)msg, msglen, gp ) );
    LP_TEST_CHECK( !sig.verify( (const uint8_t*)msg, msglen, pk ) );
    LP_TEST_CHECK( gp.is_on_curve() );
  }
}

void test_misc()
{
  // base58 of known program id
  str loader( "BPFLoaderUpgradeab1e11111111111111111111111" );
  uint8_t key[64];
  LP_TEST_CHECK( 32 == dec_base58( loader.str_, loader.len_, key, 64 ) );
  char buf[128];
  LP_TEST_CHECK( (int)loader.len_ == enc_base58( key, 32, buf, 128 ) );
  LP_TEST_CHECK( str( buf, loader.len_ ) == loader );

  // leading zeros map to leading ones
  uint8_t zeros[32] = { 0 };
  LP_TEST_CHECK( 32 == enc_base58( zeros, 32, buf, 128 ) );
  LP_TEST_CHECK( buf[0] == '1' && buf[31] == '1' );
  LP_TEST_CHECK( -1 == dec_base58( "0OIl", 4, key, 64 ) );

  // strict decimal parsing
  uint64_t uval;
  int64_t ival;
  LP_TEST_CHECK( str_to_uint( "1000000000", 10, uval ) );
  LP_TEST_CHECK( uval == 1000000000UL );
  LP_TEST_CHECK( !str_to_uint( "12a", 3, uval ) );
  LP_TEST_CHECK( !str_to_uint( "", 0, uval ) );
  LP_TEST_CHECK( !str_to_uint( "18446744073709551616", 20, uval ) );
  LP_TEST_CHECK( str_to_int( "-42", 3, ival ) );
  LP_TEST_CHECK( ival == -42L );

  char ibuf[32];
  char *end = &ibuf[sizeof(ibuf)];
  char *ptr = int_to_str( -1234, end );
  LP_TEST_CHECK( str( ptr, end - ptr ) == str( "-1234" ) );
  ptr = uint_to_str( 0, end );
  LP_TEST_CHECK( str( ptr, end - ptr ) == str( "0" ) );

  // sha256 known answer
  uint8_t dig[sha256::len];
  sha256::digest( (const uint8_t*)"abc", 3, dig );
  LP_TEST_CHECK( enc_hex( dig, sha256::len ) ==
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad" );
  sha256 sh;
  sh.add( str( "a" ) );
  sh.add( str( "bc" ) );
  hash hs;
  sh.fin( hs );
  LP_TEST_CHECK( 0 == __builtin_memcmp( hs.data(), dig, sha256::len ) );
}

void test_pda()
{
  pub_key prog;
  LP_TEST_CHECK( prog.init_from_text(
        str( "BPFLoaderUpgradeab1e11111111111111111111111" ) ) );

  // known derived addresses
  {
    static const uint8_t one[] = { 1 };
    seed_vec_t seeds;
    seeds.push_back( str( "" ) );
    seeds.push_back( str( one, 1 ) );
    pub_key addr;
    LP_TEST_CHECK( addr.create_program_address( seeds, prog ) );
    LP_TEST_CHECK( addr.as_string() ==
        "BwqrghZA2htAcqq8dzP1WDAhTXYTYWj7CHxF5j7TDBAe" );
    LP_TEST_CHECK( !addr.is_on_curve() );
  }
  {
    seed_vec_t seeds;
    seeds.push_back( str( "Talking" ) );
    seeds.push_back( str( "Squirrels" ) );
    pub_key addr;
    LP_TEST_CHECK( addr.create_program_address( seeds, prog ) );
    LP_TEST_CHECK( addr.as_string() ==
        "2fnQrngrQT4SeLcdToJAD96phoEjNL2man2kfRLCASVk" );
  }

  // seed length limit
  {
    std::string big( pub_key::max_seed_len + 1, 'x' );
    seed_vec_t seeds;
    seeds.push_back( str( big ) );
    pub_key addr;
    LP_TEST_CHECK( !addr.create_program_address( seeds, prog ) );
  }

  // bump search is deterministic and yields an off-curve address
  {
    seed_vec_t seeds;
    seeds.push_back( str( "escrow" ) );
    uint8_t bump1 = 0, bump2 = 0;
    pub_key a1, a2;
    LP_TEST_CHECK( a1.find_program_address( seeds, prog, bump1 ) );
    LP_TEST_CHECK( a2.find_program_address( seeds, prog, bump2 ) );
    LP_TEST_CHECK( bump1 == bump2 );
    LP_TEST_CHECK( a1 == a2 );
    LP_TEST_CHECK( !a1.is_on_curve() );
    uint8_t bseed[] = { bump1 };
    seeds.push_back( str( bseed, 1 ) );
    pub_key a3;
    LP_TEST_CHECK( a3.create_program_address( seeds, prog ) );
    LP_TEST_CHECK( a3 == a1 );
  }

  // marketplace addresses separate per seed
  {
    key_pair k1, k2;
    LP_TEST_CHECK( k1.gen() && k2.gen() );
    pub_key w1( k1 ), w2( k2 );
    pub_key u1, u2, j1, j2, j3, e1, a1, a2;
    LP_TEST_CHECK( find_user_address( w1, u1 ) );
    LP_TEST_CHECK( find_user_address( w2, u2 ) );
    LP_TEST_CHECK( u1 != u2 );
    LP_TEST_CHECK( find_job_address( w1, "logo design", j1 ) );
    LP_TEST_CHECK( find_job_address( w1, "web design", j2 ) );
    LP_TEST_CHECK( find_job_address( w2, "logo design", j3 ) );
    LP_TEST_CHECK( j1 != j2 && j1 != j3 );
    LP_TEST_CHECK( find_escrow_address( j1, e1 ) );
    LP_TEST_CHECK( e1 != j1 );
    LP_TEST_CHECK( find_application_address( j1, w1, a1 ) );
    LP_TEST_CHECK( find_application_address( j1, w2, a2 ) );
    LP_TEST_CHECK( a1 != a2 );

    // job titles longer than a seed still derive
    std::string title( max_title_len, 't' );
    pub_key jl;
    LP_TEST_CHECK( find_job_address( w1, title, jl ) );
  }
}

void test_bincode()
{
  char buf[256];
  bincode wtr( buf, sizeof( buf ) );
  wtr.add( (uint8_t)7 );
  wtr.add( (uint32_t)0x01020304 );
  wtr.add( (uint64_t)5000000000UL );
  wtr.add( (int64_t)-2 );
  wtr.add_bool( true );
  wtr.add_str( str( "hello" ) );
  wtr.add_opt( false, 0 );
  wtr.add_opt( true, 1700000000L );
  wtr.add_len( 300 );
  LP_TEST_CHECK( !wtr.get_is_overflow() );
  LP_TEST_CHECK( wtr.size() == 1+4+8+8+1+4+5+1+9+2 );

  // little-endian layout
  LP_TEST_CHECK( buf[1] == 0x04 && buf[4] == 0x01 );

  bindec rdr( buf, wtr.size() );
  uint8_t u8;
  uint32_t u32;
  uint64_t u64;
  int64_t i64, ts;
  bool bval, has1, has2;
  std::string sval;
  unsigned len;
  LP_TEST_CHECK( rdr.get( u8 ) && u8 == 7 );
  LP_TEST_CHECK( rdr.get( u32 ) && u32 == 0x01020304 );
  LP_TEST_CHECK( rdr.get( u64 ) && u64 == 5000000000UL );
  LP_TEST_CHECK( rdr.get( i64 ) && i64 == -2L );
  LP_TEST_CHECK( rdr.get_bool( bval ) && bval );
  LP_TEST_CHECK( rdr.get_str( sval ) && sval == "hello" );
  LP_TEST_CHECK( rdr.get_opt( has1, ts ) && !has1 );
  LP_TEST_CHECK( rdr.get_opt( has2, ts ) && has2 && ts == 1700000000L );
  LP_TEST_CHECK( rdr.get_len( len ) && len == 300 );
  LP_TEST_CHECK( rdr.get_left() == 0 );
  LP_TEST_CHECK( !rdr.get( u8 ) );

  // overflow is sticky
  char small[4];
  bincode ovr( small, sizeof( small ) );
  ovr.add( (uint64_t)1 );
  ovr.add( (uint8_t)1 );
  LP_TEST_CHECK( ovr.get_is_overflow() );

  // truncated string
  bindec trunc( buf + 22, 6 );
  LP_TEST_CHECK( !trunc.get_str( sval ) );
}

void test_jtree()
{
  static const char txt[] =
    "{\"wallet\":\"4hDXpxxchPLHUH4aCgr8Ec9B82Aztjy2w4xRc4NFhqCg\","
    "\"amount\":1000,\"delta\":-5,\"keys\":[1,2,3]}";
  jtree jt;
  jt.parse( txt, sizeof( txt ) - 1 );
  LP_TEST_CHECK( jt.is_valid() );
  LP_TEST_CHECK( jt.get_type( 1 ) == jtree::e_obj );
  uint32_t wtok = jt.find_val( 1, "wallet" );
  LP_TEST_CHECK( wtok );
  LP_TEST_CHECK( jt.get_str( wtok ) ==
      str( "4hDXpxxchPLHUH4aCgr8Ec9B82Aztjy2w4xRc4NFhqCg" ) );
  uint64_t amount = 0;
  LP_TEST_CHECK( jt.get_uint( jt.find_val( 1, "amount" ), amount ) );
  LP_TEST_CHECK( amount == 1000UL );
  int64_t delta = 0;
  LP_TEST_CHECK( jt.get_int( jt.find_val( 1, "delta" ), delta ) );
  LP_TEST_CHECK( delta == -5L );
  uint32_t arr = jt.find_val( 1, "keys" );
  LP_TEST_CHECK( jt.get_type( arr ) == jtree::e_arr );
  unsigned num = 0;
  for( uint32_t it = jt.get_first( arr ); it; it = jt.get_next( it ) ) {
    ++num;
  }
  LP_TEST_CHECK( num == 3 );
  LP_TEST_CHECK( 0 == jt.find_val( 1, "missing" ) );

  jtree bad;
  bad.parse( "{\"a\":", 5 );
  LP_TEST_CHECK( !bad.is_valid() );
}

void test_records()
{
  key_pair kp;
  LP_TEST_CHECK( kp.gen() );

  // discriminators
  uint8_t disc[disc_len];
  get_instr_disc( e_register_user, disc );
  LP_TEST_CHECK( enc_hex( disc, disc_len ) == "02f196df63d67461" );
  get_instr_disc( e_initialize_job_post, disc );
  LP_TEST_CHECK( enc_hex( disc, disc_len ) == "b3d4b7055c3a6e65" );
  get_instr_disc( e_approve_submission, disc );
  LP_TEST_CHECK( enc_hex( disc, disc_len ) == "9a4c74788f8010cd" );
  get_account_disc( job_post::get_type_name(), disc );
  LP_TEST_CHECK( enc_hex( disc, disc_len ) == "d1fbbecd13b49708" );
  get_account_disc( user_account::get_type_name(), disc );
  LP_TEST_CHECK( enc_hex( disc, disc_len ) == "d3218810ba6ef27f" );
  get_account_disc( application::get_type_name(), disc );
  LP_TEST_CHECK( enc_hex( disc, disc_len ) == "db091b71d07ecb1e" );

  // fixed record sizes
  LP_TEST_CHECK( user_account::space == 95 );
  LP_TEST_CHECK( job_post::space == 676 );
  LP_TEST_CHECK( application::space == 1100 );

  // roles
  user_role role;
  LP_TEST_CHECK( str_to_user_role( "freelancer", role ) );
  LP_TEST_CHECK( role == e_freelancer );
  LP_TEST_CHECK( !str_to_user_role( "admin", role ) );
  LP_TEST_CHECK( user_role_to_str( e_client ) == str( "client" ) );

  // job record with maximum field lengths
  job_post job;
  job.client_ = pub_key( kp );
  job.title_.assign( max_title_len, 'T' );
  job.description_.assign( max_description_len, 'D' );
  job.amount_ = 500000000UL;
  job.escrow_bump_ = 254;
  job.start_date_ = opt_ts( 1700000000L );
  job.end_date_ = opt_ts( 1700086400L );
  acc_data_t data;
  LP_TEST_CHECK( job.encode( data ) );
  LP_TEST_CHECK( data.size() == job_post::space );
  job_post job2;
  LP_TEST_CHECK( job2.decode( data ) );
  LP_TEST_CHECK( job2.client_ == job.client_ );
  LP_TEST_CHECK( job2.title_ == job.title_ );
  LP_TEST_CHECK( job2.amount_ == job.amount_ );
  LP_TEST_CHECK( job2.escrow_bump_ == 254 );
  LP_TEST_CHECK( job2.end_date_.has_val_ );
  LP_TEST_CHECK( job2.end_date_.val_ == 1700086400L );

  // records of other types do not decode
  user_account user;
  LP_TEST_CHECK( !user.decode( data ) );
  application app;
  LP_TEST_CHECK( !app.decode( data ) );

  // oversized fields are rejected
  job.title_.push_back( 'T' );
  LP_TEST_CHECK( !job.encode( data ) );
  user.name_.assign( max_name_len + 1, 'n' );
  LP_TEST_CHECK( !user.encode( data ) );
  app.client_review_.assign( max_review_len + 1, 'r' );
  LP_TEST_CHECK( !app.encode( data ) );
}

static void write_file( const std::string& file, const std::string& buf )
{
  int fd = ::open( file.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0600 );
  LP_TEST_CHECK( fd >= 0 );
  LP_TEST_CHECK( ::write( fd, buf.c_str(), buf.length() ) ==
                 (ssize_t)buf.length() );
  ::close( fd );
}

void test_key_store()
{
  char tmpl[] = "/tmp/lp_test_ks_XXXXXX";
  LP_TEST_CHECK( ::mkdtemp( tmpl ) );
  std::string dir = std::string( tmpl ) + "/keys";
  key_store kst;
  kst.set_dir( dir );
  LP_TEST_CHECK( kst.create() );
  LP_TEST_CHECK( kst.init() );

  key_pair kp1, kp2;
  LP_TEST_CHECK( kst.create_key_pair( "alice", kp1 ) );
  LP_TEST_CHECK( kst.get_key_pair( "alice", kp2 ) );
  LP_TEST_CHECK( pub_key( kp1 ) == pub_key( kp2 ) );

  // no overwrite of an existing wallet, no path names
  LP_TEST_CHECK( !kst.create_key_pair( "alice", kp2 ) );
  LP_TEST_CHECK( !kst.create_key_pair( "../alice", kp2 ) );
  LP_TEST_CHECK( !kst.get_key_pair( "bob", kp2 ) );

  // key files written by other tools, with surrounding whitespace
  std::string json;
  kp1.enc_json( json );
  std::string file = kst.get_key_pair_file( "carol" );
  write_file( file, "  \n" + json + "\n" );
  key_pair kp3;
  LP_TEST_CHECK( kp3.init_from_file( file ) );
  LP_TEST_CHECK( pub_key( kp3 ) == pub_key( kp1 ) );
  LP_TEST_CHECK( kst.get_key_pair( "carol", kp3 ) );

  // empty, oversized and missing files
  write_file( file, "" );
  LP_TEST_CHECK( !kp3.init_from_file( file ) );
  write_file( file, json + std::string( 2048, ' ' ) );
  LP_TEST_CHECK( !kp3.init_from_file( file ) );
  LP_TEST_CHECK( !kp3.init_from_file( dir + "/missing.json" ) );

  ::unlink( file.c_str() );
  ::unlink( kst.get_key_pair_file( "alice" ).c_str() );
  ::rmdir( dir.c_str() );
  ::rmdir( tmpl );
}

void test_snapshot()
{
  char tmpl[] = "/tmp/lp_test_snp_XXXXXX";
  LP_TEST_CHECK( ::mkdtemp( tmpl ) );
  std::string file = std::string( tmpl ) + "/ledger.gz";
  std::string payload;
  for( unsigned i=0; i != 100000; ++i ) {
    payload.push_back( (char)( i % 251 ) );
  }
  {
    snapshot snp;
    snp.set_file( file );
    LP_TEST_CHECK( snp.init_write() );
    LP_TEST_CHECK( snp.write( payload.c_str(), 1000 ) );
    LP_TEST_CHECK( snp.write( payload.c_str() + 1000,
                              payload.length() - 1000 ) );
    LP_TEST_CHECK( snp.commit() );
  }
  {
    snapshot snp;
    snp.set_file( file );
    std::string res;
    LP_TEST_CHECK( snp.read( res ) );
    LP_TEST_CHECK( res == payload );
  }

  // uncommitted write leaves the previous file intact
  {
    snapshot snp;
    snp.set_file( file );
    LP_TEST_CHECK( snp.init_write() );
    LP_TEST_CHECK( snp.write( "x", 1 ) );
  }
  {
    snapshot snp;
    snp.set_file( file );
    std::string res;
    LP_TEST_CHECK( snp.read( res ) );
    LP_TEST_CHECK( res == payload );
  }
  {
    snapshot snp;
    snp.set_file( std::string( tmpl ) + "/missing.gz" );
    std::string res;
    LP_TEST_CHECK( !snp.read( res ) );
    LP_TEST_CHECK( snp.get_is_err() );
  }
  ::unlink( file.c_str() );
  ::rmdir( tmpl );
}

void test_log()
{
  log::set_level( LP_LOG_DBG_LVL );
  LP_TEST_CHECK( log::has_level( LP_LOG_ERR_LVL ) );
  LP_LOG_DBG( "example" )
    .add( "hello", str( "world" ) )
    .add( "ival", 42L )
    .add( "fval", 3.14159 )
    .add( "status", e_job_already_filled )
    .end();
  log::set_level( LP_LOG_INF_LVL );
  LP_TEST_CHECK( !log::has_level( LP_LOG_DBG_LVL ) );
  LP_LOG_DBG( "example2" )
    .add( "hello", str( "world2") )
    .end();
  LP_LOG_INF( "example3" )
    .add( "hello", str( "world3" ))
    .end();
  LP_TEST_CHECK( err_code_to_str( e_job_already_filled ) ==
      str( "JobAlreadyFilled" ) );
}

int main(int,char**)
{
  LP_TEST_START
  test_key();
  test_misc();
  test_pda();
  test_bincode();
  test_jtree();
  test_records();
  test_key_store();
  test_snapshot();
  test_log();
  LP_TEST_END
  return 0;
}
