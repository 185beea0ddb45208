#include <mintage/protocol/account.hpp>

#include <bit>
#include <cstdint>
#include <iomanip>
#include <sstream>

#include <boost/container_hash/hash.hpp>

namespace mintage::protocol {

constexpr char hex_offset = 10;

std::string to_hex( const account& a )
{
  std::stringstream stream;
  stream << "0x" << std::hex << std::setfill( '0' );
  for( const auto& b: a )
    stream << std::setw( 2 ) << static_cast< unsigned int >( std::bit_cast< unsigned char >( b ) );

  return stream.str();
}

static result< std::uint8_t > nibble( char in ) noexcept
{
  if( in >= '0' && in <= '9' )
    return in - '0';
  if( in >= 'a' && in <= 'f' )
    return in - 'a' + hex_offset;
  if( in >= 'A' && in <= 'F' )
    return in - 'A' + hex_offset;

  return std::unexpected( protocol_errc::invalid_character );
}

result< account > account_from_hex( std::string_view sv ) noexcept
{
  if( sv.starts_with( "0x" ) || sv.starts_with( "0X" ) )
    sv.remove_prefix( 2 );

  if( sv.size() != account_length * 2 )
    return std::unexpected( protocol_errc::invalid_length );

  account a{};
  for( std::size_t i = 0; i < a.size(); ++i )
  {
    auto high = nibble( sv[ 2 * i ] );
    if( !high )
      return std::unexpected( high.error() );

    auto low = nibble( sv[ 2 * i + 1 ] );
    if( !low )
      return std::unexpected( low.error() );

    a[ i ] = static_cast< std::byte >( *high << 4 | *low );
  }

  return a;
}

std::size_t account_hash::operator()( const account& a ) const noexcept
{
  return boost::hash_range( a.begin(), a.end() );
}

std::size_t account_hash::operator()( const account_pair& p ) const noexcept
{
  std::size_t seed = 0;
  boost::hash_combine( seed, ( *this )( p.first ) );
  boost::hash_combine( seed, ( *this )( p.second ) );
  return seed;
}

} // namespace mintage::protocol
