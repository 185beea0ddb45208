#include <mintage/protocol/amount.hpp>

#include <limits>

namespace mintage::protocol {

constexpr unsigned int radix = 10;

std::string to_string( const amount& value )
{
  return value.str();
}

result< amount > amount_from_string( std::string_view sv ) noexcept
{
  if( sv.empty() )
    return std::unexpected( protocol_errc::invalid_amount );

  static const amount max = std::numeric_limits< amount >::max();

  amount value = 0;
  for( char c: sv )
  {
    if( c < '0' || c > '9' )
      return std::unexpected( protocol_errc::invalid_amount );

    unsigned int digit = static_cast< unsigned int >( c - '0' );

    if( value > ( max - digit ) / radix )
      return std::unexpected( protocol_errc::amount_overflow );

    value = value * radix + digit;
  }

  return value;
}

} // namespace mintage::protocol
