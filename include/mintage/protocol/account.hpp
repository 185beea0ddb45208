#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/serialization/binary_object.hpp>

#include <mintage/protocol/error.hpp>

namespace mintage::protocol {

constexpr std::size_t account_length = 32;

struct account: std::array< std::byte, account_length >
{
  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & boost::serialization::make_binary_object( data(), size() );
  }
};

using account_pair = std::pair< account, account >;

std::string to_hex( const account& a );
result< account > account_from_hex( std::string_view sv ) noexcept;

struct account_hash
{
  std::size_t operator()( const account& a ) const noexcept;
  std::size_t operator()( const account_pair& p ) const noexcept;
};

} // namespace mintage::protocol

template<>
struct std::hash< mintage::protocol::account >
{
  std::size_t operator()( const mintage::protocol::account& a ) const noexcept
  {
    return mintage::protocol::account_hash{}( a );
  }
};
