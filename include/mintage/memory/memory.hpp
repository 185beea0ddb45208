#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>

namespace mintage::memory {

template< typename T, typename U >
  requires( std::is_pointer_v< T > && std::is_trivially_copyable_v< std::remove_pointer_t< T > > )
T pointer_cast( U* p )
{
  return reinterpret_cast< T >( p ); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
}

inline std::span< const std::byte > as_bytes( std::string_view sv )
{
  return std::as_bytes( std::span( sv ) );
}

} // namespace mintage::memory
