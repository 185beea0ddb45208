#pragma once

#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include <mintage/protocol/error.hpp>

namespace mintage::protocol {

// Token quantity, 128 bit unsigned. Arithmetic that would wrap throws.
using amount = boost::multiprecision::checked_uint128_t;

std::string to_string( const amount& value );
result< amount > amount_from_string( std::string_view sv ) noexcept;

} // namespace mintage::protocol
