#pragma once

#include <expected>
#include <system_error>

namespace mintage::protocol {

enum class protocol_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_character,
  invalid_length,
  invalid_amount,
  amount_overflow,
  unknown_event,
  invalid_record
};

const std::error_category& protocol_category() noexcept;

std::error_code make_error_code( protocol_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace mintage::protocol

template<>
struct std::is_error_code_enum< mintage::protocol::protocol_errc >: public std::true_type
{};
