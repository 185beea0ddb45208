#pragma once

#include <system_error>

namespace mintage::ledger {

enum class ledger_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  insufficient_balance,
  insufficient_allowance,
  not_issuer
};

const std::error_category& ledger_category() noexcept;

std::error_code make_error_code( ledger_errc e );

} // namespace mintage::ledger

template<>
struct std::is_error_code_enum< mintage::ledger::ledger_errc >: public std::true_type
{};
