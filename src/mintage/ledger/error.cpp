#include <mintage/ledger/error.hpp>

#include <string>
#include <utility>

namespace mintage::ledger {

struct _ledger_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "ledger";
  }

  std::string message( int condition ) const noexcept final
  {
    using namespace std::string_literals;
    switch( static_cast< ledger_errc >( condition ) )
    {
      case ledger_errc::ok:
        return "ok"s;
      case ledger_errc::insufficient_balance:
        return "insufficient balance"s;
      case ledger_errc::insufficient_allowance:
        return "insufficient allowance"s;
      case ledger_errc::not_issuer:
        return "caller is not the issuer"s;
    }
    std::unreachable();
  }
};

const std::error_category& ledger_category() noexcept
{
  static _ledger_category category;
  return category;
}

std::error_code make_error_code( ledger_errc e )
{
  return std::error_code( static_cast< int >( e ), ledger_category() );
}

} // namespace mintage::ledger
