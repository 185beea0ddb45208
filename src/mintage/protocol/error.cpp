#include <mintage/protocol/error.hpp>

#include <string>
#include <utility>

namespace mintage::protocol {

struct _protocol_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "protocol";
  }

  std::string message( int condition ) const noexcept final
  {
    using namespace std::string_literals;
    switch( static_cast< protocol_errc >( condition ) )
    {
      case protocol_errc::ok:
        return "ok"s;
      case protocol_errc::invalid_character:
        return "invalid character"s;
      case protocol_errc::invalid_length:
        return "invalid length"s;
      case protocol_errc::invalid_amount:
        return "invalid amount"s;
      case protocol_errc::amount_overflow:
        return "amount overflow"s;
      case protocol_errc::unknown_event:
        return "unknown event"s;
      case protocol_errc::invalid_record:
        return "invalid record"s;
    }
    std::unreachable();
  }
};

const std::error_category& protocol_category() noexcept
{
  static _protocol_category category;
  return category;
}

std::error_code make_error_code( protocol_errc e )
{
  return std::error_code( static_cast< int >( e ), protocol_category() );
}

} // namespace mintage::protocol
