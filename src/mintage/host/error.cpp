#include <mintage/host/error.hpp>

#include <string>
#include <utility>

namespace mintage::host {

struct _host_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "host";
  }

  std::string message( int condition ) const noexcept final
  {
    using namespace std::string_literals;
    switch( static_cast< host_errc >( condition ) )
    {
      case host_errc::ok:
        return "ok"s;
      case host_errc::unknown_command:
        return "unknown command"s;
      case host_errc::invalid_arguments:
        return "invalid arguments"s;
    }
    std::unreachable();
  }
};

const std::error_category& host_category() noexcept
{
  static _host_category category;
  return category;
}

std::error_code make_error_code( host_errc e )
{
  return std::error_code( static_cast< int >( e ), host_category() );
}

} // namespace mintage::host
