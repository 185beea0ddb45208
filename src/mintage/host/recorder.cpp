#include <mintage/host/recorder.hpp>

namespace mintage::host {

void recorder::emit( const protocol::event& e )
{
  _events.push_back( e );
}

const std::vector< protocol::event >& recorder::events() const noexcept
{
  return _events;
}

void recorder::clear() noexcept
{
  _events.clear();
}

} // namespace mintage::host
