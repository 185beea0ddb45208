#pragma once

#include <mintage/protocol/event.hpp>

namespace mintage::ledger {

struct event_sink
{
  event_sink()                    = default;
  event_sink( const event_sink& ) = delete;
  event_sink( event_sink&& )      = delete;
  virtual ~event_sink()           = default;

  event_sink& operator=( const event_sink& ) = delete;
  event_sink& operator=( event_sink&& )      = delete;

  virtual void emit( const protocol::event& e ) = 0;
};

} // namespace mintage::ledger
