#pragma once

#include <vector>

#include <mintage/ledger/event_sink.hpp>

namespace mintage::host {

// Keeps every emitted event in emission order
struct recorder final: public ledger::event_sink
{
  recorder()                  = default;
  recorder( const recorder& ) = delete;
  recorder( recorder&& )      = delete;
  ~recorder() override        = default;

  recorder& operator=( const recorder& ) = delete;
  recorder& operator=( recorder&& )      = delete;

  void emit( const protocol::event& e ) override;

  const std::vector< protocol::event >& events() const noexcept;
  void clear() noexcept;

private:
  std::vector< protocol::event > _events;
};

} // namespace mintage::host
