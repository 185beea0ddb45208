#pragma once

#include <mintage/ledger/error.hpp>
#include <mintage/ledger/event_sink.hpp>
#include <mintage/ledger/ledger.hpp>
