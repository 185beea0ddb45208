#pragma once

#include <mintage/protocol/account.hpp>
#include <mintage/protocol/amount.hpp>
#include <mintage/protocol/error.hpp>
#include <mintage/protocol/event.hpp>
