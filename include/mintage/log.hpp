#pragma once

#include <mintage/log/log.hpp>
