#pragma once

#include <mintage/memory/memory.hpp>
