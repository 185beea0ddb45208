#pragma once

#include <mintage/host/error.hpp>
#include <mintage/host/interpreter.hpp>
#include <mintage/host/journal.hpp>
#include <mintage/host/recorder.hpp>
