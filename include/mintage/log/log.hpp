#pragma once

#include <optional>
#include <string_view>

#include <quill/LogMacros.h>
#include <quill/core/LogLevel.h>

#include <mintage/log/formatter.hpp>
#include <mintage/log/frontend.hpp>

namespace mintage::log {

void initialize( quill::LogLevel level = quill::LogLevel::Info ) noexcept;
logger* instance() noexcept;

std::optional< quill::LogLevel > level_from_string( std::string_view level ) noexcept;

} // namespace mintage::log
