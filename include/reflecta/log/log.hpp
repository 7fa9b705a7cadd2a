#pragma once

#include <cstdint>
#include <string_view>

#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

#include <reflecta/log/formatter.hpp>

namespace reflecta::log {

/**
 * The frontend blocks on a full queue; no log line is dropped.
 */
struct frontend_options
{
  static constexpr quill::QueueType queue_type                    = quill::QueueType::BoundedBlocking;
  static constexpr std::size_t initial_queue_capacity             = 262'144;
  static constexpr std::uint32_t blocking_queue_retry_interval_ns = 800;
  static constexpr std::size_t unbounded_queue_max_capacity       = 2ull * 1'024u * 1'024u * 1'024u;
  static constexpr quill::HugePagesPolicy huge_pages_policy       = quill::HugePagesPolicy::Never;
};

using frontend = quill::FrontendImpl< frontend_options >;
using logger   = quill::LoggerImpl< frontend_options >;

void initialize() noexcept;
logger* instance() noexcept;

/**
 * Sets the root logger's level from its name ("trace", "debug", "info",
 * "warning", "error", "critical"). Returns false for an unknown name.
 */
bool set_level( std::string_view level ) noexcept;

} // namespace reflecta::log
