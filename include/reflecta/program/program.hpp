#pragma once

#include <cstdint>
#include <string>
#include <system_error>

#include <reflecta/program/system_interface.hpp>

namespace reflecta::program {

/**
 * Every program answers the same two leading instructions. Authorize
 * writes a single bool granting or refusing authority. Receive accepts a
 * token notification of sender, net amount and payload.
 */
namespace entry_point {

constexpr std::uint32_t authorize = 0;
constexpr std::uint32_t receive   = 1;

} // namespace entry_point

struct program
{
  program()                 = default;
  program( const program& ) = delete;
  program( program&& )      = delete;
  virtual ~program()        = default;

  program& operator=( const program& ) = delete;
  program& operator=( program&& )      = delete;

  virtual std::error_code run( system_interface* system, std::span< const std::string > arguments ) = 0;
};

} // namespace reflecta::program
