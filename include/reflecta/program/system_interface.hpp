#pragma once

#include <reflecta/program/error.hpp>
#include <reflecta/protocol.hpp>

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace reflecta::program {

enum class file_descriptor : int // NOLINT(performance-enum-size)
{
  stdin,
  stdout,
  stderr
};

struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  virtual std::span< const std::string > arguments()                                       = 0;
  virtual std::error_code write( file_descriptor fd, std::span< const std::byte > buffer ) = 0;

  /**
   * Fills the buffer completely or fails without consuming any input.
   */
  virtual std::error_code read( file_descriptor fd, std::span< std::byte > buffer ) = 0;

  virtual std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) = 0;

  virtual std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual void log( std::string_view message ) = 0;

  virtual std::error_code event( std::string_view name,
                                 std::span< const std::byte > data,
                                 const std::vector< protocol::account >& impacted = {} ) = 0;

  virtual result< bool > check_authority( protocol::account_view account ) = 0;

  /**
   * The program that called the running program, or an empty span when the
   * running program was invoked directly by a transaction.
   */
  virtual std::span< const std::byte > get_caller() = 0;

  virtual std::span< const std::byte > get_program_id() = 0;

  virtual result< protocol::program_output > call_program( protocol::account_view account,
                                                           std::span< const std::byte > stdin,
                                                           std::span< const std::string > arguments = {} ) = 0;
};

} // namespace reflecta::program
