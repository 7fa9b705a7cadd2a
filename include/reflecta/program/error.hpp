#pragma once

#include <expected>
#include <system_error>

namespace reflecta::program {

enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  unauthorized,
  invalid_instruction,
  invalid_argument,
  unexpected_object,
  already_initialized,
  not_initialized,
  notification_failed
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace reflecta::program

template<>
struct std::is_error_code_enum< reflecta::program::program_errc >: public std::true_type
{};
