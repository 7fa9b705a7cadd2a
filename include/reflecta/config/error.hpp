#pragma once

#include <expected>
#include <system_error>

namespace reflecta::config {

enum class config_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  unreadable_file,
  malformed_document,
  missing_key,
  invalid_value,
  invalid_account
};

const std::error_category& config_category() noexcept;

std::error_code make_error_code( config_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace reflecta::config

template<>
struct std::is_error_code_enum< reflecta::config::config_errc >: public std::true_type
{};
