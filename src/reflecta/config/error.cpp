#include <reflecta/config/error.hpp>

#include <string>
#include <utility>

namespace reflecta::config {

struct _config_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "config";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< config_errc >( condition ) )
    {
      case config_errc::ok:
        return "ok"s;
      case config_errc::unreadable_file:
        return "unreadable file"s;
      case config_errc::malformed_document:
        return "malformed document"s;
      case config_errc::missing_key:
        return "missing key"s;
      case config_errc::invalid_value:
        return "invalid value"s;
      case config_errc::invalid_account:
        return "invalid account"s;
    }
    std::unreachable();
  }
};

const std::error_category& config_category() noexcept
{
  static _config_category category;
  return category;
}

std::error_code make_error_code( config_errc e )
{
  return std::error_code( static_cast< int >( e ), config_category() );
}

} // namespace reflecta::config
