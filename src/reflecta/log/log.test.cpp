#include <gtest/gtest.h>

#include <reflecta/log.hpp>

TEST( log, level )
{
  reflecta::log::initialize();

  EXPECT_TRUE( reflecta::log::set_level( "debug" ) );
  EXPECT_EQ( reflecta::log::instance()->get_log_level(), quill::LogLevel::Debug );

  EXPECT_TRUE( reflecta::log::set_level( "warning" ) );
  EXPECT_EQ( reflecta::log::instance()->get_log_level(), quill::LogLevel::Warning );

  EXPECT_FALSE( reflecta::log::set_level( "verbose" ) );
  EXPECT_EQ( reflecta::log::instance()->get_log_level(), quill::LogLevel::Warning );

  reflecta::log::set_level( "info" );
}

TEST( log, formatters )
{
  reflecta::log::initialize();

  std::array< std::byte, 3 > bytes{ std::byte{ 0x01 }, std::byte{ 0x6f }, std::byte{ 0x6b } };
  LOG_INFO( reflecta::log::instance(),
            "hex {} account {} rate {}",
            reflecta::log::hex{ bytes.data(), bytes.size() },
            reflecta::log::account{ bytes.data(), bytes.size() },
            reflecta::log::percent{ 250, 10'000 } );
  reflecta::log::instance()->flush_log();
}
