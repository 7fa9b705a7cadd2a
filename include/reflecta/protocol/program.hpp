#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <boost/serialization/base_object.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <reflecta/protocol/account.hpp>

namespace reflecta::protocol {

/**
 * The request handed to a program: a little-endian instruction selector
 * followed by its fields on stdin, plus optional string arguments.
 */
struct program_input
{
  std::vector< std::string > arguments;
  std::vector< std::byte > stdin;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & arguments;
    ar & stdin;
  }
};

struct program_output
{
  std::vector< std::byte > stdout;
  std::vector< std::byte > stderr;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & stdout;
    ar & stderr;
  }
};

/**
 * A successful program call as recorded in a receipt. Depth 1 is a call
 * made directly by a transaction operation; nested calls count upward.
 */
struct program_frame final: program_input,
                            program_output
{
  account id{};
  std::uint32_t depth = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar& boost::serialization::base_object< program_input >( *this );
    ar& boost::serialization::base_object< program_output >( *this );
    ar & id;
    ar & depth;
  }
};

} // namespace reflecta::protocol
