#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <boost/serialization/shared_ptr.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <reflecta/protocol/account.hpp>
#include <reflecta/protocol/program.hpp>

namespace reflecta::protocol {

/**
 * Events are numbered in emission order within a transaction. Events of a
 * failed program call are dropped together with its state changes.
 */
struct event
{
  std::uint32_t sequence = 0;
  account source{};
  std::string name;
  std::vector< std::byte > data;
  std::vector< account > impacted;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & sequence;
    ar & source;
    ar & name;
    ar & data;
    ar & impacted;
  }
};

struct call_program
{
  account id{};
  program_input input;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & id;
    ar & input;
  }

  bool validate() const noexcept;
};

/**
 * A transaction is an ordered list of program calls executed atomically.
 * Signers are the user accounts that authorized the transaction; signature
 * verification happens outside of the ledger.
 */
struct transaction
{
  std::vector< call_program > operations;
  std::vector< account > signers;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & operations;
    ar & signers;
  }

  bool validate() const noexcept;
};

struct transaction_receipt
{
  std::uint64_t revision = 0;
  std::vector< std::shared_ptr< program_frame > > frames;
  std::vector< event > events;
  std::vector< std::string > logs;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & revision;
    ar & frames;
    ar & events;
    ar & logs;
  }
};

} // namespace reflecta::protocol

template< typename T >
concept Transaction = std::same_as< reflecta::protocol::transaction, T >;

template< typename T >
concept Operation = std::same_as< reflecta::protocol::call_program, T >;
