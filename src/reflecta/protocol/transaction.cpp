#include <reflecta/protocol/transaction.hpp>

#include <algorithm>

namespace reflecta::protocol {

bool call_program::validate() const noexcept
{
  return id.program();
}

bool transaction::validate() const noexcept
{
  if( operations.empty() )
    return false;

  if( !std::ranges::all_of( operations,
                            []( const call_program& op )
                            {
                              return op.validate();
                            } ) )
    return false;

  return std::ranges::all_of( signers,
                              []( const account& signer )
                              {
                                return signer.user();
                              } );
}

} // namespace reflecta::protocol
