#pragma once

#include <optional>
#include <span>

#include <reflecta/ledger/anti_whale_guard.hpp>
#include <reflecta/ledger/exemption_registry.hpp>
#include <reflecta/ledger/journal.hpp>
#include <reflecta/ledger/reflection_ledger.hpp>
#include <reflecta/ledger/tax_policy.hpp>
#include <reflecta/ledger/treasury.hpp>

namespace reflecta::ledger {

/**
 * Executes taxed transfers. Every operation stages its effects in the
 * journal and commits only when all steps, including the treasury deposit,
 * have succeeded. On failure the journal is discarded.
 */
class transfer_engine final
{
public:
  transfer_engine( journal& staged,
                   const tax_rates& rates,
                   const anti_whale_config& limits,
                   treasury_account& treasury ) noexcept;
  transfer_engine( const transfer_engine& ) = delete;
  transfer_engine( transfer_engine&& )      = delete;
  ~transfer_engine()                        = default;

  transfer_engine& operator=( const transfer_engine& ) = delete;
  transfer_engine& operator=( transfer_engine&& )      = delete;

  result< transfer_receipt > transfer( const address& from, const address& to, amount value );
  result< transfer_receipt >
  transfer_from( const address& spender, const address& owner, const address& to, amount value );

  /**
   * A transfer followed by a notification to the recipient carrying the
   * net amount. The notification is issued after the journal commits, so
   * the recipient observes the post-transfer ledger and may call back into
   * the token.
   *
   * A failed notification returns its error but does not undo the commit.
   * The store backing the journal must therefore be transactional on the
   * host side, discarded together with the failing call.
   */
  result< transfer_receipt > send( const address& from,
                                   const address& to,
                                   amount value,
                                   std::span< const std::byte > payload,
                                   recipient_notifier& notifier );
  result< transfer_receipt > send_from( const address& spender,
                                        const address& owner,
                                        const address& to,
                                        amount value,
                                        std::span< const std::byte > payload,
                                        recipient_notifier& notifier );

  std::error_code mint( const address& to, amount value );
  std::error_code burn( const address& from, amount value );

  reflection_ledger& ledger() noexcept;
  exemption_registry& exemptions() noexcept;

private:
  result< transfer_receipt >
  execute( const std::optional< address >& spender, const address& from, const address& to, amount value );

  result< transfer_receipt >
  apply( const std::optional< address >& spender, const address& from, const address& to, amount value );

  journal& _journal;
  reflection_ledger _ledger;
  exemption_registry _exemptions;
  tax_policy _policy;
  anti_whale_guard _guard;
  treasury_account& _treasury;
};

} // namespace reflecta::ledger
