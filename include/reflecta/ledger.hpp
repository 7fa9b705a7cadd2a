#pragma once

#include <reflecta/ledger/anti_whale_guard.hpp>
#include <reflecta/ledger/error.hpp>
#include <reflecta/ledger/exemption_registry.hpp>
#include <reflecta/ledger/journal.hpp>
#include <reflecta/ledger/reflection_ledger.hpp>
#include <reflecta/ledger/store.hpp>
#include <reflecta/ledger/tax_policy.hpp>
#include <reflecta/ledger/transfer_engine.hpp>
#include <reflecta/ledger/treasury.hpp>
#include <reflecta/ledger/types.hpp>
