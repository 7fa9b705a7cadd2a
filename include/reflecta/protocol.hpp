#pragma once

#include <reflecta/protocol/account.hpp>
#include <reflecta/protocol/program.hpp>
#include <reflecta/protocol/transaction.hpp>
