#pragma once

#include <reflecta/program/calls.hpp>
#include <reflecta/program/error.hpp>
#include <reflecta/program/program.hpp>
#include <reflecta/program/system_interface.hpp>
#include <reflecta/program/token.hpp>
#include <reflecta/program/treasury.hpp>
