#pragma once

#include <reflecta/encode/binary.hpp>
#include <reflecta/encode/error.hpp>
#include <reflecta/encode/hex.hpp>
