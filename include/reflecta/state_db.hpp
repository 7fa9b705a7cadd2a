#pragma once

#include <reflecta/state_db/database.hpp>
#include <reflecta/state_db/state_node.hpp>
#include <reflecta/state_db/types.hpp>
