#pragma once

#include <reflecta/memory/memory.hpp>
