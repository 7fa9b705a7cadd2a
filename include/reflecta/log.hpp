#pragma once

#include <reflecta/log/log.hpp>
