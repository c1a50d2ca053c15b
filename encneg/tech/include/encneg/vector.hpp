#pragma once

#include <amc/vector.hpp>

namespace encneg {

using amc::vector;

}  // namespace encneg
