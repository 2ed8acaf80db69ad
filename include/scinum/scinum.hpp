#ifndef SCINUM_HPP
#define SCINUM_HPP

#include "scinum/core/arithmetic.hpp"
#include "scinum/core/display.hpp"
#include "scinum/core/enums.hpp"
#include "scinum/core/exceptions.hpp"
#include "scinum/core/limits.hpp"
#include "scinum/core/normalize.hpp"
#include "scinum/core/scientific.hpp"

#endif // SCINUM_HPP
