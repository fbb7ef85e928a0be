#pragma once

// faultless - value based error propagation.
// Result<T>, unwrap, guard macros and the short-circuit evaluator over coroutine producers.

#include "Errc.hpp"
#include "Error.hpp"
#include "Result.hpp"
#include "Sequence.hpp"
#include "evaluate.hpp"
#include "log/Logger.hpp"
#include "try.hpp"
#include "unwrap.hpp"

namespace faultless
{
} // namespace faultless
