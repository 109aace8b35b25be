#pragma once

// MCLink - coroutine based link to word addressed controllers.

#include "Codec.hpp"
#include "Device.hpp"
#include "Driver.hpp"
#include "Error.hpp"
#include "Result.hpp"
#include "coroutine/coroutine.hpp"
#include "log/Logger.hpp"
