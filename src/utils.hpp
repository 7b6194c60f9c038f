#pragma once

// Common helpers pulled in by most translation units
#include "utils/logging.hpp"
#include "utils/errors.hpp"
#include "utils/cancellation.hpp"
