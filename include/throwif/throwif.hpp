#pragma once

/**
 * throwif C++ library
 *
 * Main include file - includes the argument guards.
 * Host integrations (status.hpp, logging.hpp) are included separately.
 */

// Error types
#include "errors.hpp"

// Capability traits
#include "traits.hpp"
#include "enum.hpp"

// Free-function guards
#include "guard.hpp"

// Fluent guard
#include "fluent.hpp"
