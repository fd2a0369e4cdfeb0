#pragma once

/// Umbrella header for the typetag library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "value.hpp"
#include "registry.hpp"
#include "transformer.hpp"
#include "codec.hpp"
#include "serializer.hpp"
