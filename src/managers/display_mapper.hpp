#pragma once

#include <core/types.hpp>

// Pure mapping from snapshot to what the outputs should show.
//
//   classical quantum | ind_a ind_b | matrix
//   ----------------------------------------------------------
//       F       F     |  off   off  | blank
//       T       F     |  on    off  | "HPC"  green x3, column 3
//       F       T     |  off   on   | "Q"    blue, column 9
//       T       T     |  on    on   | "QCSC" blue blue green green, column 1
//
// node_lights mirrors node_active.
DisplayDirectives map_snapshot(const CanonicalSnapshot& snapshot);
