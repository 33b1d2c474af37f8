#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Reduce raw scheduler facts to the canonical snapshot.
//   classical_active: some job runs outside quantum_partition
//   quantum_active:   some job runs in quantum_partition
//   node_active:      allocated/mixed = true, idle/down = false,
//                     unknown nodes are left out
// Partition names compare exactly.
CanonicalSnapshot aggregate(const std::vector<Job>& jobs,
                            const std::vector<NodeState>& nodes,
                            const std::string& quantum_partition);
