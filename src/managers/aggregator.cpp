#include "aggregator.hpp"
#include "slurm_helpers.hpp"

CanonicalSnapshot aggregate(const std::vector<Job>& jobs,
                            const std::vector<NodeState>& nodes,
                            const std::string& quantum_partition) {
    CanonicalSnapshot snap;
    for (const auto& job : jobs) {
        if (job.partition == quantum_partition) snap.quantum_active = true;
        else snap.classical_active = true;
    }
    for (const auto& node : nodes) {
        if (node.token == NodeToken::Unknown) continue;
        snap.node_active[node.node_id] = node_token_active(node.token);
    }
    return snap;
}
