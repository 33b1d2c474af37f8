#include "last_known_good.hpp"
#include "aggregator.hpp"

ResolvedTick resolve_tick(const Result<std::vector<Job>>* jobs,
                          const Result<std::vector<NodeState>>* nodes,
                          const std::string& quantum_partition,
                          const LastKnownGood& lkg) {
    ResolvedTick tick;

    if (jobs && jobs->is_ok()) {
        auto snap = aggregate(jobs->value, {}, quantum_partition);
        tick.fresh_jobs = JobFlags{snap.classical_active, snap.quantum_active};
    }
    JobFlags flags = tick.fresh_jobs ? *tick.fresh_jobs : lkg.jobs.value_or(JobFlags{});
    tick.snapshot.classical_active = flags.classical_active;
    tick.snapshot.quantum_active = flags.quantum_active;

    tick.snapshot.node_active = lkg.nodes;
    if (nodes && nodes->is_ok() && !nodes->value.empty()) {
        auto fresh = aggregate({}, nodes->value, quantum_partition);
        for (const auto& [id, active] : fresh.node_active) {
            tick.snapshot.node_active[id] = active;
        }
        tick.fresh_nodes = tick.snapshot.node_active;
    }

    return tick;
}

void commit_tick(LastKnownGood& lkg, const ResolvedTick& tick) {
    if (tick.fresh_jobs) lkg.jobs = tick.fresh_jobs;
    if (tick.fresh_nodes) lkg.nodes = *tick.fresh_nodes;
}
