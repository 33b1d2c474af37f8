#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

struct JobFlags {
    bool classical_active = false;
    bool quantum_active = false;
};

// The most recent successful value of each sub-source, kept independently.
// Owned by the caller of the poll loop so tests can seed it.
struct LastKnownGood {
    std::optional<JobFlags> jobs;            // unset until the first good squeue
    std::map<std::string, bool> nodes;       // empty until the first useful sinfo
};

// Outcome of resolving one tick's query results against LastKnownGood.
struct ResolvedTick {
    CanonicalSnapshot snapshot;
    std::optional<JobFlags> fresh_jobs;                  // commit when set
    std::optional<std::map<std::string, bool>> fresh_nodes;
};

// Jobs: a good result replaces the flags; a failure falls back to the last
// good flags, or to "nothing running" before any good result.
// Nodes: fresh known entries are laid over the last good map; a failure or
// an empty listing keeps the last good map unchanged.
// A null result means that query is disabled.
ResolvedTick resolve_tick(const Result<std::vector<Job>>* jobs,
                          const Result<std::vector<NodeState>>* nodes,
                          const std::string& quantum_partition,
                          const LastKnownGood& lkg);

// Record a tick's successful sub-results. Called after rendering.
void commit_tick(LastKnownGood& lkg, const ResolvedTick& tick);
