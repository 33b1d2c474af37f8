#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/config.hpp>

// Argument vector for the running-job listing:
//   <docker> exec <container> squeue [-u <user>] -t RUNNING -h -o "%i %P %j"
// With an empty container squeue runs directly on this host.
std::vector<std::string> build_squeue_command(const JobSourceConfig& jobs);

// Argument vector for the per-node listing run on the controller host:
//   <docker> exec <container> sinfo -N -h -o "%N %T"
std::vector<std::string> build_sinfo_command(const RemoteSourceConfig& remote);

// Parse "JOBID PARTITION NAME..." lines. The name is the rest of the line and
// may contain spaces. Blank lines are skipped; a line without both an id and
// a partition makes the whole listing malformed.
Result<std::vector<Job>> parse_job_rows(const std::string& output);

// Parse "NODE STATE" lines. A node listed under several partitions appears
// once in the result, in first-seen order.
Result<std::vector<NodeState>> parse_node_rows(const std::string& output);

// Normalize a raw sinfo state ("mixed", "alloc*", "drained~", ...).
NodeToken parse_node_token(const std::string& raw);

const char* node_token_name(NodeToken token);

// Allocated and mixed nodes are running work; idle and down are not.
inline bool node_token_active(NodeToken token) {
    return token == NodeToken::Allocated || token == NodeToken::Mixed;
}
