#include "slurm_helpers.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <map>
#include <sstream>

std::vector<std::string> build_squeue_command(const JobSourceConfig& jobs) {
    std::vector<std::string> argv;
    if (!jobs.container.empty()) {
        argv = {jobs.docker_cmd, "exec", jobs.container};
    }
    argv.push_back("squeue");
    if (jobs.slurm_user) {
        argv.push_back("-u");
        argv.push_back(*jobs.slurm_user);
    }
    for (const char* a : {"-t", "RUNNING", "-h", "-o", SQUEUE_FORMAT}) {
        argv.push_back(a);
    }
    return argv;
}

std::vector<std::string> build_sinfo_command(const RemoteSourceConfig& remote) {
    std::vector<std::string> argv;
    if (!remote.container.empty()) {
        argv = {remote.docker_cmd, "exec", remote.container};
    }
    for (const char* a : {"sinfo", "-N", "-h", "-o", SINFO_FORMAT}) {
        argv.push_back(a);
    }
    return argv;
}

Result<std::vector<Job>> parse_job_rows(const std::string& output) {
    std::vector<Job> jobs;
    std::istringstream iss(output);
    std::string line;
    int lineno = 0;
    while (std::getline(iss, line)) {
        ++lineno;
        trim(line);
        if (line.empty()) continue;

        std::istringstream lss(line);
        Job job;
        lss >> job.id >> job.partition;
        if (job.id.empty() || job.partition.empty()) {
            return Result<std::vector<Job>>::Err(
                fmt::format("malformed squeue row {}: '{}'", lineno, line));
        }
        std::getline(lss, job.name);
        trim(job.name);
        jobs.push_back(std::move(job));
    }
    return Result<std::vector<Job>>::Ok(std::move(jobs));
}

namespace {

// Higher wins when one node reports different states across partitions.
int token_rank(NodeToken t) {
    switch (t) {
        case NodeToken::Allocated: return 4;
        case NodeToken::Mixed:     return 3;
        case NodeToken::Idle:      return 2;
        case NodeToken::Down:      return 1;
        case NodeToken::Unknown:   return 0;
    }
    return 0;
}

} // namespace

Result<std::vector<NodeState>> parse_node_rows(const std::string& output) {
    std::vector<NodeState> nodes;
    std::map<std::string, size_t> index;
    std::istringstream iss(output);
    std::string line;
    int lineno = 0;
    while (std::getline(iss, line)) {
        ++lineno;
        auto fields = split_whitespace(line);
        if (fields.empty()) continue;
        if (fields.size() != 2) {
            return Result<std::vector<NodeState>>::Err(
                fmt::format("malformed sinfo row {}: '{}'", lineno, line));
        }

        NodeState ns{to_lower(fields[0]), parse_node_token(fields[1])};
        auto it = index.find(ns.node_id);
        if (it == index.end()) {
            index[ns.node_id] = nodes.size();
            nodes.push_back(std::move(ns));
        } else if (token_rank(ns.token) > token_rank(nodes[it->second].token)) {
            nodes[it->second].token = ns.token;
        }
    }
    return Result<std::vector<NodeState>>::Ok(std::move(nodes));
}

NodeToken parse_node_token(const std::string& raw) {
    std::string s = to_lower(raw);
    // sinfo appends flag characters (not responding, powered down, ...)
    while (!s.empty() && std::string("*~#!%$@^-+").find(s.back()) != std::string::npos) {
        s.pop_back();
    }

    if (s == "idle") return NodeToken::Idle;
    if (s == "alloc" || s == "allocated" || s == "completing") return NodeToken::Allocated;
    if (s == "mix" || s == "mixed") return NodeToken::Mixed;
    if (s == "down" || s == "drain" || s == "drained" || s == "draining" ||
        s == "fail" || s == "failing") {
        return NodeToken::Down;
    }
    return NodeToken::Unknown;
}

const char* node_token_name(NodeToken token) {
    switch (token) {
        case NodeToken::Idle:      return "idle";
        case NodeToken::Allocated: return "allocated";
        case NodeToken::Mixed:     return "mixed";
        case NodeToken::Down:      return "down";
        case NodeToken::Unknown:   return "unknown";
    }
    return "unknown";
}
