#pragma once
#include <string>

// RAII exclusive lock on a lock file. Used to claim a device that the kernel
// does not arbitrate itself (spidev), so two monitors cannot drive it at once.
// Uses flock(); the lock is released when the process exits (even on crash).
class SingletonLock {
public:
    // Attempts to acquire the lock. Check held() after construction.
    explicit SingletonLock(const std::string& lock_path);
    ~SingletonLock();

    SingletonLock(const SingletonLock&) = delete;
    SingletonLock& operator=(const SingletonLock&) = delete;

    // Returns true if this instance holds the lock.
    bool held() const { return fd_ >= 0; }

    // Not held because another open file description has it locked.
    bool contended() const { return contended_; }

    // errno of the failed open() or flock(), 0 when held.
    int error() const { return error_; }

    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_ = -1;
    int error_ = 0;
    bool contended_ = false;
};
