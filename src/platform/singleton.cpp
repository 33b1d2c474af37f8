#include "singleton.hpp"
#include <cerrno>
#include <filesystem>
#include <system_error>
#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

SingletonLock::SingletonLock(const std::string& lock_path) : path_(lock_path) {
    // Ensure parent directory exists
    std::error_code ec;
    auto parent = std::filesystem::path(lock_path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        error_ = errno;
        return;
    }
    if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        error_ = errno;
        contended_ = (error_ == EWOULDBLOCK);
        close(fd_);
        fd_ = -1;
    }
}

SingletonLock::~SingletonLock() {
    if (fd_ < 0) return;
    close(fd_);
    // flock is released automatically when fd is closed
}
