#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <string>
#include <vector>
#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace procutil {

/**
 * @brief RAII wrapper for POSIX-style file descriptors.
 *
 * Closes the descriptor when the object goes out of scope. Use to manage
 * ownership of file descriptors returned by open, pipe and similar calls.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    int release() noexcept {
        int tmp = fd;
        fd = -1;
        return tmp;
    }

    void reset(int f = -1) noexcept {
        if (fd >= 0) {
#ifdef _WIN32
            _close(fd);
#else
            close(fd);
#endif
        }
        fd = f;
    }

  private:
    int fd;
};

/// Exit status used when the program could not be started at all.
constexpr int EXEC_FAILED = 127;

/**
 * @brief Exit status and combined stdout/stderr of a finished child process.
 */
struct ProcessResult {
    int exit_code = 0;
    std::string output;
};

/**
 * @brief Run a program and wait for it to finish.
 *
 * @p args[0] is looked up in `PATH`. No shell is involved, so arguments are
 * passed verbatim. Standard input is closed for the child. A child killed by
 * a signal reports `128 + signal`.
 *
 * @param args Program followed by its arguments. Must not be empty.
 * @return Exit status and everything the child wrote to stdout and stderr.
 */
ProcessResult run_process(const std::vector<std::string>& args);

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
