#include "system_utils.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#ifdef _WIN32
#include <array>
#else
#include <fcntl.h>
#include <sys/wait.h>
#endif

namespace procutil {

#ifdef _WIN32
static std::string quote_arg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos)
        return arg;
    std::string out = "\"";
    for (char c : arg) {
        if (c == '"')
            out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

ProcessResult run_process(const std::vector<std::string>& args) {
    ProcessResult res;
    if (args.empty()) {
        res.exit_code = EXEC_FAILED;
        res.output = "empty command";
        return res;
    }
    std::string cmd;
    for (const auto& a : args) {
        if (!cmd.empty())
            cmd += ' ';
        cmd += quote_arg(a);
    }
    cmd += " 2>&1";
    FILE* pipe = _popen(cmd.c_str(), "r");
    if (!pipe) {
        res.exit_code = EXEC_FAILED;
        res.output = std::strerror(errno);
        return res;
    }
    std::array<char, 4096> buf{};
    size_t n = 0;
    while ((n = fread(buf.data(), 1, buf.size(), pipe)) > 0)
        res.output.append(buf.data(), n);
    res.exit_code = _pclose(pipe);
    return res;
}
#else
ProcessResult run_process(const std::vector<std::string>& args) {
    ProcessResult res;
    if (args.empty()) {
        res.exit_code = EXEC_FAILED;
        res.output = "empty command";
        return res;
    }
    int fds[2];
    if (pipe(fds) != 0) {
        res.exit_code = EXEC_FAILED;
        res.output = std::string("pipe: ") + std::strerror(errno);
        return res;
    }
    UniqueFd read_end(fds[0]);
    UniqueFd write_end(fds[1]);
    fcntl(read_end.get(), F_SETFD, FD_CLOEXEC);
    fcntl(write_end.get(), F_SETFD, FD_CLOEXEC); // dup2 copies drop the flag

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        res.exit_code = EXEC_FAILED;
        res.output = std::string("fork: ") + std::strerror(errno);
        return res;
    }
    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(write_end.get(), STDOUT_FILENO);
        dup2(write_end.get(), STDERR_FILENO);
        execvp(argv[0], argv.data());
        const char* msg = "exec failed\n";
        ssize_t w = write(STDERR_FILENO, msg, std::strlen(msg));
        (void)w;
        _exit(EXEC_FAILED);
    }
    write_end.reset(); // parent keeps only the read end so EOF arrives

    char buf[4096];
    while (true) {
        ssize_t n = read(read_end.get(), buf, sizeof(buf));
        if (n > 0) {
            res.output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        break;
    }
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            res.exit_code = EXEC_FAILED;
            res.output += std::string("waitpid: ") + std::strerror(errno);
            return res;
        }
    }
    if (WIFEXITED(status))
        res.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        res.exit_code = 128 + WTERMSIG(status);
    else
        res.exit_code = EXEC_FAILED;
    return res;
}
#endif

} // namespace procutil
