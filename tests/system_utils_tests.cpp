#include "test_common.hpp"
#include "system_utils.hpp"
#ifndef _WIN32
#include <fcntl.h>
#include <cerrno>
#include <unistd.h>
#endif

TEST_CASE("UniqueFd releases descriptor") {
#ifndef _WIN32
    int raw = -1;
    {
        procutil::UniqueFd fd(::open("/dev/null", O_RDONLY));
        REQUIRE(fd);
        raw = fd.get();
    }
    errno = 0;
    REQUIRE(::close(raw) == -1);
    REQUIRE(errno == EBADF);
#else
    SUCCEED();
#endif
}

TEST_CASE("UniqueFd move transfers ownership") {
#ifndef _WIN32
    procutil::UniqueFd a(::open("/dev/null", O_RDONLY));
    REQUIRE(a);
    int raw = a.get();
    procutil::UniqueFd b(std::move(a));
    REQUIRE_FALSE(a);
    REQUIRE(b.get() == raw);
    int released = b.release();
    REQUIRE_FALSE(b);
    REQUIRE(::close(released) == 0);
#else
    SUCCEED();
#endif
}

TEST_CASE("run_process captures output and exit status") {
#ifndef _WIN32
    auto ok = procutil::run_process({"sh", "-c", "echo out; echo err 1>&2"});
    REQUIRE(ok.exit_code == 0);
    REQUIRE(ok.output.find("out") != std::string::npos);
    REQUIRE(ok.output.find("err") != std::string::npos);

    auto failed = procutil::run_process({"sh", "-c", "exit 3"});
    REQUIRE(failed.exit_code == 3);
#else
    SUCCEED();
#endif
}

TEST_CASE("run_process passes arguments verbatim") {
#ifndef _WIN32
    auto res = procutil::run_process({"printf", "%s|", "a b", "$HOME", "'q'"});
    REQUIRE(res.exit_code == 0);
    REQUIRE(res.output == "a b|$HOME|'q'|");
#else
    SUCCEED();
#endif
}

TEST_CASE("run_process reports missing programs") {
    auto res = procutil::run_process({"repomigrator-no-such-program"});
    REQUIRE(res.exit_code != 0);
#ifndef _WIN32
    REQUIRE(res.exit_code == procutil::EXEC_FAILED);
#endif
    auto empty = procutil::run_process({});
    REQUIRE(empty.exit_code == procutil::EXEC_FAILED);
}
