#include <catch2/catch_test_macros.hpp>

#include "child_process.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <string>
#include <thread>

TEST_CASE("ChildProcess", "[process]") {
    TmpDir dir;

    SECTION("ExitCodeAndStderr") {
        auto script = write_script(dir.path, "fail", "echo boom >&2\nexit 3");
        auto child = ChildProcess::spawn({.path = script});
        REQUIRE(child.has_value());

        auto status = child->wait();
        REQUIRE(status.has_value());
        REQUIRE(status->code == 3);
        REQUIRE(status->signal == 0);
        REQUIRE(status->describe() == "Process exited with code 3");
        REQUIRE(child->captured_stderr() == "boom\n");
    }

    SECTION("LargeStderrNeverBlocks") {
        auto done = dir / "done";
        auto script = write_script(dir.path, "noisy",
                                   "head -c 262144 /dev/zero | tr '\\0' x >&2\n"
                                   "touch '" + done.string() + "'");
        auto child = ChildProcess::spawn({.path = script});
        REQUIRE(child.has_value());

        // Nobody reads while the child writes four times a pipe buffer.
        REQUIRE(wait_for([&] { return std::filesystem::exists(done); }, std::chrono::milliseconds(3000)));
        REQUIRE(child->wait().value().code == 0);

        auto captured = child->captured_stderr();
        REQUIRE(captured.size() == 64 * 1024);
        REQUIRE(captured.find_first_not_of('x') == std::string::npos);
        REQUIRE(child->captured_stderr(10) == "xxxxxxxxxx");
    }

    SECTION("StderrLogFile") {
        auto log = dir / "tool.log";
        {
            std::ofstream stale(log);
            stale << "previous run\n";
        }
        auto script = write_script(dir.path, "logger", "echo first >&2\nsleep 0.3\necho second >&2");
        auto child = ChildProcess::spawn({.path = script, .stderr_log = log});
        REQUIRE(child.has_value());

        REQUIRE(wait_for([&] { return child->captured_stderr() == "first\n"; }));
        REQUIRE(child->wait().value().code == 0);
        REQUIRE(read_file(log) == "first\nsecond\n");
        REQUIRE((std::filesystem::status(log).permissions() & std::filesystem::perms::others_read) ==
                std::filesystem::perms::none);
    }

    SECTION("ReleasedStderrKeepsChildWriting") {
        auto out = dir / "out.txt";
        auto script = write_script(dir.path, "late",
                                   "sleep 0.2\necho late >&2\necho ok > '" + out.string() + "'");
        auto child = ChildProcess::spawn({.path = script});
        REQUIRE(child.has_value());

        child->release_stderr();
        REQUIRE_FALSE(child->has_stderr());
        REQUIRE(child->captured_stderr().empty());

        auto status = child->wait();
        REQUIRE(status.has_value());
        REQUIRE(status->signal == 0);
        REQUIRE(status->code == 0);
        REQUIRE(read_file(out) == "ok\n");
    }

    SECTION("OnlyStandardStreamsInherited") {
        auto out = dir / "fds.txt";
        auto script = write_script(dir.path, "fds",
                                   "n=0\n"
                                   "for f in /proc/$$/fd/*; do\n"
                                   "  [ \"$(readlink \"$f\")\" = /dev/null ] && n=$((n+1))\n"
                                   "done\n"
                                   "echo $n > '" + out.string() + "'");
        auto child = ChildProcess::spawn({.path = script});
        REQUIRE(child.has_value());
        REQUIRE(child->wait().value().code == 0);

        // stdin and stdout only; the descriptor they were copied from is closed.
        REQUIRE(read_file(out) == "2\n");
    }

    SECTION("ArgsAndEnvironment") {
        auto out = dir / "out.txt";
        auto script = write_script(dir.path, "echoer",
                                   "printf '%s|%s|%s' \"$1\" \"$2\" \"$TOOLHUB_TEST_VAR\" > \"" +
                                       out.string() + "\"");
        auto child = ChildProcess::spawn({
            .path = script,
            .args = {"--trigger-key", "F13"},
            .env = {{"TOOLHUB_TEST_VAR", "xyz"}},
        });
        REQUIRE(child.has_value());
        REQUIRE(child->wait().value().code == 0);
        REQUIRE(read_file(out) == "--trigger-key|F13|xyz");
    }

    SECTION("ExecFailure") {
        auto child = ChildProcess::spawn({.path = dir / "does-not-exist"});
        REQUIRE_FALSE(child.has_value());
        REQUIRE(child.error().find("does-not-exist") != std::string::npos);
    }

    SECTION("NotExecutable") {
        auto p = dir / "plain";
        write_script(dir.path, "plain", "exit 0");
        std::filesystem::permissions(p, std::filesystem::perms::owner_read |
                                            std::filesystem::perms::owner_write);
        REQUIRE_FALSE(ChildProcess::spawn({.path = p}).has_value());
    }

    SECTION("TryWaitWhileRunning") {
        auto script = write_script(dir.path, "sleeper", "exec sleep 30");
        auto child = ChildProcess::spawn({.path = script});
        REQUIRE(child.has_value());

        auto r = child->try_wait();
        REQUIRE(r.has_value());
        REQUIRE_FALSE(r->has_value());

        REQUIRE(child->send_signal(SIGKILL).has_value());
        auto status = child->wait();
        REQUIRE(status.has_value());
        REQUIRE(status->signal == SIGKILL);
        REQUIRE(status->describe() == "Process terminated by signal 9");

        // Reaped: further signals are no-ops and the status is remembered.
        REQUIRE(child->send_signal(SIGTERM).has_value());
        REQUIRE(child->try_wait().value().value().signal == SIGKILL);
    }

    SECTION("SigtermReachesChild") {
        // The daemon blocks SIGTERM for its signalfd; children must not inherit that.
        sigset_t mask, old;
        sigemptyset(&mask);
        sigaddset(&mask, SIGTERM);
        REQUIRE(sigprocmask(SIG_BLOCK, &mask, &old) == 0);

        auto script = write_script(dir.path, "sleeper", "exec sleep 30");
        auto child = ChildProcess::spawn({.path = script});
        REQUIRE(sigprocmask(SIG_SETMASK, &old, nullptr) == 0);
        REQUIRE(child.has_value());

        REQUIRE(child->send_signal(SIGTERM).has_value());
        auto status = child->wait();
        REQUIRE(status.has_value());
        REQUIRE(status->signal == SIGTERM);
    }

    SECTION("MoveTransfersOwnership") {
        auto script = write_script(dir.path, "quick", "exit 0");
        auto child = ChildProcess::spawn({.path = script});
        REQUIRE(child.has_value());

        ChildProcess moved = std::move(*child);
        REQUIRE(moved.pid() > 0);
        REQUIRE(moved.has_stderr());
        REQUIRE(moved.wait().value().code == 0);
    }
}
