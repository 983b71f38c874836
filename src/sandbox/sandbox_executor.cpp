#include "sandbox/sandbox_executor.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <memory>
#include <system_error>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/completion_slot.hpp"

namespace agentbench::sandbox {
namespace bp = boost::process;

namespace {

constexpr std::size_t kChunkSize = 4096;
using Chunk = std::array<char, kChunkSize>;

struct Settlement {
    std::optional<int> exit_code;
    int term_signal = 0;
    bool timed_out = false;
    double duration_secs = 0.0;
};

void ReadStream(bp::async_pipe& pipe, Chunk& chunk, std::string& sink, std::function<void()> on_closed) {
    pipe.async_read_some(
        boost::asio::buffer(chunk),
        [&pipe, &chunk, &sink, on_closed = std::move(on_closed)](const boost::system::error_code& ec,
                                                                  std::size_t size) mutable {
            sink.append(chunk.data(), size);
            if (ec) {
                on_closed();
                return;
            }
            ReadStream(pipe, chunk, sink, std::move(on_closed));
        });
}

std::string ResolveProgram(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return program;
    }
    return bp::search_path(program).string();
}

}  // namespace

SandboxExecutor::SandboxExecutor(agentbench::utils::Logger& logger)
    : logger_(logger) {}

ExecResult SandboxExecutor::Run(const ExecRequest& request) const {
    ExecResult result{};
    if (request.argv.empty()) {
        result.spawn_error = "empty command";
        return result;
    }
    const auto program = ResolveProgram(request.argv.front());
    if (program.empty()) {
        result.spawn_error = "program not found: " + request.argv.front();
        return result;
    }
    const std::vector<std::string> args(request.argv.begin() + 1, request.argv.end());
    const auto alarm_s = static_cast<unsigned int>(
        std::max<std::chrono::seconds::rep>(1, request.timeout.count()));

    logger_.Debug("sandbox", "exec " + utils::Join(request.argv, " ") +
                                 " cwd=" + request.working_dir.string() +
                                 " timeout=" + std::to_string(request.timeout.count()) + "s");

    boost::asio::io_context ioc;
    bp::async_pipe out_pipe(ioc);
    bp::async_pipe err_pipe(ioc);
    boost::asio::steady_timer deadline(ioc);
    boost::asio::steady_timer escalation(ioc);
    // Bounds the wait for both pipes to reach EOF. Descendants that inherited
    // stdout/stderr and left the process group would otherwise hold them open.
    boost::asio::steady_timer drain(ioc);
    utils::CompletionSlot<Settlement> slot;
    std::unique_ptr<bp::child> child;
    Chunk out_chunk{};
    Chunk err_chunk{};
    int open_streams = 2;
    const auto start = std::chrono::steady_clock::now();

    const auto terminate_group = [&]() {
        const pid_t group = child->id();
        if (::killpg(group, SIGTERM) != 0) {
            return;
        }
        escalation.expires_after(request.kill_grace);
        escalation.async_wait([this, group](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            logger_.Warn("sandbox", "process group " + std::to_string(group) +
                                        " survived SIGTERM, sending SIGKILL");
            ::killpg(group, SIGKILL);
        });
    };

    const auto stream_closed = [&]() {
        if (--open_streams == 0) {
            drain.cancel();
        }
    };

    // Whichever completion path settles first disarms the deadline timer.
    slot.OnSettle([&deadline]() { deadline.cancel(); });

    std::error_code spawn_ec;
    child = std::make_unique<bp::child>(
        bp::exe = program,
        bp::args = args,
        bp::start_dir = request.working_dir.string(),
        bp::std_in.close(),
        bp::std_out > out_pipe,
        bp::std_err > err_pipe,
        ioc,
        bp::on_exit([&](int, const std::error_code&) {
            escalation.cancel();
            const int status = child->native_exit_code();
            Settlement settlement{};
            settlement.duration_secs = utils::SecondsSince(start);
            if (WIFEXITED(status)) {
                settlement.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                settlement.term_signal = WTERMSIG(status);
                settlement.timed_out = std::chrono::steady_clock::now() - start >= request.timeout;
            }
            slot.Resolve(settlement);
            // Background jobs left in the group would keep the pipes open.
            ::killpg(child->id(), SIGKILL);
        }),
        // Kernel-side deadline: the alarm survives exec and kills the
        // program with SIGALRM if it is still running.
        bp::extend::on_exec_setup([alarm_s](auto&) {
            ::setpgid(0, 0);
            ::alarm(alarm_s);
        }),
        spawn_ec);

    if (spawn_ec) {
        result.spawn_error = spawn_ec.message();
        return result;
    }

    deadline.expires_after(request.timeout);
    deadline.async_wait([&](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        Settlement settlement{};
        settlement.timed_out = true;
        settlement.duration_secs = utils::SecondsSince(start);
        if (slot.Resolve(settlement)) {
            terminate_group();
        }
    });

    drain.expires_after(request.timeout + request.kill_grace);
    drain.async_wait([&](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        logger_.Warn("sandbox", "output pipes still open after the deadline, closing them");
        boost::system::error_code close_ec;
        out_pipe.close(close_ec);
        err_pipe.close(close_ec);
        if (close_ec) {
            logger_.Debug("sandbox", "closing pipes: " + close_ec.message());
        }
    });

    ReadStream(out_pipe, out_chunk, result.output, stream_closed);
    ReadStream(err_pipe, err_chunk, result.error, stream_closed);
    ioc.run();

    if (!slot.Settled()) {
        result.spawn_error = "child process was never reaped";
        return result;
    }
    const auto settlement = slot.Take();
    result.exit_code = settlement.exit_code;
    result.term_signal = settlement.term_signal;
    result.timed_out = settlement.timed_out;
    result.duration_secs = settlement.duration_secs;

    logger_.Debug("sandbox", "exit " + (result.exit_code ? std::to_string(*result.exit_code) : std::string("killed")) +
                                 (result.timed_out ? " (timed out)" : "") +
                                 " after " + std::to_string(result.duration_secs) + "s");
    return result;
}

}  // namespace agentbench::sandbox
