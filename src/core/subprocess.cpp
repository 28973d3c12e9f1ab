/**
 * @file subprocess.cpp
 * @brief 외부 프로세스 실행 구현 (fork + execvp + poll)
 */

#include "subprocess.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

namespace clonescan::core {

namespace {

using Clock = std::chrono::steady_clock;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/**
 * @brief 기한까지 남은 시간 (밀리초, 음수면 0)
 */
int remainingMs(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

void killAndReap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

} // namespace

ProcessResult runProcess(
    const std::vector<std::string>& argv,
    std::chrono::milliseconds timeout
) {
    ProcessResult result;

    if (argv.empty() || argv.front().empty()) {
        result.error_message = "실행할 프로그램이 지정되지 않았습니다.";
        return result;
    }

    // stdout 파이프 + exec 실패 보고용 파이프 (exec 성공 시 CLOEXEC로 닫힘)
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        result.error_message = std::string("pipe 생성 실패: ") + std::strerror(errno);
        return result;
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.error_message = std::string("pipe 생성 실패: ") + std::strerror(errno);
        closeFd(out_pipe[0]);
        closeFd(out_pipe[1]);
        return result;
    }

    // fork 이전에 argv 배열 구성 (자식에서 할당하지 않음)
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error_message = std::string("fork() 실패: ") + std::strerror(errno);
        closeFd(out_pipe[0]);
        closeFd(out_pipe[1]);
        closeFd(err_pipe[0]);
        closeFd(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // 자식 프로세스: stdout → 파이프, stderr → /dev/null
        ::dup2(out_pipe[1], STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execvp(args[0], args.data());

        int exec_errno = errno;
        ssize_t written = ::write(err_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)written;
        _exit(127);
    }

    // 부모 프로세스
    closeFd(out_pipe[1]);
    closeFd(err_pipe[1]);

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    closeFd(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        // exec 실패 (바이너리 없음 등)
        closeFd(out_pipe[0]);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        result.error_message = "실행 실패 (" + argv.front() + "): " + std::strerror(exec_errno);
        return result;
    }

    result.started = true;
    const auto deadline = Clock::now() + timeout;

    // 표준 출력 수집 (기한까지)
    std::array<char, 4096> buffer{};
    while (true) {
        int wait_ms = remainingMs(deadline);
        if (wait_ms == 0) {
            result.timed_out = true;
            break;
        }

        pollfd pfd{out_pipe[0], POLLIN, 0};
        int ready = ::poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.error_message = std::string("poll 실패: ") + std::strerror(errno);
            break;
        }
        if (ready == 0) continue;   // 다음 반복에서 기한 재확인

        ssize_t bytes = ::read(out_pipe[0], buffer.data(), buffer.size());
        if (bytes < 0) {
            if (errno == EINTR) continue;
            result.error_message = std::string("read 실패: ") + std::strerror(errno);
            break;
        }
        if (bytes == 0) break;  // EOF
        result.stdout_data.append(buffer.data(), static_cast<size_t>(bytes));
    }
    closeFd(out_pipe[0]);

    if (result.timed_out || !result.error_message.empty()) {
        killAndReap(pid);
        if (result.timed_out) {
            result.error_message = "실행 시간 초과 (" + std::to_string(timeout.count()) + "ms)";
        }
        return result;
    }

    // stdout을 닫은 뒤에도 남아있는 프로세스 대기 (기한 내)
    while (true) {
        int status = 0;
        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.error_message = "시그널로 종료됨: " + std::to_string(WTERMSIG(status));
            }
            break;
        }
        if (waited < 0 && errno != EINTR) {
            result.error_message = std::string("waitpid 실패: ") + std::strerror(errno);
            break;
        }
        if (remainingMs(deadline) == 0) {
            result.timed_out = true;
            result.error_message = "실행 시간 초과 (" + std::to_string(timeout.count()) + "ms)";
            killAndReap(pid);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    return result;
}

} // namespace clonescan::core
