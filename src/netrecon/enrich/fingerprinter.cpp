#include "netrecon/enrich/fingerprinter.h"
#include "netrecon/common/logger.h"
#include "netrecon/common/string_utils.h"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <sstream>

namespace netrecon {

namespace {

// nmap 自身的 --host-timeout 之外再留出的余量，超过即强制结束
constexpr std::chrono::milliseconds kKillMargin{2000};
// 轮询间隔，决定响应取消的粒度
constexpr int kPollSliceMs = 100;

void kill_group(pid_t pid) {
    // 子进程自成进程组，连同它派生的进程一起结束
    if (::kill(-pid, SIGKILL) != 0) {
        ::kill(pid, SIGKILL);
    }
}

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return status;
}

// "22/open/tcp//ssh//OpenSSH 8.2p1/"
void parse_port_entry(const std::string& entry, FingerprintResult& result) {
    auto fields = split(entry, '/');
    if (fields.size() < 5) return;

    auto port = parse_decimal(trim(fields[0]), 65535);
    if (!port || *port == 0) return;
    if (fields[1] != "open" || fields[2] != "tcp") return;

    std::string service = trim(fields[4]);
    // nmap 不确定时在服务名后加 '?'
    while (!service.empty() && service.back() == '?') {
        service.pop_back();
    }
    if (!service.empty()) {
        result.services[static_cast<Port>(*port)] = service;
    }
}

void parse_ports_field(const std::string& value, FingerprintResult& result) {
    // 表项以 '/' 结尾，以 ", " 分隔；版本串中可能含逗号
    std::size_t pos = 0;
    while (pos < value.size()) {
        std::size_t end = value.find("/, ", pos);
        if (end == std::string::npos) {
            parse_port_entry(value.substr(pos), result);
            break;
        }
        parse_port_entry(value.substr(pos, end + 1 - pos), result);
        pos = end + 3;
    }
}

} // namespace

FingerprintResult parse_grepable(const std::string& output) {
    FingerprintResult result;
    std::istringstream in(output);
    std::string line;

    while (std::getline(in, line)) {
        if (line.rfind("Host:", 0) != 0) continue;

        for (const auto& field : split(line, '\t')) {
            if (field.rfind("Ports: ", 0) == 0) {
                parse_ports_field(field.substr(7), result);
            } else if (field.rfind("OS: ", 0) == 0) {
                std::string os = trim(field.substr(4));
                if (!os.empty() && !result.os_guess) {
                    result.os_guess = os;
                }
            }
        }
    }
    return result;
}

std::optional<std::string> NmapFingerprinter::find_executable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (access(name.c_str(), X_OK) == 0) return name;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return std::nullopt;

    for (const auto& dir : split(path_env, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

NmapFingerprinter::NmapFingerprinter(std::string executable, Timeout host_timeout, bool os_detection)
    : executable_(std::move(executable)), host_timeout_(host_timeout), os_detection_(os_detection) {}

std::vector<std::string> NmapFingerprinter::build_arguments(const Address& address, const std::vector<Port>& ports) const {
    std::string port_list;
    for (Port p : ports) {
        if (!port_list.empty()) port_list += ",";
        port_list += std::to_string(p);
    }

    std::vector<std::string> args = {executable_, "-Pn", "-sV"};
    if (os_detection_) {
        args.push_back("-O");
        args.push_back("--osscan-guess");
    }
    args.push_back("-p");
    args.push_back(port_list);
    args.push_back("--host-timeout");
    args.push_back(std::to_string(host_timeout_.count()) + "ms");
    args.push_back("-oG");
    args.push_back("-");
    args.push_back(address.to_string());
    return args;
}

std::optional<std::string> NmapFingerprinter::capture_output(
    const std::vector<std::string>& args,
    std::stop_token stop
) const {
    // fork 之后子进程只能调用 async-signal-safe 函数，argv 先备好
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        LOG_ENRICH_DEBUG("pipe2 failed: errno {}", errno);
        return std::nullopt;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        LOG_ENRICH_DEBUG("fork failed: errno {}", errno);
        ::close(fds[0]);
        ::close(fds[1]);
        return std::nullopt;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(fds[1], STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execv(argv[0], argv.data());
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    ::close(fds[1]);

    auto deadline = std::chrono::steady_clock::now() + host_timeout_ + kKillMargin;
    std::string output;
    bool killed = false;
    char buffer[512];

    while (true) {
        if (stop.stop_requested()) {
            LOG_ENRICH_DEBUG("Stopping nmap (pid {})", pid);
            kill_group(pid);
            killed = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_ENRICH_DEBUG("nmap (pid {}) exceeded {} ms, killing", pid,
                             (host_timeout_ + kKillMargin).count());
            kill_group(pid);
            killed = true;
            break;
        }

        pollfd pfd{fds[0], POLLIN, 0};
        int ready = ::poll(&pfd, 1, kPollSliceMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            kill_group(pid);
            killed = true;
            break;
        }
        if (ready == 0) continue;

        ssize_t n = ::read(fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            output.append(buffer, static_cast<std::size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR && errno != EAGAIN) {
            kill_group(pid);
            killed = true;
            break;
        }
    }

    ::close(fds[0]);
    int status = wait_child(pid);

    if (killed) return std::nullopt;
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        LOG_ENRICH_DEBUG("nmap exited abnormally (status {})", status);
        return std::nullopt;
    }
    return output;
}

FingerprintResult NmapFingerprinter::run(
    const Address& address,
    const std::vector<Port>& ports,
    std::stop_token stop
) const {
    if (ports.empty() && !os_detection_) {
        return {};
    }
    // 没有开放端口时只做系统识别，仍需给 nmap 一个端口
    auto args = build_arguments(address, ports.empty() ? std::vector<Port>{80} : ports);
    LOG_ENRICH_TRACE("Running nmap for {}", address.to_string());

    auto output = capture_output(args, stop);
    if (!output) {
        LOG_ENRICH_DEBUG("No nmap result for {}", address.to_string());
        return {};
    }

    auto result = parse_grepable(*output);
    // 只保留请求的端口
    if (!ports.empty()) {
        for (auto it = result.services.begin(); it != result.services.end();) {
            if (std::find(ports.begin(), ports.end(), it->first) == ports.end()) {
                it = result.services.erase(it);
            } else {
                ++it;
            }
        }
    } else {
        result.services.clear();
    }

    LOG_ENRICH_DEBUG("nmap {}: os={}, {} services", address.to_string(),
                     result.os_guess.value_or("-"), result.services.size());
    return result;
}

} // namespace netrecon
