#include "process_conversion_engine.h"

#include <array>
#include <cerrno>
#include <charconv>
#include <csignal>
#include <cstring>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "modelsmith/logger.h"
#include "uuid.h"

namespace
{
using steady_clock = std::chrono::steady_clock;

constexpr auto k_poll_interval = std::chrono::milliseconds{100};
constexpr std::string_view k_progress_prefix = "PROGRESS ";

class unique_fd
{
  public:
    explicit unique_fd(int fd = -1) noexcept : fd_(fd) {}
    ~unique_fd()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
        }
    }

    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;
    unique_fd(unique_fd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    unique_fd& operator=(unique_fd&&) = delete;

    [[nodiscard]] int get() const noexcept
    {
        return fd_;
    }

  private:
    int fd_;
};

struct work_dir_guard
{
    std::filesystem::path path;

    ~work_dir_guard()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        if (ec)
        {
            modelsmith::log::warn("Failed to remove work directory " + path.string() + ": " + ec.message());
        }
    }
};

struct child_process
{
    pid_t pid{-1};
    unique_fd output;
};

std::string shell_quote(const std::string& value)
{
    std::string quoted = "'";
    for (const char c : value)
    {
        if (c == '\'')
        {
            quoted += "'\\''";
        }
        else
        {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string errno_message(std::string_view what)
{
    return std::string{what} + ": " + std::strerror(errno);
}

std::expected<child_process, std::string> spawn(const std::string& command_line, const std::filesystem::path& workdir)
{
    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0)
    {
        return std::unexpected(errno_message("pipe failed"));
    }

    // Everything the child touches is prepared before fork.
    const auto workdir_string = workdir.string();

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        ::close(fds[0]);
        ::close(fds[1]);
        return std::unexpected(errno_message("fork failed"));
    }

    if (pid == 0)
    {
        ::setpgid(0, 0);
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::close(fds[0]);
        ::close(fds[1]);
        if (::chdir(workdir_string.c_str()) != 0)
        {
            _exit(126);
        }
        ::execl("/bin/sh", "sh", "-c", command_line.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    ::close(fds[1]);
    ::fcntl(fds[0], F_SETFL, ::fcntl(fds[0], F_GETFL) | O_NONBLOCK);
    return child_process{pid, unique_fd{fds[0]}};
}

std::optional<float> parse_progress(std::string_view line, std::string& message)
{
    if (!line.starts_with(k_progress_prefix))
    {
        return std::nullopt;
    }
    line.remove_prefix(k_progress_prefix.size());

    const auto end = line.find(' ');
    const auto number = line.substr(0, end);
    float percent = 0.0f;
    const auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), percent);
    if (ec != std::errc{} || ptr != number.data() + number.size())
    {
        return std::nullopt;
    }

    message = end == std::string_view::npos ? std::string{} : std::string{line.substr(end + 1)};
    return percent;
}

class output_reader
{
  public:
    explicit output_reader(const modelsmith::conversion_engine::progress_callback& on_progress)
        : on_progress_(on_progress)
    {
    }

    void feed(std::string_view chunk)
    {
        buffer_.append(chunk);
        std::size_t newline = 0;
        while ((newline = buffer_.find('\n')) != std::string::npos)
        {
            emit(buffer_.substr(0, newline));
            buffer_.erase(0, newline + 1);
        }
    }

    void finish()
    {
        if (!buffer_.empty())
        {
            emit(std::move(buffer_));
            buffer_.clear();
        }
    }

    [[nodiscard]] const std::string& last_line() const noexcept
    {
        return last_line_;
    }

  private:
    void emit(std::string line)
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty())
        {
            return;
        }

        std::string message;
        if (const auto percent = parse_progress(line, message))
        {
            if (on_progress_)
            {
                on_progress_(*percent, message);
            }
            return;
        }

        last_line_ = line;
        if (on_progress_)
        {
            on_progress_(-1.0f, line);
        }
    }

    const modelsmith::conversion_engine::progress_callback& on_progress_;
    std::string buffer_;
    std::string last_line_;
};

// Reads whatever is available; returns false once the pipe reached end of file.
bool pump(int fd, std::chrono::milliseconds timeout, output_reader& reader)
{
    pollfd descriptor{fd, POLLIN, 0};
    const int ready = ::poll(&descriptor, 1, static_cast<int>(timeout.count()));
    if (ready < 0)
    {
        return errno == EINTR;
    }
    if (ready == 0)
    {
        return true;
    }

    std::array<char, 4096> chunk{};
    while (true)
    {
        const auto count = ::read(fd, chunk.data(), chunk.size());
        if (count > 0)
        {
            reader.feed(std::string_view{chunk.data(), static_cast<std::size_t>(count)});
            continue;
        }
        if (count == 0)
        {
            return false;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
    }
}

// Collects output still buffered in the pipe once the child has exited.
void drain(int fd, output_reader& reader)
{
    std::array<char, 4096> chunk{};
    ssize_t count = 0;
    while ((count = ::read(fd, chunk.data(), chunk.size())) > 0)
    {
        reader.feed(std::string_view{chunk.data(), static_cast<std::size_t>(count)});
    }
}

nlohmann::json make_job(const modelsmith::model_bundle& bundle,
                        const modelsmith::conversion_options& options,
                        const nlohmann::json& roles,
                        const std::filesystem::path& output)
{
    nlohmann::json job;
    job["format"] = modelsmith::to_string(bundle.format);
    job["primary_role"] = bundle.primary_role;
    job["roles"] = roles;
    job["options"] = options.to_json();
    job["output"] = output.string();
    return job;
}
} // namespace

namespace modelsmith
{

process_conversion_engine::process_conversion_engine(std::string command,
                                                     std::shared_ptr<filesystem_content_store> store,
                                                     std::filesystem::path work_root,
                                                     std::chrono::milliseconds kill_grace)
    : command_(std::move(command))
    , store_(std::move(store))
    , work_root_(std::move(work_root))
    , kill_grace_(kill_grace)
{
    if (command_.empty())
    {
        throw std::invalid_argument("converter command must not be empty");
    }
    if (!store_)
    {
        throw std::invalid_argument("content store must not be null");
    }
}

std::expected<std::string, std::string> process_conversion_engine::convert(const model_bundle& bundle,
                                                                           const conversion_options& options,
                                                                           const progress_callback& on_progress,
                                                                           const std::atomic_bool& cancel_token)
{
    if (cancel_token.load())
    {
        return std::unexpected("conversion cancelled");
    }

    nlohmann::json roles = nlohmann::json::object();
    for (const auto& [role, file] : bundle.roles)
    {
        auto path = store_->locate(file.ref);
        if (!path)
        {
            return std::unexpected("Input " + file.name + " is no longer available: " + path.error().message);
        }
        roles[role] = path->string();
    }

    const work_dir_guard workdir{work_root_ / utils::make_uuid()};
    std::error_code ec;
    std::filesystem::create_directories(workdir.path, ec);
    if (ec)
    {
        return std::unexpected("Failed to create work directory: " + ec.message());
    }

    const auto output_name = std::filesystem::path(bundle.primary_file().name).stem().string() + ".rknn";
    const auto output_path = workdir.path / output_name;
    const auto job_path = workdir.path / "job.json";
    {
        std::ofstream job_file(job_path);
        if (!job_file)
        {
            return std::unexpected("Unable to write job description: " + job_path.string());
        }
        job_file << make_job(bundle, options, roles, output_path).dump(2);
    }

    const auto command_line = "exec " + command_ + " " + shell_quote(job_path.string());
    log::debug("Starting converter: " + command_line);

    auto child = spawn(command_line, workdir.path);
    if (!child)
    {
        return std::unexpected(child.error());
    }

    output_reader reader(on_progress);
    std::optional<steady_clock::time_point> terminate_sent;
    bool killed = false;
    bool open = true;
    int status = 0;

    while (true)
    {
        if (open)
        {
            open = pump(child->output.get(), k_poll_interval, reader);
        }
        else
        {
            std::this_thread::sleep_for(k_poll_interval);
        }

        const pid_t done = ::waitpid(child->pid, &status, WNOHANG);
        if (done == child->pid)
        {
            break;
        }
        if (done < 0 && errno != EINTR)
        {
            return std::unexpected(errno_message("waitpid failed"));
        }

        if (cancel_token.load() && !terminate_sent)
        {
            log::info("Cancellation requested, terminating converter pid " + std::to_string(child->pid));
            ::kill(-child->pid, SIGTERM);
            terminate_sent = steady_clock::now();
        }
        else if (terminate_sent && !killed && steady_clock::now() - *terminate_sent >= kill_grace_)
        {
            log::warn("Converter ignored SIGTERM, sending SIGKILL to pid " + std::to_string(child->pid));
            ::kill(-child->pid, SIGKILL);
            killed = true;
        }
    }

    if (open)
    {
        drain(child->output.get(), reader);
    }
    reader.finish();

    if (terminate_sent)
    {
        return std::unexpected("conversion cancelled");
    }

    if (WIFSIGNALED(status))
    {
        return std::unexpected("converter terminated by signal " + std::to_string(WTERMSIG(status)));
    }

    if (const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1; code != 0)
    {
        auto message = "converter exited with status " + std::to_string(code);
        if (!reader.last_line().empty())
        {
            message += ": " + reader.last_line();
        }
        return std::unexpected(message);
    }

    if (!std::filesystem::is_regular_file(output_path, ec))
    {
        return std::unexpected("converter produced no output at " + output_path.string());
    }

    auto ref = store_->put_file(output_path, output_name);
    if (!ref)
    {
        return std::unexpected(ref.error().message);
    }
    return ref.value();
}

} // namespace modelsmith
