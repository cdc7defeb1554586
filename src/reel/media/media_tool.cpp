// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/media_tool.hpp>
#include <reel/core/error.hpp>
#include <reel/core/url.hpp>
#include <reel/disk/error.hpp>
#include <reel/media/hls_parser.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <set>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace reel::media {

namespace fs = std::filesystem;

namespace {

constexpr const char* MPV_PATH = "/usr/bin/mpv";

ProcessFailure launch_failure(int err) {
    return ProcessFailure{make_error_code(core::Errc::external_process_failed), -1, std::strerror(err)};
}

// Owns both ends of a pipe
class Pipe {
public:
    Pipe() = default;
    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    [[nodiscard]] int open() noexcept { return ::pipe2(fds_, O_CLOEXEC) == 0 ? 0 : errno; }

    [[nodiscard]] int read_end() const noexcept { return fds_[0]; }
    [[nodiscard]] int write_end() const noexcept { return fds_[1]; }

    void close_read() noexcept {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }
    void close_write() noexcept {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2]{-1, -1};
};

// posix_spawn_file_actions_t with guaranteed destroy
class FileActions {
public:
    FileActions() { ::posix_spawn_file_actions_init(&actions_); }
    ~FileActions() { ::posix_spawn_file_actions_destroy(&actions_); }

    FileActions(const FileActions&) = delete;
    FileActions& operator=(const FileActions&) = delete;

    [[nodiscard]] posix_spawn_file_actions_t* get() noexcept { return &actions_; }

private:
    posix_spawn_file_actions_t actions_;
};

} // namespace

MediaTool::MediaTool(fs::path directory, std::string index_file)
    : directory_(std::move(directory))
    , index_file_(std::move(index_file)) {}

std::expected<MediaTool, std::error_code> MediaTool::from_index(const fs::path& index) {
    if (!index.has_filename()) {
        return std::unexpected(make_error_code(disk::DiskErrc::invalid_path));
    }
    fs::path directory = index.parent_path();
    if (directory.empty()) {
        directory = ".";
    }
    return MediaTool(std::move(directory), index.filename().string());
}

std::vector<std::string> MediaTool::merge_command(const fs::path& output) const {
    std::error_code ec;
    fs::path absolute = fs::absolute(output, ec);
    if (ec) {
        absolute = output;
    }
    return {"ffmpeg", "-allowed_extensions", "ALL", "-i", index_file_, "-codec", "copy", absolute.string()};
}

std::vector<std::string> MediaTool::play_command() const {
    std::error_code ec;
    if (fs::exists(MPV_PATH, ec)) {
        return {"mpv", "--demuxer-lavf-o=allowed_extensions=ALL", index_file_};
    }
    return {"ffplay", "-allowed_extensions", "ALL", "-i", index_file_};
}

std::expected<void, ProcessFailure> MediaTool::merge_to(const fs::path& output) const {
    return run(merge_command(output));
}

std::expected<void, ProcessFailure> MediaTool::play() const {
    return run(play_command());
}

std::expected<void, ProcessFailure> MediaTool::run(const std::vector<std::string>& args) const {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    FileActions actions;
    const std::string cwd = directory_.string();
    if (int err = ::posix_spawn_file_actions_addchdir_np(actions.get(), cwd.c_str())) {
        return std::unexpected(launch_failure(err));
    }

    Pipe stderr_pipe;
    if (!verbose_) {
        if (int err = stderr_pipe.open()) {
            return std::unexpected(launch_failure(err));
        }
        if (int err = ::posix_spawn_file_actions_addopen(actions.get(), STDOUT_FILENO,
                                                         "/dev/null", O_WRONLY, 0)) {
            return std::unexpected(launch_failure(err));
        }
        if (int err = ::posix_spawn_file_actions_adddup2(actions.get(), stderr_pipe.write_end(),
                                                         STDERR_FILENO)) {
            return std::unexpected(launch_failure(err));
        }
    }

    pid_t pid = -1;
    if (int err = ::posix_spawnp(&pid, argv[0], actions.get(), nullptr, argv.data(), environ)) {
        return std::unexpected(launch_failure(err));
    }

    std::string output;
    if (!verbose_) {
        stderr_pipe.close_write();
        char buffer[4096];
        for (;;) {
            ssize_t n = ::read(stderr_pipe.read_end(), buffer, sizeof(buffer));
            if (n > 0) {
                output.append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                break;
            }
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(launch_failure(errno));
        }
    }

    const int exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exit_status != 0) {
        return std::unexpected(ProcessFailure{
            make_error_code(core::Errc::external_process_failed), exit_status, std::move(output)});
    }
    return {};
}

std::error_code MediaTool::clean_segments() const {
    std::ifstream file(directory_ / index_file_, std::ios::binary);
    if (!file) {
        return make_error_code(disk::DiskErrc::file_not_found);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return make_error_code(disk::DiskErrc::read_error);
    }

    auto playlist = HLSParser::parse_media(content);
    if (!playlist) {
        return playlist.error();
    }

    std::set<std::string> names;
    for (const auto& segment : playlist->segments) {
        names.insert(core::local_file_name(segment.uri));
        if (segment.key && segment.key->uri) {
            names.insert(core::local_file_name(*segment.key->uri));
        }
    }

    for (const auto& name : names) {
        if (name.empty()) {
            continue;
        }
        std::error_code ec;
        fs::remove(directory_ / name, ec);
        if (ec) {
            return disk::errno_to_error_code(ec.value(), disk::DiskErrc::remove_error);
        }
    }
    return {};
}

} // namespace reel::media
