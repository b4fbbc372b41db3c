#include "ProcessUtils.h"

#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {
// Owns the descriptor and spawn structures for the duration of one spawn.
class SpawnResources {
public:
    explicit SpawnResources(int sinkFd) : sinkFd_(sinkFd) {
        actionsReady_ = ::posix_spawn_file_actions_init(&actions_) == 0;
        attrReady_ = ::posix_spawnattr_init(&attr_) == 0;
    }
    ~SpawnResources() {
        if (attrReady_) ::posix_spawnattr_destroy(&attr_);
        if (actionsReady_) ::posix_spawn_file_actions_destroy(&actions_);
        if (sinkFd_ >= 0) ::close(sinkFd_);
    }
    SpawnResources(const SpawnResources&) = delete;
    SpawnResources& operator=(const SpawnResources&) = delete;

    bool ready() const { return sinkFd_ >= 0 && actionsReady_ && attrReady_; }

    // Child stderr (and stdout when silenced) go to the sink.
    bool redirect(bool includeStdout) {
        if (includeStdout && ::posix_spawn_file_actions_adddup2(&actions_, sinkFd_, STDOUT_FILENO) != 0) return false;
        return ::posix_spawn_file_actions_adddup2(&actions_, sinkFd_, STDERR_FILENO) == 0 &&
               ::posix_spawn_file_actions_addclose(&actions_, sinkFd_) == 0;
    }

    bool closeOtherDescriptors() {
#ifdef POSIX_SPAWN_CLOEXEC_DEFAULT
        return ::posix_spawnattr_setflags(&attr_, POSIX_SPAWN_CLOEXEC_DEFAULT) == 0;
#else
        return true;
#endif
    }

    const posix_spawn_file_actions_t* actions() const { return &actions_; }
    const posix_spawnattr_t* attr() const { return &attr_; }

private:
    int sinkFd_;
    posix_spawn_file_actions_t actions_{};
    posix_spawnattr_t attr_{};
    bool actionsReady_ = false;
    bool attrReady_ = false;
};
} // namespace

namespace ProcessUtils {

std::string findExecutableInPath(const std::string& command) {
    if (command.empty()) return "";
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv || !*pathEnv) return "";

    const std::string dirs(pathEnv);
    size_t begin = 0;
    while (begin <= dirs.size()) {
        size_t end = dirs.find(':', begin);
        if (end == std::string::npos) end = dirs.size();
        const std::string dir = end > begin ? dirs.substr(begin, end - begin) : ".";
        const std::filesystem::path candidate = std::filesystem::path(dir) / command;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
        begin = end + 1;
    }
    return "";
}

int spawnAndWait(const std::string& executable,
                 const std::vector<std::string>& args,
                 const std::string& stderrPath) {
    const bool silenced = stderrPath.empty();
    const int sinkFd = silenced ? ::open("/dev/null", O_WRONLY | O_CLOEXEC)
                                : ::open(stderrPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    SpawnResources spawn(sinkFd);
    if (!spawn.ready() || !spawn.redirect(silenced) || !spawn.closeOtherDescriptors()) return -1;

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = -1;
    if (::posix_spawn(&pid, executable.c_str(), spawn.actions(), spawn.attr(), argv.data(), environ) != 0 || pid <= 0) {
        return -1;
    }

    int status = 0;
    pid_t waited = -1;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited < 0 || !WIFEXITED(status)) return -1;
    return WEXITSTATUS(status);
}

} // namespace ProcessUtils
