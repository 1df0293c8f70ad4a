#include "platform/linux/wtype_injector.hpp"

#include <cerrno>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>

WtypeInjector::WtypeInjector(std::string program)
    : program_(std::move(program)) {}

std::expected<void, Error> WtypeInjector::type_char(std::string_view glyph) {
    std::string arg(glyph);

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(Error{ErrorKind::Injection,
            std::string("fork() failed: ") + std::strerror(errno)});
    }

    if (pid == 0) {
        // "--" so a typed "-" is not taken as an option
        ::execlp(program_.c_str(), program_.c_str(), "--", arg.c_str(), nullptr);
        ::_exit(127);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(Error{ErrorKind::Injection,
            std::string("waitpid() failed: ") + std::strerror(errno)});
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return std::unexpected(Error{ErrorKind::Injection,
            program_ + " exited with code " + std::to_string(WEXITSTATUS(status))});
    }
    if (WIFSIGNALED(status)) {
        return std::unexpected(Error{ErrorKind::Injection,
            program_ + " killed by signal " + std::to_string(WTERMSIG(status))});
    }

    return {};
}
