#include "ffmpeg_transcoder.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

FfmpegTranscoder::FfmpegTranscoder(std::string ffmpeg_path)
    : ffmpeg_path_(std::move(ffmpeg_path)) {}

std::expected<void, TranscriptionError>
FfmpegTranscoder::to_wav(const std::string& input_path, const std::string& output_path) {
    pid_t pid = ::fork();
    if (pid < 0) {
        return fail(ErrorKind::Io, std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: no stdin, stdout silenced, errors stay on stderr. The
        // runner's blocked SIGINT/SIGTERM must not carry over into ffmpeg.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::close(devnull);
        }
        ::execlp(ffmpeg_path_.c_str(), ffmpeg_path_.c_str(),
                 "-nostdin", "-hide_banner", "-loglevel", "error", "-y",
                 "-i", input_path.c_str(),
                 "-ac", "1", "-ar", "16000", "-acodec", "pcm_s16le", "-f", "wav",
                 output_path.c_str(), nullptr);
        ::_exit(127);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return fail(ErrorKind::Io, std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        return fail(ErrorKind::Io, ffmpeg_path_ + " could not be executed");
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return fail(ErrorKind::Io, ffmpeg_path_ + " exited with code " +
                                       std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1));
    }

    return {};
}
