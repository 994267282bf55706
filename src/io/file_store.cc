#include "file_store.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <glog/logging.h>

#include "../common/config.h"
#include "../common/errors.h"
#include "../common/scoped_fd.h"

namespace Rendezvous {

namespace {

PipelineError ErrnoError(const std::string& what, const std::string& path, int err) {
    return IOError(what + " " + path + ": " + std::strerror(err));
}

} // namespace

std::vector<std::string> ReadLinesFromFile(const std::string& path) {
    ScopedFd file(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!file.valid()) {
        throw ErrnoError("cannot open", path, errno);
    }

    std::string content;
    char buf[64 * 1024];
    while (true) {
        ssize_t n = ::read(file.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ErrnoError("cannot read", path, errno);
        }
        if (n == 0) break;
        content.append(buf, static_cast<size_t>(n));
    }

    std::vector<std::string> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t end = content.find(kLineDelimiter, start);
        if (end == std::string::npos) {
            end = content.size();
        }
        std::string line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = end + 1;
    }

    VLOG(1) << "Read " << lines.size() << " lines (" << content.size() << " bytes) from " << path;
    return lines;
}

void WriteLinesToFile(const std::string& path, const std::vector<std::string>& lines) {
    std::string content;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) content += kLineDelimiter;
        content += lines[i];
    }

    ScopedFd file(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!file.valid()) {
        throw ErrnoError("cannot open for writing", path, errno);
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(file.get(), content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ErrnoError("cannot write", path, errno);
        }
        written += static_cast<size_t>(n);
    }

    int err = file.Close();
    if (err != 0) {
        throw ErrnoError("cannot close", path, err);
    }
    VLOG(1) << "Wrote " << lines.size() << " lines (" << written << " bytes) to " << path;
}

FileSourceProvider::FileSourceProvider(std::string path, TaskExecutor& executor)
    : path_(std::move(path)), executor_(executor) {}

AsyncValue<std::vector<std::string>> FileSourceProvider::FetchLines() {
    // Capture the path by value; the task may outlive this provider
    return executor_.ExecuteAsync([path = path_]() { return ReadLinesFromFile(path); });
}

FileSink::FileSink(std::string path, TaskExecutor& executor)
    : path_(std::move(path)), executor_(executor) {}

AsyncValue<Unit> FileSink::Write(std::vector<std::string> lines) {
    return executor_.ExecuteAsync([path = path_, lines = std::move(lines)]() {
        WriteLinesToFile(path, lines);
    });
}

} // namespace Rendezvous
