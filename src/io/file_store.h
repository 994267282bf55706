#ifndef RENDEZVOUS_IO_FILE_STORE_H_
#define RENDEZVOUS_IO_FILE_STORE_H_

#include <string>
#include <vector>

#include "interfaces.h"
#include "../async/task_executor.h"

namespace Rendezvous {

/**
 * Reads the whole file and splits it into lines. A trailing '\r' is dropped
 * from every line and a final newline does not produce an empty last line.
 * Throws a kIOError PipelineError if the file cannot be opened or read.
 */
std::vector<std::string> ReadLinesFromFile(const std::string& path);

/**
 * Truncates (or creates) the file and writes the lines separated by '\n'
 * with no trailing newline. Throws a kIOError PipelineError on failure.
 */
void WriteLinesToFile(const std::string& path, const std::vector<std::string>& lines);

/**
 * Source provider reading the data file on an executor worker
 */
class FileSourceProvider : public ISourceProvider {
public:
    FileSourceProvider(std::string path, TaskExecutor& executor);

    AsyncValue<std::vector<std::string>> FetchLines() override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    TaskExecutor& executor_;
};

/**
 * Sink overwriting the data file on an executor worker
 */
class FileSink : public IRecordSink {
public:
    FileSink(std::string path, TaskExecutor& executor);

    AsyncValue<Unit> Write(std::vector<std::string> lines) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    TaskExecutor& executor_;
};

} // namespace Rendezvous

#endif // RENDEZVOUS_IO_FILE_STORE_H_
