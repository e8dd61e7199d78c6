#pragma once

#include <chrono>
#include <cstddef>
#include <istream>
#include <string>
#include <utility>
#include <vector>

namespace somaplay {
namespace stream {

enum class ReadStatus {
    Line,         // out holds one line without its terminator
    EndOfStream,  // producer closed its output
    Interrupted,  // no line yet (signal or poll timeout); caller should check its stop flag
};

constexpr size_t kDefaultMaxLineBytes = 64 * 1024;

// Cuts raw player output into lines. '\r' and '\n' both end a line
// (players redraw status lines with bare carriage returns); empty lines are
// skipped. A line longer than maxLineBytes is handed out in pieces.
class LineSplitter {
   public:
    explicit LineSplitter(size_t maxLineBytes = kDefaultMaxLineBytes);

    void append(const char* data, size_t size);

    // Next complete line, if any.
    bool next(std::string& out);

    // Unterminated remainder once the producer is done.
    bool finish(std::string& out);

   private:
    size_t maxLineBytes_;
    std::string buffer_;
};

// Blocking, single-consumer stream of output lines.
class LineSource {
   public:
    virtual ~LineSource() = default;

    virtual ReadStatus readLine(std::string& out) = 0;
};

// Reads lines from a pipe or file descriptor that is not owned. A wait for
// output longer than pollInterval returns Interrupted so the caller's stop
// flag is re-checked even if a signal lands just before the wait.
class FdLineSource : public LineSource {
   public:
    static constexpr std::chrono::milliseconds kDefaultPollInterval{250};

    explicit FdLineSource(int fd, size_t maxLineBytes = kDefaultMaxLineBytes,
                          std::chrono::milliseconds pollInterval = kDefaultPollInterval);

    ReadStatus readLine(std::string& out) override;

   private:
    int fd_;
    std::chrono::milliseconds pollInterval_;
    LineSplitter splitter_;
    bool eof_ = false;
};

// Replays a captured player log with the same line splitting as FdLineSource.
class IstreamLineSource : public LineSource {
   public:
    explicit IstreamLineSource(std::istream& in, size_t maxLineBytes = kDefaultMaxLineBytes)
        : in_(in), splitter_(maxLineBytes) {}

    ReadStatus readLine(std::string& out) override;

   private:
    std::istream& in_;
    LineSplitter splitter_;
    bool eof_ = false;
};

// Fixed list of lines; used for replaying canned output.
class VectorLineSource : public LineSource {
   public:
    explicit VectorLineSource(std::vector<std::string> lines) : lines_(std::move(lines)) {}

    ReadStatus readLine(std::string& out) override;

    size_t consumed() const {
        return next_;
    }

   private:
    std::vector<std::string> lines_;
    size_t next_ = 0;
};

}  // namespace stream
}  // namespace somaplay
