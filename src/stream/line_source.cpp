#include "stream/line_source.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace somaplay {
namespace stream {

LineSplitter::LineSplitter(size_t maxLineBytes)
    : maxLineBytes_(maxLineBytes > 0 ? maxLineBytes : kDefaultMaxLineBytes) {}

void LineSplitter::append(const char* data, size_t size) {
    buffer_.append(data, size);
}

bool LineSplitter::next(std::string& out) {
    while (true) {
        auto pos = buffer_.find_first_of("\r\n");
        if (pos == std::string::npos || pos > maxLineBytes_) {
            if (buffer_.size() >= maxLineBytes_) {
                out.assign(buffer_, 0, maxLineBytes_);
                buffer_.erase(0, maxLineBytes_);
                return true;
            }
            return false;
        }
        if (pos == 0) {
            buffer_.erase(0, 1);
            continue;
        }
        out.assign(buffer_, 0, pos);
        buffer_.erase(0, pos + 1);
        return true;
    }
}

bool LineSplitter::finish(std::string& out) {
    if (next(out)) {
        return true;
    }
    if (buffer_.empty()) {
        return false;
    }
    out.swap(buffer_);
    buffer_.clear();
    return true;
}

FdLineSource::FdLineSource(int fd, size_t maxLineBytes, std::chrono::milliseconds pollInterval)
    : fd_(fd), pollInterval_(pollInterval), splitter_(maxLineBytes) {}

ReadStatus FdLineSource::readLine(std::string& out) {
    char chunk[4096];

    while (true) {
        if (eof_) {
            return splitter_.finish(out) ? ReadStatus::Line : ReadStatus::EndOfStream;
        }
        if (splitter_.next(out)) {
            return ReadStatus::Line;
        }

        struct pollfd pfd {};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, static_cast<int>(pollInterval_.count()));
        if (ready == 0) {
            return ReadStatus::Interrupted;
        }
        if (ready < 0) {
            if (errno == EINTR) {
                return ReadStatus::Interrupted;
            }
            LOG_WARN("Player output poll failed: {}", std::strerror(errno));
            eof_ = true;
            continue;
        }

        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            splitter_.append(chunk, static_cast<size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno == EINTR) {
            return ReadStatus::Interrupted;
        } else {
            LOG_WARN("Player output read failed: {}", std::strerror(errno));
            eof_ = true;
        }
    }
}

ReadStatus IstreamLineSource::readLine(std::string& out) {
    char chunk[4096];

    while (true) {
        if (eof_) {
            return splitter_.finish(out) ? ReadStatus::Line : ReadStatus::EndOfStream;
        }
        if (splitter_.next(out)) {
            return ReadStatus::Line;
        }
        in_.read(chunk, sizeof(chunk));
        const std::streamsize n = in_.gcount();
        if (n > 0) {
            splitter_.append(chunk, static_cast<size_t>(n));
        }
        if (!in_) {
            eof_ = true;
        }
    }
}

ReadStatus VectorLineSource::readLine(std::string& out) {
    if (next_ >= lines_.size()) {
        return ReadStatus::EndOfStream;
    }
    out = lines_[next_++];
    return ReadStatus::Line;
}

}  // namespace stream
}  // namespace somaplay
