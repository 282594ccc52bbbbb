/**
 * @file Channel.cpp
 * @brief FIFO and pipe channels
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/Channel.hpp>
#include <Gamebattle/Core/Logger.hpp>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <thread>

namespace Gamebattle::Orchestrator {

// ============================================================================
// FileDescriptor
// ============================================================================

void FileDescriptor::reset(int fd) noexcept {
    if (m_fd >= 0) {
        ::close(m_fd);
    }
    m_fd = fd;
}

namespace {

int remainingMillis(TimePoint deadline) {
    auto left = std::chrono::duration_cast<Milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

} // namespace

// ============================================================================
// FdReader / FdWriter
// ============================================================================

FdReader::FdReader(FileDescriptor fd) : m_fd(std::move(fd)) {}

Result<size_t> FdReader::read(MutableByteSpan buffer, Milliseconds timeout) {
    if (!m_fd.valid()) {
        return static_cast<size_t>(0);
    }

    TimePoint deadline = Clock::now() + timeout;
    for (;;) {
        ssize_t n = ::read(m_fd.get(), buffer.data(), buffer.size());
        if (n > 0) {
            return static_cast<size_t>(n);
        }
        if (n == 0) {
            return static_cast<size_t>(0);
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            return ErrorCode::IOError;
        }

        int waitMs = remainingMillis(deadline);
        if (waitMs == 0) {
            return ErrorCode::Timeout;
        }

        pollfd pfd{m_fd.get(), POLLIN, 0};
        int ready = ::poll(&pfd, 1, waitMs);
        if (ready < 0 && errno != EINTR) {
            return ErrorCode::IOError;
        }
        if (ready == 0) {
            return ErrorCode::Timeout;
        }
    }
}

void FdReader::close() {
    m_fd.reset();
}

FdWriter::FdWriter(FileDescriptor fd) : m_fd(std::move(fd)) {}

Result<size_t> FdWriter::write(ByteSpan data, Milliseconds timeout) {
    if (!m_fd.valid()) {
        return ErrorCode::EndOfInput;
    }
    if (data.empty()) {
        return static_cast<size_t>(0);
    }

    TimePoint deadline = Clock::now() + timeout;
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::write(m_fd.get(), data.data() + offset, data.size() - offset);
        if (n > 0) {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && errno == EPIPE) {
            m_fd.reset();
            if (offset > 0) {
                return offset;
            }
            return ErrorCode::EndOfInput;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            return ErrorCode::IOError;
        }

        int waitMs = remainingMillis(deadline);
        if (waitMs == 0) {
            break;
        }

        pollfd pfd{m_fd.get(), POLLOUT, 0};
        int ready = ::poll(&pfd, 1, waitMs);
        if (ready < 0 && errno != EINTR) {
            return ErrorCode::IOError;
        }
        if (ready > 0 && (pfd.revents & (POLLERR | POLLHUP)) && !(pfd.revents & POLLOUT)) {
            m_fd.reset();
            if (offset > 0) {
                return offset;
            }
            return ErrorCode::EndOfInput;
        }
    }

    if (offset == 0) {
        return ErrorCode::Timeout;
    }
    return offset;
}

void FdWriter::close() {
    m_fd.reset();
}

// ============================================================================
// FIFO Channel
// ============================================================================

namespace {

/**
 * Opening order avoids a spurious end-of-stream on the output FIFO: the
 * parent holds `.out` for reading before fork, the child opens `.out` for
 * writing first and only then blocks opening `.in`, which the parent
 * completes last.
 */
class FifoChannel : public SandboxChannel {
public:
    FifoChannel(std::string inPath, std::string outPath, FileDescriptor outReader)
        : m_inPath(std::move(inPath))
        , m_outPath(std::move(outPath))
        , m_outReader(std::move(outReader)) {
    }

    ~FifoChannel() override {
        release();
    }

    bool bindChild() noexcept override {
        int out = ::open(m_outPath.c_str(), O_WRONLY);
        if (out < 0) {
            return false;
        }
        int in = ::open(m_inPath.c_str(), O_RDONLY);
        if (in < 0) {
            return false;
        }
        if (::dup2(in, STDIN_FILENO) < 0 || ::dup2(out, STDOUT_FILENO) < 0 ||
            ::dup2(out, STDERR_FILENO) < 0) {
            return false;
        }
        if (in > STDERR_FILENO) ::close(in);
        if (out > STDERR_FILENO) ::close(out);
        return true;
    }

    Result<void> connect(Milliseconds timeout, const std::function<bool()>& childFailed) override {
        TimePoint deadline = Clock::now() + timeout;
        for (;;) {
            int fd = ::open(m_inPath.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
            if (fd >= 0) {
                m_inWriter.reset(fd);
                return Result<void>::Success();
            }
            if (errno != ENXIO && errno != EINTR) {
                GAMEBATTLE_LOG_ERROR_F("Opening %s failed: %s", m_inPath.c_str(), std::strerror(errno));
                return ErrorCode::ChannelSetupFailed;
            }
            if (childFailed && childFailed()) {
                return ErrorCode::LaunchFailed;
            }
            if (Clock::now() >= deadline) {
                return ErrorCode::Timeout;
            }
            std::this_thread::sleep_for(Milliseconds(5));
        }
    }

    Result<SandboxStreams> takeStreams() override {
        if (!m_inWriter.valid() || !m_outReader.valid()) {
            return ErrorCode::AlreadyAttached;
        }
        SandboxStreams streams;
        streams.input = std::make_unique<FdWriter>(std::move(m_inWriter));
        streams.output = std::make_unique<FdReader>(std::move(m_outReader));
        return streams;
    }

    void release() noexcept override {
        if (m_released.exchange(true)) {
            return;
        }
        ::unlink(m_inPath.c_str());
        ::unlink(m_outPath.c_str());
    }

    std::vector<std::string> paths() const override {
        return {m_inPath, m_outPath};
    }

private:
    std::string m_inPath;
    std::string m_outPath;
    FileDescriptor m_outReader;
    FileDescriptor m_inWriter;
    std::atomic<bool> m_released{false};
};

// ============================================================================
// Pipe Channel
// ============================================================================

class PipeChannel : public SandboxChannel {
public:
    PipeChannel(int inPipe[2], int outPipe[2])
        : m_childIn(inPipe[0])
        , m_inWriter(inPipe[1])
        , m_outReader(outPipe[0])
        , m_childOut(outPipe[1]) {
    }

    bool bindChild() noexcept override {
        // dup2 clears O_CLOEXEC on the new descriptor
        if (::dup2(m_childIn.get(), STDIN_FILENO) < 0 ||
            ::dup2(m_childOut.get(), STDOUT_FILENO) < 0 ||
            ::dup2(m_childOut.get(), STDERR_FILENO) < 0) {
            return false;
        }
        return true;
    }

    Result<void> connect(Milliseconds, const std::function<bool()>&) override {
        m_childIn.reset();
        m_childOut.reset();
        int flags = ::fcntl(m_inWriter.get(), F_GETFL);
        ::fcntl(m_inWriter.get(), F_SETFL, flags | O_NONBLOCK);
        flags = ::fcntl(m_outReader.get(), F_GETFL);
        ::fcntl(m_outReader.get(), F_SETFL, flags | O_NONBLOCK);
        return Result<void>::Success();
    }

    Result<SandboxStreams> takeStreams() override {
        if (!m_inWriter.valid() || !m_outReader.valid()) {
            return ErrorCode::AlreadyAttached;
        }
        SandboxStreams streams;
        streams.input = std::make_unique<FdWriter>(std::move(m_inWriter));
        streams.output = std::make_unique<FdReader>(std::move(m_outReader));
        return streams;
    }

    void release() noexcept override {
        m_childIn.reset();
        m_childOut.reset();
    }

    std::vector<std::string> paths() const override {
        return {};
    }

private:
    FileDescriptor m_childIn;
    FileDescriptor m_inWriter;
    FileDescriptor m_outReader;
    FileDescriptor m_childOut;
};

} // namespace

// ============================================================================
// Factories
// ============================================================================

FifoChannelFactory::FifoChannelFactory(std::string runtimeDirectory)
    : m_directory(std::move(runtimeDirectory)) {
}

Result<std::unique_ptr<SandboxChannel>> FifoChannelFactory::create(const std::string& sandboxName) {
    std::error_code ec;
    std::filesystem::create_directories(m_directory, ec);
    if (ec) {
        GAMEBATTLE_LOG_ERROR_F("Cannot create runtime directory %s: %s",
                               m_directory.c_str(), ec.message().c_str());
        return ErrorCode::ChannelSetupFailed;
    }

    std::string base = (std::filesystem::path(m_directory) / sandboxName).string();
    std::string inPath = base + ".in";
    std::string outPath = base + ".out";

    if (::mkfifo(inPath.c_str(), 0600) != 0) {
        GAMEBATTLE_LOG_ERROR_F("mkfifo %s failed: %s", inPath.c_str(), std::strerror(errno));
        return ErrorCode::ChannelSetupFailed;
    }
    if (::mkfifo(outPath.c_str(), 0600) != 0) {
        GAMEBATTLE_LOG_ERROR_F("mkfifo %s failed: %s", outPath.c_str(), std::strerror(errno));
        ::unlink(inPath.c_str());
        return ErrorCode::ChannelSetupFailed;
    }

    int reader = ::open(outPath.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (reader < 0) {
        GAMEBATTLE_LOG_ERROR_F("Opening %s failed: %s", outPath.c_str(), std::strerror(errno));
        ::unlink(inPath.c_str());
        ::unlink(outPath.c_str());
        return ErrorCode::ChannelSetupFailed;
    }

    return std::unique_ptr<SandboxChannel>(
        std::make_unique<FifoChannel>(inPath, outPath, FileDescriptor(reader)));
}

Result<std::unique_ptr<SandboxChannel>> PipeChannelFactory::create(const std::string&) {
    int inPipe[2];
    int outPipe[2];
    if (::pipe2(inPipe, O_CLOEXEC) != 0) {
        return ErrorCode::ChannelSetupFailed;
    }
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        ::close(inPipe[0]);
        ::close(inPipe[1]);
        return ErrorCode::ChannelSetupFailed;
    }
    return std::unique_ptr<SandboxChannel>(std::make_unique<PipeChannel>(inPipe, outPipe));
}

std::unique_ptr<ChannelFactory> makeChannelFactory(ChannelTransport transport,
                                                   const std::string& runtimeDirectory) {
    if (transport == ChannelTransport::Pipe) {
        return std::make_unique<PipeChannelFactory>();
    }
    return std::make_unique<FifoChannelFactory>(runtimeDirectory);
}

} // namespace Gamebattle::Orchestrator
