/**
 * @file Channel.hpp
 * @brief Byte streams between the orchestrator and a sandboxed process
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * A SandboxChannel is created before the sandbox process is forked. The
 * child binds it to its standard streams, the parent connects to the other
 * ends and hands them out as a ByteWriter (game stdin) and a ByteReader
 * (game stdout and stderr).
 */

#pragma once

#ifndef GAMEBATTLE_ORCHESTRATOR_CHANNEL_HPP
#define GAMEBATTLE_ORCHESTRATOR_CHANNEL_HPP

#include <Gamebattle/Core/Types.hpp>
#include <Gamebattle/Core/ErrorCodes.hpp>
#include <Gamebattle/Orchestrator/OrchestratorConfig.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Gamebattle::Orchestrator {

// ============================================================================
// File Descriptor
// ============================================================================

/**
 * @brief Owning file descriptor
 */
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : m_fd(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : m_fd(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return m_fd; }
    [[nodiscard]] bool valid() const noexcept { return m_fd >= 0; }

    int release() noexcept {
        int fd = m_fd;
        m_fd = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept;

private:
    int m_fd = -1;
};

// ============================================================================
// Streams
// ============================================================================

/**
 * @brief Readable byte stream
 */
class ByteReader {
public:
    virtual ~ByteReader() = default;

    /**
     * @brief Read available bytes
     * @param buffer Destination
     * @param timeout Maximum time to wait for data
     * @return Bytes read, 0 at end of stream, Timeout if nothing arrived
     */
    virtual Result<size_t> read(MutableByteSpan buffer, Milliseconds timeout) = 0;

    virtual void close() = 0;
};

/**
 * @brief Writable byte stream
 */
class ByteWriter {
public:
    virtual ~ByteWriter() = default;

    /**
     * @brief Write as much as the reader accepts
     * @param data Bytes to write
     * @param timeout Maximum time to wait for the reader
     * @return Bytes written (possibly fewer than requested), EndOfInput once
     *         the reader is gone, Timeout if nothing could be written
     */
    virtual Result<size_t> write(ByteSpan data, Milliseconds timeout) = 0;

    virtual void close() = 0;
};

/**
 * @brief Poll-based reader over a non-blocking descriptor
 */
class FdReader : public ByteReader {
public:
    explicit FdReader(FileDescriptor fd);

    Result<size_t> read(MutableByteSpan buffer, Milliseconds timeout) override;
    void close() override;

private:
    FileDescriptor m_fd;
};

/**
 * @brief Poll-based writer over a non-blocking descriptor
 */
class FdWriter : public ByteWriter {
public:
    explicit FdWriter(FileDescriptor fd);

    Result<size_t> write(ByteSpan data, Milliseconds timeout) override;
    void close() override;

private:
    FileDescriptor m_fd;
};

/**
 * @brief Parent-side ends of a connected channel
 */
struct SandboxStreams {
    std::unique_ptr<ByteWriter> input;    ///< Game stdin
    std::unique_ptr<ByteReader> output;   ///< Game stdout and stderr
};

// ============================================================================
// Channels
// ============================================================================

/**
 * @brief Transport for one sandbox
 *
 * Lifecycle: created before fork, bindChild() in the child, connect() in
 * the parent, takeStreams() once, release() at teardown.
 */
class SandboxChannel {
public:
    virtual ~SandboxChannel() = default;

    /**
     * @brief Bind the channel to fds 0, 1 and 2 in the forked child
     *
     * Runs between fork and exec, so it only uses async-signal-safe calls.
     * @return false on failure
     */
    virtual bool bindChild() noexcept = 0;

    /**
     * @brief Connect the parent ends after fork
     * @param timeout Maximum wait for the child to open its ends
     * @param childFailed Polled while waiting; true aborts the connect
     */
    virtual Result<void> connect(Milliseconds timeout, const std::function<bool()>& childFailed) = 0;

    /**
     * @brief Hand out the parent ends (once)
     */
    virtual Result<SandboxStreams> takeStreams() = 0;

    /**
     * @brief Remove any filesystem entries; idempotent
     */
    virtual void release() noexcept = 0;

    /**
     * @brief Filesystem paths backing the channel, if any
     */
    virtual std::vector<std::string> paths() const = 0;
};

/**
 * @brief Creates channels of one transport kind
 */
class ChannelFactory {
public:
    virtual ~ChannelFactory() = default;

    /**
     * @brief Create a channel for the named sandbox
     */
    virtual Result<std::unique_ptr<SandboxChannel>> create(const std::string& sandboxName) = 0;
};

/**
 * @brief Named FIFOs `<dir>/<name>.in` and `<dir>/<name>.out`
 */
class FifoChannelFactory : public ChannelFactory {
public:
    explicit FifoChannelFactory(std::string runtimeDirectory);

    Result<std::unique_ptr<SandboxChannel>> create(const std::string& sandboxName) override;

private:
    std::string m_directory;
};

/**
 * @brief Anonymous pipes
 */
class PipeChannelFactory : public ChannelFactory {
public:
    Result<std::unique_ptr<SandboxChannel>> create(const std::string& sandboxName) override;
};

/**
 * @brief Factory for the configured transport
 */
std::unique_ptr<ChannelFactory> makeChannelFactory(ChannelTransport transport,
                                                   const std::string& runtimeDirectory);

} // namespace Gamebattle::Orchestrator

#endif // GAMEBATTLE_ORCHESTRATOR_CHANNEL_HPP
