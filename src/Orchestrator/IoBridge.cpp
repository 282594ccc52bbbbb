/**
 * @file IoBridge.cpp
 * @brief Pump, sender and receiver relay tasks
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/IoBridge.hpp>
#include <Gamebattle/Core/Logger.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace Gamebattle::Orchestrator {

const char* toString(EndReason reason) noexcept {
    switch (reason) {
        case EndReason::NormalExit:     return "normal-exit";
        case EndReason::Crash:          return "crash";
        case EndReason::LimitExceeded:  return "limit";
        case EndReason::AdminStop:      return "admin-stop";
        case EndReason::StoppedByOwner: return "stopped";
        case EndReason::Disconnected:   return "disconnected";
        case EndReason::StoreFailure:   return "store-failure";
        case EndReason::Shutdown:       return "shutdown";
    }
    return "unknown";
}

namespace {

constexpr size_t kChunkSize = 4096;

void joinThread(std::thread& thread) {
    if (!thread.joinable()) {
        return;
    }
    if (thread.get_id() == std::this_thread::get_id()) {
        thread.detach();
    } else {
        thread.join();
    }
}

void trimFront(std::deque<Byte>& bytes, size_t capacity, uint64_t* evicted) {
    if (bytes.size() <= capacity) {
        return;
    }
    size_t excess = bytes.size() - capacity;
    bytes.erase(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(excess));
    if (evicted != nullptr) {
        *evicted += excess;
    }
}

} // namespace

// ============================================================================
// IoBridge::Impl
// ============================================================================

class IoBridge::Impl {
public:
    explicit Impl(Options opts) : options(std::move(opts)), lastActivity(Clock::now()) {}

    ~Impl() {
        stopPump = true;
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++generation;
            stopWriter = true;
        }
        cv.notify_all();
        joinThread(pump);
        joinThread(writer);
        joinThread(sender);
        joinThread(receiver);
    }

    void startRelays() {
        pump = std::thread(&Impl::pumpLoop, this);
        writer = std::thread(&Impl::writerLoop, this);
    }

    Result<void> attachClient(std::shared_ptr<ClientConnection> next) {
        std::lock_guard<std::mutex> attachLock(attachMutex);

        std::shared_ptr<ClientConnection> previous;
        std::thread oldSender;
        std::thread oldReceiver;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closing) {
                return ErrorCode::BridgeClosed;
            }
            ++generation;
            attached = false;
            previous = std::move(client);
            oldSender = std::move(sender);
            oldReceiver = std::move(receiver);
        }
        cv.notify_all();

        if (previous && previous != next) {
            previous->close();
        }
        joinThread(oldSender);
        joinThread(oldReceiver);

        std::lock_guard<std::mutex> lock(mutex);
        if (closing) {
            return ErrorCode::BridgeClosed;
        }
        uint64_t gen = ++generation;
        client = next;
        attached = true;
        detachedAt.reset();
        lastActivity = Clock::now();
        ++statistics.attachments;
        sender = std::thread(&Impl::senderLoop, this, gen, next);
        receiver = std::thread(&Impl::receiverLoop, this, gen, next);
        cv.notify_all();
        return Result<void>::Success();
    }

    void close(EndReason reason) {
        if (closed.exchange(true)) {
            return;
        }
        std::lock_guard<std::mutex> attachLock(attachMutex);

        {
            std::unique_lock<std::mutex> lock(mutex);
            closing = true;
            cv.notify_all();
            // Let the pump drain what the sandbox already wrote
            cv.wait_for(lock, options.stallTimeout, [&] { return outputEof; });
        }
        stopPump = true;
        cv.notify_all();
        joinThread(pump);

        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait_for(lock, options.stallTimeout, [&] {
                return !attached ||
                       (buffer.empty() && pendingDropped == 0 && control.empty() && !inFlight);
            });
        }

        std::shared_ptr<ClientConnection> last;
        std::thread lastSender;
        std::thread lastReceiver;
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++generation;
            if (attached) {
                last = client;
            }
            attached = false;
            client.reset();
            lastSender = std::move(sender);
            lastReceiver = std::move(receiver);
        }
        cv.notify_all();
        joinThread(lastSender);
        joinThread(lastReceiver);

        {
            std::lock_guard<std::mutex> lock(mutex);
            stopWriter = true;
            if (!inbound.empty()) {
                GAMEBATTLE_LOG_DEBUG_F("Bridge closed with %zu input bytes unwritten", inbound.size());
            }
        }
        cv.notify_all();
        joinThread(writer);

        if (last) {
            auto sent = last->send(Frame::endOfSession(reason), options.stallTimeout);
            if (sent.isFailure()) {
                GAMEBATTLE_LOG_DEBUG("Client missed the end-of-session frame");
            }
            last->close();
        }

        input->close();
        output->close();
        GAMEBATTLE_LOG_DEBUG_F("Bridge closed: %s", toString(reason));
    }

    // ------------------------------------------------------------------------
    // Relay tasks
    // ------------------------------------------------------------------------

    void pumpLoop() {
        std::array<Byte, kChunkSize> chunk{};
        while (!stopPump) {
            auto n = output->read(chunk, options.pollInterval);
            if (n.isFailure()) {
                if (n.error() == ErrorCode::Timeout) {
                    continue;
                }
                GAMEBATTLE_LOG_WARNING_F("Sandbox output failed: %s",
                                         getErrorMessage(n.error()).data());
                break;
            }
            if (n.value() == 0) {
                break;
            }
            deliverOutput(chunk.data(), n.value());
        }

        std::lock_guard<std::mutex> lock(mutex);
        outputEof = true;
        cv.notify_all();
    }

    void deliverOutput(const Byte* data, size_t size) {
        std::unique_lock<std::mutex> lock(mutex);
        history.insert(history.end(), data, data + size);
        trimFront(history, options.replayCapacity, nullptr);
        lastActivity = Clock::now();

        if (attached && buffer.size() + size > options.bufferBytes) {
            cv.wait_for(lock, options.stallTimeout, [&] {
                return buffer.size() + size <= options.bufferBytes || !attached || stopPump;
            });
        }

        uint64_t lost = 0;
        if (attached) {
            buffer.insert(buffer.end(), data, data + size);
            trimFront(buffer, options.bufferBytes, &lost);
            if (lost > 0) {
                GAMEBATTLE_LOG_WARNING_F("Client stalled; dropped %llu output bytes",
                                         static_cast<unsigned long long>(lost));
            }
        } else if (options.detachedPolicy == DetachedOutputPolicy::ReplayBounded) {
            buffer.insert(buffer.end(), data, data + size);
            trimFront(buffer, options.replayCapacity, &lost);
        } else {
            lost = size;
        }

        pendingDropped += lost;
        statistics.droppedBytes += lost;
        cv.notify_all();
    }

    void senderLoop(uint64_t gen, std::shared_ptr<ClientConnection> peer) {
        for (;;) {
            Frame frame;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait_for(lock, options.pollInterval, [&] {
                    return gen != generation || pendingDropped > 0 || !control.empty() || !buffer.empty();
                });
                if (gen != generation) {
                    return;
                }
                if (pendingDropped > 0) {
                    frame = Frame::droppedBytes(pendingDropped);
                    pendingDropped = 0;
                } else if (!control.empty()) {
                    frame = std::move(control.front());
                    control.pop_front();
                } else if (!buffer.empty()) {
                    auto end = buffer.begin() + static_cast<std::ptrdiff_t>(std::min(buffer.size(), kChunkSize));
                    frame = Frame::output(ByteBuffer(buffer.begin(), end));
                    buffer.erase(buffer.begin(), end);
                } else {
                    continue;
                }
                inFlight = true;
                cv.notify_all();
            }

            auto sent = peer->send(frame, options.stallTimeout);

            std::unique_lock<std::mutex> lock(mutex);
            inFlight = false;
            if (sent.isSuccess()) {
                if (frame.type == Frame::Type::Output) {
                    statistics.bytesToClient += frame.data.size();
                }
                lastActivity = Clock::now();
                cv.notify_all();
                continue;
            }

            requeue(std::move(frame));
            cv.notify_all();
            if (sent.error() == ErrorCode::Timeout && gen == generation) {
                continue;
            }
            lock.unlock();
            detach(gen);
            return;
        }
    }

    void receiverLoop(uint64_t gen, std::shared_ptr<ClientConnection> peer) {
        for (;;) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (gen != generation || closing) {
                    return;
                }
            }

            auto received = peer->receive(options.pollInterval);
            if (received.isFailure()) {
                if (received.error() == ErrorCode::Timeout) {
                    continue;
                }
                detach(gen);
                return;
            }
            if (!queueInput(gen, std::move(received).value())) {
                return;
            }
        }
    }

    /**
     * Hands client input to the writer. Waits for room in the inbound buffer
     * in poll-sized steps so a replaced attachment or close() is noticed.
     * @return False when this attachment is no longer current
     */
    bool queueInput(uint64_t gen, ByteBuffer data) {
        std::unique_lock<std::mutex> lock(mutex);
        for (;;) {
            if (gen != generation || closing) {
                GAMEBATTLE_LOG_DEBUG_F("Discarding %zu input bytes from a superseded client", data.size());
                return false;
            }
            if (inputClosed) {
                control.push_back(Frame::endOfInput());
                ++statistics.endOfInputFrames;
                cv.notify_all();
                return true;
            }
            if (inbound.empty() || inbound.size() + data.size() <= options.bufferBytes) {
                break;
            }
            cv.wait_for(lock, options.pollInterval);
        }
        inbound.insert(inbound.end(), data.begin(), data.end());
        cv.notify_all();
        return true;
    }

    /// Drains the inbound buffer into the sandbox, oldest bytes first
    void writerLoop() {
        ByteBuffer chunk;
        for (;;) {
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait_for(lock, options.pollInterval, [&] {
                    return stopWriter || (!inbound.empty() && !inputClosed);
                });
                if (stopWriter) {
                    return;
                }
                if (inbound.empty() || inputClosed) {
                    continue;
                }
                size_t n = std::min(inbound.size(), kChunkSize);
                chunk.assign(inbound.begin(), inbound.begin() + static_cast<std::ptrdiff_t>(n));
            }

            auto written = input->write(chunk, options.pollInterval);

            std::lock_guard<std::mutex> lock(mutex);
            if (written.isSuccess()) {
                inbound.erase(inbound.begin(), inbound.begin() + static_cast<std::ptrdiff_t>(written.value()));
                statistics.bytesToSandbox += written.value();
                lastActivity = Clock::now();
            } else if (written.error() != ErrorCode::Timeout) {
                inputClosed = true;
                if (!inbound.empty()) {
                    GAMEBATTLE_LOG_INFO_F("Sandbox closed its input with %zu bytes unread", inbound.size());
                    inbound.clear();
                    control.push_back(Frame::endOfInput());
                    ++statistics.endOfInputFrames;
                }
            }
            cv.notify_all();
        }
    }

    /// Caller holds mutex
    void requeue(Frame frame) {
        switch (frame.type) {
            case Frame::Type::Output:
                buffer.insert(buffer.begin(), frame.data.begin(), frame.data.end());
                break;
            case Frame::Type::Dropped:
                pendingDropped += frame.dropped;
                break;
            default:
                control.push_front(std::move(frame));
                break;
        }
    }

    void detach(uint64_t gen) {
        std::shared_ptr<ClientConnection> gone;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (gen != generation || !attached) {
                return;
            }
            ++generation;
            attached = false;
            detachedAt = Clock::now();
            gone = std::move(client);
        }
        cv.notify_all();

        if (gone) {
            gone->close();
        }
        GAMEBATTLE_LOG_INFO("Client detached from bridge");
        if (options.onClientDetached) {
            options.onClientDetached();
        }
    }

    Options options;
    std::unique_ptr<ByteWriter> input;
    std::unique_ptr<ByteReader> output;

    std::mutex attachMutex;
    mutable std::mutex mutex;
    std::condition_variable cv;

    std::deque<Byte> buffer;
    std::deque<Byte> history;
    std::deque<Frame> control;
    std::deque<Byte> inbound;
    uint64_t pendingDropped = 0;
    bool inFlight = false;

    std::shared_ptr<ClientConnection> client;
    uint64_t generation = 0;
    bool attached = false;
    std::optional<TimePoint> detachedAt = Clock::now();
    TimePoint lastActivity;

    bool outputEof = false;
    bool inputClosed = false;
    bool stopWriter = false;
    bool closing = false;
    std::atomic<bool> closed{false};
    std::atomic<bool> stopPump{false};

    Statistics statistics;

    std::thread pump;
    std::thread writer;
    std::thread sender;
    std::thread receiver;
};

// ============================================================================
// IoBridge - Public API
// ============================================================================

IoBridge::IoBridge(ConstructionKey) {}

IoBridge::~IoBridge() {
    if (m_impl) {
        m_impl->close(EndReason::Shutdown);
    }
}

IoBridge::Options IoBridge::optionsFrom(const OrchestratorConfig& config) {
    Options options;
    options.bufferBytes = config.bridgeBufferBytes;
    options.replayCapacity = config.replayCapacityBytes;
    options.stallTimeout = config.stallTimeout;
    options.detachedPolicy = config.detachedPolicy;
    return options;
}

Result<std::unique_ptr<IoBridge>> IoBridge::open(SandboxStreams streams,
                                                 std::shared_ptr<ClientConnection> client,
                                                 Options options) {
    if (!streams.input || !streams.output || options.bufferBytes == 0 || options.replayCapacity == 0) {
        return ErrorCode::InvalidArgument;
    }

    auto bridge = std::make_unique<IoBridge>(ConstructionKey{});
    bridge->m_impl = std::make_unique<Impl>(std::move(options));
    bridge->m_impl->input = std::move(streams.input);
    bridge->m_impl->output = std::move(streams.output);
    bridge->m_impl->startRelays();

    if (client) {
        GAMEBATTLE_TRY(bridge->m_impl->attachClient(std::move(client)));
    }
    return bridge;
}

Result<void> IoBridge::attach(std::shared_ptr<ClientConnection> client) {
    if (!client) {
        return ErrorCode::InvalidArgument;
    }
    return m_impl->attachClient(std::move(client));
}

void IoBridge::close(EndReason reason) {
    m_impl->close(reason);
}

bool IoBridge::isClosed() const {
    return m_impl->closed.load();
}

bool IoBridge::isAttached() const {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->attached;
}

std::optional<TimePoint> IoBridge::detachedSince() const {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->detachedAt;
}

TimePoint IoBridge::lastActivity() const {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->lastActivity;
}

ByteBuffer IoBridge::snapshotOutput() const {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return ByteBuffer(m_impl->history.begin(), m_impl->history.end());
}

IoBridge::Statistics IoBridge::stats() const {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->statistics;
}

} // namespace Gamebattle::Orchestrator
