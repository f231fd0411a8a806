#include "cuedisplay/Listener.h"

#include <fmt/format.h>

#include "cuedisplay/FieldMapper.h"
#include "cuedisplay/Logging.h"
#include "cuedisplay/Message.h"

namespace cuedisplay {

    const char *listenerStateName(ListenerState state) {
        switch (state) {
            case ListenerState::Starting:
                return "starting";
            case ListenerState::Running:
                return "running";
            case ListenerState::Stopping:
                return "stopping";
            case ListenerState::Stopped:
                return "stopped";
        }
        return "unknown";
    }

    ListenerHandle Listener::start(uint16_t port, std::shared_ptr<SharedDisplayState> state,
                                   ListenerOptions options) {
        if (!state) {
            throw InvalidArgumentException("Listener needs a display state to publish into");
        }

        // Binding happens here; a StartupException leaves nothing running.
        auto source = std::make_unique<PacketSource>(port, options.pollInterval);

        // The constructor is private, so std::make_unique cannot reach it
        ListenerHandle listener(new Listener(std::move(source), std::move(state)));
        listener->setState(ListenerState::Running);
        listener->thread_ = std::thread(&Listener::run, listener.get());

        LogInfo(fmt::format("Listening for OSC on UDP port {}", listener->port()));
        return listener;
    }

    Listener::Listener(std::unique_ptr<PacketSource> source,
                       std::shared_ptr<SharedDisplayState> state)
        : source_(std::move(source)),
          displayState_(std::move(state)),
          port_(source_->port()),
          state_(ListenerState::Starting) {}

    Listener::~Listener() { stop(); }

    void Listener::stop() {
        std::lock_guard<std::mutex> lock(stopMutex_);

        bool wasRunning = state_.load() == ListenerState::Running;
        if (wasRunning) {
            setState(ListenerState::Stopping);
        }

        source_->cancel();
        if (thread_.joinable()) {
            thread_.join();
        }
        source_->close();
        setState(ListenerState::Stopped);

        if (wasRunning) {
            LogInfo(fmt::format("Listener on UDP port {} stopped", port_));
        }
    }

    ListenerState Listener::state() const { return state_.load(); }

    bool Listener::isRunning() const { return state_.load() == ListenerState::Running; }

    uint16_t Listener::port() const { return port_; }

    ListenerStats Listener::stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    std::string Listener::lastError() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastError_;
    }

    void Listener::setState(ListenerState state) { state_.store(state); }

    bool Listener::processPacket(const RawPacket &packet, SharedDisplayState &state,
                                 ListenerStats &stats) {
        stats.packetsReceived++;

        std::optional<Message> message;
        try {
            message.emplace(decode(packet.data));
        } catch (const UnsupportedPacketException &e) {
            stats.unsupportedPackets++;
            if (isLogEnabled(LogLevel::Debug)) {
                LogDebug(fmt::format("Unsupported packet from {} ({} bytes): {}", packet.sender,
                                     packet.data.size(), e.what()));
            }
            return false;
        } catch (const MalformedPacketException &e) {
            stats.malformedPackets++;
            if (isLogEnabled(LogLevel::Debug)) {
                LogDebug(fmt::format("Malformed packet from {} ({} bytes): {}", packet.sender,
                                     packet.data.size(), e.what()));
            }
            return false;
        }

        stats.lastPacket = std::chrono::steady_clock::now();

        auto update = FieldMapper::map(*message);
        if (!update) {
            stats.ignoredMessages++;
            if (isLogEnabled(LogLevel::Debug)) {
                LogDebug(fmt::format("Ignoring {} ,{} from {}", message->getPath(),
                                     message->getTypeTags(), packet.sender));
            }
            return false;
        }

        state.apply(*update);
        stats.updatesApplied++;
        if (isLogEnabled(LogLevel::Debug)) {
            LogDebug(fmt::format("Applied {} from {}", describeUpdate(*update), packet.sender));
        }
        return true;
    }

    // Thread execution function
    void Listener::run() {
        ListenerStats local;

        try {
            while (true) {
                auto packet = source_->receive();
                if (!packet) {
                    break;  // cancelled
                }

                processPacket(*packet, *displayState_, local);

                std::lock_guard<std::mutex> lock(mutex_);
                stats_ = local;
            }
        } catch (const CueDisplayException &e) {
            LogError(fmt::format("OSC listener on UDP port {} failed: {} (code: {})", port_,
                                 e.what(), static_cast<int>(e.code())));
            std::lock_guard<std::mutex> lock(mutex_);
            lastError_ = e.what();
        } catch (const std::exception &e) {
            LogError(fmt::format("OSC listener on UDP port {} failed: {}", port_, e.what()));
            std::lock_guard<std::mutex> lock(mutex_);
            lastError_ = e.what();
        }

        source_->close();
        setState(ListenerState::Stopped);
    }

}  // namespace cuedisplay
