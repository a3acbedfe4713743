#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

// Unbounded multi-producer single-consumer channel.
// send() fails once the Receiver is gone; recv() blocks until a value arrives
// and fails once every Sender is gone and the queue is drained.
namespace detail {

template <typename T>
struct ChannelState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<T> queue;
    size_t senders = 0;
    bool receiver_alive = true;
};

} // namespace detail

template <typename T>
class Sender {
public:
    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state)) {
        std::lock_guard lock(state_->mutex);
        ++state_->senders;
    }

    ~Sender() { release(); }

    Sender(const Sender& other) : state_(other.state_) {
        if (state_) {
            std::lock_guard lock(state_->mutex);
            ++state_->senders;
        }
    }

    Sender& operator=(const Sender& other) {
        if (this != &other) {
            Sender copy(other);
            std::swap(state_, copy.state_);
        }
        return *this;
    }

    Sender(Sender&& other) noexcept : state_(std::exchange(other.state_, nullptr)) {}

    Sender& operator=(Sender&& other) noexcept {
        if (this != &other) {
            release();
            state_ = std::exchange(other.state_, nullptr);
        }
        return *this;
    }

    std::expected<void, std::string> send(T value) {
        if (!state_) return std::unexpected("sending on a moved-from channel");
        {
            std::lock_guard lock(state_->mutex);
            if (!state_->receiver_alive) {
                return std::unexpected("sending on a closed channel");
            }
            state_->queue.push_back(std::move(value));
        }
        state_->cv.notify_one();
        return {};
    }

private:
    void release() {
        if (!state_) return;
        {
            std::lock_guard lock(state_->mutex);
            --state_->senders;
        }
        state_->cv.notify_all();
        state_.reset();
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T>
class Receiver {
public:
    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state)) {}

    ~Receiver() { release(); }

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    Receiver(Receiver&& other) noexcept : state_(std::exchange(other.state_, nullptr)) {}

    Receiver& operator=(Receiver&& other) noexcept {
        if (this != &other) {
            release();
            state_ = std::exchange(other.state_, nullptr);
        }
        return *this;
    }

    std::expected<T, std::string> recv() {
        if (!state_) return std::unexpected("receiving on a moved-from channel");
        std::unique_lock lock(state_->mutex);
        state_->cv.wait(lock, [this] { return !state_->queue.empty() || state_->senders == 0; });
        if (state_->queue.empty()) {
            return std::unexpected("receiving on an empty and disconnected channel");
        }
        T value = std::move(state_->queue.front());
        state_->queue.pop_front();
        return value;
    }

    // Values sent but not yet received.
    size_t pending() const {
        if (!state_) return 0;
        std::lock_guard lock(state_->mutex);
        return state_->queue.size();
    }

private:
    void release() {
        if (!state_) return;
        std::lock_guard lock(state_->mutex);
        state_->receiver_alive = false;
        state_->queue.clear();
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T>
std::pair<Sender<T>, Receiver<T>> make_channel() {
    auto state = std::make_shared<detail::ChannelState<T>>();
    return {Sender<T>(state), Receiver<T>(state)};
}
