// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

namespace ranger::core {

template<typename T> class Sender;
template<typename T> class Receiver;

namespace detail {

// Ring buffer shared by the endpoints of one channel
template<typename T>
class ChannelState {
public:
    explicit ChannelState(std::size_t capacity)
        : slots_(capacity == 0 ? 1 : capacity) {}

    bool send(T value, std::stop_token stoken) {
        std::unique_lock lock(mutex_);
        bool ready = not_full_.wait(lock, stoken, [this] {
            return receivers_ == 0 || count_ < slots_.size();
        });
        if (!ready || receivers_ == 0 || stoken.stop_requested()) {
            return false;
        }

        slots_[(head_ + count_) % slots_.size()].emplace(std::move(value));
        ++count_;
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> recv(std::stop_token stoken) {
        std::unique_lock lock(mutex_);
        bool ready = not_empty_.wait(lock, stoken, [this] {
            return count_ > 0 || senders_ == 0;
        });
        if (!ready || count_ == 0 || stoken.stop_requested()) {
            return std::nullopt;
        }

        std::optional<T> value = std::move(slots_[head_]);
        slots_[head_].reset();
        head_ = (head_ + 1) % slots_.size();
        --count_;
        lock.unlock();
        not_full_.notify_one();
        return value;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return count_;
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }

    void add_sender() {
        std::lock_guard lock(mutex_);
        ++senders_;
    }

    void add_receiver() {
        std::lock_guard lock(mutex_);
        ++receivers_;
    }

    // Last sender gone: receivers drain what is left, then see end of stream
    void drop_sender() {
        std::unique_lock lock(mutex_);
        if (--senders_ == 0) {
            lock.unlock();
            not_empty_.notify_all();
        }
    }

    // Last receiver gone: buffered values are dropped, senders fail
    void drop_receiver() {
        std::unique_lock lock(mutex_);
        if (--receivers_ == 0) {
            for (auto& slot : slots_) slot.reset();
            head_ = 0;
            count_ = 0;
            lock.unlock();
            not_full_.notify_all();
        }
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable_any not_full_;
    std::condition_variable_any not_empty_;
    std::vector<std::optional<T>> slots_;
    std::size_t head_{0};
    std::size_t count_{0};
    std::size_t senders_{0};
    std::size_t receivers_{0};
};

} // namespace detail

// Producer end. Copies count as separate producers.
template<typename T>
class Sender {
public:
    Sender() = default;
    ~Sender() { close(); }

    Sender(const Sender& other) : state_(other.state_) {
        if (state_) state_->add_sender();
    }
    Sender& operator=(const Sender& other) {
        if (this != &other) {
            close();
            state_ = other.state_;
            if (state_) state_->add_sender();
        }
        return *this;
    }
    Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}
    Sender& operator=(Sender&& other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    // Blocks while the channel is full. False when every receiver is gone or
    // stop was requested; the value is dropped in that case.
    [[nodiscard]] bool send(T value, std::stop_token stoken = {}) {
        return state_ && state_->send(std::move(value), std::move(stoken));
    }

    // Give up this producer handle
    void close() {
        if (state_) {
            state_->drop_sender();
            state_.reset();
        }
    }

    [[nodiscard]] bool is_open() const noexcept { return static_cast<bool>(state_); }

private:
    template<typename U>
    friend std::pair<Sender<U>, Receiver<U>> make_channel(std::size_t capacity);

    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {
        state_->add_sender();
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

// Consumer end. Copies share the queue; each value goes to one receiver.
template<typename T>
class Receiver {
public:
    Receiver() = default;
    ~Receiver() { close(); }

    Receiver(const Receiver& other) : state_(other.state_) {
        if (state_) state_->add_receiver();
    }
    Receiver& operator=(const Receiver& other) {
        if (this != &other) {
            close();
            state_ = other.state_;
            if (state_) state_->add_receiver();
        }
        return *this;
    }
    Receiver(Receiver&& other) noexcept : state_(std::move(other.state_)) {}
    Receiver& operator=(Receiver&& other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    // Blocks while the channel is empty. nullopt once every sender is gone and
    // the buffer is drained, or when stop was requested.
    [[nodiscard]] std::optional<T> recv(std::stop_token stoken = {}) {
        if (!state_) return std::nullopt;
        return state_->recv(std::move(stoken));
    }

    void close() {
        if (state_) {
            state_->drop_receiver();
            state_.reset();
        }
    }

    [[nodiscard]] bool is_open() const noexcept { return static_cast<bool>(state_); }

    // Values currently buffered
    [[nodiscard]] std::size_t size() const { return state_ ? state_->size() : 0; }

private:
    template<typename U>
    friend std::pair<Sender<U>, Receiver<U>> make_channel(std::size_t capacity);

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {
        state_->add_receiver();
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

// Bounded multi-producer multi-consumer channel
template<typename T>
std::pair<Sender<T>, Receiver<T>> make_channel(std::size_t capacity) {
    auto state = std::make_shared<detail::ChannelState<T>>(capacity);
    return {Sender<T>(state), Receiver<T>(state)};
}

// Counting gate limiting how many chunks may be dispatched but not yet
// delivered to the consumer
class DeliveryCredits {
public:
    explicit DeliveryCredits(std::uint32_t credits) noexcept : available_(credits) {}

    // Blocks until a credit is free. False when stop was requested.
    [[nodiscard]] bool acquire(std::stop_token stoken) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait(lock, stoken, [this] { return available_ > 0; })) {
            return false;
        }
        --available_;
        return true;
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            ++available_;
        }
        cv_.notify_one();
    }

    [[nodiscard]] std::uint32_t available() const {
        std::lock_guard lock(mutex_);
        return available_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::uint32_t available_;
};

} // namespace ranger::core
