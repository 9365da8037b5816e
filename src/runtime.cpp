// =============================================================================
// runtime.cpp - Actor runtime
// =============================================================================

#include "fairlaunch/runtime.hpp"
#include "fairlaunch/log.hpp"

#include <chrono>

namespace fairlaunch {

namespace {

Timestamp system_micros() {
    return static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

} // anonymous namespace

// =============================================================================
// Actor
// =============================================================================

Actor::Actor(Runtime& runtime, ActorId id) : runtime_(runtime), id_(id) {}

void Actor::send(ActorId to, const Message& msg) {
    runtime_.send(id_, to, msg);
}

Timestamp Actor::now() const {
    return runtime_.now();
}

// =============================================================================
// Constructor / Destructor
// =============================================================================

Runtime::Runtime(RuntimeConfig config)
    : config_(config), duplicate_delivery_(config.duplicate_delivery) {}

Runtime::~Runtime() {
    stop();
}

// =============================================================================
// Actors
// =============================================================================

void Runtime::register_actor(std::unique_ptr<Actor> actor) {
    ActorId id = actor->id();
    const char* kind = actor->kind();
    {
        std::unique_lock lock(actors_mutex_);
        actors_[id] = std::move(actor);
    }
    log::debug("spawned %s actor %llu", kind, static_cast<unsigned long long>(id));
}

Actor* Runtime::find_actor(ActorId id) const {
    std::shared_lock lock(actors_mutex_);
    auto it = actors_.find(id);
    if (it == actors_.end()) return nullptr;
    return it->second.get();
}

size_t Runtime::actor_count() const {
    std::shared_lock lock(actors_mutex_);
    return actors_.size();
}

// =============================================================================
// Messaging
// =============================================================================

void Runtime::send(ActorId from, ActorId to, const Message& msg) {
    post_raw(from, to, wire::encode(msg));
}

void Runtime::post_raw(ActorId from, ActorId to, std::string payload) {
    Envelope envelope{from, to, 0, std::move(payload)};
    bool duplicate = duplicate_delivery_.load();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        envelope.sequence = next_sequence_++;
        if (auto* listener = listener_.load()) listener->on_send(envelope);
        if (duplicate) enqueue_locked(envelope);
        enqueue_locked(std::move(envelope));
    }
    messages_sent_.fetch_add(1, std::memory_order_relaxed);

    if (duplicate) {
        queue_cv_.notify_all();
    } else {
        queue_cv_.notify_one();
    }
}

size_t Runtime::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return pending_;
}

void Runtime::enqueue_locked(Envelope envelope) {
    ActorId to = envelope.to;
    mailboxes_[to].push_back(std::move(envelope));
    ++pending_;
    if (scheduled_.insert(to).second) {
        ready_.push_back(to);
    }
}

bool Runtime::take_locked(Envelope& out) {
    if (ready_.empty()) return false;

    ActorId id = ready_.front();
    ready_.pop_front();

    auto& box = mailboxes_[id];
    out = std::move(box.front());
    box.pop_front();
    return true;
}

void Runtime::finish_locked(ActorId id) {
    auto it = mailboxes_.find(id);
    if (it != mailboxes_.end() && !it->second.empty()) {
        ready_.push_back(id);
    } else {
        if (it != mailboxes_.end()) mailboxes_.erase(it);
        scheduled_.erase(id);
    }
    --pending_;
}

bool Runtime::deliver_next() {
    Envelope envelope;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!take_locked(envelope)) return false;
    }

    dispatch(envelope);

    bool idle = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        finish_locked(envelope.to);
        idle = pending_ == 0;
    }
    queue_cv_.notify_one();
    if (idle) idle_cv_.notify_all();
    return true;
}

size_t Runtime::run_until_idle() {
    size_t delivered = 0;
    while (deliver_next()) {
        ++delivered;
    }
    return delivered;
}

void Runtime::drop(const Envelope& envelope, int32_t reason) {
    messages_dropped_.fetch_add(1, std::memory_order_relaxed);
    if (auto* listener = listener_.load()) listener->on_drop(envelope, reason);
}

void Runtime::dispatch(const Envelope& envelope) {
    auto msg = wire::decode(envelope.payload);
    if (!msg) {
        log::warn("dropping malformed message %llu from %llu to %llu",
                  static_cast<unsigned long long>(envelope.sequence),
                  static_cast<unsigned long long>(envelope.from),
                  static_cast<unsigned long long>(envelope.to));
        drop(envelope, errors::MALFORMED_MESSAGE);
        return;
    }

    Actor* actor = find_actor(envelope.to);
    if (actor == nullptr) {
        log::warn("dropping %s for unknown actor %llu", message_type(*msg),
                  static_cast<unsigned long long>(envelope.to));
        drop(envelope, errors::ACTOR_NOT_FOUND);
        return;
    }

    log::trace("deliver %s %llu -> %llu", message_type(*msg),
               static_cast<unsigned long long>(envelope.from),
               static_cast<unsigned long long>(envelope.to));

    try {
        std::lock_guard<std::mutex> lock(actor->exec_mutex_);
        actor->on_message(envelope.from, *msg);
    } catch (const std::exception& e) {
        handler_failures_.fetch_add(1, std::memory_order_relaxed);
        log::error("%s actor %llu failed on %s: %s", actor->kind(),
                   static_cast<unsigned long long>(envelope.to), message_type(*msg), e.what());
        drop(envelope, errors::MALFORMED_MESSAGE);
        return;
    }

    messages_delivered_.fetch_add(1, std::memory_order_relaxed);
    if (auto* listener = listener_.load()) listener->on_deliver(envelope, *msg);
}

// =============================================================================
// Lifecycle
// =============================================================================

void Runtime::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;  // Already running
    }

    size_t threads = config_.worker_threads == 0 ? 1 : config_.worker_threads;
    for (size_t i = 0; i < threads; ++i) {
        worker_threads_.emplace_back(&Runtime::worker_loop, this);
    }
    log::info("runtime started with %zu worker thread(s)", threads);
}

void Runtime::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;  // Already stopped
    }

    {
        // Pairs with the predicate check in worker_loop
        std::lock_guard<std::mutex> lock(queue_mutex_);
    }
    queue_cv_.notify_all();
    idle_cv_.notify_all();

    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    worker_threads_.clear();
    log::info("runtime stopped");
}

void Runtime::wait_idle() {
    if (!running_.load()) {
        run_until_idle();
        return;
    }

    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return pending_ == 0 || !running_.load();
    });
}

void Runtime::worker_loop() {
    while (running_.load()) {
        Envelope envelope;
        bool has_message = false;

        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return !ready_.empty() || !running_.load();
            });

            if (!running_.load()) {
                return;
            }

            has_message = take_locked(envelope);
        }

        if (has_message) {
            dispatch(envelope);

            bool idle = false;
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                finish_locked(envelope.to);
                idle = pending_ == 0;
            }
            queue_cv_.notify_one();
            if (idle) idle_cv_.notify_all();
        }
    }
}

// =============================================================================
// Configuration
// =============================================================================

void Runtime::set_message_listener(MessageListener* listener) {
    listener_.store(listener);
}

void Runtime::set_clock(Clock clock) {
    std::lock_guard<std::mutex> lock(clock_mutex_);
    clock_ = std::move(clock);
}

Timestamp Runtime::now() const {
    std::lock_guard<std::mutex> lock(clock_mutex_);
    if (clock_) return clock_();
    return system_micros();
}

Runtime::Stats Runtime::get_stats() const {
    return Stats{
        messages_sent_.load(),
        messages_delivered_.load(),
        messages_dropped_.load(),
        handler_failures_.load()
    };
}

} // namespace fairlaunch
