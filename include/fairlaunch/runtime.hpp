#ifndef FAIRLAUNCH_RUNTIME_HPP
#define FAIRLAUNCH_RUNTIME_HPP

#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <shared_mutex>
#include <mutex>
#include <vector>
#include <deque>
#include <thread>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

#include "types.hpp"
#include "messages.hpp"

namespace fairlaunch {

class Runtime;

// =============================================================================
// Envelope - one encoded message in flight
// =============================================================================

struct Envelope {
    ActorId from;
    ActorId to;
    uint64_t sequence;
    std::string payload;  // JSON wire form
};

// =============================================================================
// Actor - single-writer state machine driven by messages
// =============================================================================

class Actor {
public:
    Actor(Runtime& runtime, ActorId id);
    virtual ~Actor() = default;

    // Non-copyable
    Actor(const Actor&) = delete;
    Actor& operator=(const Actor&) = delete;

    ActorId id() const { return id_; }
    Account application_account() const { return Account::application(id_); }

    virtual const char* kind() const = 0;

    // Handle one delivered message. Failures are logged, never thrown.
    virtual void on_message(ActorId from, const Message& msg) = 0;

protected:
    void send(ActorId to, const Message& msg);
    Timestamp now() const;

    Runtime& runtime_;

private:
    friend class Runtime;

    ActorId id_;
    std::mutex exec_mutex_;  // Serializes operations and deliveries
};

// =============================================================================
// Message Listener
// =============================================================================

class MessageListener {
public:
    virtual ~MessageListener() = default;

    virtual void on_send(const Envelope& envelope) { (void)envelope; }
    virtual void on_deliver(const Envelope& envelope, const Message& msg) {
        (void)envelope; (void)msg;
    }
    virtual void on_drop(const Envelope& envelope, int32_t reason) {
        (void)envelope; (void)reason;
    }
};

// Runtime configuration
struct RuntimeConfig {
    size_t worker_threads = 1;
    bool duplicate_delivery = false;  // Enqueue every message twice
};

// =============================================================================
// Runtime - actor table, mailboxes and delivery
// =============================================================================

class Runtime {
public:
    using Clock = std::function<Timestamp()>;

    explicit Runtime(RuntimeConfig config = {});
    ~Runtime();

    // Non-copyable
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // =========================================================================
    // Actors
    // =========================================================================

    // Construct T(runtime, id, args...) under the next actor id
    template <class T, class... Args>
    T& spawn(Args&&... args) {
        ActorId id = next_actor_id_.fetch_add(1, std::memory_order_relaxed);
        auto actor = std::make_unique<T>(*this, id, std::forward<Args>(args)...);
        T& ref = *actor;
        register_actor(std::move(actor));
        return ref;
    }

    template <class T>
    T* find(ActorId id) const {
        return dynamic_cast<T*>(find_actor(id));
    }

    bool has_actor(ActorId id) const { return find_actor(id) != nullptr; }
    size_t actor_count() const;

    // Run fn(actor) under the actor's execution lock.
    // Throws std::out_of_range if no actor of type T has this id.
    template <class T, class Fn>
    auto with_actor(ActorId id, Fn&& fn) -> decltype(fn(std::declval<T&>())) {
        T* actor = find<T>(id);
        if (actor == nullptr) {
            throw std::out_of_range("no such actor: " + std::to_string(id));
        }
        std::lock_guard<std::mutex> lock(actor->exec_mutex_);
        return fn(*actor);
    }

    // =========================================================================
    // Messaging
    // =========================================================================

    void send(ActorId from, ActorId to, const Message& msg);

    // Enqueue an already-encoded payload as-is
    void post_raw(ActorId from, ActorId to, std::string payload);

    size_t pending() const;

    // Step mode: deliver one message on the calling thread
    bool deliver_next();
    size_t run_until_idle();

    // =========================================================================
    // Lifecycle (threaded delivery)
    // =========================================================================

    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Block until every mailbox is empty. Delivers inline when not running.
    void wait_idle();

    // =========================================================================
    // Configuration
    // =========================================================================

    void set_duplicate_delivery(bool enabled) { duplicate_delivery_.store(enabled); }
    bool duplicate_delivery() const { return duplicate_delivery_.load(); }

    void set_message_listener(MessageListener* listener);

    void set_clock(Clock clock);
    Timestamp now() const;

    // Statistics
    struct Stats {
        uint64_t messages_sent;
        uint64_t messages_delivered;
        uint64_t messages_dropped;
        uint64_t handler_failures;
    };
    Stats get_stats() const;

private:
    RuntimeConfig config_;
    std::atomic<bool> running_{false};
    std::atomic<bool> duplicate_delivery_{false};

    // Actor table
    std::atomic<ActorId> next_actor_id_{1};
    std::unordered_map<ActorId, std::unique_ptr<Actor>> actors_;
    mutable std::shared_mutex actors_mutex_;

    // Mailboxes; an actor id sits in ready_ at most once and is in scheduled_
    // while it is queued or being delivered to
    std::unordered_map<ActorId, std::deque<Envelope>> mailboxes_;
    std::deque<ActorId> ready_;
    std::unordered_set<ActorId> scheduled_;
    size_t pending_{0};
    uint64_t next_sequence_{1};
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::vector<std::thread> worker_threads_;

    std::atomic<MessageListener*> listener_{nullptr};

    Clock clock_;
    mutable std::mutex clock_mutex_;

    // Statistics
    std::atomic<uint64_t> messages_sent_{0};
    std::atomic<uint64_t> messages_delivered_{0};
    std::atomic<uint64_t> messages_dropped_{0};
    std::atomic<uint64_t> handler_failures_{0};

    void register_actor(std::unique_ptr<Actor> actor);
    Actor* find_actor(ActorId id) const;

    // Caller holds queue_mutex_
    void enqueue_locked(Envelope envelope);
    bool take_locked(Envelope& out);
    void finish_locked(ActorId id);

    void dispatch(const Envelope& envelope);
    void drop(const Envelope& envelope, int32_t reason);
    void worker_loop();
};

} // namespace fairlaunch

#endif // FAIRLAUNCH_RUNTIME_HPP
