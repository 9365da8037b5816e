// Shared fixtures for the fair launch tests

#pragma once

#include <fairlaunch/fairlaunch.hpp>

#include <memory>
#include <utility>
#include <vector>

namespace fairlaunch::test {

inline Account account(uint64_t n) {
    return Account(1, addresses::from_u64(n));
}

inline TokenMetadata metadata(const std::string& symbol, const std::string& name = "Test Token") {
    TokenMetadata m;
    m.name = name;
    m.symbol = symbol;
    m.description = "A token for tests";
    return m;
}

// k = 1000, scale = 1e6, cap = 2e6: F(s) = s^3 / 3e9, full curve costs 2666666666
inline CurveConfig small_curve(uint16_t fee_bps = 300) {
    CurveConfig c = CurveConfig::defaults();
    c.max_supply = U256(2000000);
    c.creator_fee_bps = fee_bps;
    return c;
}

// Records every delivered message
class Recorder : public Actor {
public:
    Recorder(Runtime& runtime, ActorId id) : Actor(runtime, id) {}

    const char* kind() const override { return "recorder"; }

    void on_message(ActorId from, const Message& msg) override {
        received.emplace_back(from, msg);
    }

    void emit(ActorId to, const Message& msg) { send(to, msg); }

    template <class T>
    std::vector<T> of_type() const {
        std::vector<T> out;
        for (const auto& [from, msg] : received) {
            if (auto* m = std::get_if<T>(&msg)) out.push_back(*m);
        }
        return out;
    }

    std::vector<std::pair<ActorId, Message>> received;
};

// Monotonic clock for deterministic trade ids
inline void use_counting_clock(Runtime& runtime, Timestamp start = 1000) {
    auto counter = std::make_shared<Timestamp>(start);
    runtime.set_clock([counter] { return (*counter)++; });
}

// A ledger wired to recording registry and pool actors, already initialized
struct LedgerFixture {
    FLCustody custody;
    Runtime runtime;
    Recorder& registry;
    Recorder& pool;
    FLLedger& ledger;

    Account creator = account(0xC0);
    Account alice = account(0xA1);
    Account bob = account(0xB0);
    Account carol = account(0xCA);

    explicit LedgerFixture(const CurveConfig& curve = small_curve())
        : registry(runtime.spawn<Recorder>()),
          pool(runtime.spawn<Recorder>()),
          ledger(runtime.spawn<FLLedger>(registry.id(), pool.id(), custody)) {
        use_counting_clock(runtime);
        ledger.initialize(1, creator, metadata("TEST"), curve);
        custody.deposit(alice, Amount(10000000000ULL));
        custody.deposit(bob, Amount(10000000000ULL));
    }

    Amount cash(const Account& a) const { return custody.balance(a); }
};

} // namespace fairlaunch::test
