// Fair Launch - Ledger Tests

#include <catch2/catch.hpp>
#include "test_helpers.hpp"

using namespace fairlaunch;
using namespace fairlaunch::test;

namespace {

const Amount START_CASH = 10000000000ULL;

} // namespace

TEST_CASE("Ledger lifecycle", "[ledger]") {
    FLCustody custody;
    Runtime runtime;
    auto& registry = runtime.spawn<Recorder>();
    auto& pool = runtime.spawn<Recorder>();
    auto& ledger = runtime.spawn<FLLedger>(registry.id(), pool.id(), custody);
    use_counting_clock(runtime);

    SECTION("Uninitialized rejects everything") {
        REQUIRE(ledger.phase() == LedgerPhase::Uninitialized);
        REQUIRE_FALSE(ledger.launch().has_value());
        REQUIRE(ledger.buy(account(1), U256(1), U256::max()).status == errors::NOT_INITIALIZED);
        REQUIRE(ledger.sell(account(1), U256(1), U256()).status == errors::NOT_INITIALIZED);
        REQUIRE(ledger.approve(account(1), account(2), U256(1)) == errors::NOT_INITIALIZED);
        REQUIRE(ledger.transfer_from(account(2), account(1), account(3), U256(1)) ==
                errors::NOT_INITIALIZED);
        REQUIRE(ledger.graduate() == errors::NOT_INITIALIZED);
        REQUIRE_FALSE(ledger.current_price().has_value());
        REQUIRE(ledger.progress_bps() == 0);
    }

    SECTION("Initialize once") {
        CurveConfig bad = small_curve();
        bad.scale = U256();
        REQUIRE(ledger.initialize(1, account(9), metadata("A"), bad) ==
                errors::INVALID_CURVE_CONFIG);
        REQUIRE(ledger.phase() == LedgerPhase::Uninitialized);

        REQUIRE(ledger.initialize(1, account(9), metadata("A"), small_curve()) == errors::OK);
        REQUIRE(ledger.phase() == LedgerPhase::Active);
        REQUIRE(ledger.launch()->created_at == 1000);
        REQUIRE(ledger.launch()->creator == account(9));
        REQUIRE(ledger.initialize(2, account(9), metadata("B"), small_curve()) ==
                errors::ALREADY_INITIALIZED);
        REQUIRE(ledger.launch()->id == 1);
    }

    SECTION("TokenCreated only from the registry") {
        TokenCreated created{4, account(9), metadata("MSG"), small_curve()};

        pool.emit(ledger.id(), created);
        runtime.run_until_idle();
        REQUIRE(ledger.phase() == LedgerPhase::Uninitialized);

        registry.emit(ledger.id(), created);
        runtime.run_until_idle();
        REQUIRE(ledger.phase() == LedgerPhase::Active);
        REQUIRE(ledger.launch()->id == 4);
        REQUIRE(ledger.launch()->metadata.symbol == "MSG");

        // Redelivery and a different launch are both no-ops
        registry.emit(ledger.id(), created);
        registry.emit(ledger.id(), TokenCreated{5, account(8), metadata("NO"), small_curve()});
        runtime.run_until_idle();
        REQUIRE(ledger.launch()->id == 4);
        REQUIRE(ledger.launch()->creator == account(9));
        REQUIRE(runtime.get_stats().handler_failures == 0);
    }
}

TEST_CASE("Ledger buy", "[ledger]") {
    LedgerFixture f;

    SECTION("Pays the creator fee and the net cost") {
        auto r = f.ledger.buy(f.alice, U256(100000), U256::max());
        REQUIRE(r.ok());
        REQUIRE(r.token_amount == U256(100000));
        REQUIRE(r.currency_amount == U256(333333));
        REQUIRE(r.fee == U256(9999));
        REQUIRE(r.price_after == *f.ledger.current_price());
        REQUIRE_FALSE(r.graduated);
        REQUIRE(r.trade_id.has_value());
        REQUIRE(r.trade_id->timestamp == 1001);
        REQUIRE(r.trade_id->sequence == 0);

        REQUIRE(f.cash(f.alice) == START_CASH - 333333);
        REQUIRE(f.cash(f.creator) == 9999);
        REQUIRE(f.cash(f.ledger.application_account()) == 323334);

        REQUIRE(f.ledger.balance_of(f.alice) == U256(100000));
        REQUIRE(f.ledger.holder_count() == 1);
        auto launch = f.ledger.launch();
        REQUIRE(launch->current_supply == U256(100000));
        REQUIRE(launch->total_raised == U256(333333));
        REQUIRE(f.ledger.progress_bps() == 500);

        auto pos = f.ledger.position(f.alice);
        REQUIRE(pos.has_value());
        REQUIRE(pos->balance == U256(100000));
        REQUIRE(pos->total_invested == U256(333333));
        REQUIRE(pos->trades_count == 1);
    }

    SECTION("Reports the trade to the registry") {
        REQUIRE(f.ledger.buy(f.alice, U256(100000), U256::max()).ok());
        f.runtime.run_until_idle();

        auto reports = f.registry.of_type<TradeExecuted>();
        REQUIRE(reports.size() == 1);
        REQUIRE(reports[0].launch_id == 1);
        REQUIRE(reports[0].trader == f.alice);
        REQUIRE(reports[0].is_buy);
        REQUIRE(reports[0].current_supply == U256(100000));
        REQUIRE(reports[0].total_raised == U256(333333));
        REQUIRE(f.pool.received.empty());
    }

    SECTION("Later buys cost more") {
        REQUIRE(f.ledger.buy(f.bob, U256(100000), U256::max()).ok());
        auto r = f.ledger.buy(f.alice, U256(100000), U256::max());
        REQUIRE(r.currency_amount == U256(2333333));
        REQUIRE(r.fee == U256(69999));
        REQUIRE(f.ledger.holder_count() == 2);
    }

    SECTION("Zero amount") {
        REQUIRE(f.ledger.buy(f.alice, U256(), U256::max()).status == errors::INVALID_AMOUNT);
    }

    SECTION("Supply cap is checked before slippage") {
        auto r = f.ledger.buy(f.alice, U256(2000001), U256());
        REQUIRE(r.status == errors::EXCEEDS_MAX_SUPPLY);
        REQUIRE_FALSE(r.trade_id.has_value());
        REQUIRE(f.ledger.launch()->current_supply == U256());
        REQUIRE(f.ledger.buy(f.alice, U256::max(), U256::max()).status ==
                errors::EXCEEDS_MAX_SUPPLY);
    }

    SECTION("Slippage bound is inclusive") {
        REQUIRE(f.ledger.buy(f.alice, U256(100000), U256(333332)).status ==
                errors::SLIPPAGE_EXCEEDED);
        REQUIRE(f.ledger.trade_count() == 0);
        REQUIRE(f.ledger.buy(f.alice, U256(100000), U256(333333)).ok());
    }

    SECTION("Unfunded caller changes nothing") {
        auto r = f.ledger.buy(f.carol, U256(100000), U256::max());
        REQUIRE(r.status == errors::INSUFFICIENT_FUNDS);
        REQUIRE(f.ledger.balance_of(f.carol) == U256());
        REQUIRE(f.ledger.holder_count() == 0);
        REQUIRE(f.ledger.trade_count() == 0);
        REQUIRE(f.ledger.launch()->total_raised == U256());
        REQUIRE(f.cash(f.creator) == 0);
        f.runtime.run_until_idle();
        REQUIRE(f.registry.received.empty());
    }

    SECTION("Quotes match execution") {
        auto quote = f.ledger.quote_buy(U256(250000));
        REQUIRE(quote.has_value());
        auto r = f.ledger.buy(f.alice, U256(250000), *quote);
        REQUIRE(r.ok());
        REQUIRE(r.currency_amount == *quote);

        auto affordable = f.ledger.max_buy_for_budget(U256(1000000));
        REQUIRE(affordable.has_value());
        REQUIRE(*f.ledger.quote_buy(*affordable) <= U256(1000000));
        REQUIRE(*f.ledger.quote_buy(*affordable + U256(1)) > U256(1000000));
    }
}

TEST_CASE("Ledger without creator fee", "[ledger]") {
    LedgerFixture f(small_curve(0));
    auto r = f.ledger.buy(f.alice, U256(100000), U256::max());
    REQUIRE(r.ok());
    REQUIRE(r.fee == U256());
    REQUIRE(f.cash(f.creator) == 0);
    REQUIRE(f.cash(f.ledger.application_account()) == 333333);
}

TEST_CASE("Ledger sell", "[ledger]") {
    LedgerFixture f;
    REQUIRE(f.ledger.buy(f.bob, U256(100000), U256::max()).ok());
    REQUIRE(f.ledger.buy(f.alice, U256(100000), U256::max()).ok());

    SECTION("Round trip costs the sell fee") {
        auto r = f.ledger.sell(f.alice, U256(100000), U256(2333333));
        REQUIRE(r.ok());
        REQUIRE(r.currency_amount == U256(2333333));
        REQUIRE(r.fee == U256(69999));

        REQUIRE(f.cash(f.alice) == START_CASH - 69999);
        REQUIRE(f.cash(f.creator) == 9999 + 69999 + 69999);
        REQUIRE(f.ledger.balance_of(f.alice) == U256());
        REQUIRE(f.ledger.holder_count() == 1);

        auto launch = f.ledger.launch();
        REQUIRE(launch->current_supply == U256(100000));
        REQUIRE(launch->total_raised == U256(333333));

        auto pos = f.ledger.position(f.alice);
        REQUIRE(pos->balance == U256());
        REQUIRE(pos->trades_count == 2);

        // Currency is conserved
        Amount total = f.cash(f.alice) + f.cash(f.bob) + f.cash(f.creator) +
                       f.cash(f.ledger.application_account());
        REQUIRE(total == 2 * START_CASH);
    }

    SECTION("Sell price tracks the curve") {
        auto quote = f.ledger.quote_sell(U256(40000));
        auto r = f.ledger.sell(f.alice, U256(40000), U256());
        REQUIRE(r.ok());
        REQUIRE(r.currency_amount == *quote);
        REQUIRE(r.fee == bonding_curve::creator_fee(*quote, 300));
        REQUIRE(r.price_after == *f.ledger.current_price());
        REQUIRE(f.ledger.balance_of(f.alice) == U256(60000));
    }

    SECTION("Reports the sale") {
        f.runtime.run_until_idle();
        f.registry.received.clear();
        REQUIRE(f.ledger.sell(f.bob, U256(1000), U256()).ok());
        f.runtime.run_until_idle();
        auto reports = f.registry.of_type<TradeExecuted>();
        REQUIRE(reports.size() == 1);
        REQUIRE_FALSE(reports[0].is_buy);
        REQUIRE(reports[0].trader == f.bob);
    }

    SECTION("Rejected sells change nothing") {
        REQUIRE(f.ledger.sell(f.alice, U256(), U256()).status == errors::INVALID_AMOUNT);
        REQUIRE(f.ledger.sell(f.carol, U256(1), U256()).status == errors::INSUFFICIENT_BALANCE);
        REQUIRE(f.ledger.sell(f.alice, U256(100001), U256()).status ==
                errors::INSUFFICIENT_BALANCE);
        REQUIRE(f.ledger.sell(f.alice, U256(100000), U256(2333334)).status ==
                errors::SLIPPAGE_EXCEEDED);
        REQUIRE(f.ledger.balance_of(f.alice) == U256(100000));
        REQUIRE(f.ledger.trade_count() == 2);
    }
}

TEST_CASE("Ledger sell needs pooled funds", "[ledger]") {
    LedgerFixture f;
    // A lone buyer's net payment cannot cover the gross return of a full sell
    REQUIRE(f.ledger.buy(f.alice, U256(100000), U256::max()).ok());
    auto r = f.ledger.sell(f.alice, U256(100000), U256());
    REQUIRE(r.status == errors::INSUFFICIENT_FUNDS);
    REQUIRE(f.ledger.balance_of(f.alice) == U256(100000));
    REQUIRE(f.cash(f.ledger.application_account()) == 323334);

    REQUIRE(f.ledger.sell(f.alice, U256(50000), U256()).ok());
}

TEST_CASE("Ledger allowances", "[ledger]") {
    LedgerFixture f;
    REQUIRE(f.ledger.buy(f.alice, U256(1000), U256::max()).ok());

    REQUIRE(f.ledger.approve(f.alice, f.bob, U256(500)) == errors::OK);
    REQUIRE(f.ledger.allowance(f.alice, f.bob) == U256(500));
    REQUIRE(f.ledger.allowance(f.bob, f.alice) == U256());

    SECTION("Spend within the allowance") {
        REQUIRE(f.ledger.transfer_from(f.bob, f.alice, f.carol, U256(300)) == errors::OK);
        REQUIRE(f.ledger.allowance(f.alice, f.bob) == U256(200));
        REQUIRE(f.ledger.balance_of(f.alice) == U256(700));
        REQUIRE(f.ledger.balance_of(f.carol) == U256(300));
        REQUIRE(f.ledger.holder_count() == 2);
    }

    SECTION("Approve overwrites") {
        REQUIRE(f.ledger.approve(f.alice, f.bob, U256(50)) == errors::OK);
        REQUIRE(f.ledger.allowance(f.alice, f.bob) == U256(50));
        REQUIRE(f.ledger.approve(f.alice, f.bob, U256()) == errors::OK);
        REQUIRE(f.ledger.allowance(f.alice, f.bob) == U256());
    }

    SECTION("Failures leave balances and allowance untouched") {
        REQUIRE(f.ledger.transfer_from(f.bob, f.alice, f.carol, U256()) ==
                errors::INVALID_AMOUNT);
        REQUIRE(f.ledger.transfer_from(f.bob, f.alice, f.carol, U256(501)) ==
                errors::INSUFFICIENT_ALLOWANCE);
        REQUIRE(f.ledger.transfer_from(f.carol, f.alice, f.bob, U256(1)) ==
                errors::INSUFFICIENT_ALLOWANCE);

        REQUIRE(f.ledger.approve(f.alice, f.bob, U256(5000)) == errors::OK);
        REQUIRE(f.ledger.transfer_from(f.bob, f.alice, f.carol, U256(1001)) ==
                errors::INSUFFICIENT_BALANCE);
        REQUIRE(f.ledger.allowance(f.alice, f.bob) == U256(5000));
        REQUIRE(f.ledger.balance_of(f.alice) == U256(1000));
        REQUIRE(f.ledger.balance_of(f.carol) == U256());
    }

    SECTION("Moving a whole balance updates the holder count") {
        REQUIRE(f.ledger.approve(f.alice, f.bob, U256(1000)) == errors::OK);
        REQUIRE(f.ledger.transfer_from(f.bob, f.alice, f.carol, U256(1000)) == errors::OK);
        REQUIRE(f.ledger.holder_count() == 1);
        REQUIRE(f.ledger.allowance(f.alice, f.bob) == U256());
    }
}

TEST_CASE("Ledger graduation", "[ledger]") {
    LedgerFixture f;
    REQUIRE(f.ledger.buy(f.bob, U256(1500000), U256::max()).ok());

    SECTION("Manual graduation needs a full curve") {
        REQUIRE(f.ledger.graduate() == errors::CURVE_INCOMPLETE);
        REQUIRE(f.ledger.phase() == LedgerPhase::Active);
    }

    SECTION("The filling buy graduates") {
        auto r = f.ledger.buy(f.alice, U256(500000), U256::max());
        REQUIRE(r.ok());
        REQUIRE(r.graduated);
        REQUIRE(f.ledger.phase() == LedgerPhase::Graduated);
        REQUIRE(f.ledger.launch()->graduated);
        REQUIRE(f.ledger.progress_bps() == 10000);

        f.runtime.run_until_idle();
        auto grads = f.pool.of_type<GraduateToken>();
        REQUIRE(grads.size() == 1);
        REQUIRE(grads[0].launch_id == 1);
        REQUIRE(grads[0].total_supply == U256(2000000));
        REQUIRE(grads[0].total_raised == U256(2666666666ULL));
        // The trade report goes out before the hand-off
        REQUIRE(f.registry.of_type<TradeExecuted>().size() == 2);

        SECTION("Trading stops") {
            REQUIRE(f.ledger.buy(f.alice, U256(1), U256::max()).status ==
                    errors::ALREADY_GRADUATED);
            REQUIRE(f.ledger.sell(f.alice, U256(1), U256()).status ==
                    errors::ALREADY_GRADUATED);
        }

        SECTION("Allowances still work") {
            REQUIRE(f.ledger.approve(f.alice, f.carol, U256(10)) == errors::OK);
            REQUIRE(f.ledger.transfer_from(f.carol, f.alice, f.carol, U256(10)) == errors::OK);
            REQUIRE(f.ledger.balance_of(f.carol) == U256(10));
        }

        SECTION("Retry resends until acknowledged") {
            REQUIRE(f.ledger.graduate() == errors::OK);
            f.runtime.run_until_idle();
            REQUIRE(f.pool.of_type<GraduateToken>().size() == 2);

            f.pool.emit(f.ledger.id(), PoolCreated{1, 7});
            f.runtime.run_until_idle();
            REQUIRE(f.ledger.launch()->pool_id == PoolId(7));

            REQUIRE(f.ledger.graduate() == errors::OK);
            f.runtime.run_until_idle();
            REQUIRE(f.pool.of_type<GraduateToken>().size() == 2);
        }

        SECTION("Pool acknowledgment is authenticated and set once") {
            f.registry.emit(f.ledger.id(), PoolCreated{1, 3});
            f.pool.emit(f.ledger.id(), PoolCreated{2, 4});
            f.runtime.run_until_idle();
            REQUIRE_FALSE(f.ledger.launch()->pool_id.has_value());

            f.pool.emit(f.ledger.id(), PoolCreated{1, 7});
            f.pool.emit(f.ledger.id(), PoolCreated{1, 7});
            f.pool.emit(f.ledger.id(), PoolCreated{1, 8});
            f.runtime.run_until_idle();
            REQUIRE(f.ledger.launch()->pool_id == PoolId(7));
        }
    }

    SECTION("Acknowledgment before graduation is ignored") {
        f.pool.emit(f.ledger.id(), PoolCreated{1, 7});
        f.runtime.run_until_idle();
        REQUIRE_FALSE(f.ledger.launch()->pool_id.has_value());
    }
}

TEST_CASE("Ledger trade history", "[ledger]") {
    LedgerFixture f;
    REQUIRE(f.ledger.buy(f.bob, U256(100000), U256::max()).ok());
    REQUIRE(f.ledger.buy(f.alice, U256(1000), U256::max()).ok());
    REQUIRE(f.ledger.sell(f.bob, U256(500), U256()).ok());

    REQUIRE(f.ledger.trade_count() == 3);

    auto all = f.ledger.trades(0, 10);
    REQUIRE(all.size() == 3);
    REQUIRE(all[0].trader == f.bob);
    REQUIRE(all[0].is_buy);
    REQUIRE(all[1].trader == f.alice);
    REQUIRE_FALSE(all[2].is_buy);
    REQUIRE(all[0].id < all[1].id);
    REQUIRE(all[1].id < all[2].id);
    REQUIRE(all[2].id.to_string() == "1003-2");
    REQUIRE(all[2].launch_id == 1);

    auto page = f.ledger.trades(1, 1);
    REQUIRE(page.size() == 1);
    REQUIRE(page[0].id == all[1].id);

    REQUIRE(f.ledger.trades(3, 10).empty());
    REQUIRE(f.ledger.trades(0, 0).empty());

    REQUIRE_FALSE(f.ledger.position(f.carol).has_value());
    REQUIRE(f.ledger.position(f.bob)->trades_count == 2);
    REQUIRE(f.ledger.position(f.bob)->balance == U256(99500));
}
