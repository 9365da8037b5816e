// Fair Launch - Demo
// Creates a launch, trades it up to the supply cap and swaps on the locked pool

#include <fairlaunch/fairlaunch.hpp>
#include <iostream>

using namespace fairlaunch;

int main(int argc, char** argv) {
    Config config;
    try {
        if (argc > 1) config = Config::from_file(argv[1]);
    } catch (const std::exception& e) {
        std::cerr << "config: " << e.what() << "\n";
        return 1;
    }

    // Small cap so the demo graduates
    CurveConfig curve = config.curve;
    curve.max_supply = U256(2000000);

    FairLaunch fl(config);
    fl.start();

    Account creator(1, addresses::from_u64(0xC0FFEE));
    Account alice(1, addresses::from_u64(0xA11CE));
    Account bob(1, addresses::from_u64(0xB0B));

    if (fl.custody().deposit(alice, 10000000) != errors::OK ||
        fl.custody().deposit(bob, 10000000) != errors::OK) {
        std::cerr << "deposit failed\n";
        return 1;
    }

    TokenMetadata metadata;
    metadata.name = "Demo Token";
    metadata.symbol = "DEMO";
    metadata.description = "Bonding curve demo";
    metadata.website = "https://demo.example";

    auto created = fl.create_token(creator, metadata, curve);
    if (!created.ok()) {
        std::cerr << "create_token failed: " << error_name(created.status) << "\n";
        return 1;
    }
    std::cout << "Launch " << created.launch_id << " on ledger actor " << created.ledger << "\n";

    auto first = fl.buy(created.launch_id, alice, U256(500000), U256::max());
    if (!first.ok()) {
        std::cerr << "buy failed: " << error_name(first.status) << "\n";
        return 1;
    }
    std::cout << "Alice bought " << first.token_amount << " for " << first.currency_amount
              << " (fee " << first.fee << ", price now " << first.price_after << ")\n";

    auto sold = fl.sell(created.launch_id, alice, U256(100000), U256());
    if (!sold.ok()) {
        std::cerr << "sell failed: " << error_name(sold.status) << "\n";
        return 1;
    }
    std::cout << "Alice sold " << sold.token_amount << " for " << sold.currency_amount << "\n";

    auto remaining = fl.launch(created.launch_id);
    U256 rest = remaining->curve_config.max_supply - remaining->current_supply;
    auto last = fl.buy(created.launch_id, bob, rest, U256::max());
    if (!last.ok()) {
        std::cerr << "buy failed: " << error_name(last.status) << "\n";
        return 1;
    }
    std::cout << "Bob bought the remaining " << last.token_amount
              << (last.graduated ? " and graduated the launch" : "") << "\n";

    fl.settle();

    auto pool = fl.pool_for_launch(created.launch_id);
    if (!pool) {
        std::cerr << "pool was not created\n";
        return 1;
    }
    std::cout << "Pool " << pool->id << ": tokens=" << pool->token_reserve
              << " currency=" << pool->currency_reserve << " tvl=" << pool->tvl << "\n";

    auto swapped = fl.swap(pool->id, SwapDirection::CURRENCY_TO_TOKEN, U256(10000), U256());
    std::cout << "Swap 10000 currency -> " << swapped.amount_out << " tokens ("
              << error_name(swapped.status) << ")\n";

    std::cout << "add_liquidity: "
              << error_name(fl.add_liquidity(pool->id, U256(1), U256(1))) << "\n";

    auto stats = fl.get_stats();
    std::cout << "Messages sent=" << stats.runtime.messages_sent
              << " delivered=" << stats.runtime.messages_delivered
              << " pools=" << stats.pool.total_pools << "\n";

    fl.stop();
    return 0;
}
