#include <functional>
#include <limits>

#include <boost/test/unit_test.hpp>

#include <transmuter/errors.hpp>
#include <transmuter/setters.hpp>
#include <transmuter/swapper.hpp>

#include "transmuter_fixture.hpp"

using namespace transmuter;
using namespace transmuter::test;

namespace {

// Gateway that runs a callback before minting, to reach back into the engine
class hooked_tokens : public MemoryTokens {
public:
   using MemoryTokens::MemoryTokens;
   std::function<void()> on_mint;

   void mint(const std::string& to, const uint256& amount) override {
      if (on_mint) on_mint();
      MemoryTokens::mint(to, amount);
   }
};

const uint256 bob_minted("499500499500499500499");

}

BOOST_FIXTURE_TEST_SUITE(swapper_tests, transmuter_fixture)

BOOST_AUTO_TEST_CASE(first_mint_moves_tokens) {
   BOOST_CHECK_EQUAL(mint_in("alice", "EUROC", e6(1000)), e18(1000));

   BOOST_CHECK_EQUAL(tokens.balance_of("agEUR", "alice"), e18(1000));
   BOOST_CHECK_EQUAL(tokens.balance_of("EUROC", "alice"), e6(9000));
   BOOST_CHECK_EQUAL(tokens.balance_of("EUROC", tokens.vault()), e6(1000));
   BOOST_CHECK_EQUAL(tm.get_issued_by_collateral("EUROC").first, e18(1000));
   BOOST_CHECK_EQUAL(tm.get_total_issued(), e18(1000));
   check_counters();
}

BOOST_AUTO_TEST_CASE(mint_and_burn_sequence) {
   mint_in("alice", "EUROC", e6(1000));
   BOOST_CHECK_EQUAL(mint_in("bob", "bERNX", e18(500)), bob_minted);
   check_counters();

   // 66% exposure: on the second mint segment
   BOOST_CHECK_EQUAL(mint_in("alice", "EUROC", e6(200)), uint256("199581257764758728652"));
   check_counters();
   tm.swap_exact_input("alice", e18(100), 0, "agEUR", "EUROC", "alice", 2000);
   check_counters();

   BOOST_CHECK_EQUAL(tokens.total_supply("agEUR"), tm.get_total_issued());
}

BOOST_AUTO_TEST_CASE(burn_on_flat_segment) {
   mint_in("alice", "EUROC", e6(1000));
   mint_in("bob", "bERNX", e18(500));

   BOOST_CHECK_EQUAL(tm.quote_in(e18(100), "agEUR", "EUROC"), uint256(99700000));
   BOOST_CHECK_EQUAL(burn_in("alice", "EUROC", e18(100)), uint256(99700000));
   BOOST_CHECK_EQUAL(tm.get_issued_by_collateral("EUROC").first, e18(900));
   BOOST_CHECK_EQUAL(tokens.balance_of("EUROC", "alice"), e6(9000) + 99700000);
   check_counters();
}

BOOST_AUTO_TEST_CASE(exact_output_swaps) {
   BOOST_CHECK_EQUAL(tm.quote_out(e18(1000), "EUROC", "agEUR"), e6(1000));
   BOOST_CHECK_EQUAL(tm.swap_exact_output("alice", e18(1000), e6(1000), "EUROC", "agEUR", "alice", 2000), e6(1000));
   BOOST_CHECK_EQUAL(tokens.balance_of("agEUR", "alice"), e18(1000));
   mint_in("bob", "bERNX", e18(500));

   // 0.3% burn fee on 50 EUROC out
   const uint256 cost("50150451354062186560");
   BOOST_CHECK_EQUAL(tm.quote_out(e6(50), "agEUR", "EUROC"), cost);
   BOOST_CHECK_EQUAL(tm.swap_exact_output("alice", e6(50), e18(100), "agEUR", "EUROC", "alice", 2000), cost);
   BOOST_CHECK_EQUAL(tokens.balance_of("agEUR", "alice"), e18(1000) - cost);
   check_counters();
}

BOOST_AUTO_TEST_CASE(round_trip_quotes) {
   mint_in("alice", "EUROC", e6(1000));
   mint_in("bob", "bERNX", e18(500));

   const uint256 out = tm.quote_in(e6(300), "EUROC", "agEUR");
   const uint256 in = tm.quote_out(out, "EUROC", "agEUR");
   BOOST_CHECK_GE(in, e6(300) - 1);
   BOOST_CHECK_LE(in, e6(300) + 1);
}

BOOST_AUTO_TEST_CASE(rejected_swaps) {
   mint_in("alice", "EUROC", e6(1000));

   TRANSMUTER_CHECK_ERROR(tm.swap_exact_input("alice", e6(1), 0, "EUROC", "bERNX", "alice", 2000), ErrorKind::InvalidTokens);
   TRANSMUTER_CHECK_ERROR(tm.swap_exact_input("alice", e6(1), 0, "DAI", "agEUR", "alice", 2000), ErrorKind::NotCollateral);
   TRANSMUTER_CHECK_ERROR(tm.swap_exact_input("alice", e6(1), 0, "EUROC", "agEUR", "alice", 999), ErrorKind::TooLate);
   TRANSMUTER_CHECK_ERROR(tm.swap_exact_input("alice", e6(1), e18(1) + 1, "EUROC", "agEUR", "alice", 2000), ErrorKind::TooSmallAmountOut);
   TRANSMUTER_CHECK_ERROR(tm.swap_exact_output("alice", e18(1), e6(1) - 1, "EUROC", "agEUR", "alice", 2000), ErrorKind::TooBigAmountIn);

   tm.toggle_pause("EUROC", ActionType::Burn);
   BOOST_CHECK(tm.is_paused("EUROC", ActionType::Burn));
   BOOST_CHECK(!tm.is_paused("EUROC", ActionType::Mint));
   TRANSMUTER_CHECK_ERROR(burn_in("alice", "EUROC", e18(1)), ErrorKind::Paused);
   TRANSMUTER_CHECK_ERROR(tm.quote_in(e18(1), "agEUR", "EUROC"), ErrorKind::Paused);

   // none of the above touched the ledger
   BOOST_CHECK_EQUAL(tm.get_total_issued(), e18(1000));

   // minting stays open, at the 1% fee of full exposure
   const uint256 minted = mint_in("alice", "EUROC", e6(1));
   BOOST_CHECK_EQUAL(minted, uint256("990099009900990099"));
   BOOST_CHECK_EQUAL(tm.get_total_issued(), e18(1000) + minted);
   check_counters();
}

// The deadline is inclusive
BOOST_AUTO_TEST_CASE(deadline_boundary) {
   tm.set_block_timestamp(2000);
   mint_in("alice", "EUROC", e6(1));
   tm.advance_time(1);
   TRANSMUTER_CHECK_ERROR(mint_in("alice", "EUROC", e6(1)), ErrorKind::TooLate);
}

BOOST_AUTO_TEST_CASE(burn_limited_to_issued) {
   mint_in("alice", "EUROC", e6(100));
   mint_in("bob", "bERNX", e18(500));
   TRANSMUTER_CHECK_ERROR(burn_in("bob", "EUROC", e18(101)), ErrorKind::InvalidSwap);
   check_counters();
}

BOOST_AUTO_TEST_CASE(manager_liquidity_guard) {
   manager.attach("bERNX", "strategy");
   tm.set_manager("bERNX", "strategy");
   mint_in("bob", "bERNX", e18(500));
   BOOST_CHECK_EQUAL(tokens.balance_of("bERNX", "strategy"), e18(500));

   manager.deploy("bERNX", e18(450));
   BOOST_CHECK_EQUAL(manager.max_available("bERNX"), e18(50));

   TRANSMUTER_CHECK_ERROR(tm.quote_in(e18(100), "agEUR", "bERNX"), ErrorKind::InvalidSwap);
   TRANSMUTER_CHECK_ERROR(burn_in("bob", "bERNX", e18(100)), ErrorKind::InvalidSwap);
   TRANSMUTER_CHECK_ERROR(tm.quote_out(e18(51), "agEUR", "bERNX"), ErrorKind::InvalidSwap);

   BOOST_CHECK_EQUAL(burn_in("bob", "bERNX", e18(40)), uint256("39920000000000000000"));
   BOOST_CHECK_EQUAL(tokens.balance_of("bERNX", "strategy"), e18(500) - uint256("39920000000000000000"));

   // Detaching recalls everything into the vault
   tm.unset_manager("bERNX");
   BOOST_CHECK_EQUAL(tokens.balance_of("bERNX", "strategy"), uint256(0));
   BOOST_CHECK_EQUAL(tokens.balance_of("bERNX", tokens.vault()), e18(500) - uint256("39920000000000000000"));
   BOOST_CHECK_EQUAL(burn_in("bob", "bERNX", e18(100)), uint256("99800000000000000000"));
}

// A failing token movement leaves the counters untouched
BOOST_AUTO_TEST_CASE(settlement_rolls_back) {
   mint_in("alice", "EUROC", e6(1000));
   const uint256 before = tm.ledger().normalized_stables;

   BOOST_CHECK_THROW(mint_in("carol", "EUROC", e6(1)), std::runtime_error);
   BOOST_CHECK_EQUAL(tm.ledger().normalized_stables, before);
   BOOST_CHECK_EQUAL(tm.get_issued_by_collateral("EUROC").first, e18(1000));

   // carol holds no stablecoins to burn either
   BOOST_CHECK_THROW(burn_in("carol", "EUROC", e18(1)), std::runtime_error);
   BOOST_CHECK_EQUAL(tm.ledger().normalized_stables, before);
   check_counters();
}

// A mint that would overflow the total fails before either counter or any token moves
BOOST_AUTO_TEST_CASE(mint_overflow_keeps_counters) {
   Ledger ledger;
   ledger.stablecoin = "agEUR";
   Setters::add_collateral(ledger, "EUROC", 6);
   Setters::set_oracle(ledger, "EUROC", "EUR", "EUR");
   Setters::set_fees(ledger, "EUROC", {0}, {0}, ActionType::Mint);
   Setters::toggle_pause(ledger, "EUROC", ActionType::Mint);
   const uint256 near_max = std::numeric_limits<uint256>::max() - e18(1);
   ledger.normalized_stables = near_max;

   Swapper swapper(oracle, manager, tokens);
   BOOST_CHECK_THROW(swapper.swap_exact_input(ledger, "alice", e6(10), 0, "EUROC", "agEUR", "alice", 10, 0),
                     std::overflow_error);
   BOOST_CHECK_EQUAL(ledger.collateral("EUROC").normalized_stables, uint256(0));
   BOOST_CHECK_EQUAL(ledger.normalized_stables, near_max);
   BOOST_CHECK_EQUAL(tokens.balance_of("EUROC", "alice"), e6(10000));
   BOOST_CHECK_EQUAL(tokens.total_supply("agEUR"), uint256(0));
}

BOOST_AUTO_TEST_CASE(reentrant_swap_is_rejected) {
   FeedOracle feeds;
   feeds.set_feed("EUR", e18(1));
   hooked_tokens hooked("agEUR");
   MemoryManager idle(hooked);
   Transmuter engine("agEUR", feeds, idle, hooked);
   engine.add_collateral("EUROC", 6);
   engine.set_oracle("EUROC", "EUR", "EUR");
   engine.set_fees("EUROC", {0}, {0}, ActionType::Mint);
   engine.set_fees("EUROC", {1000000000}, {0}, ActionType::Burn);
   engine.toggle_pause("EUROC", ActionType::Mint);
   engine.set_block_timestamp(0);
   hooked.credit("EUROC", "alice", e6(10));

   hooked.on_mint = [&]() { engine.swap_exact_input("alice", e6(1), 0, "EUROC", "agEUR", "alice", 10); };
   TRANSMUTER_CHECK_ERROR(engine.swap_exact_input("alice", e6(1), 0, "EUROC", "agEUR", "alice", 10), ErrorKind::ReentrantCall);
   BOOST_CHECK_EQUAL(engine.get_total_issued(), uint256(0));

   // the guard is released once the failed call unwinds
   hooked.on_mint = nullptr;
   BOOST_CHECK_EQUAL(engine.swap_exact_input("alice", e6(1), 0, "EUROC", "agEUR", "alice", 10), e18(1));
}

BOOST_AUTO_TEST_SUITE_END()
