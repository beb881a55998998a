#pragma once

#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

#include <transmuter/errors.hpp>
#include <transmuter/feed_oracle.hpp>
#include <transmuter/memory_tokens.hpp>
#include <transmuter/transmuter.hpp>

namespace transmuter { namespace test {

inline uint256 e18(uint64_t units) { return uint256(units) * BASE_18; }
inline uint256 e6(uint64_t units) { return uint256(units) * BASE_6; }

// BOOST_CHECK_THROW cannot look at the error kind
#define TRANSMUTER_CHECK_ERROR(statement, expected_kind)                               \
   do {                                                                                \
      bool thrown_ = false;                                                            \
      try { statement; }                                                               \
      catch (const transmuter::TransmuterError& e_) {                                  \
         thrown_ = true;                                                               \
         BOOST_CHECK_MESSAGE(e_.kind() == (expected_kind), "unexpected error: " << e_.what()); \
      }                                                                                \
      BOOST_CHECK_MESSAGE(thrown_, #statement " did not throw");                       \
   } while (false)

// Mint curve used across the suites: free up to 50% exposure, then rising to 1%
const std::vector<uint64_t> mint_x = {0, 500000000, 990000000};
const std::vector<int64_t> mint_y = {0, 2000000, 10000000};
// Burn curve: flat 0.3% until exposure drops to 60%, then rising to 1% at 30%
const std::vector<uint64_t> burn_x = {1000000000, 600000000, 300000000};
const std::vector<int64_t> burn_y = {3000000, 3000000, 10000000};

// Two live collaterals priced against the same EUR target: EUROC (6 decimals)
// with the curves above and bERNX (18 decimals) with constant fees.
struct transmuter_fixture {
   FeedOracle oracle;
   MemoryTokens tokens{"agEUR"};
   MemoryManager manager{tokens};
   Transmuter tm{"agEUR", oracle, manager, tokens};

   transmuter_fixture() {
      oracle.set_feed("EUR", e18(1));
      oracle.set_feed("EUROC", e18(1));
      oracle.set_feed("bERNX", e18(1));

      add_live("EUROC", 6, mint_x, mint_y, burn_x, burn_y);
      add_live("bERNX", 18, {0}, {1000000}, {1000000000}, {2000000});

      tm.toggle_trusted("keeper");
      tm.set_block_timestamp(1000);

      tokens.credit("EUROC", "alice", e6(10000));
      tokens.credit("bERNX", "bob", e18(10000));
   }

   void add_live(const std::string& asset, uint8_t decimals,
                 const std::vector<uint64_t>& xm, const std::vector<int64_t>& ym,
                 const std::vector<uint64_t>& xb, const std::vector<int64_t>& yb) {
      tm.add_collateral(asset, decimals);
      tm.set_oracle(asset, "EUR", asset);
      tm.set_fees(asset, xm, ym, ActionType::Mint);
      tm.set_fees(asset, xb, yb, ActionType::Burn);
      tm.toggle_pause(asset, ActionType::Mint);
      tm.toggle_pause(asset, ActionType::Burn);
   }

   uint256 mint_in(const std::string& caller, const std::string& asset, const uint256& amount) {
      return tm.swap_exact_input(caller, amount, 0, asset, "agEUR", caller, 2000);
   }

   uint256 burn_in(const std::string& caller, const std::string& asset, const uint256& amount) {
      return tm.swap_exact_input(caller, amount, 0, "agEUR", asset, caller, 2000);
   }

   // Sum of the per-collateral counters against the global one
   void check_counters() const {
      const Ledger& ledger = tm.ledger();
      uint256 sum = 0;
      for (const auto& asset : ledger.collateral_list) {
         sum += ledger.collateral(asset).normalized_stables;
      }
      BOOST_CHECK_EQUAL(sum, ledger.normalized_stables);
   }
};

} } // namespace transmuter::test
