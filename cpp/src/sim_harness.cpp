// Scenario harness: replays JSON action sequences against a transmuter backed
// by in-memory oracle, tokens and manager, and dumps ledger snapshots.
#include "transmuter/errors.hpp"
#include "transmuter/feed_oracle.hpp"
#include "transmuter/memory_tokens.hpp"
#include "transmuter/transmuter.hpp"
#include <iostream>
#include <fstream>
#include <boost/json.hpp>
#include <boost/json/src.hpp>
#include <algorithm>
#include <cstdlib>
#include <limits>
#include <vector>
#include <string>
#include <thread>
#include <mutex>
#include <atomic>

using namespace transmuter;
namespace json = boost::json;

namespace {

std::string str_of(const json::value& v) { return std::string(v.as_string().c_str()); }

uint256 amount_of(const json::object& o, const char* key) { return uint256(str_of(o.at(key))); }

std::string string_or(const json::object& o, const char* key, const std::string& fallback) {
    return o.if_contains(key) ? str_of(o.at(key)) : fallback;
}

ActionType action_of(const json::object& o) {
    const std::string side = str_of(o.at("action"));
    if (side == "mint") return ActionType::Mint;
    if (side == "burn") return ActionType::Burn;
    throw std::invalid_argument("unknown action side: " + side);
}

std::vector<uint64_t> breakpoints_of(const json::value& v) {
    std::vector<uint64_t> out;
    for (const auto& e : v.as_array()) out.push_back(static_cast<uint64_t>(e.as_int64()));
    return out;
}

std::vector<int64_t> fees_of(const json::value& v) {
    std::vector<int64_t> out;
    for (const auto& e : v.as_array()) out.push_back(e.as_int64());
    return out;
}

// Everything one scenario mutates. Workers never share a world.
struct World {
    FeedOracle oracle;
    MemoryTokens tokens;
    MemoryManager manager;
    Transmuter transmuter;

    World(const std::string& stablecoin, const uint256& user_deviation, const uint256& burn_ratio_deviation)
        : oracle(user_deviation, burn_ratio_deviation),
          tokens(stablecoin),
          manager(tokens),
          transmuter(stablecoin, oracle, manager, tokens) {}
};

struct Report {
    static json::object to_json(const World& w) {
        const Ledger& ledger = w.transmuter.ledger();
        json::object o;
        o["timestamp"] = w.transmuter.block_timestamp();
        o["normalizer"] = ledger.normalizer.str();
        o["normalized_stables"] = ledger.normalized_stables.str();
        o["total_issued"] = w.transmuter.get_total_issued().str();
        o["stablecoin_supply"] = w.tokens.total_supply(ledger.stablecoin).str();
        json::object collats;
        for (const auto& asset : ledger.collateral_list) {
            const Collateral& collat = ledger.collateral(asset);
            json::object c;
            c["normalized_stables"] = collat.normalized_stables.str();
            c["issued"] = w.transmuter.get_issued_by_collateral(asset).first.str();
            c["custody"] = w.tokens.balance_of(asset, collat.is_managed ? collat.manager_config : w.tokens.vault()).str();
            c["mint_live"] = collat.is_mint_live;
            c["burn_live"] = collat.is_burn_live;
            collats[asset] = c;
        }
        o["collaterals"] = collats;
        return o;
    }
};

void setup_world(World& w, const json::object& scenario) {
    Transmuter& t = w.transmuter;
    if (scenario.if_contains("start_timestamp")) t.set_block_timestamp(static_cast<uint64_t>(scenario.at("start_timestamp").as_int64()));
    if (scenario.if_contains("feeds")) {
        for (const auto& kv : scenario.at("feeds").as_object()) w.oracle.set_feed(std::string(kv.key().data(), kv.key().size()), uint256(str_of(kv.value())));
    }
    if (scenario.if_contains("trusted")) {
        for (const auto& a : scenario.at("trusted").as_array()) t.toggle_trusted(str_of(a));
    }
    for (const auto& cv : scenario.at("collaterals").as_array()) {
        const auto& c = cv.as_object();
        const std::string asset = str_of(c.at("asset"));
        t.add_collateral(asset, static_cast<uint8_t>(c.at("decimals").as_int64()));
        const auto& oracle = c.at("oracle").as_object();
        t.set_oracle(asset, str_of(oracle.at("target")), str_of(oracle.at("spot")));
        t.set_fees(asset, breakpoints_of(c.at("x_fee_mint")), fees_of(c.at("y_fee_mint")), ActionType::Mint);
        t.set_fees(asset, breakpoints_of(c.at("x_fee_burn")), fees_of(c.at("y_fee_burn")), ActionType::Burn);
        if (c.if_contains("manager")) {
            const std::string account = str_of(c.at("manager"));
            w.manager.attach(asset, account);
            t.set_manager(asset, account);
        }
        // collaterals are registered paused
        const bool paused = c.if_contains("paused") && c.at("paused").as_bool();
        if (!paused) {
            t.toggle_pause(asset, ActionType::Mint);
            t.toggle_pause(asset, ActionType::Burn);
        }
        if (c.if_contains("issued")) t.adjust_stablecoins(asset, uint256(str_of(c.at("issued"))), true);
    }
    if (scenario.if_contains("balances")) {
        for (const auto& bv : scenario.at("balances").as_array()) {
            const auto& b = bv.as_object();
            w.tokens.credit(str_of(b.at("token")), str_of(b.at("account")), amount_of(b, "amount"));
        }
    }
}

// Returns the amount the action produced, empty when it has none
std::string apply_action(World& w, const json::object& act) {
    Transmuter& t = w.transmuter;
    const std::string type = str_of(act.at("type"));
    const uint64_t deadline = act.if_contains("deadline")
        ? static_cast<uint64_t>(act.at("deadline").as_int64())
        : std::numeric_limits<uint64_t>::max();

    if (type == "swap_exact_input") {
        const std::string caller = str_of(act.at("caller"));
        const uint256 min_out = act.if_contains("limit") ? amount_of(act, "limit") : uint256(0);
        return t.swap_exact_input(caller, amount_of(act, "amount"), min_out, str_of(act.at("token_in")),
                                  str_of(act.at("token_out")), string_or(act, "to", caller), deadline).str();
    } else if (type == "swap_exact_output") {
        const std::string caller = str_of(act.at("caller"));
        const uint256 max_in = act.if_contains("limit") ? amount_of(act, "limit") : std::numeric_limits<uint256>::max();
        return t.swap_exact_output(caller, amount_of(act, "amount"), max_in, str_of(act.at("token_in")),
                                   str_of(act.at("token_out")), string_or(act, "to", caller), deadline).str();
    } else if (type == "quote_in") {
        return t.quote_in(amount_of(act, "amount"), str_of(act.at("token_in")), str_of(act.at("token_out"))).str();
    } else if (type == "quote_out") {
        return t.quote_out(amount_of(act, "amount"), str_of(act.at("token_in")), str_of(act.at("token_out"))).str();
    } else if (type == "set_feed") {
        w.oracle.set_feed(str_of(act.at("feed")), amount_of(act, "price"));
    } else if (type == "time_travel") {
        if (act.if_contains("seconds")) t.advance_time(static_cast<uint64_t>(act.at("seconds").as_int64()));
        else t.set_block_timestamp(static_cast<uint64_t>(act.at("timestamp").as_int64()));
    } else if (type == "update_normalizer") {
        return t.update_normalizer(str_of(act.at("caller")), amount_of(act, "amount"), act.at("increase").as_bool()).str();
    } else if (type == "adjust_stablecoins") {
        t.adjust_stablecoins(str_of(act.at("asset")), amount_of(act, "amount"), act.at("increase").as_bool());
    } else if (type == "toggle_pause") {
        t.toggle_pause(str_of(act.at("asset")), action_of(act));
    } else if (type == "revoke_collateral") {
        t.revoke_collateral(str_of(act.at("asset")));
    } else if (type == "deploy") {
        w.manager.deploy(str_of(act.at("asset")), amount_of(act, "amount"));
    } else {
        throw std::invalid_argument("unknown action type: " + type);
    }
    return std::string();
}

} // namespace

int run_harness(const std::string& scenarios_file, const std::string& output_file) {
    try {
        std::ifstream sf(scenarios_file); if (!sf) throw std::runtime_error("Cannot open scenarios file"); std::string s1((std::istreambuf_iterator<char>(sf)), std::istreambuf_iterator<char>());
        json::array scenarios = json::parse(s1).as_object().at("scenarios").as_array();
        if (scenarios.empty()) throw std::runtime_error("No scenarios found");

        bool save_last_only = false;
        if (const char* slo = std::getenv("SAVE_LAST_ONLY")) {
            if (std::string(slo) == "1") save_last_only = true;
        }
        size_t threads = std::max<size_t>(1, std::thread::hardware_concurrency());
        if (const char* thr = std::getenv("CPP_THREADS")) {
            const unsigned long v = std::strtoul(thr, nullptr, 10);
            if (v > 0) threads = static_cast<size_t>(v);
        }
        threads = std::min(threads, scenarios.size());

        std::vector<json::object> results(scenarios.size()); std::atomic<size_t> next{0}; std::mutex io_mu;

        auto worker = [&]() {
            for (;;) {
                size_t idx = next.fetch_add(1); if (idx >= scenarios.size()) break;
                const auto& scenario = scenarios[idx].as_object();
                std::string name;
                try {
                    name = str_of(scenario.at("name"));
                    {
                        std::lock_guard<std::mutex> lk(io_mu); std::cout << "Processing " << name << "..." << std::endl;
                    }
                    World w(str_of(scenario.at("stablecoin")),
                            uint256(string_or(scenario, "user_deviation", "0")),
                            uint256(string_or(scenario, "burn_ratio_deviation", "0")));
                    setup_world(w, scenario);

                    json::array states;
                    if (!save_last_only) states.push_back(Report::to_json(w));
                    size_t failed = 0;
                    for (const auto& a : scenario.at("actions").as_array()) {
                        const auto& act = a.as_object();
                        bool success = true; std::string error; std::string amount;
                        try {
                            amount = apply_action(w, act);
                        } catch (const std::exception& e) { success = false; error = e.what(); ++failed; }
                        if (save_last_only) continue;
                        auto st = Report::to_json(w);
                        st["action"] = act.at("type");
                        st["action_success"] = success;
                        if (!amount.empty()) st["amount"] = amount;
                        if (!success) st["error"] = error;
                        states.push_back(st);
                    }

                    json::object tr; tr["scenario"] = name;
                    json::object res; res["success"] = true; res["failed_actions"] = failed;
                    if (save_last_only) res["final_state"] = Report::to_json(w);
                    else res["states"] = states;
                    tr["result"] = res; results[idx] = std::move(tr);
                } catch (const std::exception& e) {
                    // A broken scenario is reported and the others keep running
                    json::object tr; tr["scenario"] = name;
                    json::object res; res["success"] = false; res["error"] = e.what();
                    tr["result"] = res; results[idx] = std::move(tr);
                }
            }
        };
        std::vector<std::thread> ws; ws.reserve(threads); for (size_t t=0;t<threads;++t) ws.emplace_back(worker); for (auto& th:ws) th.join();
        json::array out; for (auto& r : results) out.push_back(r);
        json::object O; O["results"] = out; O["metadata"] = json::object{{"scenarios_file", scenarios_file}, {"total_scenarios", scenarios.size()}};
        std::ofstream of(output_file); of << json::serialize(O) << std::endl; return 0;
    } catch (const std::exception& e) { std::cerr << "Error: " << e.what() << std::endl; return 1; }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <scenarios.json> <output.json>" << std::endl; return 1;
    }
    return run_harness(argv[1], argv[2]);
}
