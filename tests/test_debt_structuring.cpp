#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/debt_structuring.hpp"
#include "../src/errors.hpp"

using namespace debtcalc;
using Catch::Approx;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Helper functions for setting up test data
// ============================================================================

namespace {

Tranche make_tranche(const std::string& id, double principal, double rate, size_t tenor,
                     AmortizationStyle style, double target = 0.0) {
    Tranche t;
    t.id = id;
    t.currency = Currency::HardCurrency;
    t.principal = principal;
    t.rate = rate;
    t.tenor_periods = tenor;
    t.style = style;
    t.target_dscr = target;
    return t;
}

StructuringOptions options_with(AllocationPolicy policy,
                                SculptFallback fallback = SculptFallback::None) {
    StructuringOptions options;
    options.allocator.policy = policy;
    options.sculpt_fallback = fallback;
    options.run_id = "test";
    return options;
}

} // anonymous namespace

TEST_CASE("Sculpt fallback parsing", "[structuring]") {
    REQUIRE(sculpt_fallback_from_string("annuity") == SculptFallback::Annuity);
    REQUIRE(sculpt_fallback_from_string("None") == SculptFallback::None);
    REQUIRE(sculpt_fallback_from_string("error") == SculptFallback::None);
    REQUIRE(sculpt_fallback_from_string("") == SculptFallback::None);
    REQUIRE(sculpt_fallback_to_string(SculptFallback::Annuity) == "annuity");
    REQUIRE_THROWS_AS(sculpt_fallback_from_string("bullet"), ConfigurationError);
}

TEST_CASE("Single tranche structuring matches the standalone schedule", "[structuring]") {
    Tranche t = make_tranche("a", 1000000.0, 0.08, 5, AmortizationStyle::Annuity);
    CfadsSeries cfads(std::vector<double>(5, 300000.0));

    DebtStructurer structurer;
    DebtSchedule schedule = structurer.run({t}, cfads);

    auto standalone = build_schedule(t, {});

    REQUIRE(schedule.first_period == 1);
    REQUIRE(schedule.maturity_period == 5);
    REQUIRE(schedule.consolidated.size() == 5);
    REQUIRE(schedule.tranches.size() == 1);
    REQUIRE(schedule.fallback_tranches.empty());

    for (size_t p = 1; p <= 5; ++p) {
        REQUIRE(schedule.at(p).total_service == Approx(standalone[p - 1].total_service));
        REQUIRE(schedule.opening_balance(p) == Approx(standalone[p - 1].outstanding_balance_start));
        // Sole tranche receives the whole period's CFADS
        REQUIRE(schedule.tranches[0].cfads_allocation[p - 1] == 300000.0);
    }

    REQUIRE_THROWS_AS(schedule.at(0), std::out_of_range);
    REQUIRE_THROWS_AS(schedule.at(6), std::out_of_range);
    REQUIRE(schedule.tranche("a").maturity_period() == 5);
    REQUIRE_THROWS_AS(schedule.tranche("missing"), std::out_of_range);
}

TEST_CASE("Pro-rata sculpted tranches behave like one combined tranche", "[structuring][sculpted]") {
    std::vector<Tranche> tranches = {
        make_tranche("a", 600000.0, 0.08, 4, AmortizationStyle::Sculpted, 1.25),
        make_tranche("b", 400000.0, 0.08, 4, AmortizationStyle::Sculpted, 1.25)
    };
    CfadsSeries cfads(std::vector<double>(4, 400000.0));

    DebtSchedule schedule = DebtStructurer(options_with(AllocationPolicy::ProRata)).run(tranches, cfads);

    REQUIRE(schedule.at(1).principal_paid == Approx(240000.0));
    REQUIRE(schedule.at(2).principal_paid == Approx(259200.0));
    REQUIRE(schedule.at(3).principal_paid == Approx(279936.0));
    REQUIRE(schedule.at(4).principal_paid == Approx(220864.0));
    REQUIRE_THAT(schedule.at(4).outstanding_balance_end, WithinAbs(0.0, 1e-6));

    for (size_t p = 1; p <= 3; ++p) {
        REQUIRE(cfads.get(p) / schedule.total_debt_service(p) == Approx(1.25));
    }

    // First period split follows the 60/40 balances
    REQUIRE(schedule.tranches[0].cfads_allocation[0] == Approx(240000.0));
    REQUIRE(schedule.tranches[1].cfads_allocation[0] == Approx(160000.0));
}

TEST_CASE("Sixty-forty pro-rata split of a 10m CFADS base", "[structuring][pro_rata]") {
    std::vector<Tranche> tranches = {
        make_tranche("senior", 6000000.0, 0.07, 5, AmortizationStyle::Annuity),
        make_tranche("junior", 4000000.0, 0.07, 5, AmortizationStyle::Annuity)
    };
    CfadsSeries cfads(std::vector<double>(5, 10000000.0));

    DebtSchedule schedule = DebtStructurer(options_with(AllocationPolicy::ProRata)).run(tranches, cfads);

    const TrancheSchedule& senior = schedule.tranche("senior");
    const TrancheSchedule& junior = schedule.tranche("junior");
    REQUIRE(senior.cfads_allocation_base.size() == 5);
    REQUIRE(junior.cfads_allocation_base.size() == 5);

    for (size_t k = 0; k < 5; ++k) {
        INFO("period " << k + 1);
        REQUIRE(senior.cfads_allocation_base[k] == Approx(6000000.0));
        REQUIRE(junior.cfads_allocation_base[k] == Approx(4000000.0));
        // Residual to the last tranche keeps the split exact
        REQUIRE(senior.cfads_allocation_base[k] + junior.cfads_allocation_base[k] ==
                cfads.get(k + 1));
    }
}

TEST_CASE("Default structurer accepts any internally consistent tranche", "[structuring][validation]") {
    SECTION("Large balloon") {
        Tranche t = make_tranche("balloon", 1000000.0, 0.08, 5, AmortizationStyle::Annuity);
        t.balloon_fraction = 0.30;
        CfadsSeries cfads(std::vector<double>(5, 400000.0));

        DebtSchedule schedule = DebtStructurer().run({t}, cfads);
        REQUIRE(schedule.tranche("balloon").final_balance() == Approx(300000.0));
        REQUIRE(schedule.findings.empty());
    }

    SECTION("Monthly periods over ten years") {
        Tranche t = make_tranche("monthly", 1000000.0, 0.005, 120, AmortizationStyle::Annuity);
        CfadsSeries cfads(std::vector<double>(120, 15000.0));

        DebtSchedule schedule = DebtStructurer().run({t}, cfads);
        REQUIRE(schedule.maturity_period == 120);
        REQUIRE(schedule.tranche("monthly").entries.size() == 120);
        REQUIRE_THAT(schedule.tranche("monthly").final_balance(), WithinAbs(0.0, 1e-6));
    }

    SECTION("Limits apply once configured") {
        Tranche t = make_tranche("monthly", 1000000.0, 0.005, 120, AmortizationStyle::Annuity);
        CfadsSeries cfads(std::vector<double>(120, 15000.0));

        StructuringOptions options;
        options.allocator.limits = FinancingLimits();
        REQUIRE_THROWS_AS(DebtStructurer(options).run({t}, cfads), ConfigurationError);
    }
}

TEST_CASE("Consolidated rows sum the live tranches", "[structuring]") {
    std::vector<Tranche> tranches = {
        make_tranche("short", 300000.0, 0.06, 3, AmortizationStyle::Annuity),
        make_tranche("long", 700000.0, 0.08, 5, AmortizationStyle::Sculpted, 1.30)
    };
    tranches[0].balloon_fraction = 0.05;
    CfadsSeries cfads(std::vector<double>(5, 400000.0));

    DebtSchedule schedule = DebtStructurer(options_with(AllocationPolicy::ProRata)).run(tranches, cfads);

    REQUIRE(schedule.maturity_period == 5);
    REQUIRE(schedule.tranche("short").entries.size() == 3);
    REQUIRE(schedule.tranche("long").entries.size() == 5);

    for (size_t p = 1; p <= 5; ++p) {
        INFO("period " << p);
        double service = 0.0;
        double allocated = 0.0;
        for (const auto& ts : schedule.tranches) {
            if (p < ts.first_period() || p > ts.maturity_period()) continue;
            service += ts.entries[p - ts.first_period()].total_service;
            allocated += ts.cfads_allocation_base[p - ts.first_period()];
        }
        REQUIRE(schedule.at(p).total_service == Approx(service));
        REQUIRE_THAT(allocated, WithinAbs(cfads.get(p), 1e-6));
    }

    // After the short tranche matures, its balloon no longer counts
    REQUIRE(schedule.tranche("short").final_balance() == Approx(15000.0));
    REQUIRE(schedule.opening_balance(4) ==
            Approx(schedule.tranche("long").entries[3].outstanding_balance_start));
}

TEST_CASE("Priority allocation structures seniors on their demand", "[structuring][priority]") {
    Tranche senior = make_tranche("senior", 500000.0, 0.08, 4, AmortizationStyle::Sculpted, 1.25);
    senior.seniority = 0;
    Tranche junior = make_tranche("junior", 200000.0, 0.10, 4, AmortizationStyle::Annuity);
    junior.seniority = 1;

    CfadsSeries cfads(std::vector<double>(4, 400000.0));
    DebtSchedule schedule =
        DebtStructurer(options_with(AllocationPolicy::Priority)).run({junior, senior}, cfads);

    const auto& s = schedule.tranche("senior");
    // Senior demand in period 1: 1.25 * (interest + balance)
    REQUIRE(s.cfads_allocation[0] == Approx(400000.0));
    REQUIRE(schedule.tranche("junior").cfads_allocation[0] == Approx(0.0));
}

TEST_CASE("Infeasible sculpting propagates or falls back", "[structuring][fallback]") {
    Tranche t = make_tranche("sculpted", 1000000.0, 0.08, 4, AmortizationStyle::Sculpted, 1.25);
    CfadsSeries cfads({200000.0, 220000.0, 50000.0, 240000.0});

    SECTION("No fallback") {
        DebtStructurer structurer(options_with(AllocationPolicy::ProRata, SculptFallback::None));
        try {
            structurer.run({t}, cfads);
            FAIL("expected InfeasibleSculptError");
        } catch (const InfeasibleSculptError& e) {
            REQUIRE(e.tranche_id() == "sculpted");
            REQUIRE(e.period() == 3);
            REQUIRE(e.shortfall() == Approx(31760.0));
        }
    }

    SECTION("Annuity fallback") {
        DebtStructurer structurer(options_with(AllocationPolicy::ProRata, SculptFallback::Annuity));
        DebtSchedule schedule = structurer.run({t}, cfads);

        REQUIRE(schedule.fallback_tranches == std::vector<std::string>{"sculpted"});
        const auto& ts = schedule.tranche("sculpted");
        REQUIRE(ts.fell_back_to_annuity);
        REQUIRE(ts.tranche.style == AmortizationStyle::Annuity);
        REQUIRE(schedule.at(1).total_service == Approx(annuity_payment(0.08, 4, 1000000.0)));
        REQUIRE(ts.final_balance() == 0.0);

        // Caller's tranche is untouched
        REQUIRE(t.style == AmortizationStyle::Sculpted);
    }
}

TEST_CASE("Structurer rejects inputs it cannot schedule", "[structuring][validation]") {
    Tranche t = make_tranche("a", 1000000.0, 0.08, 5, AmortizationStyle::Annuity);

    SECTION("CFADS shorter than the debt") {
        CfadsSeries cfads(std::vector<double>(3, 300000.0));
        try {
            DebtStructurer().run({t}, cfads);
            FAIL("expected ConfigurationError");
        } catch (const ConfigurationError& e) {
            REQUIRE(e.period() == 4);
        }
    }

    SECTION("Non-base tranche without exchange rates") {
        Tranche domestic = t;
        domestic.currency = Currency::Domestic;
        CfadsSeries cfads(std::vector<double>(5, 300000.0), Currency::HardCurrency);
        REQUIRE_THROWS_AS(DebtStructurer().run({domestic}, cfads), ConfigurationError);
    }

    SECTION("Duplicate ids") {
        CfadsSeries cfads(std::vector<double>(5, 300000.0));
        REQUIRE_THROWS_AS(DebtStructurer().run({t, t}, cfads), ConfigurationError);
    }

    SECTION("Period numbering starts at 1") {
        StructuringOptions options;
        options.first_period = 0;
        REQUIRE_THROWS_AS(DebtStructurer(options), ConfigurationError);
    }
}

TEST_CASE("Non-base tranches are consolidated at the period rate", "[structuring][fx]") {
    Tranche t = make_tranche("lkr", 1000000.0, 0.0, 2, AmortizationStyle::Annuity);
    t.currency = Currency::Domestic;

    CfadsSeries cfads({1000.0, 1000.0}, Currency::HardCurrency);
    ExchangeRateSeries fx({0.5, 0.25});

    DebtSchedule schedule = DebtStructurer().run({t}, cfads, fx);
    const auto& ts = schedule.tranche("lkr");

    // Tranche currency: 500,000 principal per period
    REQUIRE(ts.entries[0].principal_paid == Approx(500000.0));
    REQUIRE(ts.cfads_allocation_base[0] == Approx(1000.0));
    REQUIRE(ts.cfads_allocation[0] == Approx(2000.0));
    REQUIRE(ts.cfads_allocation[1] == Approx(4000.0));

    // Base currency rows use each period's own rate
    REQUIRE(schedule.opening_balance(1) == Approx(500000.0));
    REQUIRE(schedule.at(1).principal_paid == Approx(250000.0));
    REQUIRE(schedule.opening_balance(2) == Approx(125000.0));
    REQUIRE(schedule.base_currency == Currency::HardCurrency);
}

TEST_CASE("Structuring can start at a later period", "[structuring]") {
    Tranche t = make_tranche("late", 1000000.0, 0.08, 3, AmortizationStyle::Sculpted, 1.25);
    CfadsSeries cfads({1.0, 1.0, 500000.0, 500000.0, 500000.0});

    StructuringOptions options;
    options.first_period = 3;
    DebtSchedule schedule = DebtStructurer(options).run({t}, cfads);

    REQUIRE(schedule.first_period == 3);
    REQUIRE(schedule.maturity_period == 5);
    REQUIRE_FALSE(schedule.covers(2));
    REQUIRE(schedule.at(3).period == 3);
    REQUIRE(schedule.tranche("late").cfads_allocation[0] == 500000.0);
    REQUIRE(schedule.at(3).principal_paid == Approx(500000.0 / 1.25 - 80000.0));
}
