#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/allocation.hpp"
#include "../src/errors.hpp"
#include <numeric>

using namespace debtcalc;
using Catch::Approx;
using Catch::Matchers::WithinAbs;

namespace {

TrancheClaim claim(double balance, double principal = 0.0, double demand = 0.0,
                   int seniority = 0, bool live = true) {
    TrancheClaim c;
    c.live = live;
    c.opening_balance_base = balance;
    c.original_principal_base = principal;
    c.demand_base = demand;
    c.seniority = seniority;
    return c;
}

double sum(const std::vector<double>& v) {
    return std::accumulate(v.begin(), v.end(), 0.0);
}

TrancheAllocator make_allocator(AllocationPolicy policy) {
    AllocatorConfig config;
    config.policy = policy;
    return TrancheAllocator(config);
}

Tranche domestic_tranche(const std::string& id, size_t tenor) {
    Tranche t;
    t.id = id;
    t.currency = Currency::Domestic;
    t.principal = 1000000.0;
    t.rate = 0.10;
    t.tenor_periods = tenor;
    return t;
}

} // anonymous namespace

TEST_CASE("Allocation policy parsing", "[allocation]") {
    REQUIRE(allocation_policy_from_string("pro_rata") == AllocationPolicy::ProRata);
    REQUIRE(allocation_policy_from_string("Pro-Rata") == AllocationPolicy::ProRata);
    REQUIRE(allocation_policy_from_string("prorata") == AllocationPolicy::ProRata);
    REQUIRE(allocation_policy_from_string("priority") == AllocationPolicy::Priority);
    REQUIRE(allocation_policy_from_string("waterfall") == AllocationPolicy::Priority);
    REQUIRE(allocation_policy_to_string(AllocationPolicy::Priority) == "priority");
    REQUIRE_THROWS_AS(allocation_policy_from_string("random"), ConfigurationError);

    AllocatorConfig defaults;
    REQUIRE(defaults.policy == AllocationPolicy::ProRata);
    REQUIRE(defaults.validation_policy == ValidationPolicy::Strict);
    REQUIRE_FALSE(defaults.limits.has_value());
}

TEST_CASE("Pro-rata allocation follows opening balances", "[allocation][pro_rata]") {
    TrancheAllocator allocator = make_allocator(AllocationPolicy::ProRata);

    SECTION("Proportional shares") {
        auto a = allocator.allocate(1, 1000.0, {claim(300.0), claim(100.0)});
        REQUIRE(a.size() == 2);
        REQUIRE(a[0] == Approx(750.0));
        REQUIRE(a[1] == Approx(250.0));
        REQUIRE_THAT(sum(a), WithinAbs(1000.0, 1e-9));
    }

    SECTION("Tranches outside their life get nothing") {
        auto a = allocator.allocate(1, 900.0,
                                    {claim(300.0), claim(500.0, 0.0, 0.0, 0, false), claim(600.0)});
        REQUIRE(a[1] == 0.0);
        REQUIRE(a[0] == Approx(300.0));
        REQUIRE(a[2] == Approx(600.0));
    }

    SECTION("Fully repaid balances fall back to original principals") {
        auto a = allocator.allocate(1, 100.0, {claim(0.0, 3000.0), claim(0.0, 1000.0)});
        REQUIRE(a[0] == Approx(75.0));
        REQUIRE(a[1] == Approx(25.0));
    }

    SECTION("No weights at all splits equally") {
        auto a = allocator.allocate(1, 90.0, {claim(0.0), claim(0.0), claim(0.0)});
        for (double share : a) {
            REQUIRE(share == Approx(30.0));
        }
    }

    SECTION("Negative CFADS is shared the same way") {
        auto a = allocator.allocate(1, -400.0, {claim(300.0), claim(100.0)});
        REQUIRE(a[0] == Approx(-300.0));
        REQUIRE_THAT(sum(a), WithinAbs(-400.0, 1e-9));
    }

    SECTION("Nothing live") {
        auto a = allocator.allocate(1, 500.0, {claim(300.0, 0.0, 0.0, 0, false)});
        REQUIRE(a[0] == 0.0);
    }

    SECTION("Awkward fractions still sum exactly") {
        auto a = allocator.allocate(1, 1.0, {claim(1.0), claim(1.0), claim(1.0)});
        REQUIRE(sum(a) == 1.0);
    }
}

TEST_CASE("Priority allocation serves seniors first", "[allocation][priority]") {
    TrancheAllocator allocator = make_allocator(AllocationPolicy::Priority);

    SECTION("Senior demand met, residual to junior") {
        // Junior listed first to check that seniority, not input order, decides
        auto a = allocator.allocate(1, 1000.0, {claim(500.0, 0.0, 700.0, 1),
                                                claim(500.0, 0.0, 600.0, 0)});
        REQUIRE(a[1] == Approx(600.0));
        REQUIRE(a[0] == Approx(400.0));
    }

    SECTION("Shortfall starves the junior") {
        auto a = allocator.allocate(1, 500.0, {claim(500.0, 0.0, 600.0, 0),
                                               claim(500.0, 0.0, 700.0, 1)});
        REQUIRE(a[0] == Approx(500.0));
        REQUIRE(a[1] == 0.0);
    }

    SECTION("Surplus goes to the most junior live tranche") {
        auto a = allocator.allocate(1, 5000.0, {claim(500.0, 0.0, 600.0, 0),
                                                claim(500.0, 0.0, 700.0, 1),
                                                claim(0.0, 0.0, 0.0, 2, false)});
        REQUIRE(a[0] == Approx(600.0));
        REQUIRE(a[1] == Approx(4400.0));
        REQUIRE(a[2] == 0.0);
    }

    SECTION("Equal seniority keeps input order") {
        auto a = allocator.allocate(1, 1000.0, {claim(500.0, 0.0, 300.0, 0),
                                                claim(500.0, 0.0, 300.0, 0),
                                                claim(500.0, 0.0, 300.0, 0)});
        REQUIRE(a[0] == Approx(300.0));
        REQUIRE(a[1] == Approx(300.0));
        REQUIRE(a[2] == Approx(400.0));
    }

    SECTION("Negative CFADS lands on the residual tranche") {
        auto a = allocator.allocate(1, -100.0, {claim(500.0, 0.0, 600.0, 0),
                                                claim(500.0, 0.0, 700.0, 1)});
        REQUIRE(a[0] == 0.0);
        REQUIRE(a[1] == Approx(-100.0));
    }
}

TEST_CASE("Allocator validation follows its policy", "[allocation][validation]") {
    Tranche t = domestic_tranche("expensive", 5);
    t.rate = 0.40;

    SECTION("No limits configured") {
        REQUIRE(TrancheAllocator().validate({t}).empty());
    }

    SECTION("Strict with limits") {
        AllocatorConfig strict;
        strict.limits = FinancingLimits();
        REQUIRE_THROWS_AS(TrancheAllocator(strict).validate({t}), ConfigurationError);
    }

    SECTION("Permissive with limits") {
        AllocatorConfig permissive;
        permissive.validation_policy = ValidationPolicy::Permissive;
        permissive.limits = FinancingLimits();
        auto findings = TrancheAllocator(permissive).validate({t});
        REQUIRE(findings.warnings.size() == 1);
    }
}

TEST_CASE("Currency conversion helpers", "[allocation][fx]") {
    ExchangeRateSeries fx({0.004, 0.002});
    Tranche domestic = domestic_tranche("lkr", 2);
    Tranche hard = domestic_tranche("usd", 2);
    hard.currency = Currency::HardCurrency;

    REQUIRE(base_to_tranche_currency(400.0, domestic, Currency::HardCurrency, fx, 1) == Approx(100000.0));
    REQUIRE(tranche_to_base_currency(100000.0, domestic, Currency::HardCurrency, fx, 2) == Approx(200.0));

    // Base-currency tranches never consult the series
    REQUIRE(base_to_tranche_currency(400.0, hard, Currency::HardCurrency, fx, 99) == 400.0);
    REQUIRE(tranche_to_base_currency(400.0, hard, Currency::HardCurrency, ExchangeRateSeries(), 1) == 400.0);

    REQUIRE_THROWS_AS(base_to_tranche_currency(1.0, domestic, Currency::HardCurrency, fx, 3),
                      ConfigurationError);
}

TEST_CASE("Exchange-rate coverage check names the first gap", "[allocation][fx]") {
    ExchangeRateSeries fx({0.004, 0.004, 0.004});
    std::vector<Tranche> tranches = {domestic_tranche("short", 3), domestic_tranche("long", 5)};

    try {
        check_exchange_rate_coverage(tranches, Currency::HardCurrency, fx, 1);
        FAIL("expected ConfigurationError");
    } catch (const ConfigurationError& e) {
        REQUIRE(e.tranche_id() == "long");
        REQUIRE(e.period() == 4);
    }

    SECTION("Base-currency tranches need no rates") {
        REQUIRE_NOTHROW(check_exchange_rate_coverage(tranches, Currency::Domestic,
                                                     ExchangeRateSeries(), 1));
    }

    SECTION("Coverage is checked from the first scheduled period") {
        std::vector<Tranche> short_only = {domestic_tranche("short", 3)};
        REQUIRE_NOTHROW(check_exchange_rate_coverage(short_only, Currency::HardCurrency, fx, 1));
        REQUIRE_THROWS_AS(check_exchange_rate_coverage(short_only, Currency::HardCurrency, fx, 2),
                          ConfigurationError);
    }
}
