// app_tests.cpp
// Command line, size schemes, driver ticks and batch runs.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <atomic>
#include <sstream>
#include <string>
#include <vector>

#include "app/driver.hpp"
#include "app/schemes.hpp"
#include "cli/cli.hpp"
#include "core/rng.hpp"
#include "sim/batch.hpp"

namespace testutil {

// argv builder for parse_args
struct Argv {
    std::vector<std::string> store;
    std::vector<char*> ptrs;
    explicit Argv(std::vector<std::string> args) : store(std::move(args)) {
        store.insert(store.begin(), "listlife");
        for (auto& s : store) ptrs.push_back(s.data());
    }
    int argc() const { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }
};

inline cli::Options parse(std::vector<std::string> args, bool& want_help) {
    Argv a(std::move(args));
    std::string help;
    return cli::parse_args(a.argc(), a.argv(), want_help, help);
}

} // namespace testutil

TEST_CASE("parse_size accepts WxH and rejects malformed sizes")
{
    auto wh = cli::parse_size("120x90");
    REQUIRE(wh.has_value());
    CHECK(wh->first == 120);
    CHECK(wh->second == 90);
    CHECK(cli::parse_size("8X6").has_value());
    CHECK_FALSE(cli::parse_size("120").has_value());
    CHECK_FALSE(cli::parse_size("0x5").has_value());
    CHECK_FALSE(cli::parse_size("ax5").has_value());
    CHECK_FALSE(cli::parse_size("5x").has_value());
}

TEST_CASE("parse_probability accepts p/q and decimals, clamped to [0,1]")
{
    CHECK(cli::parse_probability("1/4").value() == doctest::Approx(0.25));
    CHECK(cli::parse_probability("0.1").value() == doctest::Approx(0.1));
    CHECK(cli::parse_probability("3/2").value() == doctest::Approx(1.0));
    CHECK(cli::parse_probability("-0.5").value() == doctest::Approx(0.0));
    CHECK_FALSE(cli::parse_probability("abc").has_value());
    CHECK_FALSE(cli::parse_probability("1/0").has_value());
    CHECK_FALSE(cli::parse_probability("").has_value());
}

TEST_CASE("parse_args defaults")
{
    bool help = true;
    const auto o = testutil::parse({}, help);
    CHECK_FALSE(help);
    CHECK(o.exit_code == 0);
    CHECK(o.width == 0);
    CHECK(o.height == 0);
    CHECK(o.density == doctest::Approx(0.1));
    CHECK(o.pattern == life::Pattern::Random);
    CHECK(o.generations == 0);
    CHECK(o.delay_ms == 67);
    CHECK(o.color);
    CHECK(o.experiments == 0);
}

TEST_CASE("parse_args reads size, pattern, density and batch options")
{
    bool help = true;
    const auto o = testutil::parse({"--size", "30x20", "-p", "glider", "-d", "1/3",
                                    "-g", "12", "--seed", "42", "--no-color",
                                    "-e", "8", "--threads", "2"}, help);
    CHECK_FALSE(help);
    CHECK(o.exit_code == 0);
    CHECK(o.width == 30);
    CHECK(o.height == 20);
    CHECK(o.pattern == life::Pattern::Glider);
    CHECK(o.density == doctest::Approx(1.0 / 3.0));
    CHECK(o.generations == 12);
    CHECK(o.seed == 42);
    CHECK_FALSE(o.color);
    CHECK(o.experiments == 8);
    CHECK(o.threads == 2);
}

TEST_CASE("parse_args: scheme fills the size unless --size is given")
{
    bool help = true;
    auto o = testutil::parse({"--scheme", "tablet"}, help);
    CHECK(o.width == 120);
    CHECK(o.height == 90);
    o = testutil::parse({"--scheme", "tablet", "--size", "10x10"}, help);
    CHECK(o.width == 10);
    CHECK(o.height == 10);
}

TEST_CASE("parse_args reports invalid input with exit code 2")
{
    bool help = false;
    CHECK(testutil::parse({"--size", "nope"}, help).exit_code == 2);
    CHECK(help);
    CHECK(testutil::parse({"--pattern", "pulsar"}, help).exit_code == 2);
    CHECK(testutil::parse({"--scheme", "watch"}, help).exit_code == 2);
    CHECK(testutil::parse({"--density", "lots"}, help).exit_code == 2);
    CHECK(testutil::parse({"--experiments", "4"}, help).exit_code == 2); // needs -g
    CHECK(testutil::parse({"--no-such-flag"}, help).exit_code == 2);
}

TEST_CASE("parse_args --help requests help with exit code 0")
{
    bool help = false;
    const auto o = testutil::parse({"--help"}, help);
    CHECK(help);
    CHECK(o.exit_code == 0);
}

TEST_CASE("scheme selection picks the widest scheme that fits the terminal")
{
    CHECK(std::string(app::select_scheme(80).name) == "phone");
    CHECK(std::string(app::select_scheme(200).name) == "desktop");
    CHECK(std::string(app::select_scheme(240).name) == "tablet");
    CHECK(std::string(app::select_scheme(120, 1).name) == "tablet");
    CHECK(std::string(app::select_scheme(10).name) == "phone");
    CHECK(app::parse_scheme("desktop")->columns == 100);
    CHECK_FALSE(app::parse_scheme("watch").has_value());
}

TEST_CASE("driver seeds, settles and ticks a random board")
{
    cli::Options o;
    o.width = 40; o.height = 30; o.seed = 7; o.quiet = true; o.delay_ms = 0; o.generations = 5;
    std::ostringstream out;
    app::Driver d(o, out);
    CHECK(d.width() == 40);
    CHECK(d.ticks() == 0);
    CHECK(d.board().generation() == 1); // one settling advance after seeding
    CHECK(out.str().empty());

    for (int i = 0; i < 5; ++i) {
        const auto rep = d.step();
        CHECK(rep.alive == d.board().alive_count());
    }
    CHECK(d.ticks() == 5);
    d.board().state().for_each_cell([&](life::coord_t x, life::coord_t y){
        if (d.ages().in_bounds(x, y)) CHECK(d.ages().age(x, y) > 0);
    });
}

TEST_CASE("driver places patterns at the centre and draws frames")
{
    cli::Options o;
    o.width = 10; o.height = 10; o.pattern = life::Pattern::Block; o.color = false;
    std::ostringstream out;
    app::Driver d(o, out);
    CHECK(d.board().alive_count() == 4);
    CHECK(d.board().is_alive(4, 4));
    CHECK(d.board().is_alive(5, 5));
    CHECK(out.str().find("generation: 0  cells: 4") != std::string::npos);
    d.step();
    CHECK(out.str().find("generation: 1  cells: 4") != std::string::npos);

    const auto t = d.toggle(0, 0);
    CHECK(t.kind == life::TransitionKind::Born);
    CHECK(d.ages().age(0, 0) == 1);
}

TEST_CASE("driver run writes its final summary to the given stream")
{
    cli::Options o;
    o.width = 10; o.height = 10; o.pattern = life::Pattern::Block;
    o.quiet = true; o.delay_ms = 0; o.generations = 3;
    std::ostringstream out;
    app::Driver d(o, out);
    CHECK(d.run() == 0);
    CHECK(d.ticks() == 3);
    CHECK(out.str() == "generation: 3  cells: 4\n");
}

TEST_CASE("batch runs are deterministic for a fixed master seed")
{
    sim::BatchConfig cfg{ .experiments = 16, .width = 20, .height = 20, .density = 0.25,
                          .generations = 40, .threads = 2 };
    core::SplitMix64 m1(2024), m2(2024);
    std::atomic<std::size_t> calls{0};
    std::atomic<bool> totals_ok{true};
    const auto a = sim::run_batch(cfg, m1, [&](std::size_t, std::size_t total){
        if (total != 16) totals_ok.store(false);
        calls.fetch_add(1);
    });
    const auto b = sim::run_batch(cfg, m2);

    CHECK(calls.load() == 16);
    CHECK(totals_ok.load());
    REQUIRE(a.runs.size() == 16);
    REQUIRE(b.runs.size() == 16);
    std::uint64_t sum = 0;
    std::size_t extinct = 0;
    for (std::size_t i = 0; i < a.runs.size(); ++i) {
        CHECK(a.runs[i].final_alive == b.runs[i].final_alive);
        CHECK(a.runs[i].initial_alive == 100);
        CHECK(a.runs[i].generations <= 40);
        sum += a.runs[i].final_alive;
        extinct += (a.runs[i].final_alive == 0);
    }
    CHECK(a.total_final_alive == sum);
    CHECK(a.extinct == extinct);
    CHECK(a.average_final_alive() == doctest::Approx(static_cast<double>(sum) / 16.0));
}

TEST_CASE("a single batch run matches stepping the same board by hand")
{
    sim::BatchConfig cfg{ .experiments = 1, .width = 16, .height = 16, .density = 0.4,
                          .generations = 25, .threads = 0 };
    const auto r = sim::run_single(cfg, 555);

    core::SplitMix64 rng(555);
    life::ListLife board;
    life::seed_random(board, 16, 16, 0.4, rng);
    for (std::uint64_t g = 0; g < r.generations; ++g) board.advance();
    CHECK(board.alive_count() == r.final_alive);
}
