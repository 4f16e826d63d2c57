// cli.cpp: Command-line parsing implementation using cxxopts

#include "cli/cli.hpp"

#include <cxxopts.hpp>
#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>
#include <iostream>
#include <optional>

#include "app/schemes.hpp"

namespace cli {
static inline std::optional<std::pair<std::uint64_t,std::uint64_t>> parse_pq(std::string_view s) {
    auto pos = s.find('/');
    if (pos == std::string_view::npos) return std::nullopt;
    std::string_view sp = s.substr(0, pos);
    std::string_view sq = s.substr(pos + 1);
    std::uint64_t p=0, q=0;
    auto to_u64 = [](std::string_view x, std::uint64_t& out)->bool{
        const char* b = x.data();
        const char* e = b + x.size();
        auto res = std::from_chars(b, e, out); return res.ec == std::errc{} && res.ptr == e;
    };
    if (!to_u64(sp, p) || !to_u64(sq, q) || q == 0) return std::nullopt;
    return std::make_pair(p,q);
}

std::optional<std::pair<core::coord_t, core::coord_t>> parse_size(const std::string& s) {
    auto pos = s.find_first_of("xX");
    if (pos == std::string::npos) return std::nullopt;
    auto to_coord = [](std::string_view x, core::coord_t& out)->bool{
        const char* b = x.data();
        const char* e = b + x.size();
        auto res = std::from_chars(b, e, out); return res.ec == std::errc{} && res.ptr == e && out > 0;
    };
    core::coord_t w = 0, h = 0;
    const std::string_view sv(s);
    if (!to_coord(sv.substr(0, pos), w) || !to_coord(sv.substr(pos + 1), h)) return std::nullopt;
    return std::make_pair(w, h);
}

std::optional<double> parse_probability(const std::string& s) {
    double v = 0.0;
    if (auto pq = parse_pq(std::string_view(s))) {
        v = static_cast<double>(pq->first) / static_cast<double>(pq->second);
    } else {
        if (s.empty()) return std::nullopt;
        char* endp = nullptr;
        v = std::strtod(s.c_str(), &endp);
        if (!endp || *endp != '\0') return std::nullopt;
    }
    if (v < 0.0) v = 0.0;
    if (v > 1.0) v = 1.0;
    return v;
}

Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text) {
    Options opt;
    want_help = false;

    std::string size_s;
    std::string density_s;
    std::string pattern_s;
    bool no_color = false;

    cxxopts::Options desc("listlife", "Sparse Conway's Game of Life (List Life) in the terminal");
    desc.add_options()
        ("h,help", "Show this help")
        ("s,size", "Board size WxH (default: scheme chosen from terminal width)", cxxopts::value<std::string>(size_s))
        ("scheme", "Fixed size scheme: phone|tablet|desktop", cxxopts::value<std::string>(opt.scheme))
        ("d,density", "Initial live probability as p/q or decimal", cxxopts::value<std::string>(density_s)->default_value("0.1"))
        ("p,pattern", "Initial state: random|block|blinker|glider", cxxopts::value<std::string>(pattern_s)->default_value("random"))
        ("g,generations", "Generations to run (0 = until interrupted)", cxxopts::value<std::uint64_t>(opt.generations)->default_value("0"))
        ("delay-ms", "Delay between generations in milliseconds", cxxopts::value<unsigned>(opt.delay_ms)->default_value("67"))
        ("seed", "Master seed (0 = random; SEED env var also honoured)", cxxopts::value<std::uint64_t>(opt.seed)->default_value("0"))
        ("no-color", "Plain-text frames", cxxopts::value<bool>(no_color))
        ("q,quiet", "Do not draw frames; print the final summary only", cxxopts::value<bool>(opt.quiet))
        ("e,experiments", "Batch mode: number of random boards to run", cxxopts::value<std::size_t>(opt.experiments)->default_value("0"))
        ("threads", "Batch threads (0 = TBB default)", cxxopts::value<int>(opt.threads)->default_value("0"))
        ("progress", "Show a progress bar in batch mode", cxxopts::value<bool>(opt.progress))
    ;
    help_text = desc.help();

    auto fail = [&](const std::string& msg) {
        std::cerr << "ERROR: " << msg << "\n";
        want_help = true;
        opt.exit_code = 2;
        return opt;
    };

    bool help_requested = false;
    try {
        auto result = desc.parse(argc, argv);
        help_requested = result.count("help") > 0;
    } catch (const cxxopts::exceptions::exception& e) {
        return fail(e.what());
    }
    if (help_requested) { want_help = true; return opt; }

    opt.color = !no_color;

    if (!size_s.empty()) {
        auto wh = parse_size(size_s);
        if (!wh) return fail("--size must be WxH with positive integers");
        opt.width = wh->first;
        opt.height = wh->second;
    }

    if (!opt.scheme.empty()) {
        auto sc = app::parse_scheme(opt.scheme);
        if (!sc) return fail("--scheme must be 'phone', 'tablet' or 'desktop'");
        if (size_s.empty()) { opt.width = sc->columns; opt.height = sc->rows; }
    }

    if (auto d = parse_probability(density_s)) opt.density = *d;
    else return fail("--density expects p/q or a decimal");

    if (auto p = life::parse_pattern(pattern_s)) opt.pattern = *p;
    else return fail("--pattern must be 'random', 'block', 'blinker' or 'glider'");

    if (opt.seed == 0) {
        if (const char* es = std::getenv("SEED")) {
            unsigned long long v = std::strtoull(es, nullptr, 10);
            if (v != 0ULL) opt.seed = static_cast<std::uint64_t>(v);
        }
    }

    if (opt.experiments > 0 && opt.generations == 0)
        return fail("batch mode (--experiments) needs --generations > 0");

    return opt;
}

} // namespace cli
