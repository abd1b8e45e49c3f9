#include "treehash/treehash.hpp"
#include "treehash/analysis.hpp"
#include "treehash/hash.hpp"
#include "treehash/reduce.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

inline std::string compiler_info() {
#if defined(__clang__)
  return std::string("clang:") + __clang_version__;
#elif defined(__GNUC__)
  return std::string("gcc:") + __VERSION__;
#else
  return "cxx:?";
#endif
}

void print_list(const char* label, const std::vector<std::string>& items) {
  std::cout << "  " << label << " (" << items.size() << ")\n";
  for (std::size_t i = 0; i < items.size(); ++i)
    std::cout << "    [" << i << "] " << items[i] << "\n";
}

void print_trace(const treehash::Trace& t) {
  std::cout << "  message: " << t.original_message << "\n";
  std::cout << "  padded:  " << t.padded << "\n";
  print_list("blocks", t.blocks);
  print_list("stage1", t.initial_hash_outputs);
  for (const auto& r : t.rounds) {
    std::cout << "  round " << r.round << " iv=" << r.computed_new_iv << "\n";
    print_list("in", r.input_hash_outputs);
    print_list("blocks", r.new_blocks);
    print_list("out", r.output_hash_outputs);
  }
  std::cout << "  final:   " << t.final_digest << "\n";
}

int run_stats(const treehash::AnalysisConfig& cfg) {
  auto progress = [&](std::uint64_t done, const treehash::Digest&) {
    static std::uint64_t last = 0;
    const std::uint64_t pct = done * 100 / cfg.samples;
    if (pct / 20 > last) {  // print at ~20% steps
      std::cout << "  " << pct << "%\n";
      last = pct / 20;
    }
  };
  auto res = treehash::analyze(cfg, cfg.enable_progress ? progress : treehash::ProgressCb{});

  std::cout << "samples=" << res.samples << " | collisions=" << res.collisions
            << " | avalanche mean=" << res.mean_avalanche << " min=" << res.min_avalanche
            << " max=" << res.max_avalanche << " | chi2=" << res.chi_square
            << " (df=" << res.buckets.size() - 1 << ")\n";
  std::cout << "buckets:";
  for (auto c : res.buckets) std::cout << " " << c;
  std::cout << "\n";
  return 0;
}

int run(int argc, char** argv) {
  // Flags: --threads=N --trace --compare --hex --bench=N
  //        --stats=N --buckets=N --seed=N --stride=N --no-progress
  treehash::TreeConfig cfg;
  treehash::AnalysisConfig stats;
  unsigned repeats = 1;
  bool trace = false, compare = false, hex_input = false;
  std::uint64_t stats_samples = 0;
  std::vector<std::string> msgs;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    try {
      if (a.rfind("--threads=", 0) == 0) {
        unsigned long v = std::stoul(a.substr(10));
        if (v > std::numeric_limits<std::uint32_t>::max())
          throw std::out_of_range("threads");
        cfg.threads = static_cast<std::uint32_t>(v);
      } else if (a.rfind("--bench=", 0) == 0) {
        repeats = std::stoul(a.substr(8));
      } else if (a.rfind("--stats=", 0) == 0) {
        stats_samples = std::stoull(a.substr(8));
      } else if (a.rfind("--buckets=", 0) == 0) {
        stats.buckets = static_cast<std::uint32_t>(std::stoul(a.substr(10)));
      } else if (a.rfind("--seed=", 0) == 0) {
        stats.seed = std::stoull(a.substr(7));
      } else if (a.rfind("--stride=", 0) == 0) {
        stats.progress_stride = std::stoull(a.substr(9));
      } else if (a == "--no-progress") {
        stats.enable_progress = false;
      } else if (a == "--trace") {
        trace = true;
      } else if (a == "--compare") {
        compare = true;
      } else if (a == "--hex") {
        hex_input = true;
      } else {
        msgs.push_back(a);
      }
    } catch (const std::exception&) {
      std::cerr << "skip '" << a << "'\n";
    }
  }
  if (repeats == 0) repeats = 1;

  if (stats_samples) {
    stats.samples = stats_samples;
    stats.tree.iv = cfg.iv;
    return run_stats(stats);
  }
  if (msgs.empty()) msgs = {"abc"};

  const std::string engine = "threads:" +
                             std::to_string(treehash::effective_threads(cfg.threads)) +
                             "; " + compiler_info();

  for (const auto& m : msgs) {
    std::vector<std::uint8_t> bytes;
    if (hex_input) {
      try { bytes = treehash::from_hex(m); }
      catch (const std::invalid_argument& e) { std::cerr << "skip '" << m << "': " << e.what() << "\n"; continue; }
    } else {
      bytes.assign(m.begin(), m.end());
    }

    std::uint64_t best = UINT64_MAX, sum = 0;
    treehash::DigestTrace res;
    for (unsigned r = 0; r < repeats; ++r) {
      auto t0 = std::chrono::steady_clock::now();
      if (trace) res = treehash::digest_with_trace(bytes, cfg);
      else res.digest = treehash::digest(bytes, cfg);
      auto t1 = std::chrono::steady_clock::now();
      auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
      sum += ns; if ((std::uint64_t)ns < best) best = ns;
    }

    std::cout << treehash::to_hex(res.digest) << "  " << m << "\n";
    if (compare)
      std::cout << treehash::to_hex(treehash::reference_sha256(bytes)) << "  (sha256)\n";
    if (trace)
      print_trace(res.trace);
    if (repeats > 1) {
      std::cout << "  bench repeats=" << repeats << " | best(ns)=" << best
                << " | avg(ns)=" << (sum / repeats) << " | engine=" << engine << "\n";
    }
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  try {
    return run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
