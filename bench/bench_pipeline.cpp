#include "core/pipeline.hpp"
#include "metrics/timers.hpp"
#include <fmt/format.h>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

using betarank::numeric_block;

static numeric_block make_block(std::size_t rows, std::size_t cols, double missing_frac){
  std::mt19937_64 rng(42);
  std::normal_distribution<double> beta(1.0, 0.4);
  std::uniform_real_distribution<double> u(0.0, 1.0);
  numeric_block b(rows, cols);
  for (std::size_t c=0;c<cols;++c){
    const double scale = 0.5 + static_cast<double>(c % 7);
    for (std::size_t r=0;r<rows;++r){
      if (u(rng) < missing_frac) continue; // stays undefined
      b.columns[c][r] = beta(rng) * scale;
    }
  }
  return b;
}

int main(int argc, char** argv){
  // Defaults
  std::size_t rows = 5000;
  std::size_t cols = 88;
  double missing = 0.01;
  int repeats = 5;

  // Supported:
  //   --rows N | --cols N | --missing F | --repeats N   (also --flag=value)
  for (int i=1;i<argc;++i){
    std::string_view a(argv[i]);
    auto value = [&](std::string_view name)->std::string{
      if (a.size() > name.size() && a.substr(0, name.size()) == name && a[name.size()] == '=')
        return std::string(a.substr(name.size() + 1));
      if (a == name && i+1<argc) return argv[++i];
      return {};
    };
    std::string v;
    if      (!(v = value("--rows")).empty())    rows = static_cast<std::size_t>(std::stoull(v));
    else if (!(v = value("--cols")).empty())    cols = static_cast<std::size_t>(std::stoull(v));
    else if (!(v = value("--missing")).empty()) missing = std::stod(v);
    else if (!(v = value("--repeats")).empty()) repeats = std::stoi(v);
    else {
      fmt::print(stderr,
        "usage: betarank_bench_pipeline [--rows N] [--cols N] [--missing F] [--repeats N]\n");
      return 2;
    }
  }
  if (rows == 0 || cols == 0 || repeats <= 0){
    fmt::print(stderr, "rows, cols and repeats must be > 0\n");
    return 2;
  }

  const numeric_block raw = make_block(rows, cols, missing);

  double best_ms = 0.0;
  std::size_t undefined_cells = 0;
  for (int k=0;k<repeats;++k){
    betarank::WallTimer wt; wt.start();
    const auto out = betarank::transform(raw);
    wt.stop();
    undefined_cells = out.transformed.count_undefined();
    if (k == 0 || wt.ms() < best_ms) best_ms = wt.ms();
  }

  const double cells = double(rows) * double(cols);
  const double secs  = best_ms / 1000.0;
  const double cps   = secs>0? cells/secs : 0.0;

  fmt::print("bench_pipeline,rows={},cols={},undefined={},best_ms={:.3f},cells/s={:.0f}\n",
             rows, cols, undefined_cells, best_ms, cps);
  return 0;
}
