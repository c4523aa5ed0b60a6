#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <string>
#include <random>
#include <fstream>
#include <iostream>

// Writes a synthetic factor beta CSV: Symbol, Company Name, then <factors>
// numeric columns. With messy=1, some cells are blank or "n/a" (both read as
// missing), use thousands separators, carry a unicode minus or are junk text.
int main(int argc, char** argv){
  if (argc < 5){
    std::cerr << "usage: gen_synth_csv <out.csv> <rows> <factors> <messy:0|1>\n";
    return 2;
  }
  const std::string out = argv[1];
  const std::uint64_t rows = std::strtoull(argv[2], nullptr, 10);
  const std::uint64_t factors = std::strtoull(argv[3], nullptr, 10);
  const bool messy = std::string(argv[4]) == "1";

  std::ofstream f(out, std::ios::binary);
  if (!f){ std::cerr << "open failed: " << out << "\n"; return 2; }

  // header
  f << "Symbol,Company Name";
  for (std::uint64_t c=1;c<=factors;++c) f << ",Factor_" << c;
  f << "\n";

  std::mt19937_64 rng(42);
  std::normal_distribution<double> beta(0.9, 0.5);
  std::uniform_int_distribution<int> pick(0, 99);
  const char* words[] = {"Alpha","Bravo","Charlie","Delta","Echo","Foxtrot"};
  for (std::uint64_t i=1;i<=rows;++i){
    char sym[16];
    std::snprintf(sym, sizeof(sym), "T%05llu", static_cast<unsigned long long>(i));
    f << sym << ",\"" << words[i % 6] << " Holdings, Inc.\"";

    for (std::uint64_t c=1;c<=factors;++c){
      double v = beta(rng) * static_cast<double>(c % 5 + 1);
      if (c % 9 == 0) v *= 1000.0;   // large enough for thousands separators
      char buf[64];
      std::snprintf(buf, sizeof(buf), "%.6f", v);
      std::string cell = buf;

      if (messy){
        const int roll = pick(rng);
        if (roll < 2) cell.clear();
        else if (roll < 3) cell = "n/a";
        else if (roll < 6 && cell[0] == '-') cell = "\xE2\x88\x92" + cell.substr(1);
        else if (std::abs(v) >= 1000.0){
          // 1234.5 -> "1,234.5" (quoted)
          const auto dot = cell.find('.');
          std::string ip = cell.substr(0, dot), fp = cell.substr(dot);
          const std::size_t sign = (ip[0] == '-') ? 1 : 0;
          for (std::size_t p = ip.size(); p > sign + 3; p -= 3) ip.insert(p - 3, ",");
          cell = "\"" + ip + fp + "\"";
        }
      }
      f << "," << cell;
    }
    f << "\n";
  }
  std::cerr << "wrote " << rows << " rows x " << factors << " factors to " << out << "\n";
  return 0;
}
