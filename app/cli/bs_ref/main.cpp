#include <ov/pricing/analytic_bs.hpp>

#include <iostream>
#include <iomanip>
#include <vector>
#include <string>
#include <cstdlib>

struct Case {
  double S, K, T, r, sigma;
};

static void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " [S K T r sigma]\n"
            << "If no arguments are provided, runs 3 reference cases.\n";
}

int main(int argc, char** argv) {
  std::cout.setf(std::ios::fixed);
  std::cout << std::setprecision(6);

  std::vector<Case> cases;
  if (argc == 1) {
    cases.push_back({100.0, 100.0, 1.0, 0.05, 0.20}); // ≈ 10.4506
    cases.push_back({50.0,  45.0,  4.0, 0.0169, 0.30});
    cases.push_back({80.0,  100.0, 2.0, -0.01, 0.35}); // r négatif
  } else if (argc == 6) {
    Case c;
    try {
      c.S     = std::stod(argv[1]);
      c.K     = std::stod(argv[2]);
      c.T     = std::stod(argv[3]);
      c.r     = std::stod(argv[4]);
      c.sigma = std::stod(argv[5]);
    } catch (const std::exception&) {
      print_usage(argv[0]);
      return 1;
    }
    cases.push_back(c);
  } else {
    print_usage(argv[0]);
    return 1;
  }

  std::cout << "      S        K        T        r     sigma         d1         d2        Call\n";
  std::cout << "--------------------------------------------------------------------------------\n";
  for (const auto& c : cases) {
    try {
      const auto d    = ov::pricing::bs_terms(c.S, c.K, c.T, c.r, c.sigma);
      const double px = ov::pricing::price_call_bs(c.S, c.K, c.T, c.r, c.sigma);

      std::cout << std::setw(7)  << c.S    << ' '
                << std::setw(8)  << c.K    << ' '
                << std::setw(8)  << c.T    << ' '
                << std::setw(8)  << c.r    << ' '
                << std::setw(9)  << c.sigma<< ' '
                << std::setw(10) << d.d1   << ' '
                << std::setw(10) << d.d2   << ' '
                << std::setw(11) << px     << '\n';
    } catch (const std::exception& e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 2;
    }
  }
  return 0;
}
