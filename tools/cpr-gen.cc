#include <iostream>
#include <string>
#include <random>
#include <cstdlib>

#include "CPRUtil.hpp"

void PrintUsage() {
  std::cout << "Usage: ./cpr-gen count" << std::endl;
}

int main(int argc, char** argv) {
  // Check argument count.
  if (argc != 2) {
    PrintUsage();
    exit(1);
  }

  int n = atoi(argv[1]);
  if (n < 0) {
    PrintUsage();
    exit(1);
  }

  std::random_device rd;
  std::mt19937 mt(rd());
  std::uniform_int_distribution<int> digit_dist(0, 9);
  std::uniform_int_distribution<int> month_dist(1, 12);
  std::uniform_int_distribution<int> day_dist(1, 31);
  while (n > 0) {
    CPRDigits d;
    int month = month_dist(mt);
    int day = day_dist(mt);
    d[0] = day / 10;
    d[1] = day % 10;
    d[2] = month / 10;
    d[3] = month % 10;
    // Days past the end of the month are drawn again.
    if (!CPRUtil::CheckCalendar(d)) {
      continue;
    }
    for (int i = 4; i < 9; ++i) {
      d[i] = digit_dist(mt);
    }
    // The last digit has weight 1, so it alone has to bring the sum to a
    // multiple of 11. A remainder of 1 cannot be fixed, draw again.
    d[9] = 0;
    int last_digit = (11 - CPRUtil::WeightedSum(d) % 11) % 11;
    if (last_digit == 10) {
      continue;
    }
    d[9] = last_digit;
    std::cout << CPRUtil::ToString(d) << "\n";
    --n;
  }
  std::cout.flush();

  return 0;
}
