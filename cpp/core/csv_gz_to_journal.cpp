#include "converter.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
  try {
    if (argc != 3) {
      std::cerr << "Usage: csv_gz_to_journal <input.csv.gz> <output.journal>\n";
      return 2;
    }
    (void)auction::journal::convert(argv[1], argv[2]);
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] " << e.what() << "\n";
    return 1;
  }
}
