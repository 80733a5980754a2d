#include <iostream>

void run_config_benchmark();
void run_ingest_benchmark();
void run_index_benchmark();

int main() {
  std::cout << "nexarag benchmarks\n";
  run_config_benchmark();
  run_ingest_benchmark();
  run_index_benchmark();
  return 0;
}
