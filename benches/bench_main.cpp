#include <iostream>

void run_record_benchmark();
void run_storage_benchmark();
void run_token_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "Chronicle Benchmarks\n";
  run_record_benchmark();
  run_storage_benchmark();
  run_token_benchmark();
  run_config_benchmark();
  return 0;
}
