#include <iostream>

void run_config_benchmark();
void run_decision_benchmark();

int main() {
  std::cout << "shellguard benchmarks\n";
  run_config_benchmark();
  run_decision_benchmark();
  return 0;
}
