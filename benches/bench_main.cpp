#include <iostream>

void run_config_benchmark();
void run_hashing_benchmark();
void run_gateway_benchmark();
void run_audit_benchmark();

int main() {
  std::cout << "llmgate Benchmarks\n";
  run_config_benchmark();
  run_hashing_benchmark();
  run_gateway_benchmark();
  run_audit_benchmark();
  return 0;
}
