#include <iostream>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <functional>

#include "CPRUtil.hpp"
#include "CPRValidatorClient.hpp"

using namespace std::chrono;

void PrintUsage() {
  std::cerr << "Usage: ./cli local|server_address [quiet|time|reason]" << std::endl;
}

int main(int argc, char** argv) {
  // Check argument count.
  if (argc < 2 || argc > 3) {
    PrintUsage();
    exit(1);
  }

  std::string target(argv[1]);

  // Sort out output mode arg.
  bool quiet = false, time = false, reason = false;
  if (argc == 3) {
    if (strcmp(argv[2], "quiet") == 0) {
      quiet = true;
    } else if (strcmp(argv[2], "time") == 0) {
      time = true;
    } else if (strcmp(argv[2], "reason") == 0) {
      reason = true;
    } else {
      PrintUsage();
      exit(1);
    }
  }

  // Init client unless we validate in process.
  std::unique_ptr<CPRValidatorClient> cpr_validator_client;
  if (target != "local") {
    cpr_validator_client = CPRValidatorClient::New(target);
  }

  auto local_fn = [] (const std::string& cpr, bool* valid, CPRFailure* failure) -> bool {
    *failure = CPRUtil::Validate(cpr);
    *valid = *failure == CPRFailure::kNone;
    return true;
  };
  auto remote_fn = [&] (const std::string& cpr, bool* valid, CPRFailure* failure) -> bool {
    return cpr_validator_client->Validate(cpr, valid, failure);
  };

  std::function<bool(const std::string&, bool*, CPRFailure*)> f;
  if (cpr_validator_client == nullptr) {
    f = local_fn;
  } else {
    f = remote_fn;
  }

  // Read all lines, validate each.
  std::ios::sync_with_stdio(false);
  std::string cpr;

  int line_count = 0;
  auto start = high_resolution_clock::now();
  while (std::getline(std::cin, cpr)) {
    bool valid = false;
    CPRFailure failure = CPRFailure::kNone;
    if (!f(cpr, &valid, &failure)) {
      exit(1);
    }
    ++line_count;
    if (quiet) continue;
    std::cout << (valid ? "true" : "false");
    if (reason && !valid) {
      std::cout << " " << CPRUtil::FailureName(failure);
    }
    std::cout << "\n";
  }
  std::cout.flush();
  if (line_count == 0) return 1;
  auto stop = high_resolution_clock::now();
  auto duration_ms = duration_cast<milliseconds>(stop - start);
  auto duration_s = duration_cast<seconds>(stop - start);
  if (time) {
    std::cout << "Took " << duration_ms.count() << "ms." << std::endl;
    if (duration_s.count() > 0) {
      long long qps = line_count / duration_s.count();
      std::cout << "QPS: " << qps << std::endl;
    }
    std::cout << "Average request duration: "
              << duration_ms.count() / line_count << "ms." << std::endl;
  }

  return 0;
}
