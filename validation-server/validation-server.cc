#include <iostream>
#include <memory>
#include <string>
#include <cstdlib>
#include <cstring>
#include <pthread.h>
#include <signal.h>
#include <thread>

#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>

#include "CPRValidatorServiceImpl.hpp"

using grpc::Server;
using grpc::ServerBuilder;

void PrintUsage() {
  std::cerr << "Usage: ./validation-server [listen_address] [quiet]" << std::endl;
}

// Blocks SIGINT in the calling thread. Must run before any other thread is
// started so that every gRPC thread inherits the mask and the signal is only
// ever picked up by WaitForSigInt.
void BlockSigInt(sigset_t* sig_int_set) {
  sigemptyset(sig_int_set);
  sigaddset(sig_int_set, SIGINT);
  pthread_sigmask(SIG_BLOCK, sig_int_set, nullptr);
}

void WaitForSigInt(const sigset_t& sig_int_set) {
  int signal_number = 0;
  while (sigwait(&sig_int_set, &signal_number) != 0 || signal_number != SIGINT) {
  }
  std::cout << "Caught SIGINT." << std::endl;
}

int RunServer(const std::string& server_address, bool quiet) {
  sigset_t sig_int_set;
  BlockSigInt(&sig_int_set);

  CPRValidatorServiceImpl service(quiet);
  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();
  ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<Server> server(builder.BuildAndStart());
  if (server == nullptr) {
    std::cerr << "Could not listen on " << server_address << std::endl;
    return 1;
  }
  std::cout << "Server listening on " << server_address << std::endl;
  std::thread t([&] () -> void { server->Wait(); });
  WaitForSigInt(sig_int_set);
  server->Shutdown();
  t.join();
  return 0;
}

int main(int argc, char** argv) {
  // Check argument count.
  if (argc > 3) {
    PrintUsage();
    exit(1);
  }

  std::string server_address("0.0.0.0:12000");
  bool quiet = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "quiet") == 0) {
      quiet = true;
    } else if (i == 1) {
      server_address = argv[i];
    } else {
      PrintUsage();
      exit(1);
    }
  }

  int result = RunServer(server_address, quiet);
  std::cout << "Bye." << std::endl;
  return result;
}
