#ifndef CPR_VALIDATOR_CPR_VALIDATOR_CLIENT_H_
#define CPR_VALIDATOR_CPR_VALIDATOR_CLIENT_H_

#include <grpcpp/grpcpp.h>
#include <iostream>
#include <memory>
#include <string>

#include "cprvalidator.grpc.pb.h"

#include "CPRUtil.hpp"
#include "CPRFailureProto.hpp"

using grpc::Channel;
using grpc::ClientContext;
using grpc::Status;

using cprvalidator::CPRValidator;
using cprvalidator::CPRValidateRequest;
using cprvalidator::CPRValidateResponse;

class CPRValidatorClient {
 public:
  // Asks the server for a verdict. Returns false if the call itself failed,
  // in which case valid and failure are left untouched.
  bool Validate(const std::string& cpr, bool* valid, CPRFailure* failure) {
    CPRValidateRequest request;
    request.set_cpr(cpr);
    CPRValidateResponse response;
    ClientContext context;
    Status status = stub_->Validate(&context, request, &response);
    if (!status.ok()) {
      std::cerr << status.error_code() << ": " << status.error_message() << std::endl;
      return false;
    }
    *valid = response.valid();
    *failure = CPRFailureProto::FromProto(response.failure());
    return true;
  }

  static std::unique_ptr<CPRValidatorClient> New(const std::string& target) {
    auto insecure_credentials = grpc::InsecureChannelCredentials();
    auto grpc_channel = grpc::CreateChannel(target, insecure_credentials);
    return std::unique_ptr<CPRValidatorClient>(new CPRValidatorClient(grpc_channel));
  }

 private:
  CPRValidatorClient(std::shared_ptr<Channel> channel)
      : stub_(CPRValidator::NewStub(channel)) {}

  std::unique_ptr<CPRValidator::Stub> stub_;
};

#endif  // CPR_VALIDATOR_CPR_VALIDATOR_CLIENT_H_
