#ifndef CPR_VALIDATOR_CPR_VALIDATOR_SERVICE_IMPL_H_
#define CPR_VALIDATOR_CPR_VALIDATOR_SERVICE_IMPL_H_

#include <iostream>
#include <mutex>

#include "cprvalidator.grpc.pb.h"

#include "CPRFailureProto.hpp"
#include "CPRUtil.hpp"

using grpc::ServerContext;
using grpc::Status;

using cprvalidator::CPRValidator;
using cprvalidator::CPRValidateRequest;
using cprvalidator::CPRValidateResponse;

class CPRValidatorServiceImpl final : public CPRValidator::Service {
 public:
  explicit CPRValidatorServiceImpl(bool quiet)
      : quiet_(quiet) {
  }

  Status Validate(ServerContext* context, const CPRValidateRequest* request,
                  CPRValidateResponse* response) override {
    CPRFailure failure = CPRUtil::Validate(request->cpr());
    response->set_valid(failure == CPRFailure::kNone);
    response->set_failure(CPRFailureProto::ToProto(failure));
    if (!quiet_) {
      // Only the verdict is logged, never the number.
      cout_mutex_.lock();
      std::cout << "Validate " << CPRUtil::FailureName(failure) << std::endl;
      cout_mutex_.unlock();
    }
    return Status::OK;
  }

 private:
  std::mutex cout_mutex_;
  bool quiet_;
};

#endif  // CPR_VALIDATOR_CPR_VALIDATOR_SERVICE_IMPL_H_
