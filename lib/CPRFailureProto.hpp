#ifndef CPR_VALIDATOR_CPR_FAILURE_PROTO_H_
#define CPR_VALIDATOR_CPR_FAILURE_PROTO_H_

#include "cprvalidator.pb.h"

#include "CPRUtil.hpp"

using cprvalidator::CPRValidateResponse;

// Maps CPRFailure to and from its wire enum.
class CPRFailureProto {
 public:
  static CPRValidateResponse::Failure ToProto(CPRFailure failure) {
    switch (failure) {
      case CPRFailure::kNone: return CPRValidateResponse::NONE;
      case CPRFailure::kFormat: return CPRValidateResponse::FORMAT;
      case CPRFailure::kCalendar: return CPRValidateResponse::CALENDAR;
      case CPRFailure::kChecksum: return CPRValidateResponse::CHECKSUM;
    }
    return CPRValidateResponse::FORMAT;
  }

  // Unknown wire values are treated as format failures.
  static CPRFailure FromProto(CPRValidateResponse::Failure failure) {
    switch (failure) {
      case CPRValidateResponse::NONE: return CPRFailure::kNone;
      case CPRValidateResponse::CALENDAR: return CPRFailure::kCalendar;
      case CPRValidateResponse::CHECKSUM: return CPRFailure::kChecksum;
      default: return CPRFailure::kFormat;
    }
  }
};

#endif  // CPR_VALIDATOR_CPR_FAILURE_PROTO_H_
