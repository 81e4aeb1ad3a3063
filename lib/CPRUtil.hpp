#ifndef CPR_VALIDATOR_CPR_UTIL_H_
#define CPR_VALIDATOR_CPR_UTIL_H_

#include <array>
#include <cstddef>
#include <string>

// Positional digit values of a normalized CPR (DDMMYYSSSS).
typedef std::array<int, 10> CPRDigits;

// Stage at which a candidate was rejected.
enum class CPRFailure {
  kNone,
  kFormat,
  kCalendar,
  kChecksum,
};

class CPRUtil {
 public:
  static const char* FailureName(CPRFailure failure) {
    switch (failure) {
      case CPRFailure::kNone: return "none";
      case CPRFailure::kFormat: return "format";
      case CPRFailure::kCalendar: return "calendar";
      case CPRFailure::kChecksum: return "checksum";
    }
    return "unknown";
  }

  // Removes every '-' from the supplied string and checks that exactly 10
  // ASCII digits remain. On success the digits are written to digits_out.
  static bool Normalize(const std::string& raw, CPRDigits* digits_out) {
    int count = 0;
    for (char c : raw) {
      if (c == '-') {
        continue;
      }
      // Only ASCII digits are accepted, isdigit() would depend on the locale.
      if (c < '0' || c > '9') {
        return false;
      }
      if (count == 10) {
        // More than 10 digits.
        return false;
      }
      (*digits_out)[count++] = c - '0';
    }
    return count == 10;
  }

  // Checks day and month against the fixed day count table. February always
  // allows 29 days (no leap year rule) and day 00 passes.
  static bool CheckCalendar(const CPRDigits& digits) {
    int day = digits[0] * 10 + digits[1];
    int month = digits[2] * 10 + digits[3];
    if (month == 0 || month > 12) {
      return false;
    }
    return day <= DaysInMonth(month);
  }

  // Weighted sum of all 10 digits, weights 4,3,2,7,6,5,4,3,2,1.
  static int WeightedSum(const CPRDigits& digits) {
    int sum = 0;
    for (size_t i = 0; i < digits.size(); ++i) {
      sum += digits[i] * Weights()[i];
    }
    return sum;
  }

  static bool CheckChecksum(const CPRDigits& digits) {
    return WeightedSum(digits) % 11 == 0;
  }

  // Runs the three stages in order and reports the first one that failed.
  static CPRFailure Validate(const std::string& raw) {
    CPRDigits digits;
    if (!Normalize(raw, &digits)) {
      return CPRFailure::kFormat;
    }
    if (!CheckCalendar(digits)) {
      return CPRFailure::kCalendar;
    }
    if (!CheckChecksum(digits)) {
      return CPRFailure::kChecksum;
    }
    return CPRFailure::kNone;
  }

  static CPRFailure Validate(const char* raw) {
    if (raw == nullptr) {
      return CPRFailure::kFormat;
    }
    return Validate(std::string(raw));
  }

  // Checks whether the supplied cpr is valid.
  static bool IsValid(const std::string& cpr) {
    return Validate(cpr) == CPRFailure::kNone;
  }

  static bool IsValid(const char* cpr) {
    return Validate(cpr) == CPRFailure::kNone;
  }

  static std::string ToString(const CPRDigits& digits) {
    std::string s(digits.size(), '0');
    for (size_t i = 0; i < digits.size(); ++i) {
      s[i] = (char) ('0' + digits[i]);
    }
    return s;
  }

 private:
  // Month is 1-based, callers check the 1..12 range first.
  static int DaysInMonth(int month) {
    static const int days_in_month[12] = {
        31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return days_in_month[month - 1];
  }

  static const std::array<int, 10>& Weights() {
    static const std::array<int, 10> weights = {{4, 3, 2, 7, 6, 5, 4, 3, 2, 1}};
    return weights;
  }
};

#endif  // CPR_VALIDATOR_CPR_UTIL_H_
