#include "availability.hpp"

#include <algorithm>

namespace booking::model {

bool ValidationResult::Has(ValidationReason reason) const {
  return std::find(reasons.begin(), reasons.end(), reason) != reasons.end();
}

std::vector<std::string> ValidationResult::ReasonCodes() const {
  std::vector<std::string> codes;
  codes.reserve(reasons.size());
  for (auto reason : reasons) {
    codes.emplace_back(ToString(reason));
  }
  return codes;
}

} // namespace booking::model
