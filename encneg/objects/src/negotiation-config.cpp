#include "encneg/negotiation-config.hpp"

#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <utility>

#include "encneg/coding.hpp"
#include "encneg/invalid_argument_exception.hpp"
#include "encneg/vector.hpp"

namespace encneg {

void NegotiationConfig::validate() const {
  if (availableEncodings.empty()) {
    throw invalid_argument("availableEncodings should not be empty");
  }
  for (auto it = availableEncodings.begin(); it != availableEncodings.end(); ++it) {
    if (std::find(std::next(it), availableEncodings.end(), *it) != availableEncodings.end()) {
      throw invalid_argument("Duplicated encoding '{}' in availableEncodings", it->str());
    }
  }
}

NegotiationConfig &NegotiationConfig::withAvailableEncodings(std::initializer_list<Coding> encodings) {
  availableEncodings = vector<Coding>(encodings);
  return *this;
}

NegotiationConfig &NegotiationConfig::withMissingHeaderEncoding(Coding coding) {
  missingHeaderEncoding = std::move(coding);
  return *this;
}

}  // namespace encneg
