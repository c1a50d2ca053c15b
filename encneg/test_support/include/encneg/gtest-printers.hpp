#pragma once

#include <fmt/format.h>

#include <ostream>

#include "encneg/accept-encoding.hpp"
#include "encneg/coding.hpp"
#include "encneg/content-encoding.hpp"
#include "encneg/encoding-format.hpp"
#include "encneg/encoding-proposal.hpp"
#include "encneg/encoding.hpp"

// Readable gtest failure messages for the negotiation types, found by ADL.
namespace encneg {

inline void PrintTo(Encoding enc, std::ostream *os) { *os << fmt::format("{}", enc); }

inline void PrintTo(const Coding &coding, std::ostream *os) { *os << fmt::format("{}", coding); }

inline void PrintTo(const EncodingProposal &proposal, std::ostream *os) { *os << fmt::format("{}", proposal); }

inline void PrintTo(const ContentEncoding &contentEncoding, std::ostream *os) {
  *os << fmt::format("{}", contentEncoding);
}

inline void PrintTo(const AcceptEncoding &accept, std::ostream *os) { *os << fmt::format("{:d}", accept); }

}  // namespace encneg
