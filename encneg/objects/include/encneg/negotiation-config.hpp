#pragma once

#include <initializer_list>

#include "encneg/coding.hpp"
#include "encneg/encoding.hpp"
#include "encneg/vector.hpp"

namespace encneg {

struct NegotiationConfig {
  // Throws invalid_argument if the configuration is invalid.
  void validate() const;

  // Codings the server is able to produce, most preferred first. The first one is selected when the client only
  // accepts them through the '*' wildcard. Must be non-empty and without duplicates.
  vector<Coding> availableEncodings{Encoding::br, Encoding::zstd, Encoding::gzip, Encoding::deflate,
                                    Encoding::identity};

  // If true, adds a Vary: Accept-Encoding header to responses whose coding was negotiated.
  bool addVaryHeader{true};

  // Coding selected when the request has no Accept-Encoding header at all.
  // It does not need to be listed in availableEncodings.
  Coding missingHeaderEncoding{Encoding::identity};

  NegotiationConfig &withAvailableEncodings(std::initializer_list<Coding> encodings);

  NegotiationConfig &withVaryHeader(bool enable = true) {
    addVaryHeader = enable;
    return *this;
  }

  NegotiationConfig &withMissingHeaderEncoding(Coding coding);
};

}  // namespace encneg
