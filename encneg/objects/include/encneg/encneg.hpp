// encneg Umbrella Header
//
// Include this single header to pull in the public content-negotiation API:
//   - Codings (Encoding, Coding) and client proposals (EncodingProposal)
//   - Accept-Encoding parsing, sorting, negotiation and serialization (AcceptEncoding)
//   - fmt formatters for the above (encoding-format.hpp)
//   - Negotiation result (ContentEncoding) and request-level negotiator (EncodingNegotiator, NegotiationConfig)
//   - Header container (http::Headers) and errors (HttpError, invalid_argument)
//
// Each re-exported header line is annotated with
//   IWYU pragma: export
// so that symbols they provide are treated as satisfied for direct use in user code.
//
// Usage Example:
//    #include <encneg/encneg.hpp>
//    using namespace encneg;
//    http::Headers request;
//    request.append("Accept-Encoding", "gzip;q=0.4, br;q=0.8");
//    EncodingNegotiator negotiator(NegotiationConfig{}.withAvailableEncodings({Encoding::gzip, Encoding::br}));
//    http::Headers response;
//    negotiator.apply(request, response);  // Content-Encoding: br, Vary: Accept-Encoding
#pragma once

#include "encneg/accept-encoding.hpp"           // IWYU pragma: export
#include "encneg/coding.hpp"                    // IWYU pragma: export
#include "encneg/content-encoding.hpp"          // IWYU pragma: export
#include "encneg/encoding-format.hpp"           // IWYU pragma: export
#include "encneg/encoding-negotiator.hpp"       // IWYU pragma: export
#include "encneg/encoding-proposal.hpp"         // IWYU pragma: export
#include "encneg/encoding.hpp"                  // IWYU pragma: export
#include "encneg/http-constants.hpp"            // IWYU pragma: export
#include "encneg/http-error.hpp"                // IWYU pragma: export
#include "encneg/http-headers.hpp"              // IWYU pragma: export
#include "encneg/http-status-code.hpp"          // IWYU pragma: export
#include "encneg/invalid_argument_exception.hpp"  // IWYU pragma: export
#include "encneg/negotiation-config.hpp"        // IWYU pragma: export
