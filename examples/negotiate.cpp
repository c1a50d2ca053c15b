// Negotiates a Content-Encoding from Accept-Encoding header values given on the command line.
//
// Usage: encneg-negotiate [--verbose] [--available=br,gzip,...] [<Accept-Encoding value>...]
//
// Each positional argument is one occurrence of the Accept-Encoding header. Without any, the request is considered
// to have no Accept-Encoding header at all.
#include <encneg/encneg.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <ranges>
#include <string_view>
#include <utility>

#include "encneg/log.hpp"
#include "encneg/string-trim.hpp"

using namespace encneg;

namespace {

constexpr std::string_view kAvailableOpt = "--available=";
constexpr std::string_view kVerboseOpt = "--verbose";

vector<Coding> ParseAvailable(std::string_view list) {
  vector<Coding> codings;
  for (auto part : list | std::views::split(http::kListSep)) {
    std::string_view token = TrimOws(std::string_view(part.begin(), part.end()));
    if (!token.empty()) {
      codings.push_back(Coding::Parse(token));
    }
  }
  return codings;
}

}  // namespace

int main(int argc, char **argv) {
  NegotiationConfig config;
  http::Headers request;

  try {
    for (int argPos = 1; argPos < argc; ++argPos) {
      std::string_view arg(argv[argPos]);
      if (arg == kVerboseOpt) {
        log::set_level(log::level::debug);
      } else if (arg.starts_with(kAvailableOpt)) {
        config.availableEncodings = ParseAvailable(arg.substr(kAvailableOpt.size()));
      } else {
        request.append(http::AcceptEncoding, arg);
      }
    }

    EncodingNegotiator negotiator(std::move(config));

    if (auto accept = AcceptEncoding::FromHeaders(request)) {
      accept->sort();
      std::cout << "Sorted " << AcceptEncoding::name() << ": " << accept->value() << '\n';
    }

    http::Headers response;
    ContentEncoding selected = negotiator.apply(request, response);
    std::cout << "Selected: " << selected.value() << '\n';
    for (const http::Header &header : response) {
      std::cout << header.name() << http::HeaderSep << header.value() << '\n';
    }
  } catch (const HttpError &e) {
    const auto status = e.statusOr(http::StatusCodeBadRequest);
    std::cerr << status << ' ' << http::ReasonPhraseFor(status) << ": " << e.what() << '\n';
    return EXIT_FAILURE;
  } catch (const std::exception &e) {
    std::cerr << "Invalid arguments: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
