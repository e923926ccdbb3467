#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace apparatus::text {

/*
  Canonical comparison key for a text span.

  Pipeline (ICU):
    NFD -> drop combining marks (Mn/Mc/Me) -> case fold -> NFD
        -> drop marks and punctuation (P*) -> collapse whitespace + trim

  Total: malformed UTF-8 decodes to U+FFFD and passes through.
  Idempotent: Normalize(Normalize(x)) == Normalize(x).
  An empty key is a valid result (omission).
*/
std::string Normalize(std::string_view text);

// Splits a canonical key on single spaces.
std::vector<std::string> Tokens(std::string_view canonical_key);

// Decodes UTF-8 into code points (ill-formed input becomes U+FFFD).
std::u32string CodePoints(std::string_view utf8);

} // namespace apparatus::text
