#include "normalizer.hpp"

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>

#include <stdexcept>

namespace apparatus::text {

namespace {

const icu::Normalizer2& Nfd() {
  UErrorCode              status = U_ZERO_ERROR;
  const icu::Normalizer2* norm   = icu::Normalizer2::getNFDInstance(status);
  if (U_FAILURE(status) || norm == nullptr) {
    throw std::runtime_error("ICU: failed to get NFD normalizer");
  }
  return *norm;
}

icu::UnicodeString Decompose(const icu::UnicodeString& in) {
  UErrorCode         status = U_ZERO_ERROR;
  icu::UnicodeString out;
  Nfd().normalize(in, out, status);
  if (U_FAILURE(status)) {
    throw std::runtime_error("ICU: NFD normalize failed");
  }
  return out;
}

bool IsCombiningMark(UChar32 c) {
  return (U_GET_GC_MASK(c) & U_GC_M_MASK) != 0;
}

icu::UnicodeString StripMarks(const icu::UnicodeString& in) {
  icu::UnicodeString out;
  for (int32_t i = 0; i < in.length();) {
    const UChar32 c = in.char32At(i);
    i += U16_LENGTH(c);
    if (!IsCombiningMark(c)) out.append(c);
  }
  return out;
}

} // namespace

std::string Normalize(std::string_view text) {
  // fromUTF8 substitutes U+FFFD for ill-formed sequences.
  icu::UnicodeString u = icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));

  // Marks go before folding: U+0345 (iota subscript) folds to a full iota.
  u = StripMarks(Decompose(u));
  u.foldCase(U_FOLD_CASE_DEFAULT);
  u = Decompose(u);

  icu::UnicodeString out;
  bool               pending_space = false;
  for (int32_t i = 0; i < u.length();) {
    const UChar32 c = u.char32At(i);
    i += U16_LENGTH(c);

    if (IsCombiningMark(c) || u_ispunct(c)) {
      continue;
    }
    if (u_isUWhiteSpace(c)) {
      pending_space = !out.isEmpty();
      continue;
    }
    if (pending_space) {
      out.append(static_cast<UChar>(0x20));
      pending_space = false;
    }
    out.append(c);
  }

  std::string result;
  out.toUTF8String(result);
  return result;
}

std::vector<std::string> Tokens(std::string_view canonical_key) {
  std::vector<std::string> tokens;
  std::size_t              start = 0;
  while (start < canonical_key.size()) {
    auto end = canonical_key.find(' ', start);
    if (end == std::string_view::npos) end = canonical_key.size();
    if (end > start) {
      tokens.emplace_back(canonical_key.substr(start, end - start));
    }
    start = end + 1;
  }
  return tokens;
}

std::u32string CodePoints(std::string_view utf8) {
  icu::UnicodeString u = icu::UnicodeString::fromUTF8(icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));

  std::u32string out;
  out.reserve(static_cast<std::size_t>(u.countChar32()));
  for (int32_t i = 0; i < u.length();) {
    const UChar32 c = u.char32At(i);
    i += U16_LENGTH(c);
    out.push_back(static_cast<char32_t>(c));
  }
  return out;
}

} // namespace apparatus::text
