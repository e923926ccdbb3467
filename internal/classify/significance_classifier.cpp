#include "significance_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <sstream>

#include "internal/text/normalizer.hpp"

namespace apparatus::classify {

namespace {

using model::Significance;

// Inflected forms of God, Christ, Jesus, Lord, Spirit, Son, Father,
// only-begotten, sin, faith. Normalized at construction.
const std::vector<std::string> kTheologicalTerms = {
    "θεος",     "θεου",     "θεον",      "θεω",       "χριστος",  "χριστου", "χριστον", "χριστω",
    "ιησους",   "ιησου",    "ιησουν",    "κυριος",    "κυριου",   "κυριον",  "κυριω",   "πνευμα",
    "πνευματος", "πνευματι", "υιος",     "υιου",      "υιον",     "υιω",     "πατηρ",   "πατρος",
    "πατρι",    "πατερα",   "μονογενης", "μονογενους", "αμαρτια", "αμαρτιας", "πιστις", "πιστεως",
};

// Articles, particles and conjunctions (incl. elided forms).
const std::vector<std::string> kFunctionWords = {
    "ο",   "η",   "το",   "του",  "της",  "των", "τω",   "τη",    "τοις", "ταις", "τον",  "την",  "τους",
    "τας", "οι",  "αι",   "τα",   "και",  "δε",  "δ",    "γαρ",   "ουν",  "τε",   "μεν",  "αν",   "εαν",
    "ει",  "οτι", "ινα",  "ως",   "αλλα", "αλλ", "ουδε", "μηδε",  "ουτε", "μητε", "ου",   "ουκ",  "ουχ",
    "μη",  "δη",  "γε",   "ηδη",  "κ",    "τοτε", "ιδου", "ουχι",
};

const std::vector<std::string> kBannedPhrases = {
    "more likely",    "likely original",    "probably original", "preferred reading", "better reading", "best reading",
    "original reading", "weight of evidence", "superior",        "inferior",          "corruption",     "authentic",
};

using Multiset = std::map<std::string, int>;

Multiset Count(const std::vector<std::string>& tokens) {
  Multiset counts;
  for (const auto& token : tokens) {
    ++counts[token];
  }
  return counts;
}

// Tokens of `a` not matched by `b`, with multiplicity.
std::vector<std::string> Minus(const Multiset& a, const Multiset& b) {
  std::vector<std::string> out;
  for (const auto& [token, count] : a) {
    auto      it    = b.find(token);
    const int other = it == b.end() ? 0 : it->second;
    for (int i = other; i < count; ++i) {
      out.push_back(token);
    }
  }
  return out;
}

std::size_t EditDistance(const std::u32string& a, const std::u32string& b) {
  std::vector<std::size_t> prev(b.size() + 1);
  std::vector<std::size_t> cur(b.size() + 1);
  for (std::size_t j = 0; j <= b.size(); ++j) prev[j] = j;

  for (std::size_t i = 1; i <= a.size(); ++i) {
    cur[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      const std::size_t substitution = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      cur[j]                         = std::min({prev[j] + 1, cur[j - 1] + 1, substitution});
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

model::Classification Shape(std::size_t spine_count, std::size_t alt_count) {
  if (alt_count < spine_count) return model::Classification::kOmission;
  if (alt_count > spine_count) return model::Classification::kAddition;
  return model::Classification::kSubstitution;
}

std::string Join(const std::vector<std::string>& tokens) {
  std::string out;
  for (const auto& token : tokens) {
    if (!out.empty()) out += ", ";
    out += token;
  }
  return out.empty() ? "(none)" : out;
}

std::string AsciiLower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

SignificanceClassifier::SignificanceClassifier() {
  for (const auto& term : kTheologicalTerms) {
    theological_terms_.insert(text::Normalize(term));
  }
  for (const auto& word : kFunctionWords) {
    function_words_.insert(text::Normalize(word));
  }
}

bool SignificanceClassifier::IsTheologicalTerm(const std::string& token) const {
  return theological_terms_.contains(token);
}

bool SignificanceClassifier::IsFunctionWord(const std::string& token) const {
  return function_words_.contains(token);
}

Classification SignificanceClassifier::Classify(std::string_view spine_text, std::string_view alt_text) const {
  const auto spine_tokens = text::Tokens(text::Normalize(spine_text));
  const auto alt_tokens   = text::Tokens(text::Normalize(alt_text));
  const auto spine_count  = spine_tokens.size();
  const auto alt_count    = alt_tokens.size();

  const auto spine_bag = Count(spine_tokens);
  const auto alt_bag   = Count(alt_tokens);
  const auto removed   = Minus(spine_bag, alt_bag);
  const auto added     = Minus(alt_bag, spine_bag);

  Classification result;
  result.classification = Shape(spine_count, alt_count);

  // 1. theological term present in one reading only
  std::set<std::string> term_diff;
  for (const auto& [token, _] : spine_bag) {
    if (IsTheologicalTerm(token) && !alt_bag.contains(token)) term_diff.insert(token);
  }
  for (const auto& [token, _] : alt_bag) {
    if (IsTheologicalTerm(token) && !spine_bag.contains(token)) term_diff.insert(token);
  }
  if (!term_diff.empty()) {
    result.significance   = Significance::kMajor;
    result.reason_code    = "theological_term";
    result.reason_summary = "Listed term(s) present in only one reading: " +
                            Join(std::vector<std::string>(term_diff.begin(), term_diff.end())) + "; token count " +
                            std::to_string(spine_count) + " -> " + std::to_string(alt_count);
    return result;
  }

  // 2. same multiset, different order
  if (removed.empty() && added.empty()) {
    result.classification = model::Classification::kWordOrder;
    result.significance   = Significance::kMinor;
    result.reason_code    = "word_order";
    result.reason_summary = "Same " + std::to_string(spine_count) + " token(s) in a different order";
    return result;
  }

  // 3. only function words differ
  const bool only_function_words =
      std::all_of(removed.begin(), removed.end(), [this](const std::string& t) { return IsFunctionWord(t); }) &&
      std::all_of(added.begin(), added.end(), [this](const std::string& t) { return IsFunctionWord(t); });
  if (only_function_words) {
    result.significance   = Significance::kMinor;
    result.reason_code    = "function_word";
    result.reason_summary = "Difference limited to article/particle token(s); absent from alternate: " + Join(removed) +
                            "; added in alternate: " + Join(added);
    return result;
  }

  // 4. single-token spelling difference
  if (spine_count == alt_count && removed.size() == 1 && added.size() == 1) {
    const auto a = text::CodePoints(removed.front());
    const auto b = text::CodePoints(added.front());
    if (a.size() >= 4 && b.size() >= 4 && EditDistance(a, b) == 1) {
      result.classification = model::Classification::kSpelling;
      result.significance   = Significance::kMinor;
      result.reason_code    = "spelling";
      result.reason_summary = "Single-token spelling difference: " + removed.front() + " / " + added.front();
      return result;
    }
  }

  // 5. length change of three or more tokens
  const auto delta = spine_count > alt_count ? spine_count - alt_count : alt_count - spine_count;
  if (delta >= 3) {
    result.significance   = Significance::kSignificant;
    result.reason_code    = "length_change";
    result.reason_summary = "Token count changes from " + std::to_string(spine_count) + " to " + std::to_string(alt_count);
    return result;
  }

  // 6. default
  result.significance   = Significance::kSignificant;
  result.reason_code    = "content_difference";
  result.reason_summary = "Differing tokens; absent from alternate: " + Join(removed) + "; added in alternate: " + Join(added);
  return result;
}

bool SignificanceClassifier::ContainsEvaluativeLanguage(std::string_view text) {
  const auto lowered = AsciiLower(text);
  for (const auto& phrase : kBannedPhrases) {
    if (lowered.find(phrase) != std::string::npos) {
      return true;
    }
  }
  return false;
}

const std::vector<std::string>& SignificanceClassifier::BannedPhrases() {
  return kBannedPhrases;
}

} // namespace apparatus::classify
