#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "internal/model/variant.hpp"

namespace apparatus::classify {

struct Classification {
  model::Classification classification = model::Classification::kSubstitution;
  model::Significance   significance   = model::Significance::kSignificant;
  std::string           reason_code;
  std::string           reason_summary;
};

/*
  Rule-based scoring of the difference between a spine reading and an
  alternate reading. Both inputs are normalized first, so only
  substantive differences reach the rules.

  Rules, first match wins:
    1. theological_term  listed term present in one reading only  -> major
    2. word_order        same token multiset, different order      -> minor
    3. function_word     difference is only articles/particles     -> minor
    4. spelling          one token, edit distance 1                -> minor
    5. length_change     token count differs by 3 or more          -> significant
    6. content_difference                                          -> significant

  Classification (shape) for rules 1, 3, 5 and 6: fewer alternate tokens is
  an omission, more is an addition, equal is a substitution.

  Pure and deterministic. Summaries are descriptive only.
*/
class SignificanceClassifier {
 public:
  SignificanceClassifier();

  Classification Classify(std::string_view spine_text, std::string_view alt_text) const;

  // Case-insensitive match against the banned evaluative phrase list.
  static bool ContainsEvaluativeLanguage(std::string_view text);

  static const std::vector<std::string>& BannedPhrases();

 private:
  bool IsTheologicalTerm(const std::string& token) const;
  bool IsFunctionWord(const std::string& token) const;

  std::unordered_set<std::string> theological_terms_;
  std::unordered_set<std::string> function_words_;
};

} // namespace apparatus::classify
