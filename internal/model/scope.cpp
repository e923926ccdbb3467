#include "scope.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <unordered_map>

#include "internal/util/errors.hpp"

namespace apparatus::model {

namespace {

// Keys are lowercase with spaces removed.
const std::unordered_map<std::string, std::string>& BookAliases() {
  static const std::unordered_map<std::string, std::string> kAliases = {
      {"matthew", "Matthew"},         {"matt", "Matthew"},          {"mat", "Matthew"},          {"mt", "Matthew"},
      {"mark", "Mark"},               {"mk", "Mark"},               {"mr", "Mark"},              {"mrk", "Mark"},
      {"luke", "Luke"},               {"lk", "Luke"},               {"luk", "Luke"},
      {"john", "John"},               {"jn", "John"},               {"jhn", "John"},             {"joh", "John"},
      {"acts", "Acts"},               {"ac", "Acts"},               {"act", "Acts"},
      {"romans", "Romans"},           {"rom", "Romans"},            {"rm", "Romans"},            {"ro", "Romans"},
      {"1corinthians", "1Corinthians"}, {"1cor", "1Corinthians"},   {"1co", "1Corinthians"},     {"icor", "1Corinthians"},
      {"2corinthians", "2Corinthians"}, {"2cor", "2Corinthians"},   {"2co", "2Corinthians"},     {"iicor", "2Corinthians"},
      {"galatians", "Galatians"},     {"gal", "Galatians"},         {"ga", "Galatians"},
      {"ephesians", "Ephesians"},     {"eph", "Ephesians"},         {"ep", "Ephesians"},
      {"philippians", "Philippians"}, {"phil", "Philippians"},      {"php", "Philippians"},      {"pp", "Philippians"},
      {"colossians", "Colossians"},   {"col", "Colossians"},
      {"1thessalonians", "1Thessalonians"}, {"1thess", "1Thessalonians"}, {"1th", "1Thessalonians"}, {"ithess", "1Thessalonians"},
      {"2thessalonians", "2Thessalonians"}, {"2thess", "2Thessalonians"}, {"2th", "2Thessalonians"}, {"iithess", "2Thessalonians"},
      {"1timothy", "1Timothy"},       {"1tim", "1Timothy"},         {"1ti", "1Timothy"},         {"itim", "1Timothy"},
      {"2timothy", "2Timothy"},       {"2tim", "2Timothy"},         {"2ti", "2Timothy"},         {"iitim", "2Timothy"},
      {"titus", "Titus"},             {"tit", "Titus"},
      {"philemon", "Philemon"},       {"phlm", "Philemon"},         {"phm", "Philemon"},         {"philem", "Philemon"},
      {"hebrews", "Hebrews"},         {"heb", "Hebrews"},
      {"james", "James"},             {"jas", "James"},             {"jm", "James"},             {"jam", "James"},
      {"1peter", "1Peter"},           {"1pet", "1Peter"},           {"1pe", "1Peter"},           {"1pt", "1Peter"},
      {"2peter", "2Peter"},           {"2pet", "2Peter"},           {"2pe", "2Peter"},           {"2pt", "2Peter"},
      {"1john", "1John"},             {"1jn", "1John"},             {"1jhn", "1John"},           {"ijn", "1John"},
      {"2john", "2John"},             {"2jn", "2John"},             {"2jhn", "2John"},           {"iijn", "2John"},
      {"3john", "3John"},             {"3jn", "3John"},             {"3jhn", "3John"},           {"iiijn", "3John"},
      {"jude", "Jude"},               {"jud", "Jude"},              {"jd", "Jude"},
      {"revelation", "Revelation"},   {"rev", "Revelation"},        {"re", "Revelation"},        {"rv", "Revelation"},
  };
  return kAliases;
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  return text;
}

std::optional<uint32_t> ParsePositive(std::string_view text) {
  if (text.empty()) return std::nullopt;
  uint32_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
    return std::nullopt;
  }
  return value;
}

std::vector<std::string_view> Split(std::string_view text, char sep) {
  std::vector<std::string_view> parts;
  std::size_t                   start = 0;
  for (;;) {
    auto pos = text.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

[[noreturn]] void Reject(std::string_view text, std::string_view why) {
  throw util::InputError("invalid scope '" + std::string(text) + "': " + std::string(why));
}

} // namespace

const std::vector<std::string>& CanonicalBooks() {
  static const std::vector<std::string> kBooks = {
      "Matthew",   "Mark",     "Luke",           "John",           "Acts",     "Romans",   "1Corinthians",
      "2Corinthians", "Galatians", "Ephesians",  "Philippians",    "Colossians", "1Thessalonians", "2Thessalonians",
      "1Timothy",  "2Timothy", "Titus",          "Philemon",       "Hebrews",  "James",    "1Peter",
      "2Peter",    "1John",    "2John",          "3John",          "Jude",     "Revelation",
  };
  return kBooks;
}

std::optional<std::string> CanonicalBook(std::string_view name) {
  std::string key;
  key.reserve(name.size());
  for (char c : name) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (key.empty()) return std::nullopt;

  const auto& aliases = BookAliases();
  auto        it      = aliases.find(key);
  if (it == aliases.end()) return std::nullopt;
  return it->second;
}

int BookOrder(std::string_view canonical_book) {
  const auto& books = CanonicalBooks();
  auto        it    = std::find(books.begin(), books.end(), canonical_book);
  return it == books.end() ? -1 : static_cast<int>(it - books.begin());
}

std::optional<VerseRef> VerseRef::Parse(std::string_view verse_id) {
  auto parts = Split(verse_id, '.');
  if (parts.size() != 3) return std::nullopt;

  auto book = CanonicalBook(parts[0]);
  if (!book) return std::nullopt;

  auto chapter = ParsePositive(parts[1]);
  auto verse   = ParsePositive(parts[2]);
  if (!chapter || !verse) return std::nullopt;

  return VerseRef{.book = *book, .chapter = *chapter, .verse = *verse};
}

std::string VerseRef::ToString() const {
  return book + "." + std::to_string(chapter) + "." + std::to_string(verse);
}

bool LocationLess(const std::string& verse_a, uint32_t position_a, const std::string& verse_b, uint32_t position_b) {
  auto a = VerseRef::Parse(verse_a);
  auto b = VerseRef::Parse(verse_b);
  if (a && b) {
    const int book_a = BookOrder(a->book);
    const int book_b = BookOrder(b->book);
    if (book_a != book_b) return book_a < book_b;
    if (a->chapter != b->chapter) return a->chapter < b->chapter;
    if (a->verse != b->verse) return a->verse < b->verse;
    return position_a < position_b;
  }
  // Unparseable ids sort after parseable ones, then lexically.
  if (a.has_value() != b.has_value()) return a.has_value();
  if (verse_a != verse_b) return verse_a < verse_b;
  return position_a < position_b;
}

Scope Scope::Parse(std::string_view text) {
  const auto trimmed = Trim(text);
  if (trimmed.empty()) {
    Reject(text, "empty reference");
  }

  Scope scope;

  // Canonical dotted form: Book[.Chapter[.Verse]]
  if (trimmed.find('.') != std::string_view::npos || trimmed.find(' ') == std::string_view::npos) {
    auto parts = Split(trimmed, '.');
    if (parts.size() > 3) Reject(text, "too many components");

    auto book = CanonicalBook(parts[0]);
    if (!book) Reject(text, "unknown book '" + std::string(parts[0]) + "'");
    scope.book = *book;

    if (parts.size() >= 2) {
      scope.chapter = ParsePositive(parts[1]);
      if (!scope.chapter) Reject(text, "chapter must be a positive integer");
    }
    if (parts.size() == 3) {
      scope.verse = ParsePositive(parts[2]);
      if (!scope.verse) Reject(text, "verse must be a positive integer");
    }
    return scope;
  }

  // Human form: "<book words> [chapter[:verse]]"
  const auto last_space = trimmed.find_last_of(' ');
  const auto tail       = trimmed.substr(last_space + 1);
  const bool tail_is_ref =
      !tail.empty() && std::isdigit(static_cast<unsigned char>(tail.front())) && CanonicalBook(trimmed) == std::nullopt;

  if (!tail_is_ref) {
    auto book = CanonicalBook(trimmed);
    if (!book) Reject(text, "unknown book '" + std::string(trimmed) + "'");
    scope.book = *book;
    return scope;
  }

  auto book = CanonicalBook(Trim(trimmed.substr(0, last_space)));
  if (!book) Reject(text, "unknown book '" + std::string(Trim(trimmed.substr(0, last_space))) + "'");
  scope.book = *book;

  auto numbers = Split(tail, ':');
  if (numbers.size() > 2) Reject(text, "expected chapter or chapter:verse");

  scope.chapter = ParsePositive(numbers[0]);
  if (!scope.chapter) Reject(text, "chapter must be a positive integer");
  if (numbers.size() == 2) {
    scope.verse = ParsePositive(numbers[1]);
    if (!scope.verse) Reject(text, "verse must be a positive integer");
  }
  return scope;
}

bool Scope::Contains(std::string_view verse_id) const {
  auto ref = VerseRef::Parse(verse_id);
  if (!ref || ref->book != book) return false;
  if (chapter && ref->chapter != *chapter) return false;
  if (verse && ref->verse != *verse) return false;
  return true;
}

std::string Scope::ToString() const {
  std::string out = book;
  if (chapter) out += "." + std::to_string(*chapter);
  if (verse) out += "." + std::to_string(*verse);
  return out;
}

} // namespace apparatus::model
