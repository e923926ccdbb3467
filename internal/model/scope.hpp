#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apparatus::model {

/*
  Canonical verse ids look like "John.1.18" (Book.Chapter.Verse).
  Book names are the 27 canonical New Testament names in corpus order.
*/

const std::vector<std::string>& CanonicalBooks();

// Resolves a full name or common abbreviation ("Jn", "1 Cor") to the canonical name.
std::optional<std::string> CanonicalBook(std::string_view name);

// Position of a canonical book in corpus order, or -1.
int BookOrder(std::string_view canonical_book);

struct VerseRef {
  std::string book;
  uint32_t    chapter = 0;
  uint32_t    verse   = 0;

  static std::optional<VerseRef> Parse(std::string_view verse_id);

  std::string ToString() const;
};

// Total order used for every "ordered by location" listing.
bool LocationLess(const std::string& verse_a, uint32_t position_a, const std::string& verse_b, uint32_t position_b);

/*
  Scope of a build or query: a whole book, one chapter, or one verse.

  Accepted forms:
    "John", "John.1", "John.1.18"
    "John 1", "John 1:18", "Jn 1:18", "1 Cor 13"
*/
struct Scope {
  std::string             book;
  std::optional<uint32_t> chapter;
  std::optional<uint32_t> verse;

  // Throws util::InputError on anything unparseable.
  static Scope Parse(std::string_view text);

  bool Contains(std::string_view verse_id) const;

  std::string ToString() const;
};

} // namespace apparatus::model
