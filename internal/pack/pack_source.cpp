#include "internal/pack/pack_source.hpp"

#include <algorithm>

#include "internal/model/scope.hpp"
#include "internal/util/errors.hpp"

namespace apparatus::pack {

void MemoryPackLoader::Add(const std::string& pack_id, PackRecord record) {
  auto ref = model::VerseRef::Parse(record.verse_id);
  if (!ref) {
    throw util::InputError("pack record has malformed verse id: " + record.verse_id);
  }

  std::lock_guard lock(mutex_);
  records_[{pack_id, ref->book, ref->chapter}].push_back(std::move(record));
}

std::vector<PackRecord> MemoryPackLoader::Load(const std::string& pack_id, const std::string& book, uint32_t chapter) {
  std::lock_guard lock(mutex_);
  auto            it = records_.find({pack_id, book, chapter});
  if (it == records_.end()) return {};
  return it->second;
}

void MemorySpineSource::Add(const std::string& verse_id, const std::string& text, uint32_t position) {
  auto ref = model::VerseRef::Parse(verse_id);
  if (!ref) {
    throw util::InputError("spine verse has malformed verse id: " + verse_id);
  }

  std::lock_guard lock(mutex_);
  auto&           chapter = verses_[ref->book][ref->chapter];
  chapter.push_back(SpineVerse{verse_id, position, text});
  std::stable_sort(chapter.begin(), chapter.end(),
                   [](const auto& a, const auto& b) { return model::LocationLess(a.verse_id, a.position, b.verse_id, b.position); });
}

std::vector<uint32_t> MemorySpineSource::Chapters(const std::string& book) {
  std::lock_guard lock(mutex_);
  auto            it = verses_.find(book);
  if (it == verses_.end()) return {};

  std::vector<uint32_t> out;
  for (const auto& [chapter, _] : it->second) {
    out.push_back(chapter);
  }
  return out;
}

std::vector<SpineVerse> MemorySpineSource::Verses(const std::string& book, uint32_t chapter) {
  std::lock_guard lock(mutex_);
  auto            book_it = verses_.find(book);
  if (book_it == verses_.end()) return {};
  auto chapter_it = book_it->second.find(chapter);
  if (chapter_it == book_it->second.end()) return {};
  return chapter_it->second;
}

} // namespace apparatus::pack
