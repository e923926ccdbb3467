#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

#include "internal/witness/witness_resolver.hpp"

namespace apparatus::pack {

// One witness attestation as a comparative pack delivers it.
struct PackRecord {
  std::string              pack_id;
  std::string              verse_id;
  uint32_t                 position = 0;
  std::string              text;
  witness::WitnessMetadata witness;
};

struct SpineVerse {
  std::string verse_id;
  uint32_t    position = 0;
  std::string text;
};

/*
  Source of pack records, one chapter at a time.

  Records come back in the pack's document order. Implementations must
  not filter or repair records; attribution problems are the engine's
  to report.
*/
class PackLoader {
 public:
  virtual ~PackLoader() = default;

  virtual std::vector<PackRecord> Load(const std::string& pack_id, const std::string& book, uint32_t chapter) = 0;
};

// The base text every pack is compared against.
class SpineSource {
 public:
  virtual ~SpineSource() = default;

  // Ascending.
  virtual std::vector<uint32_t> Chapters(const std::string& book) = 0;

  // In verse order.
  virtual std::vector<SpineVerse> Verses(const std::string& book, uint32_t chapter) = 0;
};

// ------------------------------------------------------------------
// In-process implementations
// ------------------------------------------------------------------

class MemoryPackLoader final : public PackLoader {
 public:
  // Records are filed under the pack they were added to, even when the
  // record's own pack_id disagrees, so mis-attributed data can be modelled.
  void Add(const std::string& pack_id, PackRecord record);

  std::vector<PackRecord> Load(const std::string& pack_id, const std::string& book, uint32_t chapter) override;

 private:
  using Key = std::tuple<std::string, std::string, uint32_t>;

  std::mutex                                mutex_;
  std::map<Key, std::vector<PackRecord>>    records_;
};

class MemorySpineSource final : public SpineSource {
 public:
  // verse_id must be a canonical "Book.Chapter.Verse" id.
  void Add(const std::string& verse_id, const std::string& text, uint32_t position = 0);

  std::vector<uint32_t>   Chapters(const std::string& book) override;
  std::vector<SpineVerse> Verses(const std::string& book, uint32_t chapter) override;

 private:
  std::mutex                                                        mutex_;
  std::map<std::string, std::map<uint32_t, std::vector<SpineVerse>>> verses_;
};

} // namespace apparatus::pack
