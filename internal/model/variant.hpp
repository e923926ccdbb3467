#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apparatus::model {

enum class Classification : std::uint8_t {
  kSpelling     = 0,
  kWordOrder    = 1,
  kOmission     = 2,
  kAddition     = 3,
  kSubstitution = 4,
};

// Ordered: comparisons use the underlying value.
enum class Significance : std::uint8_t {
  kMinor       = 0,
  kSignificant = 1,
  kMajor       = 2,
};

enum class WitnessType : std::uint8_t {
  kEdition    = 0,
  kManuscript = 1,
  kTradition  = 2,
  kOther      = 3,
};

constexpr std::string_view ToString(Classification classification) {
  switch (classification) {
    case Classification::kSpelling:
      return "spelling";
    case Classification::kWordOrder:
      return "word_order";
    case Classification::kOmission:
      return "omission";
    case Classification::kAddition:
      return "addition";
    case Classification::kSubstitution:
    default:
      return "substitution";
  }
}

constexpr std::string_view ToString(Significance significance) {
  switch (significance) {
    case Significance::kMinor:
      return "minor";
    case Significance::kMajor:
      return "major";
    case Significance::kSignificant:
    default:
      return "significant";
  }
}

constexpr std::string_view ToString(WitnessType type) {
  switch (type) {
    case WitnessType::kEdition:
      return "edition";
    case WitnessType::kManuscript:
      return "manuscript";
    case WitnessType::kTradition:
      return "tradition";
    case WitnessType::kOther:
    default:
      return "other";
  }
}

constexpr std::optional<Classification> ParseClassification(std::string_view text) {
  if (text == "spelling") return Classification::kSpelling;
  if (text == "word_order") return Classification::kWordOrder;
  if (text == "omission") return Classification::kOmission;
  if (text == "addition") return Classification::kAddition;
  if (text == "substitution") return Classification::kSubstitution;
  return std::nullopt;
}

constexpr std::optional<Significance> ParseSignificance(std::string_view text) {
  if (text == "minor") return Significance::kMinor;
  if (text == "significant") return Significance::kSignificant;
  if (text == "major") return Significance::kMajor;
  return std::nullopt;
}

constexpr std::optional<WitnessType> ParseWitnessType(std::string_view text) {
  if (text == "edition") return WitnessType::kEdition;
  if (text == "manuscript") return WitnessType::kManuscript;
  if (text == "tradition") return WitnessType::kTradition;
  if (text == "other") return WitnessType::kOther;
  return std::nullopt;
}

constexpr bool IsAtLeast(Significance value, Significance threshold) {
  return static_cast<std::uint8_t>(value) >= static_cast<std::uint8_t>(threshold);
}

struct CenturyRange {
  int earliest = 0;
  int latest   = 0;
};

struct WitnessSupport {
  uint64_t                    id = 0;
  std::string                 witness_siglum;
  WitnessType                 witness_type = WitnessType::kOther;
  std::string                 raw_type_label;
  std::string                 source_pack_id;
  std::optional<CenturyRange> century_range;
};

struct Reading {
  uint64_t    id    = 0;
  uint32_t    index = 0;
  std::string surface_text;
  std::string canonical_key;
  bool        is_spine = false;

  // Set once when a non-spine reading is created; empty for the spine.
  std::optional<Classification> classification;
  std::optional<Significance>   significance;
  std::string                   reason_code;
  std::string                   reason_summary;

  std::vector<WitnessSupport> supports;
};

struct VariantUnit {
  uint64_t       id = 0;
  std::string    verse_id;
  uint32_t       position       = 0;
  Classification classification = Classification::kSubstitution;
  Significance   significance   = Significance::kMinor;
  std::string    reason_code;
  std::string    reason_summary;
  uint64_t       version       = 0;
  uint64_t       created_at_ms = 0;

  // Index 0 is always the spine.
  std::vector<Reading> readings;
};

struct UnitRef {
  uint64_t    unit_id = 0;
  std::string verse_id;
  uint32_t    position = 0;
};

struct Acknowledgement {
  uint64_t    unit_id = 0;
  std::string session_id;
  uint32_t    reading_index = 0;
  std::string reason;
  uint64_t    acknowledged_at_ms = 0;
};

} // namespace apparatus::model
