#include "internal/witness/witness_resolver.hpp"

#include <cassert>
#include <iostream>

namespace {

using apparatus::model::CenturyRange;
using apparatus::model::WitnessType;
using apparatus::witness::WitnessMetadata;
using apparatus::witness::WitnessResolver;

void TestKnownLabels() {
  assert(WitnessResolver::ResolveType("papyrus") == WitnessType::kManuscript);
  assert(WitnessResolver::ResolveType("Uncial") == WitnessType::kManuscript);
  assert(WitnessResolver::ResolveType(" minuscule ") == WitnessType::kManuscript);
  assert(WitnessResolver::ResolveType("edition") == WitnessType::kEdition);
  assert(WitnessResolver::ResolveType("NA28") == WitnessType::kEdition);
  assert(WitnessResolver::ResolveType("Westcott-Hort") == WitnessType::kEdition);
  assert(WitnessResolver::ResolveType("Byzantine") == WitnessType::kTradition);
  assert(WitnessResolver::ResolveType("majority text") == WitnessType::kTradition);
}

void TestUnknownLabelsNeverFail() {
  assert(WitnessResolver::ResolveType("") == WitnessType::kOther);
  assert(WitnessResolver::ResolveType("ostracon") == WitnessType::kOther);
  assert(WitnessResolver::ResolveType("μεμβράνα") == WitnessType::kOther);
}

void TestResolveBuildsSupport() {
  WitnessMetadata metadata;
  metadata.siglum        = " P66 ";
  metadata.type_label    = "Papyrus";
  metadata.century_range = CenturyRange{2, 3};

  auto support = WitnessResolver::Resolve(metadata, "pack-papyri");
  assert(support.witness_siglum == "P66");
  assert(support.witness_type == WitnessType::kManuscript);
  assert(support.raw_type_label == "Papyrus");
  assert(support.source_pack_id == "pack-papyri");
  assert(support.century_range.has_value());
  assert(support.century_range->earliest == 2 && support.century_range->latest == 3);
  assert(support.id == 0);

  WitnessMetadata undated{"Byz", "tradition", std::nullopt};
  auto            tradition = WitnessResolver::Resolve(undated, "byz");
  assert(tradition.witness_type == WitnessType::kTradition);
  assert(!tradition.century_range.has_value());
}

} // namespace

int main() {
  TestKnownLabels();
  TestUnknownLabelsNeverFail();
  TestResolveBuildsSupport();

  std::cout << "apparatus_unit_witness_resolver: pass\n";
  return 0;
}
