#include "witness_resolver.hpp"

#include <cctype>
#include <unordered_map>

namespace apparatus::witness {

namespace {

using model::WitnessType;

const std::unordered_map<std::string, WitnessType>& LabelTable() {
  static const std::unordered_map<std::string, WitnessType> kTable = {
      // physical manuscripts
      {"papyrus", WitnessType::kManuscript},
      {"uncial", WitnessType::kManuscript},
      {"majuscule", WitnessType::kManuscript},
      {"minuscule", WitnessType::kManuscript},
      {"lectionary", WitnessType::kManuscript},
      {"manuscript", WitnessType::kManuscript},
      {"codex", WitnessType::kManuscript},

      // printed / critical editions
      {"edition", WitnessType::kEdition},
      {"critical edition", WitnessType::kEdition},
      {"critical_edition", WitnessType::kEdition},
      {"sblgnt", WitnessType::kEdition},
      {"na27", WitnessType::kEdition},
      {"na28", WitnessType::kEdition},
      {"ubs4", WitnessType::kEdition},
      {"ubs5", WitnessType::kEdition},
      {"wh", WitnessType::kEdition},
      {"westcott-hort", WitnessType::kEdition},
      {"westcott hort", WitnessType::kEdition},
      {"tischendorf", WitnessType::kEdition},
      {"tregelles", WitnessType::kEdition},
      {"thgnt", WitnessType::kEdition},
      {"tr", WitnessType::kEdition},
      {"textus receptus", WitnessType::kEdition},
      {"rp", WitnessType::kEdition},

      // aggregate traditions
      {"tradition", WitnessType::kTradition},
      {"byz", WitnessType::kTradition},
      {"byzantine", WitnessType::kTradition},
      {"majority", WitnessType::kTradition},
      {"majority text", WitnessType::kTradition},
      {"family", WitnessType::kTradition},
      {"f1", WitnessType::kTradition},
      {"f13", WitnessType::kTradition},
      {"lat", WitnessType::kTradition},
      {"syr", WitnessType::kTradition},
      {"cop", WitnessType::kTradition},
      {"version", WitnessType::kTradition},
  };
  return kTable;
}

std::string TrimLower(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end   = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

  std::string out;
  out.reserve(end - begin);
  for (std::size_t i = begin; i < end; ++i) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(text[i]))));
  }
  return out;
}

std::string Trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end   = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return std::string(text.substr(begin, end - begin));
}

} // namespace

model::WitnessType WitnessResolver::ResolveType(std::string_view label) {
  const auto& table = LabelTable();
  auto        it    = table.find(TrimLower(label));
  return it == table.end() ? WitnessType::kOther : it->second;
}

model::WitnessSupport WitnessResolver::Resolve(const WitnessMetadata& metadata, const std::string& source_pack_id) {
  model::WitnessSupport support;
  support.witness_siglum = Trim(metadata.siglum);
  support.witness_type   = ResolveType(metadata.type_label);
  support.raw_type_label = metadata.type_label;
  support.source_pack_id = source_pack_id;
  support.century_range  = metadata.century_range;
  return support;
}

} // namespace apparatus::witness
