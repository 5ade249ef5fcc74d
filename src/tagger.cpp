#include "doc_chunker/tagger.h"
#include "doc_chunker/text_normalizer.h"
#include <algorithm>

namespace doc_chunker {

const char* const kUnspecifiedSection = "Section non spécifiée";

namespace {

bool contains_any(const std::string& haystack, const std::vector<std::string>& terms) {
    return std::any_of(terms.begin(), terms.end(), [&haystack](const std::string& term) {
        return haystack.find(to_lower(term)) != std::string::npos;
    });
}

} // namespace

KeywordTagger::KeywordTagger()
    : KeywordTagger(default_sections(), default_concepts(), "Contenu principal",
                    {"communication circulaire", "feedback", "MRI"}) {}

KeywordTagger::KeywordTagger(KeywordTable sections, KeywordTable concepts,
                             std::string fallback_section,
                             std::vector<std::string> default_concepts)
    : sections_(std::move(sections)),
      concepts_(std::move(concepts)),
      fallback_section_(std::move(fallback_section)),
      default_concepts_(std::move(default_concepts)) {}

const KeywordTable& KeywordTagger::default_sections() {
    static const KeywordTable table = {
        {"Introduction", {"introduction", "contexte", "préambule", "avant-propos"}},
        {"Méthodologie", {"méthode", "approche", "démarche", "processus"}},
        {"Résultats et Discussion", {"résultat", "analyse", "observation", "discussion"}},
        {"Application clinique", {"application", "cas", "exemple", "pratique", "clinique"}},
        {"Conclusion", {"conclusion", "synthèse", "perspective", "recommandation"}},
    };
    return table;
}

const KeywordTable& KeywordTagger::default_concepts() {
    static const KeywordTable table = {
        {"communication circulaire", {"communication", "circulaire", "circularité"}},
        {"feedback", {"feedback", "rétroaction", "boucle"}},
        {"MRI", {"MRI", "mental research institute", "palo alto"}},
        {"homéostasie", {"homéostasie", "équilibre", "stabilité"}},
        {"double contrainte", {"double contrainte", "double bind", "paradoxe"}},
        {"recadrage", {"recadrage", "reframing", "nouvelle perspective"}},
        {"prescription du symptôme", {"prescription", "symptôme", "paradoxale"}},
    };
    return table;
}

std::string KeywordTagger::tag_section(const std::vector<std::string>& paragraphs,
                                       size_t /*chunk_index*/) const {
    if (paragraphs.empty()) {
        return kUnspecifiedSection;
    }

    const std::string text = to_lower(join(paragraphs, " "));
    for (const auto& [label, terms] : sections_) {
        if (contains_any(text, terms)) {
            return label;
        }
    }
    return fallback_section_;
}

std::vector<std::string> KeywordTagger::tag_concepts(const std::string& text) const {
    const std::string lowered = to_lower(text);
    std::vector<std::string> found;

    for (const auto& [concept_name, terms] : concepts_) {
        if (contains_any(lowered, terms)) {
            found.push_back(concept_name);
            if (found.size() == kMaxConcepts) {
                break;
            }
        }
    }

    if (found.empty()) {
        found = default_concepts_;
        if (found.size() > kMaxConcepts) {
            found.resize(kMaxConcepts);
        }
    }
    return found;
}

PositionalTagger::PositionalTagger()
    : PositionalTagger({"Introduction", "Méthodologie", "Application clinique"}) {}

PositionalTagger::PositionalTagger(std::vector<std::string> labels)
    : labels_(std::move(labels)) {}

std::string PositionalTagger::tag_section(const std::vector<std::string>& /*paragraphs*/,
                                          size_t chunk_index) const {
    if (labels_.empty()) {
        return kUnspecifiedSection;
    }
    return labels_[chunk_index % labels_.size()];
}

std::vector<std::string> PositionalTagger::tag_concepts(const std::string& /*text*/) const {
    return {};
}

} // namespace doc_chunker
