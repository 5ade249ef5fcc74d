#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace doc_chunker {

// Label used when there is nothing to classify
extern const char* const kUnspecifiedSection;

// Ordered label -> surface terms table. Declaration order is match priority.
using KeywordTable = std::vector<std::pair<std::string, std::vector<std::string>>>;

// Labels a chunk with a section name and up to three key concepts.
// Implementations must be stateless: one instance is shared by every chunk.
class Tagger {
public:
    virtual ~Tagger() = default;

    // `paragraphs` are the paragraphs that contributed to the chunk,
    // `chunk_index` its position in the output sequence.
    virtual std::string tag_section(const std::vector<std::string>& paragraphs,
                                    size_t chunk_index) const = 0;

    // Empty when the tagger does not extract concepts.
    virtual std::vector<std::string> tag_concepts(const std::string& text) const = 0;
};

// Content-derived labels from fixed keyword tables (substring match on the
// lower-cased text).
class KeywordTagger : public Tagger {
public:
    static constexpr size_t kMaxConcepts = 3;

    KeywordTagger();
    KeywordTagger(KeywordTable sections, KeywordTable concepts,
                  std::string fallback_section, std::vector<std::string> default_concepts);

    std::string tag_section(const std::vector<std::string>& paragraphs,
                            size_t chunk_index) const override;
    std::vector<std::string> tag_concepts(const std::string& text) const override;

    static const KeywordTable& default_sections();
    static const KeywordTable& default_concepts();

private:
    KeywordTable sections_;
    KeywordTable concepts_;
    std::string fallback_section_;
    std::vector<std::string> default_concepts_;
};

// Round-robin placeholder labels by chunk position; ignores content and
// extracts no concepts.
class PositionalTagger : public Tagger {
public:
    PositionalTagger();
    explicit PositionalTagger(std::vector<std::string> labels);

    std::string tag_section(const std::vector<std::string>& paragraphs,
                            size_t chunk_index) const override;
    std::vector<std::string> tag_concepts(const std::string& text) const override;

private:
    std::vector<std::string> labels_;
};

} // namespace doc_chunker
