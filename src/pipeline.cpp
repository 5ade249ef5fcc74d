#include "doc_chunker/pipeline.h"
#include <utility>

namespace doc_chunker {

CleanedDocument clean_and_structure(const std::string& raw_text, const CleaningOptions& options) {
    CleanedDocument document;
    auto cleaned = clean_document(raw_text, options);
    document.text = std::move(cleaned.text);
    document.stats = std::move(cleaned.stats);
    document.structure = identify_structure(document.text);
    return document;
}

} // namespace doc_chunker
