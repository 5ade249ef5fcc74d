#pragma once

#include "doc_chunker/chunker.h"
#include "doc_chunker/document_cleaner.h"
#include "doc_chunker/structure_identifier.h"
#include <string>

namespace doc_chunker {

struct CleanedDocument {
    std::string text;
    CleaningStats stats;
    DocumentStructure structure;
};

// First entry point: raw extracted text -> cleaned text, stats and structure.
// Structure line indices refer to the cleaned text.
CleanedDocument clean_and_structure(const std::string& raw_text,
                                    const CleaningOptions& options = CleaningOptions{});

// Second entry point is chunk_document() from chunker.h.

} // namespace doc_chunker
