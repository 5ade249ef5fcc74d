#pragma once

#include <functional>
#include <string>
#include <vector>
#include <regex>

namespace doc_chunker {

struct StructureEntry {
    std::string title;   // the trimmed source line
    int line_index;      // 0-based line index into the cleaned text
};

struct DocumentStructure {
    bool has_toc = false;
    std::vector<StructureEntry> chapters;
    std::vector<StructureEntry> sections;
    std::vector<StructureEntry> subsections;
    std::vector<StructureEntry> figures;
    std::vector<StructureEntry> tables;

    bool empty() const;
};

// Pattern tables, tested case-insensitively in this order for every line:
// toc, chapter, section, subsection, figure, table. First match wins.
// The regexes only see the first kMatchWindow bytes of a line, which bounds
// the work std::regex does on very long lines. Rules that must see the whole
// line go in `section_rule`.
struct StructurePatterns {
    static constexpr size_t kMatchWindow = 256;

    std::vector<std::regex> toc;
    std::vector<std::regex> chapter;
    std::vector<std::regex> section;
    std::vector<std::regex> subsection;
    std::vector<std::regex> figure;
    std::vector<std::regex> table;

    // Tested on the whole trimmed line after the section regexes; may be empty
    std::function<bool(const std::string&)> section_rule;

    // French/English document conventions
    static const StructurePatterns& defaults();
};

class StructureIdentifier {
public:
    explicit StructureIdentifier(const StructurePatterns& patterns = StructurePatterns::defaults());

    DocumentStructure identify(const std::string& text) const;

private:
    StructurePatterns patterns_;
};

// Starts with an ASCII letter and holds no '.', '!' or '?'
bool is_title_line(const std::string& line);

// Shorthand for StructureIdentifier{}.identify(text)
DocumentStructure identify_structure(const std::string& text);

} // namespace doc_chunker
