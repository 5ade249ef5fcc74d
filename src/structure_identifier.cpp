#include "doc_chunker/structure_identifier.h"
#include "doc_chunker/text_normalizer.h"
#include <algorithm>

namespace doc_chunker {

namespace {

std::vector<std::regex> compile(std::initializer_list<const char*> patterns) {
    std::vector<std::regex> compiled;
    for (const char* pattern : patterns) {
        compiled.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
    }
    return compiled;
}

bool matches_any(const std::vector<std::regex>& patterns, const std::string& line) {
    return std::any_of(patterns.begin(), patterns.end(), [&line](const std::regex& pattern) {
        return std::regex_search(line, pattern);
    });
}

} // namespace

bool is_title_line(const std::string& line) {
    if (line.empty()) {
        return false;
    }
    char first = line[0];
    bool letter = (first >= 'A' && first <= 'Z') || (first >= 'a' && first <= 'z');
    return letter && line.find_first_of(".!?") == std::string::npos;
}

bool DocumentStructure::empty() const {
    return !has_toc && chapters.empty() && sections.empty() && subsections.empty() &&
           figures.empty() && tables.empty();
}

const StructurePatterns& StructurePatterns::defaults() {
    static const StructurePatterns patterns = [] {
        StructurePatterns p;
        p.toc = compile({
            "^table\\s+des\\s+matières",
            "^sommaire",
            "^table\\s+of\\s+contents",
        });
        p.chapter = compile({
            "^chapitre\\s+\\d+",
            "^\\d+\\.\\s+[A-Z]",
            "^[IVX]+\\.\\s+[A-Z]",
        });
        p.section = compile({
            "^\\d+\\.\\d+\\.\\s+[A-Z]",
        });
        p.section_rule = is_title_line;
        p.subsection = compile({
            "^\\d+\\.\\d+\\.\\d+\\.\\s+",
            "^•\\s+[A-Z]",
        });
        p.figure = compile({"^(figure|fig\\.)\\s+\\d+"});
        p.table = compile({"^(tableau|table)\\s+\\d+"});
        return p;
    }();
    return patterns;
}

StructureIdentifier::StructureIdentifier(const StructurePatterns& patterns)
    : patterns_(patterns) {}

DocumentStructure StructureIdentifier::identify(const std::string& text) const {
    DocumentStructure structure;
    const auto lines = split_lines(text);

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string line = trim(lines[i]);
        if (line.empty()) {
            continue;
        }

        const StructureEntry entry{line, static_cast<int>(i)};
        const std::string head =
            line.substr(0, floor_char_boundary(line, StructurePatterns::kMatchWindow));

        if (matches_any(patterns_.toc, head)) {
            structure.has_toc = true;
        } else if (matches_any(patterns_.chapter, head)) {
            structure.chapters.push_back(entry);
        } else if (matches_any(patterns_.section, head) ||
                   (patterns_.section_rule && patterns_.section_rule(line))) {
            structure.sections.push_back(entry);
        } else if (matches_any(patterns_.subsection, head)) {
            structure.subsections.push_back(entry);
        } else if (matches_any(patterns_.figure, head)) {
            structure.figures.push_back(entry);
        } else if (matches_any(patterns_.table, head)) {
            structure.tables.push_back(entry);
        }
    }

    return structure;
}

DocumentStructure identify_structure(const std::string& text) {
    static const StructureIdentifier identifier;
    return identifier.identify(text);
}

} // namespace doc_chunker
