#include "merge/region_analyzer.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <regex>
#include "merge/line_merge.hpp"

namespace hive::merge {

namespace {

struct DeclarationPattern {
    std::regex pattern;
    RegionType type;
    std::size_t name_group;
};

const std::vector<DeclarationPattern>& brace_patterns() {
    static const std::vector<DeclarationPattern> patterns = {
        {std::regex(R"(^(export\s+)?(default\s+)?(abstract\s+)?class\s+([A-Za-z_$][\w$]*))"),
         RegionType::Class, 4},
        {std::regex(R"(^(template\s*<.*>\s*)?(class|struct)\s+([A-Za-z_]\w*)\s*(final\s*)?[:{]?\s*[^;]*$)"),
         RegionType::Class, 3},
        {std::regex(R"(^(export\s+)?(declare\s+)?interface\s+([A-Za-z_$][\w$]*))"),
         RegionType::Interface, 3},
        {std::regex(R"(^(export\s+)?(declare\s+)?type\s+([A-Za-z_$][\w$]*)\s*(<[^=]*>)?\s*=)"),
         RegionType::TypeDefinition, 3},
        {std::regex(R"(^(export\s+)?(const\s+)?enum\s+(class\s+|struct\s+)?([A-Za-z_$][\w$]*))"),
         RegionType::TypeDefinition, 4},
        {std::regex(R"(^(typedef\s+)?(union)\s+([A-Za-z_]\w*))"),
         RegionType::TypeDefinition, 3},
        {std::regex(R"(^(export\s+)?(default\s+)?(async\s+)?function\s*\*?\s*([A-Za-z_$][\w$]*))"),
         RegionType::Function, 4},
        {std::regex(R"(^(export\s+)?(const|let|var)\s+([A-Za-z_$][\w$]*)\s*(:[^=]+)?=\s*(async\s+)?(\([^)]*\)|[A-Za-z_$][\w$]*)\s*(:[^=]+)?=>)"),
         RegionType::Function, 3},
        {std::regex(R"(^(pub(\([^)]*\))?\s+)?(async\s+)?(unsafe\s+)?fn\s+([A-Za-z_]\w*))"),
         RegionType::Function, 5},
        {std::regex(R"(^func\s+(\([^)]*\)\s*)?([A-Za-z_]\w*))"),
         RegionType::Function, 2},
        {std::regex(R"(^export\s+(default\s+)?\{?\s*([A-Za-z_$][\w$]*))"),
         RegionType::Export, 2},
        {std::regex(R"(^(export\s+)?(const|let|var)\s+([A-Za-z_$][\w$]*))"),
         RegionType::Variable, 3},
        // C-family function definition: `ret name(args` without a trailing ';'
        {std::regex(R"(^(?!(if|for|while|switch|return|else|do|case|catch|sizeof)\b)[A-Za-z_][\w:<>,\*&\s~]*?\b([A-Za-z_~][\w:~]*)\s*\([^;]*$)"),
         RegionType::Function, 2},
    };
    return patterns;
}

const std::regex& brace_import_pattern() {
    static const std::regex pattern(
        R"(^(import\s|import\{|#include\s|#import\s|using\s+namespace\s|use\s|package\s|const\s+\w+\s*=\s*require\())");
    return pattern;
}

const std::regex& namespace_pattern() {
    static const std::regex pattern(R"(^(export\s+)?(inline\s+)?namespace(\s+[\w:]+)?\s*\{?\s*$|^extern\s+"C"\s*\{?\s*$)");
    return pattern;
}

std::string ltrim(const std::string& line) {
    const auto first = line.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    return line.substr(first);
}

// Declarations are recognized from their first characters. std::regex recurses
// per character, so an unbounded line (minified or generated code) would
// exhaust the stack.
constexpr std::size_t kDeclarationHeadChars = 1024;

std::string declaration_head(const std::string& line) {
    return line.size() > kDeclarationHeadChars ? line.substr(0, kDeclarationHeadChars) : line;
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

// Brace delta of one line, skipping comments and string literals.
int brace_delta(const std::string& line, bool& in_block_comment, bool& saw_semicolon,
                bool& saw_open) {
    int delta = 0;
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        const char next = i + 1 < line.size() ? line[i + 1] : '\0';
        if (in_block_comment) {
            if (c == '*' && next == '/') {
                in_block_comment = false;
                ++i;
            }
            continue;
        }
        if (quote != 0) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '/' && next == '/') {
            break;
        }
        if (c == '/' && next == '*') {
            in_block_comment = true;
            ++i;
            continue;
        }
        if (c == '"' || c == '\'' || c == '`') {
            quote = c;
            continue;
        }
        if (c == '{') {
            ++delta;
            saw_open = true;
        } else if (c == '}') {
            --delta;
        } else if (c == ';') {
            saw_semicolon = true;
        }
    }
    return delta;
}

// Last line (0-based) of the declaration starting at `start`.
std::size_t find_block_end(const std::vector<std::string>& lines, const std::size_t start) {
    int depth = 0;
    bool in_block_comment = false;
    bool opened = false;
    for (std::size_t i = start; i < lines.size(); ++i) {
        bool saw_semicolon = false;
        bool saw_open = false;
        depth += brace_delta(lines[i], in_block_comment, saw_semicolon, saw_open);
        opened = opened || saw_open;
        if (opened && depth <= 0) {
            return i;
        }
        if (!opened && saw_semicolon) {
            return i;
        }
    }
    return opened ? lines.size() - 1 : start;
}

std::string make_region_id(const std::string& file_path, const RegionType type,
                           const std::string& name) {
    return file_path + ":" + to_string(type) + ":" + name;
}

// Overloads and redeclarations get "#2", "#3", ... so names stay unique.
void disambiguate(std::vector<CodeRegion>& regions) {
    std::map<std::string, int> seen;
    for (auto& region : regions) {
        const std::string key = to_string(region.type) + ":" + region.name;
        const int count = ++seen[key];
        if (count > 1) {
            region.name += "#" + std::to_string(count);
        }
        region.id = make_region_id(region.file_path, region.type, region.name);
    }
}

}  // namespace

std::string to_string(const RegionType type) {
    switch (type) {
        case RegionType::Imports:
            return "imports";
        case RegionType::TypeDefinition:
            return "type_definition";
        case RegionType::Interface:
            return "interface";
        case RegionType::Class:
            return "class";
        case RegionType::Function:
            return "function";
        case RegionType::Variable:
            return "variable";
        case RegionType::Export:
            return "export";
        case RegionType::Other:
            return "other";
        default:
            return "unknown";
    }
}

RegionAnalyzer::RegionAnalyzer(const std::size_t chunk_lines)
    : chunk_lines_(chunk_lines == 0 ? 50 : chunk_lines) {}

RegionAnalyzer::Language RegionAnalyzer::detect_language(const std::string& file_path) {
    static const std::vector<std::string> brace_extensions = {
        ".ts", ".tsx", ".js", ".jsx", ".mjs", ".cjs", ".c", ".h", ".cc", ".cpp",
        ".cxx", ".hpp", ".hh", ".hxx", ".java", ".cs", ".go", ".rs", ".kt", ".swift",
        ".scala"};
    const auto dot = file_path.find_last_of('.');
    if (dot == std::string::npos) {
        return Language::Unknown;
    }
    std::string extension = file_path.substr(dot);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (extension == ".py") {
        return Language::Python;
    }
    if (std::find(brace_extensions.begin(), brace_extensions.end(), extension) !=
        brace_extensions.end()) {
        return Language::BraceLike;
    }
    return Language::Unknown;
}

std::vector<CodeRegion> RegionAnalyzer::analyze(const std::string& file_path,
                                                const std::string& content) const {
    const auto lines = split_lines(content);
    std::vector<CodeRegion> regions;
    switch (detect_language(file_path)) {
        case Language::BraceLike:
            regions = analyze_brace(file_path, lines);
            break;
        case Language::Python:
            regions = analyze_python(file_path, lines);
            break;
        case Language::Unknown:
            break;
    }
    if (regions.empty()) {
        regions = analyze_chunks(file_path, lines);
    }
    disambiguate(regions);
    return regions;
}

std::vector<CodeRegion> RegionAnalyzer::analyze_brace(
    const std::string& file_path, const std::vector<std::string>& lines) const {
    std::vector<CodeRegion> regions;
    std::optional<CodeRegion> imports;

    int depth = 0;
    std::vector<int> transparent_depths;  // Depths opened by namespace blocks
    bool pending_transparent = false;
    bool in_block_comment = false;
    std::size_t covered_until = 0;  // Lines below this index belong to a region

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string trimmed = declaration_head(ltrim(lines[i]));
        const int effective_depth = depth - static_cast<int>(transparent_depths.size());
        const bool comment_start = trimmed.rfind("//", 0) == 0 || trimmed.rfind("/*", 0) == 0 ||
                                   trimmed.rfind("*", 0) == 0;

        if (effective_depth == 0 && i >= covered_until && !in_block_comment &&
            !trimmed.empty() && !comment_start) {
            if (std::regex_search(trimmed, brace_import_pattern())) {
                if (!imports.has_value()) {
                    CodeRegion region;
                    region.file_path = file_path;
                    region.type = RegionType::Imports;
                    region.name = "imports";
                    region.start_line = i + 1;
                    imports = region;
                }
                imports->end_line = i + 1;
            } else if (std::regex_search(trimmed, namespace_pattern())) {
                pending_transparent = true;
            } else {
                for (const auto& declaration : brace_patterns()) {
                    std::smatch match;
                    if (!std::regex_search(trimmed, match, declaration.pattern)) {
                        continue;
                    }
                    CodeRegion region;
                    region.file_path = file_path;
                    region.type = declaration.type;
                    region.name = match[declaration.name_group].str();
                    region.start_line = i + 1;
                    const std::size_t end = find_block_end(lines, i);
                    region.end_line = end + 1;
                    covered_until = end + 1;
                    regions.push_back(region);
                    break;
                }
            }
        }

        bool saw_semicolon = false;
        bool saw_open = false;
        const bool was_pending = pending_transparent;
        const int before = depth;
        depth += brace_delta(lines[i], in_block_comment, saw_semicolon, saw_open);
        if (was_pending && saw_open) {
            transparent_depths.push_back(before);
            pending_transparent = false;
        }
        while (!transparent_depths.empty() && depth <= transparent_depths.back()) {
            transparent_depths.pop_back();
        }
        if (depth < 0) {
            depth = 0;
        }
    }

    if (imports.has_value()) {
        regions.insert(regions.begin(), imports.value());
    }
    return regions;
}

std::vector<CodeRegion> RegionAnalyzer::analyze_python(
    const std::string& file_path, const std::vector<std::string>& lines) const {
    static const std::regex def_pattern(R"(^(async\s+)?def\s+([A-Za-z_]\w*))");
    static const std::regex class_pattern(R"(^class\s+([A-Za-z_]\w*))");
    static const std::regex import_pattern(R"(^(import\s|from\s+\S+\s+import\s))");
    static const std::regex variable_pattern(R"(^([A-Za-z_]\w*)\s*(:[^=]+)?=[^=])");

    std::vector<CodeRegion> regions;
    std::optional<CodeRegion> imports;

    auto block_end = [&lines](const std::size_t start) {
        std::size_t last = start;
        for (std::size_t j = start + 1; j < lines.size(); ++j) {
            if (is_blank(lines[j])) {
                continue;
            }
            if (lines[j][0] != ' ' && lines[j][0] != '\t' && lines[j][0] != '#' &&
                lines[j][0] != ')' && lines[j][0] != ']' && lines[j][0] != '}') {
                break;
            }
            last = j;
        }
        return last;
    };

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string line = declaration_head(lines[i]);
        if (is_blank(line) || line[0] == ' ' || line[0] == '\t' || line[0] == '#' ||
            line[0] == '@') {
            continue;
        }

        std::smatch match;
        if (std::regex_search(line, import_pattern)) {
            if (!imports.has_value()) {
                CodeRegion region;
                region.file_path = file_path;
                region.type = RegionType::Imports;
                region.name = "imports";
                region.start_line = i + 1;
                imports = region;
            }
            imports->end_line = i + 1;
            continue;
        }

        CodeRegion region;
        region.file_path = file_path;
        if (std::regex_search(line, match, def_pattern)) {
            region.type = RegionType::Function;
            region.name = match[2].str();
        } else if (std::regex_search(line, match, class_pattern)) {
            region.type = RegionType::Class;
            region.name = match[1].str();
        } else if (std::regex_search(line, match, variable_pattern)) {
            region.type = RegionType::Variable;
            region.name = match[1].str();
        } else {
            continue;
        }

        // Decorators directly above belong to the declaration.
        std::size_t start = i;
        while (start > 0 && !lines[start - 1].empty() && lines[start - 1][0] == '@') {
            --start;
        }
        const std::size_t end = block_end(i);
        region.start_line = start + 1;
        region.end_line = end + 1;
        regions.push_back(region);
        i = end;
    }

    if (imports.has_value()) {
        regions.insert(regions.begin(), imports.value());
    }
    return regions;
}

std::vector<CodeRegion> RegionAnalyzer::analyze_chunks(
    const std::string& file_path, const std::vector<std::string>& lines) const {
    std::vector<CodeRegion> regions;
    for (std::size_t start = 0; start < lines.size(); start += chunk_lines_) {
        const std::size_t end = std::min(start + chunk_lines_, lines.size());
        CodeRegion region;
        region.file_path = file_path;
        region.type = RegionType::Other;
        region.start_line = start + 1;
        region.end_line = end;
        region.name = "lines_" + std::to_string(region.start_line) + "_" +
                      std::to_string(region.end_line);
        regions.push_back(region);
    }
    return regions;
}

bool RegionAnalyzer::regions_overlap(const CodeRegion& a, const CodeRegion& b) {
    if (a.file_path != b.file_path) {
        return false;
    }
    return a.start_line <= b.end_line && b.start_line <= a.end_line;
}

std::string RegionAnalyzer::region_text(const std::string& content, const CodeRegion& region) {
    const auto lines = split_lines(content);
    if (region.start_line == 0 || region.start_line > lines.size()) {
        return "";
    }
    const std::size_t end = std::min(region.end_line, lines.size());
    std::vector<std::string> selected(lines.begin() + static_cast<std::ptrdiff_t>(region.start_line - 1),
                                      lines.begin() + static_cast<std::ptrdiff_t>(end));
    return join_lines(selected);
}

}  // namespace hive::merge
