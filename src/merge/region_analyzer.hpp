#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace hive::merge {

enum class RegionType {
    Imports,
    TypeDefinition,
    Interface,
    Class,
    Function,
    Variable,
    Export,
    Other
};

struct CodeRegion {
    std::string id;
    std::string file_path;
    RegionType type = RegionType::Other;
    std::string name;
    std::size_t start_line = 1;  // 1-based, inclusive
    std::size_t end_line = 1;
};

// Lightweight declaration scanner. Brace languages are split on top-level
// declarations, Python on top-level def/class, anything else into fixed
// line chunks. Not a parser: regions only need stable names and bounds.
class RegionAnalyzer {
public:
    explicit RegionAnalyzer(std::size_t chunk_lines = 50);

    std::vector<CodeRegion> analyze(const std::string& file_path,
                                    const std::string& content) const;

    // Same file and intersecting line ranges.
    static bool regions_overlap(const CodeRegion& a, const CodeRegion& b);

    // Text covered by the region's line range.
    static std::string region_text(const std::string& content, const CodeRegion& region);

private:
    enum class Language { BraceLike, Python, Unknown };

    static Language detect_language(const std::string& file_path);

    std::vector<CodeRegion> analyze_brace(const std::string& file_path,
                                          const std::vector<std::string>& lines) const;
    std::vector<CodeRegion> analyze_python(const std::string& file_path,
                                           const std::vector<std::string>& lines) const;
    std::vector<CodeRegion> analyze_chunks(const std::string& file_path,
                                           const std::vector<std::string>& lines) const;

    std::size_t chunk_lines_;
};

std::string to_string(RegionType type);

}  // namespace hive::merge
