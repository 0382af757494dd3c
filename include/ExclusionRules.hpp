#pragma once

#include <string>
#include <unordered_set>
#include <vector>

// Rule strings, one flat list:
//   "/name"      exact directory name
//   "name"       exact file name
//   "~/pattern"  wildcard directory pattern
//   "~pattern"   wildcard file pattern
class ExclusionRules
{
public:
    ExclusionRules() = default;
    explicit ExclusionRules(const std::vector<std::string>& Rules);

    void Parse(const std::vector<std::string>& Rules);

    bool IsExcludedDirectory(const std::string& Name) const;
    bool IsExcludedFile(const std::string& Name) const;

    bool MatchesExactDirectory(const std::string& Name) const;
    bool MatchesExactFile(const std::string& Name) const;
    bool MatchesWildcardDirectory(const std::string& Name) const;
    bool MatchesWildcardFile(const std::string& Name) const;

    bool Empty() const;

private:
    std::unordered_set<std::string> ExactDirectories;
    std::unordered_set<std::string> ExactFiles;
    std::vector<std::string> WildcardDirectories;
    std::vector<std::string> WildcardFiles;
};
