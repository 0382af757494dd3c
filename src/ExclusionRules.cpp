#include "ExclusionRules.hpp"
#include "WildcardMatcher.hpp"

#include <algorithm>

ExclusionRules::ExclusionRules(const std::vector<std::string>& Rules)
{
    Parse(Rules);
}

void ExclusionRules::Parse(const std::vector<std::string>& Rules)
{
    ExactDirectories.clear();
    ExactFiles.clear();
    WildcardDirectories.clear();
    WildcardFiles.clear();

    for (const auto& Rule : Rules)
    {
        if (Rule.empty())
        {
            continue;
        }

        if (Rule.starts_with("~/"))
        {
            WildcardDirectories.push_back(Rule.substr(2));
        }
        else if (Rule.starts_with("~"))
        {
            WildcardFiles.push_back(Rule.substr(1));
        }
        else if (Rule.starts_with("/"))
        {
            size_t NameStart = Rule.find_first_not_of('/');
            if (NameStart != std::string::npos)
            {
                ExactDirectories.insert(Rule.substr(NameStart));
            }
        }
        else
        {
            ExactFiles.insert(Rule);
        }
    }
}

bool ExclusionRules::MatchesExactDirectory(const std::string& Name) const
{
    return ExactDirectories.count(Name) > 0;
}

bool ExclusionRules::MatchesExactFile(const std::string& Name) const
{
    return ExactFiles.count(Name) > 0;
}

bool ExclusionRules::MatchesWildcardDirectory(const std::string& Name) const
{
    return std::any_of(WildcardDirectories.begin(), WildcardDirectories.end(), [&Name](const std::string& Pattern) { return WildcardMatches(Pattern, Name); });
}

bool ExclusionRules::MatchesWildcardFile(const std::string& Name) const
{
    return std::any_of(WildcardFiles.begin(), WildcardFiles.end(), [&Name](const std::string& Pattern) { return WildcardMatches(Pattern, Name); });
}

bool ExclusionRules::IsExcludedDirectory(const std::string& Name) const
{
    return MatchesExactDirectory(Name) || MatchesWildcardDirectory(Name);
}

bool ExclusionRules::IsExcludedFile(const std::string& Name) const
{
    return MatchesExactFile(Name) || MatchesWildcardFile(Name);
}

bool ExclusionRules::Empty() const
{
    return ExactDirectories.empty() && ExactFiles.empty() && WildcardDirectories.empty() && WildcardFiles.empty();
}
