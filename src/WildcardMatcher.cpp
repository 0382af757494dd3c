#include "WildcardMatcher.hpp"

#include <algorithm>
#include <cctype>

namespace
{
    std::string ToLower(const std::string& Text)
    {
        std::string Lowered(Text);
        std::transform(Lowered.begin(), Lowered.end(), Lowered.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
        return Lowered;
    }

    bool MatchFrom(const std::string& Pattern, size_t P, const std::string& Name, size_t N)
    {
        if (P == Pattern.size())
        {
            return N == Name.size();
        }

        if (Pattern[P] == '*')
        {
            // Zero characters first, then consume one and retry
            if (MatchFrom(Pattern, P + 1, Name, N))
            {
                return true;
            }
            return N < Name.size() && MatchFrom(Pattern, P, Name, N + 1);
        }

        if (N == Name.size())
        {
            return false;
        }

        if (Pattern[P] == '?' || Pattern[P] == Name[N])
        {
            return MatchFrom(Pattern, P + 1, Name, N + 1);
        }
        return false;
    }
}

bool WildcardMatches(const std::string& Pattern, const std::string& Name)
{
    return MatchFrom(ToLower(Pattern), 0, ToLower(Name), 0);
}
