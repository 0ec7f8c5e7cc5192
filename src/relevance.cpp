#include "relevance.hpp"

#include <algorithm>
#include <cctype>

namespace dastore {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

int relevance_score(const PackageInfo &pkg, const std::string &query) {
    std::string query_lower = to_lower(query);
    std::string name_lower = to_lower(pkg.name);

    int score = 0;
    if (name_lower == query_lower) {
        score += SCORE_EXACT;
    } else if (name_lower.compare(0, query_lower.size(), query_lower) == 0) {
        score += SCORE_PREFIX;
    } else if (name_lower.find(query_lower) != std::string::npos) {
        score += SCORE_SUBSTRING;
    }

    if (pkg.installed) {
        score += SCORE_INSTALLED;
    }

    return score;
}

void sort_by_relevance(PackageList &packages, const std::string &query) {
    for (auto &pkg : packages) {
        pkg.relevance_score = relevance_score(pkg, query);
    }

    std::stable_sort(packages.begin(), packages.end(),
        [](const PackageInfo &a, const PackageInfo &b) {
            return a.relevance_score > b.relevance_score;
        });
}

} // namespace dastore
