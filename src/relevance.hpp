#pragma once

#include "package.hpp"

#include <string>

namespace dastore {

constexpr int SCORE_EXACT = 1000;
constexpr int SCORE_PREFIX = 800;
constexpr int SCORE_SUBSTRING = 400;
constexpr int SCORE_INSTALLED = 50;

// Score a package name against the query (case-insensitive).
int relevance_score(const PackageInfo &pkg, const std::string &query);

// Score every package and stable-sort, best first.
void sort_by_relevance(PackageList &packages, const std::string &query);

} // namespace dastore
