#include "progress.hpp"

#include <algorithm>
#include <cctype>

namespace dastore {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// First "(NN%)" in the line, or -1.
int find_percent(const std::string &line) {
    size_t pos = 0;
    while ((pos = line.find('(', pos)) != std::string::npos) {
        size_t j = pos + 1;
        int value = 0;
        size_t digits = 0;
        while (j < line.size() && std::isdigit(static_cast<unsigned char>(line[j]))) {
            if (digits < 3) value = value * 10 + (line[j] - '0');
            digits++;
            j++;
        }
        if (digits > 0 && digits <= 3 && j + 1 < line.size() &&
            line[j] == '%' && line[j + 1] == ')') {
            return std::min(value, 100);
        }
        pos++;
    }
    return -1;
}

} // anonymous namespace

ProgressUpdate parse_progress_line(const std::string &line) {
    ProgressUpdate update;

    int percent = find_percent(line);
    if (percent < 0) {
        return update;
    }

    double p = percent / 100.0;
    std::string lower = to_lower(line);

    if (lower.find("downloading") != std::string::npos) {
        update.matched = true;
        update.fraction = 0.1 + p * 0.3;
        update.status = "Downloading...";
    } else if (lower.find("installing") != std::string::npos ||
               lower.find("upgrading") != std::string::npos) {
        update.matched = true;
        update.fraction = 0.4 + p * 0.5;
        update.status = "Installing...";
    } else if (lower.find("removing") != std::string::npos) {
        update.matched = true;
        update.fraction = 0.4 + p * 0.5;
        update.status = "Removing...";
    }

    return update;
}

bool needs_confirmation(const std::string &line) {
    return to_lower(line).find(":: proceed") != std::string::npos;
}

} // namespace dastore
