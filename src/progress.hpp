#pragma once

#include <string>

namespace dastore {

struct ProgressUpdate {
    bool matched = false;
    double fraction = 0.0;   // overall, 0..1
    std::string status;
};

// Map one line of pacman output to overall progress. Only lines carrying a
// "(NN%)" marker and a known phase match.
ProgressUpdate parse_progress_line(const std::string &line);

// True for ":: Proceed with installation? [Y/n]" style prompts.
bool needs_confirmation(const std::string &line);

} // namespace dastore
