#pragma once

#include <algorithm>
#include <cctype>
#include <string>

// Lower-cases a transcript and drops trailing punctuation and whitespace.
// "Three one nine." -> "three one nine"
inline std::string normalize_transcript(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    while (!text.empty()) {
        auto c = static_cast<unsigned char>(text.back());
        if (!std::ispunct(c) && !std::isspace(c)) break;
        text.pop_back();
    }
    return text;
}
