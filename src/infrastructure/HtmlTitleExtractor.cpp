/**
 * @file HtmlTitleExtractor.cpp
 * @brief Implementation of HtmlTitleExtractor.
 */

#include "infrastructure/HtmlTitleExtractor.hpp"
#include "infrastructure/Utf8.hpp"

#include <algorithm>
#include <cctype>

namespace dualtap::infrastructure {

namespace {

std::string ToLowerAscii(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

} // namespace

std::vector<HtmlTitleExtractor::TagPattern> HtmlTitleExtractor::DefaultPatterns() {
    return {
        {"title", false, "html_title_tag"},
        {"h1", true, "html_h1_tag"},
        {"h2", true, "html_h2_tag"},
    };
}

HtmlTitleExtractor::HtmlTitleExtractor() : m_patterns(DefaultPatterns()) {}

HtmlTitleExtractor::HtmlTitleExtractor(std::vector<TagPattern> patterns)
    : m_patterns(std::move(patterns)) {}

std::optional<domain::ExtractedTitle> HtmlTitleExtractor::extract(const std::string& html) const {
    if (html.empty()) {
        return std::nullopt;
    }

    // Offsets are shared between both copies; lowering ASCII keeps byte positions.
    const std::string lowered = ToLowerAscii(html);

    for (const auto& pattern : m_patterns) {
        for (const auto& raw : FindElementContents(html, lowered, pattern)) {
            std::string cleaned = Utf8::Trim(StripMarkup(raw));
            if (Utf8::Length(cleaned) > kMinTitleLength) {
                return domain::ExtractedTitle{Utf8::Truncate(cleaned, kMaxTitleLength), pattern.method};
            }
        }
    }
    return std::nullopt;
}

std::vector<std::string> HtmlTitleExtractor::FindElementContents(const std::string& html,
                                                                 const std::string& lowered,
                                                                 const TagPattern& pattern) {
    std::vector<std::string> contents;
    const std::string opener = "<" + pattern.tag + (pattern.allowAttributes ? "" : ">");
    const std::string closer = "</" + pattern.tag + ">";

    std::size_t pos = 0;
    while ((pos = lowered.find(opener, pos)) != std::string::npos) {
        std::size_t bodyStart = pos + opener.size();
        if (pattern.allowAttributes) {
            std::size_t tagEnd = lowered.find('>', bodyStart);
            if (tagEnd == std::string::npos) break;
            bodyStart = tagEnd + 1;
        }

        std::size_t bodyEnd = lowered.find(closer, bodyStart);
        if (bodyEnd == std::string::npos) break; // No later opener can close either.

        contents.push_back(html.substr(bodyStart, bodyEnd - bodyStart));
        pos = bodyEnd + closer.size();
    }
    return contents;
}

std::string HtmlTitleExtractor::StripMarkup(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '<') {
            std::size_t close = text.find('>', i + 1);
            if (close != std::string::npos && close > i + 1) {
                i = close + 1;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

} // namespace dualtap::infrastructure
