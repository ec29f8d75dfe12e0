#include "PageFilter.hpp"
#include "StringUtils.hpp"
#include <string>

namespace {

constexpr std::string_view DISAMBIGUATION_TEMPLATES[] = {
    "disambiguation", "disambig", "dab", "disamb", "hndis", "geodis"
};

} // namespace

PageFilter::PageFilter(std::set<int> allowed_namespaces, bool skip_redirects, bool skip_disambiguation)
    : allowed_namespaces_(std::move(allowed_namespaces)),
      skip_redirects_(skip_redirects),
      skip_disambiguation_(skip_disambiguation) {}

PageFilter PageFilter::from_config(const RunConfig& config) {
    return PageFilter(config.allowed_namespaces, config.skip_redirects, config.skip_disambiguation);
}

bool PageFilter::is_redirect_text(std::string_view text) {
    return StringUtils::istarts_with(StringUtils::ltrim_view(text), "#redirect");
}

bool PageFilter::is_disambiguation(std::string_view title, std::string_view text) {
    if (title.find("(disambiguation)") != std::string_view::npos) {
        return true;
    }

    const std::string lowered = StringUtils::to_lower(std::string(text));
    for (const auto name : DISAMBIGUATION_TEMPLATES) {
        size_t pos = 0;
        while ((pos = lowered.find("{{", pos)) != std::string::npos) {
            pos += 2;
            if (lowered.compare(pos, name.size(), name) != 0) {
                continue;
            }
            const size_t after = pos + name.size();
            if (after < lowered.size() &&
                (lowered[after] == '|' || lowered.compare(after, 2, "}}") == 0)) {
                return true;
            }
        }
    }
    return false;
}

bool PageFilter::accepts(const PageRecord& record) const {
    if (allowed_namespaces_.count(record.ns) == 0) {
        return false;
    }
    if (skip_redirects_ && (record.is_redirect || is_redirect_text(record.text))) {
        return false;
    }
    if (skip_disambiguation_ && is_disambiguation(record.title, record.text)) {
        return false;
    }
    return true;
}
