#pragma once

#include "PageRecord.hpp"
#include "RunConfig.hpp"
#include <set>
#include <string_view>

class PageFilter {
public:
    PageFilter() = default;
    PageFilter(std::set<int> allowed_namespaces, bool skip_redirects, bool skip_disambiguation);

    static PageFilter from_config(const RunConfig& config);

    bool accepts(const PageRecord& record) const;

    // "#redirect" after leading whitespace, any case
    static bool is_redirect_text(std::string_view text);

    // "(disambiguation)" in the title or a disambiguation template in the text
    static bool is_disambiguation(std::string_view title, std::string_view text);

private:
    std::set<int> allowed_namespaces_{0};
    bool skip_redirects_ = true;
    bool skip_disambiguation_ = false;
};
