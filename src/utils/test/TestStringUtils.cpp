#include "StringUtils.hpp"
#include <cassert>
#include <iostream>
#include <string>

void test_case_conversion() {
    assert(StringUtils::to_lower("BZip2") == "bzip2");
    assert(StringUtils::to_upper("gzip") == "GZIP");
    std::cout << "test_case_conversion passed" << std::endl;
}

void test_trim() {
    std::string s = "  \t enwiki \n";
    StringUtils::trim(s);
    assert(s == "enwiki");
    assert(StringUtils::ltrim_view("\n  #REDIRECT [[X]]") == "#REDIRECT [[X]]");
    assert(StringUtils::ltrim_view("   ").empty());
    std::cout << "test_trim passed" << std::endl;
}

void test_prefix_suffix() {
    assert(StringUtils::istarts_with("#Redirect [[Foo]]", "#redirect"));
    assert(!StringUtils::istarts_with("#redir", "#redirect"));
    assert(StringUtils::ends_with("enwiki-latest-pages-articles.xml.bz2", ".bz2"));
    assert(!StringUtils::ends_with("gz", ".gz"));
    std::cout << "test_prefix_suffix passed" << std::endl;
}

void test_human_bytes() {
    assert(StringUtils::human_bytes(512) == "512 B");
    assert(StringUtils::human_bytes(1536) == "1.5 KiB");
    assert(StringUtils::human_bytes(100ULL * 1024 * 1024) == "100.0 MiB");
    std::cout << "test_human_bytes passed" << std::endl;
}

int main() {
    test_case_conversion();
    test_trim();
    test_prefix_suffix();
    test_human_bytes();
    std::cout << "All StringUtils tests passed." << std::endl;
    return 0;
}
