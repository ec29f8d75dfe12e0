#include "PageParser.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

std::string make_page(const std::string& id, const std::string& title, const std::string& text,
                      int ns = 0, bool redirect = false) {
    std::string p = "  <page>\n    <title>" + title + "</title>\n    <ns>" + std::to_string(ns) +
                    "</ns>\n    <id>" + id + "</id>\n";
    if (redirect) {
        p += "    <redirect title=\"Target\" />\n";
    }
    p += "    <revision>\n      <id>9" + id + "</id>\n"
         "      <contributor><username>Editor</username><id>77</id></contributor>\n"
         "      <text bytes=\"" + std::to_string(text.size()) + "\" xml:space=\"preserve\">" + text +
         "</text>\n    </revision>\n  </page>\n";
    return p;
}

std::string make_document(const std::string& pages) {
    return "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
           "<mediawiki xmlns=\"http://www.mediawiki.org/xml/export-0.10/\" xml:lang=\"en\">\n"
           "  <siteinfo>\n    <sitename>Wikipedia</sitename>\n"
           "    <namespaces><namespace key=\"0\" case=\"first-letter\" /></namespaces>\n"
           "  </siteinfo>\n" + pages + "</mediawiki>\n";
}

std::vector<PageRecord> parse_all(PageParser& parser, const std::string& xml, size_t piece) {
    std::vector<PageRecord> out;
    PageRecord record;
    for (size_t pos = 0; pos < xml.size(); pos += piece) {
        parser.feed(std::string_view(xml).substr(pos, piece));
        while (parser.next(record)) {
            out.push_back(record);
        }
    }
    parser.finish();
    while (parser.next(record)) {
        out.push_back(record);
    }
    return out;
}

PageFilter accept_all() {
    return PageFilter({0}, false, false);
}

struct RecordingObserver : public IPageObserver {
    std::vector<uint64_t> starts;
    std::vector<uint64_t> ends;
    void on_page_start(uint64_t offset) override { starts.push_back(offset); }
    void on_page_end(uint64_t offset) override { ends.push_back(offset); }
};

} // namespace

void test_filters_redirect_and_disambiguation() {
    const std::string xml = make_document(
        make_page("1", "Albert Einstein", "Albert Einstein was a physicist.") +
        make_page("2", "Einstein", "#REDIRECT [[Albert Einstein]]", 0, true) +
        make_page("3", "Mercury", "'''Mercury''' may refer to:\n{{disambiguation}}") +
        make_page("4", "Marie Curie", "Marie Curie was a chemist."));

    PageParser parser(PageFilter({0}, true, true));
    const auto records = parse_all(parser, xml, 4096);

    assert(records.size() == 2);
    assert(records[0].title == "Albert Einstein");
    assert(records[1].title == "Marie Curie");
    assert(parser.pages_seen() == 4);
    assert(parser.pages_emitted() == 2);
    assert(parser.parse_errors() == 0);
    std::cout << "test_filters_redirect_and_disambiguation passed" << std::endl;
}

void test_all_pages_in_order_small_pieces() {
    std::string pages;
    for (int i = 1; i <= 50; ++i) {
        pages += make_page(std::to_string(i), "Page " + std::to_string(i), "Body of page " + std::to_string(i));
    }
    const std::string xml = make_document(pages);

    for (size_t piece : {size_t{1}, size_t{7}, size_t{64}, xml.size()}) {
        PageParser parser(accept_all());
        const auto records = parse_all(parser, xml, piece);
        assert(records.size() == 50);
        for (int i = 0; i < 50; ++i) {
            assert(records[i].id == std::to_string(i + 1));
            assert(records[i].title == "Page " + std::to_string(i + 1));
            assert(records[i].text == "Body of page " + std::to_string(i + 1));
            assert(records[i].ns == 0);
            assert(!records[i].is_redirect);
        }
    }
    std::cout << "test_all_pages_in_order_small_pieces passed" << std::endl;
}

void test_latest_revision_and_entities() {
    const std::string xml = make_document(
        "  <page>\n    <title>AT&amp;T</title>\n    <ns>0</ns>\n    <id>42</id>\n"
        "    <revision><id>1</id><text>old body</text></revision>\n"
        "    <revision><id>2</id><text>new &lt;ref&gt;body&lt;/ref&gt;</text></revision>\n"
        "  </page>\n");

    PageParser parser(accept_all());
    const auto records = parse_all(parser, xml, 16);
    assert(records.size() == 1);
    assert(records[0].id == "42");
    assert(records[0].title == "AT&T");
    assert(records[0].text == "new <ref>body</ref>");
    std::cout << "test_latest_revision_and_entities passed" << std::endl;
}

void test_incomplete_pages_dropped() {
    const std::string xml = make_document(
        "  <page><title>No id</title><ns>0</ns><revision><text>x</text></revision></page>\n"
        "  <page><title>No text</title><ns>0</ns><id>5</id><revision><id>1</id></revision></page>\n"
        "  <page><title>Empty text</title><ns>0</ns><id>6</id><revision><text/></revision></page>\n"
        "  <page><title>Bad ns</title><ns>main</ns><id>7</id><revision><text>x</text></revision></page>\n"
        "  <page><title>No ns</title><id>8</id><revision><text>kept</text></revision></page>\n");

    PageParser parser(accept_all());
    const auto records = parse_all(parser, xml, 100);
    assert(records.size() == 1);
    assert(records[0].id == "8");
    assert(records[0].ns == 0);
    assert(parser.pages_seen() == 5);
    std::cout << "test_incomplete_pages_dropped passed" << std::endl;
}

void test_namespace_filter() {
    const std::string xml = make_document(
        make_page("1", "Article", "a") +
        make_page("2", "Talk:Article", "t", 1) +
        make_page("3", "File:X.png", "f", 6));

    PageParser main_only(PageFilter({0}, true, false));
    assert(parse_all(main_only, xml, 512).size() == 1);

    PageParser with_talk(PageFilter({0, 1}, true, false));
    const auto records = parse_all(with_talk, xml, 512);
    assert(records.size() == 2);
    assert(records[1].ns == 1);
    std::cout << "test_namespace_filter passed" << std::endl;
}

void test_redirect_text_kept_when_not_skipping() {
    const std::string xml = make_document(make_page("1", "Short", "  #redirect [[Long]]"));
    PageParser parser(accept_all());
    const auto records = parse_all(parser, xml, 512);
    assert(records.size() == 1);
    assert(records[0].is_redirect);
    std::cout << "test_redirect_text_kept_when_not_skipping passed" << std::endl;
}

void test_malformed_page_skipped() {
    const std::string xml = make_document(
        make_page("1", "First", "one") +
        "  <page><title>Broken</title><ns>0</ns><id>2</id><revision><text>oops</revision></page>\n" +
        make_page("3", "Third", "three") +
        make_page("4", "Fourth", "four"));

    for (size_t piece : {size_t{13}, xml.size()}) {
        PageParser parser(accept_all());
        const auto records = parse_all(parser, xml, piece);
        assert(records.size() == 3);
        assert(records[0].title == "First");
        assert(records[1].title == "Third");
        assert(records[2].title == "Fourth");
        assert(parser.parse_errors() == 1);
    }
    std::cout << "test_malformed_page_skipped passed" << std::endl;
}

void test_unclosed_page_does_not_swallow_rest() {
    std::string pages = make_page("1", "T1", "one");
    std::string unclosed = make_page("2", "T2", "two");
    unclosed.erase(unclosed.rfind("  </page>\n"));
    pages += unclosed;
    for (int i = 3; i <= 10; ++i) {
        pages += make_page(std::to_string(i), "T" + std::to_string(i), "body " + std::to_string(i));
    }
    const std::string xml = make_document(pages);

    for (size_t piece : {size_t{17}, size_t{256}, xml.size()}) {
        RecordingObserver observer;
        PageParser parser(accept_all(), PageParserOptions{}, &observer);
        const auto records = parse_all(parser, xml, piece);
        assert(records.size() == 9);
        assert(records[0].title == "T1");
        for (size_t i = 1; i < records.size(); ++i) {
            assert(records[i].title == "T" + std::to_string(i + 2));
        }
        assert(parser.parse_errors() >= 1);
        // The abandoned page starts but never ends
        assert(observer.starts.size() == 10);
        assert(observer.ends.size() == 9);
    }
    std::cout << "test_unclosed_page_does_not_swallow_rest passed" << std::endl;
}

void test_truncated_input_keeps_completed_pages() {
    std::string xml = make_document(
        make_page("1", "First", "one") +
        make_page("2", "Second", "two") +
        make_page("3", "Third", "three is cut off somewhere in here"));
    xml.resize(xml.find("cut off"));

    PageParser parser(accept_all());
    const auto records = parse_all(parser, xml, 50);
    assert(records.size() == 2);
    assert(records[1].title == "Second");
    assert(parser.parse_errors() == 0);
    std::cout << "test_truncated_input_keeps_completed_pages passed" << std::endl;
}

void test_fragment_mode_with_skip() {
    const std::string fragment =
        "xt>tail of an earlier page</text>\n    </revision>\n  </page>\n" +
        make_page("10", "Ten", "ten") +
        make_page("11", "Eleven", "eleven") +
        make_page("12", "Twelve", "twelve") +
        "</mediawiki>\n";

    for (size_t piece : {size_t{3}, size_t{40}, fragment.size()}) {
        PageParserOptions options;
        options.fragment = true;
        options.skip_pages = 1;
        PageParser parser(accept_all(), options);
        const auto records = parse_all(parser, fragment, piece);
        assert(records.size() == 2);
        assert(records[0].title == "Eleven");
        assert(records[1].title == "Twelve");
        assert(parser.pages_seen() == 3);
    }
    std::cout << "test_fragment_mode_with_skip passed" << std::endl;
}

void test_fragment_without_closing_root() {
    const std::string fragment = make_page("1", "A", "a") + make_page("2", "B", "b");
    PageParserOptions options;
    options.fragment = true;
    PageParser parser(accept_all(), options);
    const auto records = parse_all(parser, fragment, 10);
    assert(records.size() == 2);
    assert(parser.parse_errors() == 0);
    std::cout << "test_fragment_without_closing_root passed" << std::endl;
}

void test_observer_offsets() {
    const std::string pages = make_page("1", "A", "alpha") + make_page("2", "B", "beta", 0, true);
    const std::string xml = make_document(pages);

    RecordingObserver observer;
    PageParser parser(PageFilter({0}, true, false), {}, &observer);
    parse_all(parser, xml, 9);

    assert(observer.starts.size() == 2);
    assert(observer.ends.size() == 2);
    for (size_t i = 0; i < 2; ++i) {
        const std::string element = xml.substr(observer.starts[i], observer.ends[i] - observer.starts[i]);
        assert(element.rfind("<page>", 0) == 0);
        assert(element.size() >= 7 && element.compare(element.size() - 7, 7, "</page>") == 0);
    }

    // Fragment offsets count the discarded prefix as well
    const std::string fragment = "junk</page>\n" + pages;
    RecordingObserver frag_observer;
    PageParserOptions options;
    options.fragment = true;
    PageParser frag_parser(accept_all(), options, &frag_observer);
    parse_all(frag_parser, fragment, 5);
    assert(frag_observer.starts.size() == 2);
    assert(frag_observer.starts[0] == fragment.find("<page>"));
    assert(frag_observer.ends[1] == fragment.rfind("</page>") + 7);
    std::cout << "test_observer_offsets passed" << std::endl;
}

void test_filter_helpers() {
    assert(PageFilter::is_redirect_text("#REDIRECT [[X]]"));
    assert(PageFilter::is_redirect_text("\n  #Redirect[[X]]"));
    assert(!PageFilter::is_redirect_text("See #redirect"));

    assert(PageFilter::is_disambiguation("Mercury (disambiguation)", "text"));
    assert(PageFilter::is_disambiguation("Mercury", "x {{Disambig}} y"));
    assert(PageFilter::is_disambiguation("Mercury", "{{dab|planet}}"));
    assert(PageFilter::is_disambiguation("Mercury", "{{hndis|name=Smith}}"));
    assert(!PageFilter::is_disambiguation("Mercury", "{{disambiguation needed}}"));
    assert(!PageFilter::is_disambiguation("Mercury", "{{dablink}}"));
    assert(!PageFilter::is_disambiguation("Mercury", "plain article"));
    std::cout << "test_filter_helpers passed" << std::endl;
}

void test_record_json_line() {
    PageRecord record;
    record.id = "12";
    record.title = "Anarchism";
    record.text = "Line one\n\"quoted\"";
    record.ns = 0;
    const std::string line = record.to_json_line();
    assert(line.find('\n') == std::string::npos);

    const auto j = nlohmann::json::parse(line);
    assert(j.size() == 5);
    assert(j["id"] == "12");
    assert(j["namespace"] == 0);
    assert(j["is_redirect"] == false);
    assert(j.get<PageRecord>().text == record.text);
    std::cout << "test_record_json_line passed" << std::endl;
}

int main() {
    test_filters_redirect_and_disambiguation();
    test_all_pages_in_order_small_pieces();
    test_latest_revision_and_entities();
    test_incomplete_pages_dropped();
    test_namespace_filter();
    test_redirect_text_kept_when_not_skipping();
    test_malformed_page_skipped();
    test_unclosed_page_does_not_swallow_rest();
    test_truncated_input_keeps_completed_pages();
    test_fragment_mode_with_skip();
    test_fragment_without_closing_root();
    test_observer_offsets();
    test_filter_helpers();
    test_record_json_line();

    std::cout << "All PageParser tests passed!" << std::endl;
    return 0;
}
