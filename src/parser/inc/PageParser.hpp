#pragma once

#include "PageFilter.hpp"
#include "PageObserver.hpp"
#include "PageRecord.hpp"
#include <expat.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <type_traits>
#include <string>
#include <string_view>
#include <vector>

struct PageParserOptions {
    // Input starts mid-document: bytes before the first <page> are dropped
    bool fragment = false;

    // Completed pages to consume without emitting
    uint64_t skip_pages = 0;
};

// Pull parser over a MediaWiki export. Decompressed bytes go in through
// feed(); next() runs expat until one accepted page is complete, so at
// most one record is ever pending.
class PageParser {
public:
    PageParser(PageFilter filter, PageParserOptions options = {}, IPageObserver* observer = nullptr);
    ~PageParser();

    PageParser(const PageParser&) = delete;
    PageParser& operator=(const PageParser&) = delete;

    // Only valid after next() has returned false for the previous input
    void feed(std::string_view data);

    // End of input; call next() afterwards to drain
    void finish();

    bool next(PageRecord& record);

    uint64_t pages_seen() const noexcept { return pages_seen_; }
    uint64_t pages_emitted() const noexcept { return pages_emitted_; }
    uint64_t parse_errors() const noexcept { return parse_errors_; }

private:
    struct ParserDeleter {
        void operator()(XML_Parser p) const noexcept { XML_ParserFree(p); }
    };
    using ParserPtr = std::unique_ptr<std::remove_pointer_t<XML_Parser>, ParserDeleter>;

    enum class Capture { None, Id, Title, Ns, Text };

    static void XMLCALL on_start(void* user_data, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL on_end(void* user_data, const XML_Char* name);
    static void XMLCALL on_chars(void* user_data, const XML_Char* s, int len);

    void handle_start(std::string_view name);
    void handle_end(std::string_view name);
    void finish_page();

    void create_parser(bool fragment);
    void reset_page_state();

    // Returns the index in input_ where a <page> tag starts, or npos and
    // keeps a small carry for a tag split across feeds
    size_t scan_for_page(size_t from);

    void run_parse();
    void run_resume();
    void run_final();
    void handle_status(XML_Status status, bool final);
    void resync_after_error();

    uint64_t to_segment_offset(XML_Index index) const;

    PageFilter filter_;
    IPageObserver* observer_;
    uint64_t skip_remaining_;

    ParserPtr parser_;
    size_t prefix_len_ = 0;
    uint64_t parser_origin_ = 0;     // segment offset of the first real byte given to parser_
    bool scanning_ = false;
    bool finishing_ = false;
    bool done_ = false;
    bool suspended_ = false;
    bool final_call_ = false;

    std::string input_;
    std::string carry_;              // tail of a scanned buffer that may hold a split <page tag
    uint64_t input_base_ = 0;        // segment offset of input_[0]
    size_t input_pos_ = 0;           // first byte of input_ not yet handed to expat
    size_t call_start_ = 0;          // input_ index where the last XML_Parse call began
    XML_Index call_index_ = 0;       // parser byte index at that point

    // Per-page state
    std::vector<std::string> stack_;
    bool in_page_ = false;
    size_t page_depth_ = 0;
    size_t revision_depth_ = 0;
    Capture capture_ = Capture::None;
    std::string id_;
    std::string title_;
    std::string ns_;
    std::string text_;
    std::string revision_text_;
    bool has_id_ = false;
    bool has_title_ = false;
    bool has_ns_ = false;
    bool has_text_ = false;
    bool redirect_element_ = false;

    std::optional<PageRecord> pending_;

    uint64_t pages_seen_ = 0;
    uint64_t pages_emitted_ = 0;
    uint64_t parse_errors_ = 0;
};
