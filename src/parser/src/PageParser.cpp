#include "PageParser.hpp"
#include "IngestErrors.hpp"
#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace {

constexpr char FRAGMENT_ROOT[] = "<mediawiki>";
constexpr std::string_view PAGE_TAG = "<page";

std::string_view local_name(const XML_Char* name) {
    std::string_view n(name);
    const auto colon = n.rfind(':');
    return colon == std::string_view::npos ? n : n.substr(colon + 1);
}

} // namespace

PageParser::PageParser(PageFilter filter, PageParserOptions options, IPageObserver* observer)
    : filter_(std::move(filter)),
      observer_(observer),
      skip_remaining_(options.skip_pages) {
    if (options.fragment) {
        scanning_ = true;
    } else {
        create_parser(false);
        parser_origin_ = 0;
    }
}

PageParser::~PageParser() = default;

void PageParser::create_parser(bool fragment) {
    parser_.reset(XML_ParserCreate(nullptr));
    if (!parser_) {
        throw ParseError("XML_ParserCreate failed");
    }
    XML_SetUserData(parser_.get(), this);
    XML_SetElementHandler(parser_.get(), &PageParser::on_start, &PageParser::on_end);
    XML_SetCharacterDataHandler(parser_.get(), &PageParser::on_chars);

    stack_.clear();
    reset_page_state();
    in_page_ = false;
    suspended_ = false;
    prefix_len_ = 0;

    if (fragment) {
        prefix_len_ = sizeof(FRAGMENT_ROOT) - 1;
        if (XML_Parse(parser_.get(), FRAGMENT_ROOT, static_cast<int>(prefix_len_), XML_FALSE) != XML_STATUS_OK) {
            throw ParseError("Failed to prime fragment parser");
        }
    }
}

void PageParser::reset_page_state() {
    capture_ = Capture::None;
    page_depth_ = 0;
    revision_depth_ = 0;
    id_.clear();
    title_.clear();
    ns_.clear();
    text_.clear();
    revision_text_.clear();
    has_id_ = false;
    has_title_ = false;
    has_ns_ = false;
    has_text_ = false;
    redirect_element_ = false;
}

void PageParser::feed(std::string_view data) {
    if (suspended_ || input_pos_ < input_.size()) {
        throw std::logic_error("PageParser::feed called before previous input was drained");
    }
    if (finishing_) {
        throw std::logic_error("PageParser::feed called after finish");
    }

    const uint64_t next_base = input_base_ + input_.size();
    if (scanning_ && !carry_.empty()) {
        input_ = std::move(carry_);
        input_.append(data);
        input_base_ = next_base - (input_.size() - data.size());
    } else {
        input_.assign(data);
        input_base_ = next_base;
    }
    carry_.clear();
    input_pos_ = 0;
}

void PageParser::finish() {
    finishing_ = true;
}

bool PageParser::next(PageRecord& record) {
    while (true) {
        if (pending_) {
            record = std::move(*pending_);
            pending_.reset();
            return true;
        }
        if (done_) {
            return false;
        }
        if (suspended_) {
            run_resume();
            continue;
        }
        if (input_pos_ < input_.size()) {
            run_parse();
            continue;
        }
        if (finishing_) {
            run_final();
            continue;
        }
        return false;
    }
}

size_t PageParser::scan_for_page(size_t from) {
    size_t pos = input_.find(PAGE_TAG, from);
    while (pos != std::string::npos) {
        const size_t after = pos + PAGE_TAG.size();
        if (after >= input_.size()) {
            break;
        }
        const unsigned char c = static_cast<unsigned char>(input_[after]);
        if (c == '>' || std::isspace(c)) {
            return pos;
        }
        pos = input_.find(PAGE_TAG, pos + 1);
    }

    // Keep what could still become a <page tag once more bytes arrive
    size_t keep_from;
    if (pos != std::string::npos) {
        keep_from = pos;
    } else {
        keep_from = input_.size() >= from + PAGE_TAG.size() - 1 ? input_.size() - (PAGE_TAG.size() - 1) : from;
    }
    carry_ = input_.substr(keep_from);
    input_pos_ = input_.size();
    return std::string::npos;
}

void PageParser::run_parse() {
    if (scanning_) {
        const size_t pos = scan_for_page(input_pos_);
        if (pos == std::string::npos) {
            return;
        }
        create_parser(true);
        scanning_ = false;
        input_pos_ = pos;
        parser_origin_ = input_base_ + pos;
        LogUtils::debug("Parser synchronized at decompressed offset {}", parser_origin_);
    }

    const char* data = input_.data() + input_pos_;
    const size_t len = input_.size() - input_pos_;
    input_pos_ = input_.size();
    final_call_ = false;
    handle_status(XML_Parse(parser_.get(), data, static_cast<int>(len), XML_FALSE), false);
}

void PageParser::run_resume() {
    suspended_ = false;
    handle_status(XML_ResumeParser(parser_.get()), final_call_);
}

void PageParser::run_final() {
    if (scanning_ || !parser_) {
        done_ = true;
        return;
    }
    final_call_ = true;
    handle_status(XML_Parse(parser_.get(), nullptr, 0, XML_TRUE), true);
}

void PageParser::handle_status(XML_Status status, bool final) {
    if (status == XML_STATUS_SUSPENDED) {
        suspended_ = true;
        return;
    }
    if (status == XML_STATUS_OK) {
        if (final) {
            done_ = true;
        }
        return;
    }

    const XML_Error code = XML_GetErrorCode(parser_.get());
    if (final) {
        // Fragments never see their closing root, and a cut-off input
        // ends inside an element; neither loses a completed page
        if (in_page_) {
            LogUtils::warn("Input ended inside a page ({}); partial page discarded", XML_ErrorString(code));
        } else {
            LogUtils::debug("Input ended: {}", XML_ErrorString(code));
        }
        done_ = true;
        return;
    }

    ++parse_errors_;
    LogUtils::warn("XML error at decompressed offset {} (line {}): {}; skipping to the next page",
                   to_segment_offset(XML_GetCurrentByteIndex(parser_.get())),
                   XML_GetCurrentLineNumber(parser_.get()), XML_ErrorString(code));
    resync_after_error();
}

void PageParser::resync_after_error() {
    const uint64_t error_offset = to_segment_offset(XML_GetCurrentByteIndex(parser_.get()));

    size_t from = 0;
    if (error_offset >= input_base_) {
        from = static_cast<size_t>(std::min<uint64_t>(error_offset - input_base_ + 1, input_.size()));
    }

    parser_.reset();
    stack_.clear();
    reset_page_state();
    in_page_ = false;
    suspended_ = false;
    scanning_ = true;
    carry_.clear();
    input_pos_ = from;
}

uint64_t PageParser::to_segment_offset(XML_Index index) const {
    return parser_origin_ + static_cast<uint64_t>(index) - prefix_len_;
}

void XMLCALL PageParser::on_start(void* user_data, const XML_Char* name, const XML_Char**) {
    static_cast<PageParser*>(user_data)->handle_start(local_name(name));
}

void XMLCALL PageParser::on_end(void* user_data, const XML_Char* name) {
    static_cast<PageParser*>(user_data)->handle_end(local_name(name));
}

void XMLCALL PageParser::on_chars(void* user_data, const XML_Char* s, int len) {
    auto* self = static_cast<PageParser*>(user_data);
    switch (self->capture_) {
        case Capture::Id:    self->id_.append(s, len); break;
        case Capture::Title: self->title_.append(s, len); break;
        case Capture::Ns:    self->ns_.append(s, len); break;
        case Capture::Text:  self->revision_text_.append(s, len); break;
        case Capture::None:  break;
    }
}

void PageParser::handle_start(std::string_view name) {
    stack_.emplace_back(name);
    const size_t depth = stack_.size();

    if (in_page_ && name == "page") {
        // The open page was never closed; drop it and start over here
        ++parse_errors_;
        LogUtils::warn("Page '{}' at depth {} is missing its end tag; discarding it", title_, page_depth_);
        in_page_ = false;
    }

    if (!in_page_) {
        if (name == "page") {
            reset_page_state();
            in_page_ = true;
            page_depth_ = depth;
            if (observer_) {
                observer_->on_page_start(to_segment_offset(XML_GetCurrentByteIndex(parser_.get())));
            }
        }
        return;
    }

    if (name == "redirect") {
        redirect_element_ = true;
    }

    if (depth == page_depth_ + 1) {
        if (name == "id" && !has_id_) {
            id_.clear();
            capture_ = Capture::Id;
        } else if (name == "title") {
            title_.clear();
            capture_ = Capture::Title;
        } else if (name == "ns") {
            ns_.clear();
            capture_ = Capture::Ns;
        } else if (name == "revision") {
            revision_depth_ = depth;
        }
    } else if (revision_depth_ != 0 && depth == revision_depth_ + 1 && name == "text") {
        revision_text_.clear();
        capture_ = Capture::Text;
    }
}

void PageParser::handle_end(std::string_view name) {
    const size_t depth = stack_.size();

    if (in_page_) {
        switch (capture_) {
            case Capture::Id:    has_id_ = true; break;
            case Capture::Title: has_title_ = true; break;
            case Capture::Ns:    has_ns_ = true; break;
            case Capture::Text:
                // Later revisions replace earlier ones
                text_.swap(revision_text_);
                has_text_ = true;
                break;
            case Capture::None:  break;
        }
        capture_ = Capture::None;

        if (revision_depth_ == depth && name == "revision") {
            revision_depth_ = 0;
        } else if (page_depth_ == depth && name == "page") {
            finish_page();
        }
    }

    if (!stack_.empty()) {
        stack_.pop_back();
    }
}

void PageParser::finish_page() {
    const uint64_t end = to_segment_offset(XML_GetCurrentByteIndex(parser_.get())) +
                         static_cast<uint64_t>(XML_GetCurrentByteCount(parser_.get()));
    in_page_ = false;
    ++pages_seen_;
    if (observer_) {
        observer_->on_page_end(end);
    }

    if (skip_remaining_ > 0) {
        --skip_remaining_;
        reset_page_state();
        return;
    }

    StringUtils::trim(id_);
    if (!has_id_ || !has_title_ || !has_text_ || id_.empty() || title_.empty() || text_.empty()) {
        LogUtils::debug("Dropping incomplete page ending at offset {}", end);
        reset_page_state();
        return;
    }

    int ns = 0;
    StringUtils::trim(ns_);
    if (has_ns_ && !ns_.empty()) {
        const auto [ptr, ec] = std::from_chars(ns_.data(), ns_.data() + ns_.size(), ns);
        if (ec != std::errc() || ptr != ns_.data() + ns_.size()) {
            LogUtils::debug("Dropping page '{}' with non-integer namespace '{}'", title_, ns_);
            reset_page_state();
            return;
        }
    }

    PageRecord record;
    record.id = std::move(id_);
    record.title = std::move(title_);
    record.text = std::move(text_);
    record.ns = ns;
    record.is_redirect = redirect_element_ || PageFilter::is_redirect_text(record.text);
    reset_page_state();

    if (!filter_.accepts(record)) {
        return;
    }

    ++pages_emitted_;
    pending_ = std::move(record);
    XML_StopParser(parser_.get(), XML_TRUE);
}
