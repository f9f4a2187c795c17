#include "markdown_renderer.hpp"
#include "terminal.hpp"

#include <cmark.h>
#include <sstream>

namespace talk {

namespace {

constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD = "\033[1m";
constexpr const char* DIM = "\033[2m";
constexpr const char* ITALIC = "\033[3m";
constexpr const char* UNDERLINE = "\033[4m";
constexpr const char* YELLOW = "\033[33m";
constexpr const char* CYAN = "\033[36m";
constexpr const char* GREEN = "\033[32m";

// Walks a cmark tree and writes terminal text.
class TreeWriter {
public:
    TreeWriter(bool colors, int width) : colors_(colors), width_(width) {}

    std::string write(cmark_node* doc) {
        for (cmark_node* child = cmark_node_first_child(doc); child; child = cmark_node_next(child)) {
            block(child, "");
        }
        return out_.str();
    }

private:
    bool colors_;
    int width_;
    std::ostringstream out_;

    std::string style(const char* code) const {
        return colors_ ? code : "";
    }

    std::string reset() const {
        return colors_ ? RESET : "";
    }

    static std::string literal(cmark_node* node) {
        const char* text = cmark_node_get_literal(node);
        return text ? text : "";
    }

    // Renders the inline children of node on one logical line.
    std::string inlines(cmark_node* node, const std::string& prefix) {
        std::string result;
        for (cmark_node* cur = cmark_node_first_child(node); cur; cur = cmark_node_next(cur)) {
            switch (cmark_node_get_type(cur)) {
                case CMARK_NODE_TEXT:
                    result += literal(cur);
                    break;
                case CMARK_NODE_SOFTBREAK:
                case CMARK_NODE_LINEBREAK:
                    result += "\n" + prefix;
                    break;
                case CMARK_NODE_CODE:
                    result += style(YELLOW) + (colors_ ? "" : "`") + literal(cur) +
                              (colors_ ? "" : "`") + reset();
                    break;
                case CMARK_NODE_EMPH:
                    result += style(ITALIC) + inlines(cur, prefix) + reset();
                    break;
                case CMARK_NODE_STRONG:
                    result += style(BOLD) + inlines(cur, prefix) + reset();
                    break;
                case CMARK_NODE_LINK: {
                    const char* url = cmark_node_get_url(cur);
                    std::string text = inlines(cur, prefix);
                    result += style(UNDERLINE) + text + reset();
                    if (url && *url && text != url) {
                        result += style(DIM) + " (" + url + ")" + reset();
                    }
                    break;
                }
                case CMARK_NODE_IMAGE: {
                    const char* url = cmark_node_get_url(cur);
                    result += "[image: " + inlines(cur, prefix) + "]";
                    if (url && *url) {
                        result += style(DIM) + " (" + url + ")" + reset();
                    }
                    break;
                }
                case CMARK_NODE_HTML_INLINE:
                    result += literal(cur);
                    break;
                default:
                    result += inlines(cur, prefix);
                    break;
            }
        }
        return result;
    }

    void block(cmark_node* node, const std::string& prefix) {
        switch (cmark_node_get_type(node)) {
            case CMARK_NODE_HEADING: {
                int level = cmark_node_get_heading_level(node);
                std::string text = inlines(node, prefix);
                out_ << prefix << style(BOLD) << (level <= 2 ? style(CYAN) : "") << text << reset() << "\n";
                if (level == 1) {
                    out_ << prefix << std::string(static_cast<size_t>(terminal::display_width(text)), '=') << "\n";
                }
                break;
            }
            case CMARK_NODE_PARAGRAPH:
                out_ << prefix << inlines(node, prefix) << "\n";
                break;
            case CMARK_NODE_CODE_BLOCK: {
                const char* info = cmark_node_get_fence_info(node);
                if (info && *info) {
                    out_ << prefix << style(DIM) << "[" << info << "]" << reset() << "\n";
                }
                std::istringstream lines(literal(node));
                std::string line;
                while (std::getline(lines, line)) {
                    out_ << prefix << "    " << style(GREEN) << line << reset() << "\n";
                }
                break;
            }
            case CMARK_NODE_BLOCK_QUOTE: {
                std::string quote_prefix = prefix + style(DIM) + "│ " + reset();
                bool first = true;
                for (cmark_node* child = cmark_node_first_child(node); child; child = cmark_node_next(child)) {
                    if (!first) {
                        out_ << quote_prefix << "\n";
                    }
                    block(child, quote_prefix);
                    first = false;
                }
                break;
            }
            case CMARK_NODE_LIST:
                list(node, prefix);
                break;
            case CMARK_NODE_THEMATIC_BREAK: {
                int rule_width = width_ > 40 ? 40 : width_;
                std::string rule;
                for (int i = 0; i < rule_width; ++i) {
                    rule += "─";
                }
                out_ << prefix << style(DIM) << rule << reset() << "\n";
                break;
            }
            case CMARK_NODE_HTML_BLOCK:
                out_ << prefix << literal(node);
                break;
            default:
                for (cmark_node* child = cmark_node_first_child(node); child; child = cmark_node_next(child)) {
                    block(child, prefix);
                }
                break;
        }
    }

    void list(cmark_node* node, const std::string& prefix) {
        bool ordered = cmark_node_get_list_type(node) == CMARK_ORDERED_LIST;
        int number = cmark_node_get_list_start(node);

        for (cmark_node* item = cmark_node_first_child(node); item; item = cmark_node_next(item)) {
            std::string marker = ordered ? std::to_string(number++) + ". " : "• ";
            std::string child_prefix = prefix + std::string(static_cast<size_t>(terminal::display_width(marker)), ' ');

            bool first = true;
            for (cmark_node* child = cmark_node_first_child(item); child; child = cmark_node_next(child)) {
                if (first && cmark_node_get_type(child) == CMARK_NODE_PARAGRAPH) {
                    out_ << prefix << style(CYAN) << marker << reset() << inlines(child, child_prefix) << "\n";
                } else {
                    if (first) {
                        out_ << prefix << style(CYAN) << marker << reset() << "\n";
                    }
                    block(child, child_prefix);
                }
                first = false;
            }
            if (first) {
                out_ << prefix << style(CYAN) << marker << reset() << "\n";
            }
        }
    }
};

} // namespace

MarkdownRenderer::MarkdownRenderer(OutputCallback output, bool colors_enabled, int width)
    : output_(std::move(output))
    , colors_enabled_(colors_enabled)
    , width_(width > 0 ? width : terminal::get_width()) {}

std::string MarkdownRenderer::render(const std::string& markdown) const {
    cmark_node* doc = cmark_parse_document(markdown.c_str(), markdown.length(), CMARK_OPT_DEFAULT);
    if (!doc) {
        return markdown;
    }
    TreeWriter writer(colors_enabled_, width_);
    std::string result = writer.write(doc);
    cmark_node_free(doc);
    return result;
}

bool MarkdownRenderer::is_thematic_break(const std::string& line) {
    size_t pos = line.find_first_not_of(' ');
    if (pos == std::string::npos || pos > 3) {
        return false;
    }
    char marker = line[pos];
    if (marker != '-' && marker != '*' && marker != '_') {
        return false;
    }
    int count = 0;
    for (size_t i = pos; i < line.length(); ++i) {
        if (line[i] == marker) {
            ++count;
        } else if (line[i] != ' ' && line[i] != '\t') {
            return false;
        }
    }
    return count >= 3;
}

bool MarkdownRenderer::is_heading(const std::string& line) {
    size_t pos = line.find_first_not_of(' ');
    if (pos == std::string::npos || pos > 3 || line[pos] != '#') {
        return false;
    }
    size_t end = line.find_first_not_of('#', pos);
    size_t level = (end == std::string::npos ? line.length() : end) - pos;
    if (level > 6) {
        return false;
    }
    return end == std::string::npos || line[end] == ' ' || line[end] == '\t';
}

bool MarkdownRenderer::opens_fence(const std::string& line) {
    size_t pos = line.find_first_not_of(' ');
    if (pos == std::string::npos || pos > 3) {
        return false;
    }
    char c = line[pos];
    if (c != '`' && c != '~') {
        return false;
    }
    size_t end = line.find_first_not_of(c, pos);
    size_t length = (end == std::string::npos ? line.length() : end) - pos;
    if (length < 3) {
        return false;
    }
    // Backtick fences cannot have backticks in the info string
    if (c == '`' && end != std::string::npos && line.find('`', end) != std::string::npos) {
        return false;
    }
    fence_char_ = c;
    fence_length_ = length;
    return true;
}

bool MarkdownRenderer::closes_fence(const std::string& line) const {
    size_t pos = line.find_first_not_of(' ');
    if (pos == std::string::npos || pos > 3 || line[pos] != fence_char_) {
        return false;
    }
    size_t end = line.find_first_not_of(fence_char_, pos);
    size_t length = (end == std::string::npos ? line.length() : end) - pos;
    if (length < fence_length_) {
        return false;
    }
    return end == std::string::npos || line.find_first_not_of(" \t", end) == std::string::npos;
}

void MarkdownRenderer::feed(const std::string& delta) {
    pending_line_ += delta;

    size_t pos;
    while ((pos = pending_line_.find('\n')) != std::string::npos) {
        std::string line = pending_line_.substr(0, pos);
        pending_line_.erase(0, pos + 1);
        process_line(line);
    }
}

void MarkdownRenderer::process_line(const std::string& line) {
    if (in_code_block_) {
        block_ += line + "\n";
        if (closes_fence(line)) {
            in_code_block_ = false;
            emit_block();
        }
        return;
    }

    if (line.find_first_not_of(" \t\r") == std::string::npos) {
        emit_block();
        return;
    }

    // ATX headings are single-line blocks and interrupt a paragraph. A rule
    // is only a rule when no paragraph precedes it (else it is a setext underline).
    if (is_heading(line) || (block_.empty() && is_thematic_break(line))) {
        emit_block();
        block_ = line + "\n";
        emit_block();
        return;
    }

    if (opens_fence(line)) {
        // A fence starts its own block
        emit_block();
        in_code_block_ = true;
    }
    block_ += line + "\n";
}

void MarkdownRenderer::emit_block() {
    if (block_.empty()) {
        return;
    }
    std::string formatted = render(block_);
    block_.clear();
    if (formatted.empty()) {
        return;
    }
    if (emitted_block_) {
        output_("\n");
    }
    output_(formatted);
    emitted_block_ = true;
}

void MarkdownRenderer::finish() {
    if (!pending_line_.empty()) {
        std::string line;
        line.swap(pending_line_);
        process_line(line);
    }
    // An unterminated fence is still rendered as code
    in_code_block_ = false;
    emit_block();
    emitted_block_ = false;
}

} // namespace talk
