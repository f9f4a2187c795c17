#pragma once

#include <string>
#include <functional>

namespace talk {

/**
 * Markdown renderer that buffers streaming text and renders complete
 * CommonMark blocks with ANSI terminal formatting.
 *
 * Text is split into blocks at blank lines outside fenced code. Each
 * complete block is parsed with cmark and handed to the output callback;
 * the trailing partial block is held until more text arrives or finish()
 * is called.
 *
 * Usage:
 *   MarkdownRenderer renderer([](const std::string& s) { std::cout << s; });
 *   renderer.feed(delta1);
 *   renderer.feed(delta2);
 *   renderer.finish();  // Flush remaining content
 */
class MarkdownRenderer {
public:
    using OutputCallback = std::function<void(const std::string&)>;

    /**
     * Create a markdown renderer.
     * @param output Callback invoked with formatted text chunks
     * @param colors_enabled Whether to emit ANSI color codes
     * @param width Column count for rules and code blocks (0 = auto-detect)
     */
    explicit MarkdownRenderer(OutputCallback output, bool colors_enabled = true, int width = 0);

    // Feed a streaming text chunk.
    void feed(const std::string& delta);

    // Flush any remaining buffered content. The renderer can be reused afterwards.
    void finish();

    // Renders a complete document in one call.
    std::string render(const std::string& markdown) const;

    /**
     * Check if a line is a CommonMark thematic break (---, ***, ___).
     */
    static bool is_thematic_break(const std::string& line);

    /**
     * Check if a line is an ATX heading (# to ######).
     */
    static bool is_heading(const std::string& line);

private:
    OutputCallback output_;
    bool colors_enabled_;
    int width_;

    std::string pending_line_;     // Text after the last newline
    std::string block_;            // Complete lines of the current block
    bool in_code_block_ = false;
    char fence_char_ = 0;
    size_t fence_length_ = 0;
    bool emitted_block_ = false;   // A block has been written since the last finish()

    void process_line(const std::string& line);
    void emit_block();

    bool opens_fence(const std::string& line);
    bool closes_fence(const std::string& line) const;
};

} // namespace talk
