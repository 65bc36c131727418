#pragma once

#include "printer/OutputSink.hpp"
#include "command/Character.hpp"
#include "command/CodePage.hpp"
#include "style/StyledNode.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace thermo::printer {

/**
 * Synchronous printer front end.
 *
 * Rendered bytes accumulate in an internal buffer and reach the sink only
 * on flush(), or when the buffer grows past its capacity. Every operation
 * returns false on failure; last_error() says why. A call that returns false
 * has queued nothing, so it can simply be repeated. Not thread-safe: one
 * Printer per device, owned by one thread.
 */
class Printer {
public:
    static constexpr size_t DEFAULT_BUFFER_CAPACITY = 8192;

    explicit Printer(std::unique_ptr<OutputSink> sink,
                     size_t buffer_capacity = DEFAULT_BUFFER_CAPACITY);
    ~Printer();

    Printer(const Printer&) = delete;
    Printer& operator=(const Printer&) = delete;

    // Raw bytes, passed through untouched
    bool send_raw(std::string_view bytes);

    // Encoded attribute requests, in order
    bool send(const style::StyleCommand& cmd);
    bool send(const std::vector<style::StyleCommand>& cmds);

    // Styled text without a trailing line feed
    bool print(const style::StyledNode& node);

    // Styled text followed by a line feed
    bool println(const style::StyledNode& node);

    // ESC @
    bool initialize();

    // ESC t n
    bool select_code_page(command::CodePage page);

    // ESC R n
    bool select_character_set(command::InternationalCharacterSet set);

    // Line and font settings outside the style tree. They persist on the
    // device until changed or until initialize().
    bool select_font(command::Font font);
    bool set_character_size(command::CharacterSize size);
    bool set_justification(command::Justification justification);
    bool set_smoothing(bool on);

    bool flush();

    size_t pending_bytes() const { return pending_.size(); }
    const std::string& last_error() const { return last_error_; }

    OutputSink& sink() { return *sink_; }

private:
    std::unique_ptr<OutputSink> sink_;
    size_t buffer_capacity_;
    std::string pending_;
    std::string last_error_;

    bool write_pending();
};

}  // namespace thermo::printer
