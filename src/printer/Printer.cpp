#include "printer/Printer.hpp"
#include "command/Character.hpp"
#include "util/Logger.hpp"
#include <format>

namespace thermo::printer {

Printer::Printer(std::unique_ptr<OutputSink> sink, size_t buffer_capacity)
    : sink_(std::move(sink)), buffer_capacity_(buffer_capacity) {
    pending_.reserve(buffer_capacity_);
}

Printer::~Printer() {
    if (!pending_.empty() && !flush()) {
        util::Logger::warn(std::format("Printer: Dropped {} unsent bytes on close", pending_.size()));
    }
}

// A failed write-through takes `bytes` back out of the queue, so a false
// return never leaves half a call behind to be sent by a later retry
bool Printer::send_raw(std::string_view bytes) {
    const size_t queued = pending_.size();
    pending_.append(bytes);
    if (pending_.size() >= buffer_capacity_ && !write_pending()) {
        pending_.resize(queued);
        return false;
    }
    return true;
}

bool Printer::send(const style::StyleCommand& cmd) {
    return send_raw(command::encode(cmd));
}

bool Printer::send(const std::vector<style::StyleCommand>& cmds) {
    return send_raw(command::encode(cmds));
}

bool Printer::print(const style::StyledNode& node) {
    return send_raw(node.render());
}

bool Printer::println(const style::StyledNode& node) {
    return send_raw(node.render_line());
}

bool Printer::initialize() {
    util::Logger::debug("Printer: Initialize");
    return send_raw(command::initialize());
}

bool Printer::select_code_page(command::CodePage page) {
    util::Logger::debug(std::format("Printer: Select code page {}", command::code_page_name(page)));
    return send_raw(command::select_code_page(page));
}

bool Printer::select_character_set(command::InternationalCharacterSet set) {
    util::Logger::debug(std::format("Printer: Select character set {}", static_cast<int>(set)));
    return send_raw(command::select_character_set(set));
}

bool Printer::select_font(command::Font font) {
    return send_raw(command::select_font(font));
}

bool Printer::set_character_size(command::CharacterSize size) {
    return send_raw(command::set_character_size(size));
}

bool Printer::set_justification(command::Justification justification) {
    return send_raw(command::set_justification(justification));
}

bool Printer::set_smoothing(bool on) {
    return send_raw(command::set_smoothing(on));
}

bool Printer::flush() {
    if (!write_pending()) return false;

    if (!sink_->flush()) {
        last_error_ = "flush failed: " + sink_->last_error();
        return false;
    }
    return true;
}

// Unsent bytes stay queued on failure so the caller can retry
bool Printer::write_pending() {
    if (pending_.empty()) return true;

    if (!sink_->write(pending_)) {
        last_error_ = "write failed: " + sink_->last_error();
        util::Logger::error(std::format("Printer: {} ({} bytes pending)", last_error_, pending_.size()));
        return false;
    }

    pending_.clear();
    return true;
}

}  // namespace thermo::printer
