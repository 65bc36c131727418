#include "config/CommandLine.hpp"
#include "command/CodePage.hpp"
#include "printer/Printer.hpp"
#include "style/StyledNode.hpp"
#include "util/Logger.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using thermo::style::StyledNode;
using thermo::util::Logger;

namespace {

// Encodes for the configured code page; logs and reports failure on
// unrepresentable text
std::optional<StyledNode> encoded(const thermo::command::CodePageEncoder& encoder, const std::string& utf8) {
    thermo::command::EncodingError err;
    auto bytes = encoder.encode(utf8, &err);
    if (!bytes) {
        Logger::error("thermo: " + err.message + " at byte " + std::to_string(err.byte_offset));
        std::cerr << "thermo: " << err.message << " at byte " << err.byte_offset << "\n";
        return std::nullopt;
    }
    return StyledNode::text(*bytes);
}

bool print_demo(thermo::printer::Printer& printer) {
    StyledNode title = StyledNode("RECEIPT").bold().double_underlined();
    StyledNode order = StyledNode("Order ").append(StyledNode("#1042").reversed());
    StyledNode item1 = StyledNode("Coffee           $3.50");
    StyledNode item2 = StyledNode("Bagel            $2.25");
    StyledNode total = StyledNode("Total ").bold()
                           .append(StyledNode("           $5.75").bold().underlined());
    StyledNode note = StyledNode::text("Thank you, ")
                          .append(StyledNode("come again").double_strike())
                          .append(StyledNode("!"))
                          .underlined();

    using thermo::command::CharacterSize;
    using thermo::command::Justification;

    bool ok = printer.set_justification(Justification::Center)
        && printer.set_character_size(CharacterSize::double_size())
        && printer.set_smoothing(true)
        && printer.println(title)
        && printer.set_smoothing(false)
        && printer.set_character_size(CharacterSize::standard())
        && printer.set_justification(Justification::Left);
    if (!ok) return false;

    for (const auto& line : {order, item1, item2, total, note}) {
        if (!printer.println(line)) return false;
    }
    return true;
}

bool print_stdin(thermo::printer::Printer& printer, const thermo::command::CodePageEncoder& encoder) {
    std::string line;
    size_t count = 0;
    while (std::getline(std::cin, line)) {
        auto node = encoded(encoder, line);
        if (!node || !printer.println(*node)) return false;
        ++count;
    }
    Logger::info("thermo: Printed " + std::to_string(count) + " lines from stdin");
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        auto cmdline = thermo::config::parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
        if (!cmdline) {
            std::cerr << thermo::config::usage();
            return 1;
        }

        // Warnings logged while loading are carried over by init()
        auto config = thermo::config::resolve_config(*cmdline);
        Logger::init(config.log_file);
        Logger::set_level(config.log_level);
        Logger::info("THERMO starting, device " + config.device.string());

        auto sink = thermo::printer::FileDescriptorSink::open(config.device);
        if (!sink) {
            std::cerr << "thermo: cannot open " << config.device.string() << "\n";
            return 1;
        }

        thermo::printer::Printer printer(std::move(sink));
        thermo::command::CodePageEncoder encoder(config.code_page, config.transliterate);

        bool ok = true;
        if (config.initialize_on_open) {
            ok = printer.initialize();
        }
        ok = ok && printer.select_code_page(config.code_page);
        ok = ok && (cmdline->demo ? print_demo(printer) : print_stdin(printer, encoder));
        ok = ok && printer.flush();

        if (!ok) {
            if (!printer.last_error().empty()) {
                std::cerr << "thermo: " << printer.last_error() << "\n";
            }
            Logger::error("thermo: Printing failed");
            return 1;
        }

        Logger::info("thermo: Done");
        return 0;
    } catch (const std::exception& e) {
        Logger::error(std::string("thermo: Fatal: ") + e.what());
        std::cerr << "thermo: " << e.what() << "\n";
        return 1;
    }
}
