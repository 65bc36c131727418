#include "../framework/SimpleTest.hpp"
#include "command/Character.hpp"
#include "command/CodePage.hpp"
#include "command/Command.hpp"
#include <string>

using namespace thermo::command;
using thermo::style::StyleAttribute;
using thermo::style::StyleCommand;
using thermo::style::Underline;

TEST_CASE(test_emphasized_bytes) {
    ASSERT_BYTES_EQ(set_emphasized(true), (std::string{0x1B, 'E', 1}));
    ASSERT_BYTES_EQ(set_emphasized(false), (std::string{0x1B, 'E', 0}));
}

TEST_CASE(test_underline_bytes) {
    ASSERT_BYTES_EQ(set_underline(Underline::None), (std::string{0x1B, '-', 0}));
    ASSERT_BYTES_EQ(set_underline(Underline::Single), (std::string{0x1B, '-', 1}));
    ASSERT_BYTES_EQ(set_underline(Underline::Double), (std::string{0x1B, '-', 2}));
}

TEST_CASE(test_other_attribute_bytes) {
    ASSERT_BYTES_EQ(set_double_strike(true), (std::string{0x1B, 'G', 1}));
    ASSERT_BYTES_EQ(set_reverse(true), (std::string{0x1D, 'B', 1}));
    ASSERT_BYTES_EQ(set_reverse(false), (std::string{0x1D, 'B', 0}));
    ASSERT_BYTES_EQ(set_upside_down(true), (std::string{0x1B, '{', 1}));
    ASSERT_BYTES_EQ(set_rotation(true), (std::string{0x1B, 'V', 1}));
    ASSERT_BYTES_EQ(set_rotation(false), (std::string{0x1B, 'V', 0}));
}

TEST_CASE(test_encode_style_command) {
    ASSERT_BYTES_EQ(encode(StyleCommand::toggle(StyleAttribute::Bold, true)), set_emphasized(true));
    ASSERT_BYTES_EQ(encode(StyleCommand::toggle(StyleAttribute::DoubleStrike, false)), set_double_strike(false));
    ASSERT_BYTES_EQ(encode(StyleCommand::toggle(StyleAttribute::UpsideDown, false)), set_upside_down(false));
    ASSERT_BYTES_EQ(encode(StyleCommand::underline_level(Underline::Double)), set_underline(Underline::Double));
    ASSERT_BYTES_EQ(encode(StyleCommand::underline_level(Underline::None)), set_underline(Underline::None));
}

TEST_CASE(test_encode_command_list_keeps_order) {
    std::vector<StyleCommand> cmds = {
        StyleCommand::toggle(StyleAttribute::Rotated, true),
        StyleCommand::toggle(StyleAttribute::Bold, false),
    };
    ASSERT_BYTES_EQ(encode(cmds), set_rotation(true) + set_emphasized(false));
    ASSERT_TRUE(encode(std::vector<StyleCommand>{}).empty());
}

TEST_CASE(test_fixed_commands) {
    ASSERT_BYTES_EQ(line_feed(), "\n");
    ASSERT_BYTES_EQ(initialize(), (std::string{0x1B, '@'}));
    ASSERT_BYTES_EQ(select_code_page(CodePage::Windows1252), (std::string{0x1B, 't', 16}));
    ASSERT_BYTES_EQ(select_code_page(CodePage::Cp437), (std::string{0x1B, 't', 0}));
}

TEST_CASE(test_underline_encoded_from_level_only) {
    // A hand-built request whose flag disagrees with its level
    StyleCommand off;
    off.attribute = StyleAttribute::Underline;
    off.enabled = true;
    off.underline = Underline::None;
    ASSERT_BYTES_EQ(encode(off), set_underline(Underline::None));

    StyleCommand twodot;
    twodot.attribute = StyleAttribute::Underline;
    twodot.enabled = false;
    twodot.underline = Underline::Double;
    ASSERT_BYTES_EQ(encode(twodot), set_underline(Underline::Double));
}

TEST_CASE(test_font_bytes) {
    ASSERT_BYTES_EQ(select_font(Font::A), (std::string{0x1B, 'M', 0}));
    ASSERT_BYTES_EQ(select_font(Font::B), (std::string{0x1B, 'M', 1}));
}

TEST_CASE(test_character_size_bytes) {
    ASSERT_BYTES_EQ(set_character_size(CharacterSize::standard()), (std::string{0x1D, '!', 0x00}));
    ASSERT_BYTES_EQ(set_character_size(CharacterSize::double_size()), (std::string{0x1D, '!', 0x11}));
    ASSERT_BYTES_EQ(set_character_size(CharacterSize::double_width()), (std::string{0x1D, '!', 0x10}));
    ASSERT_BYTES_EQ(set_character_size(CharacterSize::double_height()), (std::string{0x1D, '!', 0x01}));
    ASSERT_BYTES_EQ(set_character_size(CharacterSize{ScaleFactor::X3, ScaleFactor::X5}), (std::string{0x1D, '!', 0x24}));
    ASSERT_BYTES_EQ(set_character_size(CharacterSize{ScaleFactor::X8, ScaleFactor::X8}), (std::string{0x1D, '!', 0x77}));
}

TEST_CASE(test_justification_bytes) {
    ASSERT_BYTES_EQ(set_justification(Justification::Left), (std::string{0x1B, 'a', 0}));
    ASSERT_BYTES_EQ(set_justification(Justification::Center), (std::string{0x1B, 'a', 1}));
    ASSERT_BYTES_EQ(set_justification(Justification::Right), (std::string{0x1B, 'a', 2}));
}

TEST_CASE(test_smoothing_bytes) {
    ASSERT_BYTES_EQ(set_smoothing(true), (std::string{0x1D, 'b', 1}));
    ASSERT_BYTES_EQ(set_smoothing(false), (std::string{0x1D, 'b', 0}));
}

TEST_CASE(test_character_set_bytes) {
    ASSERT_BYTES_EQ(select_character_set(InternationalCharacterSet::Usa), (std::string{0x1B, 'R', 0}));
    ASSERT_BYTES_EQ(select_character_set(InternationalCharacterSet::Germany), (std::string{0x1B, 'R', 2}));
    ASSERT_BYTES_EQ(select_character_set(InternationalCharacterSet::Japan), (std::string{0x1B, 'R', 8}));
    ASSERT_BYTES_EQ(select_character_set(InternationalCharacterSet::Korea), (std::string{0x1B, 'R', 13}));
}

TEST_CASE(test_code_page_names) {
    ASSERT_TRUE(code_page_name(CodePage::Cp437) == "cp437");
    ASSERT_TRUE(code_page_name(CodePage::Windows1251) == "windows-1251");
    ASSERT_TRUE(parse_code_page("CP850") == CodePage::Cp850);
    ASSERT_TRUE(parse_code_page("windows-1256") == CodePage::Windows1256);
    ASSERT_FALSE(parse_code_page("ebcdic").has_value());
}

TEST_CASE(test_encoder_passes_ascii) {
    CodePageEncoder encoder(CodePage::Cp437);
    auto out = encoder.encode("Total: $25.00");
    ASSERT_TRUE(out.has_value());
    ASSERT_BYTES_EQ(*out, "Total: $25.00");
}

TEST_CASE(test_encoder_ascii_on_page_without_converter) {
    CodePageEncoder encoder(CodePage::Thai42);
    ASSERT_FALSE(encoder.has_converter());
    auto out = encoder.encode("plain");
    ASSERT_TRUE(out.has_value());
    ASSERT_BYTES_EQ(*out, "plain");
}

TEST_CASE(test_encoder_maps_latin_to_cp437) {
    CodePageEncoder encoder(CodePage::Cp437);
    auto out = encoder.encode("caf\xC3\xA9");  // café
    ASSERT_TRUE(out.has_value());
    ASSERT_BYTES_EQ(*out, (std::string{'c', 'a', 'f', static_cast<char>(0x82)}));
}

TEST_CASE(test_encoder_reports_unmappable_character) {
    CodePageEncoder encoder(CodePage::Cp437);
    EncodingError err;
    auto out = encoder.encode("Price: \xE2\x82\xAC" "5", &err);  // euro sign
    ASSERT_FALSE(out.has_value());
    ASSERT_TRUE(err.code_page == CodePage::Cp437);
    ASSERT_EQ(err.byte_offset, 7u);
    ASSERT_EQ(err.byte_length, 3u);
    ASSERT_FALSE(err.message.empty());
}

TEST_CASE(test_encoder_euro_on_cp858) {
    CodePageEncoder encoder(CodePage::Cp858);
    auto out = encoder.encode("\xE2\x82\xAC");
    ASSERT_TRUE(out.has_value());
    ASSERT_BYTES_EQ(*out, std::string(1, static_cast<char>(0xD5)));
}

TEST_CASE(test_encoder_rejects_invalid_utf8) {
    CodePageEncoder encoder(CodePage::Windows1252, true);
    EncodingError err;
    auto out = encoder.encode("ok\xFF", &err);
    ASSERT_FALSE(out.has_value());
    ASSERT_EQ(err.byte_offset, 2u);
}

TEST_CASE(test_encoder_transliterates_when_enabled) {
    // “quoted” has no CP437 form; Latin-ASCII turns the quotes into '"'
    const char* text = "\xE2\x80\x9Cquoted\xE2\x80\x9D";

    CodePageEncoder strict(CodePage::Cp437, false);
    ASSERT_FALSE(strict.encode(text).has_value());

    CodePageEncoder lenient(CodePage::Cp437, true);
    auto out = lenient.encode(text);
    ASSERT_TRUE(out.has_value());
    ASSERT_BYTES_EQ(*out, "\"quoted\"");
}

int main() {
    return thermo::test::TestRunner::instance().run_all();
}
