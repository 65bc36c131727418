#include "command/CodePage.hpp"
#include "command/Command.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <unicode/ucnv.h>
#include <unicode/translit.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>
#include <unicode/utf16.h>

namespace thermo::command {

namespace {

struct CodePageInfo {
    CodePage page;
    std::string_view name;
    const char* icu_converter;  // nullptr: no ICU table, ASCII only
};

constexpr std::array<CodePageInfo, 30> CODE_PAGES = {{
    {CodePage::Cp437, "cp437", "ibm-437"},
    {CodePage::Katakana, "katakana", nullptr},
    {CodePage::Cp850, "cp850", "ibm-850"},
    {CodePage::Cp860, "cp860", "ibm-860"},
    {CodePage::Cp863, "cp863", "ibm-863"},
    {CodePage::Cp865, "cp865", "ibm-865"},
    {CodePage::Windows1252, "windows-1252", "windows-1252"},
    {CodePage::Cp866, "cp866", "ibm-866"},
    {CodePage::Cp852, "cp852", "ibm-852"},
    {CodePage::Cp858, "cp858", "ibm-858"},
    {CodePage::Cp862, "cp862", "ibm-862"},
    {CodePage::Cp864, "cp864", "ibm-864"},
    {CodePage::Thai42, "thai42", nullptr},
    {CodePage::Windows1253, "windows-1253", "windows-1253"},
    {CodePage::Windows1254, "windows-1254", "windows-1254"},
    {CodePage::Windows1257, "windows-1257", "windows-1257"},
    {CodePage::Farsi, "farsi", nullptr},
    {CodePage::Windows1251, "windows-1251", "windows-1251"},
    {CodePage::Cp737, "cp737", "ibm-737"},
    {CodePage::Cp775, "cp775", "ibm-775"},
    {CodePage::Thai14, "thai14", nullptr},
    {CodePage::HebrewOld, "hebrew-old", nullptr},
    {CodePage::Windows1255, "windows-1255", "windows-1255"},
    {CodePage::Thai11, "thai11", nullptr},
    {CodePage::Thai18, "thai18", nullptr},
    {CodePage::Cp855, "cp855", "ibm-855"},
    {CodePage::Cp857, "cp857", "ibm-857"},
    {CodePage::Cp928, "cp928", nullptr},
    {CodePage::Thai16, "thai16", nullptr},
    {CodePage::Windows1256, "windows-1256", "windows-1256"},
}};

const CodePageInfo& info_for(CodePage page) {
    for (const auto& info : CODE_PAGES) {
        if (info.page == page) return info;
    }
    return CODE_PAGES[0];
}

}  // namespace

std::string_view code_page_name(CodePage page) {
    return info_for(page).name;
}

std::optional<CodePage> parse_code_page(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& info : CODE_PAGES) {
        if (info.name == lower) return info.page;
    }
    return std::nullopt;
}

std::string select_code_page(CodePage page) {
    return std::string{ESC, 't', static_cast<char>(page)};
}

std::string select_character_set(InternationalCharacterSet set) {
    return std::string{ESC, 'R', static_cast<char>(set)};
}

struct CodePageEncoder::Impl {
    UConverter* converter = nullptr;
    std::unique_ptr<icu::Transliterator> transliterator;

    ~Impl() {
        if (converter) ucnv_close(converter);
    }

    // Appends the page's bytes for one code point; false if unmapped
    bool append_code_point(UChar32 c, std::string& out) const {
        if (c >= 0 && c < 0x80) {
            out.push_back(static_cast<char>(c));
            return true;
        }
        if (!converter) return false;

        UChar units[U16_MAX_LENGTH];
        int32_t length = 0;
        U16_APPEND_UNSAFE(units, length, c);

        char bytes[8];
        UErrorCode status = U_ZERO_ERROR;
        int32_t written = ucnv_fromUChars(converter, bytes, sizeof(bytes), units, length, &status);
        if (U_FAILURE(status) || written <= 0) return false;

        out.append(bytes, static_cast<size_t>(written));
        return true;
    }

    bool append_transliterated(UChar32 c, std::string& out) const {
        if (!transliterator) return false;

        icu::UnicodeString text(c);
        transliterator->transliterate(text);
        if (text.isEmpty()) return false;

        std::string rewritten;
        for (int32_t i = 0; i < text.length();) {
            UChar32 r = text.char32At(i);
            if (r == c || !append_code_point(r, rewritten)) return false;
            i += U16_LENGTH(r);
        }
        out += rewritten;
        return true;
    }
};

CodePageEncoder::CodePageEncoder(CodePage page, bool transliterate)
    : page_(page), transliterate_(transliterate), impl_(std::make_unique<Impl>()) {
    const auto& info = info_for(page);

    if (info.icu_converter) {
        UErrorCode status = U_ZERO_ERROR;
        impl_->converter = ucnv_open(info.icu_converter, &status);
        if (U_FAILURE(status)) {
            util::Logger::warn(std::format("CodePageEncoder: no ICU converter '{}' ({}), ASCII only",
                                           info.icu_converter, u_errorName(status)));
            impl_->converter = nullptr;
        } else {
            // Report unmapped characters instead of substituting 0x1A
            ucnv_setFromUCallBack(impl_->converter, UCNV_FROM_U_CALLBACK_STOP,
                                  nullptr, nullptr, nullptr, &status);
        }
    }

    if (transliterate_) {
        UErrorCode status = U_ZERO_ERROR;
        impl_->transliterator.reset(icu::Transliterator::createInstance(
            "NFD; [:Nonspacing Mark:] Remove; NFC; Latin-ASCII",
            UTRANS_FORWARD,
            status));
        if (U_FAILURE(status) || !impl_->transliterator) {
            util::Logger::warn(std::format("CodePageEncoder: transliterator unavailable ({})",
                                           u_errorName(status)));
            impl_->transliterator.reset();
        }
    }
}

CodePageEncoder::~CodePageEncoder() = default;

bool CodePageEncoder::has_converter() const {
    return impl_->converter != nullptr;
}

std::optional<std::string> CodePageEncoder::encode(std::string_view utf8, EncodingError* error) const {
    std::string out;
    out.reserve(utf8.size());

    const auto* data = reinterpret_cast<const uint8_t*>(utf8.data());
    const auto length = static_cast<int32_t>(utf8.size());

    int32_t i = 0;
    while (i < length) {
        const int32_t start = i;
        UChar32 c;
        U8_NEXT(data, i, length, c);

        std::string reason;
        if (c < 0) {
            reason = "invalid UTF-8 sequence";
        } else if (impl_->append_code_point(c, out) || impl_->append_transliterated(c, out)) {
            continue;
        } else {
            reason = std::format("U+{:04X} cannot be encoded", static_cast<uint32_t>(c));
        }

        const auto name = code_page_name(page_);
        util::Logger::debug(std::format("CodePageEncoder: {} in {} at byte {}", reason, name, start));
        if (error) {
            error->code_page = page_;
            error->byte_offset = static_cast<size_t>(start);
            error->byte_length = static_cast<size_t>(i - start);
            error->message = std::format("{} in {}", reason, name);
        }
        return std::nullopt;
    }

    return out;
}

}  // namespace thermo::command
