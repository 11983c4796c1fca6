#include "tool_catalog.hpp"

#include <algorithm>

namespace {

constexpr std::array<ToolDescriptor, 6> kTools = {{
    {ToolId::DeskTalk, "desk-talk", "DeskTalk",
     "Voice-to-text transcription with push-to-talk",
     "desk-talk", true, "", "", true, "Push to talk"},
    {ToolId::SpeakSelected, "speak-selected", "Speak Selected",
     "Read selected text aloud using AI",
     "speak-selected", true, "--ptt-key", "--special-ptt-key", false, "Push to talk"},
    {ToolId::QuickAssistant, "quick-assistant", "Quick Assistant",
     "Voice-activated AI assistant",
     "quick-assistant", true, "--ptt-key", "--special-ptt-key", false, "Push to talk"},
    {ToolId::FlattenString, "flatten-string", "Flatten String",
     "Flatten clipboard text (remove newlines)",
     "strflatten", false, "--trigger-key", "", false, "Flatten clipboard"},
    {ToolId::TypoFix, "typo-fix", "Typo Fix",
     "Fix typos in selected text using AI",
     "typo-fix", true, "", "", true, "Fix selection"},
    {ToolId::OcrPaste, "ocr-paste", "OCR Paste",
     "OCR from clipboard images",
     "ocrp", true, "--trigger-key", "", false, "OCR clipboard"},
}};

constexpr std::array<ToolId, 6> kAllTools = {
    ToolId::DeskTalk, ToolId::SpeakSelected, ToolId::QuickAssistant,
    ToolId::FlattenString, ToolId::TypoFix, ToolId::OcrPaste,
};

} // namespace

const std::array<ToolId, 6>& all_tools() {
    return kAllTools;
}

const ToolDescriptor& describe(ToolId id) {
    // Table is declared in enum order.
    return kTools[static_cast<size_t>(id)];
}

std::optional<ToolId> tool_from_slug(std::string_view slug) {
    auto it = std::ranges::find_if(kTools, [slug](const ToolDescriptor& d) { return d.slug == slug; });
    if (it == kTools.end()) return std::nullopt;
    return it->id;
}

std::string executable_name(ToolId id) {
    std::string name(describe(id).binary_name);
    name += kExecutableSuffix;
    return name;
}
