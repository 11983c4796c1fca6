#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

enum class ToolId { DeskTalk, SpeakSelected, QuickAssistant, FlattenString, TypoFix, OcrPaste };

struct ToolDescriptor {
    ToolId id;
    std::string_view slug;          // config / IPC key, e.g. "speak-selected"
    std::string_view display_name;
    std::string_view description;
    std::string_view binary_name;   // without platform suffix
    bool requires_credential;
    std::string_view hotkey_flag;          // empty if the tool takes no hotkey argument
    std::string_view special_hotkey_flag;  // empty if scan codes are not accepted
    bool own_config;                // reads its own settings, receives no hotkey flags
    std::string_view hotkey_action; // label used when registering its trigger key
};

// Environment variable the shared credential is passed in.
inline constexpr std::string_view kCredentialEnvVar = "OPENAI_API_KEY";

#ifdef _WIN32
inline constexpr std::string_view kExecutableSuffix = ".exe";
#else
inline constexpr std::string_view kExecutableSuffix = "";
#endif

const std::array<ToolId, 6>& all_tools();

const ToolDescriptor& describe(ToolId id);

std::optional<ToolId> tool_from_slug(std::string_view slug);

// Binary name with the platform executable suffix applied.
std::string executable_name(ToolId id);
