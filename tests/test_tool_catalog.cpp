#include <catch2/catch_test_macros.hpp>

#include "tool_catalog.hpp"

#include <set>
#include <string>

TEST_CASE("ToolCatalog", "[catalog]") {

    SECTION("SixToolsInEnumOrder") {
        auto& tools = all_tools();
        REQUIRE(tools.size() == 6);
        for (auto id : tools) {
            REQUIRE(describe(id).id == id);
        }
    }

    SECTION("SlugsAreUniqueAndRoundTrip") {
        std::set<std::string_view> slugs;
        for (auto id : all_tools()) {
            auto slug = describe(id).slug;
            REQUIRE(slugs.insert(slug).second);
            REQUIRE(tool_from_slug(slug) == id);
        }
        REQUIRE_FALSE(tool_from_slug("notepad").has_value());
        REQUIRE_FALSE(tool_from_slug("").has_value());
    }

    SECTION("BinaryNames") {
        REQUIRE(describe(ToolId::FlattenString).binary_name == "strflatten");
        REQUIRE(describe(ToolId::OcrPaste).binary_name == "ocrp");
        REQUIRE(executable_name(ToolId::SpeakSelected) ==
                std::string("speak-selected") + std::string(kExecutableSuffix));
    }

    SECTION("CredentialRequirements") {
        REQUIRE(describe(ToolId::SpeakSelected).requires_credential);
        REQUIRE(describe(ToolId::QuickAssistant).requires_credential);
        REQUIRE(describe(ToolId::OcrPaste).requires_credential);
        REQUIRE_FALSE(describe(ToolId::FlattenString).requires_credential);
    }

    SECTION("HotkeyFlags") {
        REQUIRE(describe(ToolId::SpeakSelected).hotkey_flag == "--ptt-key");
        REQUIRE(describe(ToolId::SpeakSelected).special_hotkey_flag == "--special-ptt-key");
        REQUIRE(describe(ToolId::FlattenString).hotkey_flag == "--trigger-key");
        REQUIRE(describe(ToolId::FlattenString).special_hotkey_flag.empty());
        REQUIRE(describe(ToolId::DeskTalk).own_config);
        REQUIRE(describe(ToolId::TypoFix).own_config);
        REQUIRE(describe(ToolId::DeskTalk).hotkey_flag.empty());
    }
}
