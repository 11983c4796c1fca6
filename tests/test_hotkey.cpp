#include <catch2/catch_test_macros.hpp>

#include "hotkey.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

TEST_CASE("Hotkey keys and modifiers", "[hotkey]") {

    SECTION("KeyNamesRoundTrip") {
        for (auto k : {NamedKey::F1, NamedKey::F13, NamedKey::F24, NamedKey::PageUp,
                       NamedKey::NumpadEnter, NamedKey::VolumeMute}) {
            REQUIRE(named_key_from_string(key_name(k)) == k);
        }
        REQUIRE(key_name(NamedKey::F13) == "F13");
        REQUIRE_FALSE(named_key_from_string("f13").has_value());
        REQUIRE_FALSE(named_key_from_string("Hyper").has_value());
    }

    SECTION("ParseKey") {
        REQUIRE(parse_key("F13") == HotkeyKey{NamedKey::F13});
        REQUIRE(parse_key("#124") == HotkeyKey{ScanCode{124}});
        REQUIRE_FALSE(parse_key("#").has_value());
        REQUIRE_FALSE(parse_key("#12x").has_value());
        REQUIRE_FALSE(parse_key("").has_value());

        REQUIRE(format_key(HotkeyKey{ScanCode{124}}) == "#124");
        REQUIRE(format_key(HotkeyKey{NamedKey::Pause}) == "Pause");
    }

    SECTION("NamedKeyNeverEqualsScanCode") {
        HotkeyKey named = NamedKey::F1;
        HotkeyKey code = ScanCode{0};
        REQUIRE(named != code);
        REQUIRE(HotkeyKey{ScanCode{5}} == HotkeyKey{ScanCode{5}});
    }

    SECTION("ModifierSetIgnoresOrder") {
        ModifierSet a{Modifier::Ctrl, Modifier::Shift};
        ModifierSet b{Modifier::Shift, Modifier::Ctrl};
        REQUIRE(a == b);
        REQUIRE(a.list() == std::vector<Modifier>{Modifier::Ctrl, Modifier::Shift});

        ModifierSet dup{Modifier::Alt, Modifier::Alt};
        REQUIRE(dup == ModifierSet{Modifier::Alt});
        REQUIRE(ModifierSet{}.empty());
        REQUIRE_FALSE(a.contains(Modifier::Meta));
    }

    SECTION("FormatCombo") {
        ModifierSet mods{Modifier::Shift, Modifier::Ctrl};
        REQUIRE(format_combo(NamedKey::F13, mods) == "Ctrl+Shift+F13");
        REQUIRE(format_combo(ScanCode{124}, {}) == "#124");
    }

    SECTION("ConfigJsonShape") {
        RegisteredHotkey hk{
            .owner = ToolId::SpeakSelected,
            .action = "Push to talk",
            .key = NamedKey::F13,
            .modifiers = {Modifier::Meta},
        };
        auto j = hotkey_to_json(hk);
        REQUIRE(j["tool_id"] == "speak-selected");
        REQUIRE(j["action_name"] == "Push to talk");
        REQUIRE(j["key"]["type"] == "Named");
        REQUIRE(j["key"]["value"] == "F13");
        REQUIRE(j["modifiers"] == json::array({"Meta"}));

        auto back = hotkey_from_json(j);
        REQUIRE(back.has_value());
        REQUIRE(back->owner == ToolId::SpeakSelected);
        REQUIRE(back->key == hk.key);
        REQUIRE(back->modifiers == hk.modifiers);
    }

    SECTION("ScanCodeJson") {
        auto j = json::parse(R"({"type": "Unknown", "value": 124})");
        REQUIRE(key_from_json(j) == HotkeyKey{ScanCode{124}});
        REQUIRE(key_to_json(ScanCode{124}) == j);
        REQUIRE(key_from_json(json("#7")) == HotkeyKey{ScanCode{7}});
    }

    SECTION("ScanCodeRange") {
        REQUIRE(scan_code_from_json(json(0)) == 0u);
        REQUIRE(scan_code_from_json(json(4294967295ULL)) == 4294967295u);
        REQUIRE_FALSE(scan_code_from_json(json(4294967296ULL)).has_value());
        REQUIRE_FALSE(scan_code_from_json(json(-5)).has_value());
        REQUIRE_FALSE(scan_code_from_json(json(12.0)).has_value());
        REQUIRE_FALSE(scan_code_from_json(json("12")).has_value());
        REQUIRE_FALSE(key_from_json(json::parse(R"({"type": "Unknown", "value": 4294967309})")).has_value());
    }

    SECTION("RejectsMalformedJson") {
        REQUIRE_FALSE(key_from_json(json::parse(R"({"type": "Named", "value": "Nope"})")).has_value());
        REQUIRE_FALSE(key_from_json(json::parse(R"({"type": "Unknown", "value": -1})")).has_value());
        REQUIRE_FALSE(modifiers_from_json(json::parse(R"(["Ctrl", "Hyper"])")).has_value());
        REQUIRE(modifiers_from_json(json()).value().empty());
        REQUIRE_FALSE(hotkey_from_json(json::parse(R"({"tool_id": "nope", "key": "F1"})")).has_value());
    }
}
