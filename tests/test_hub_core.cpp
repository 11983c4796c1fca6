#include <catch2/catch_test_macros.hpp>

#include "hub_core.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace {

struct HubFixture {
    TmpDir dir;
    FakeProcessTable table;
    MemoryCredentialStore credentials;
    BinaryLocator locator{{.exe_dir = dir.path, .cwd = dir.path, .dev_search = false}};

    std::unique_ptr<HubCore> core;

    HubCore& make(HubConfig config = {}, bool persist = false) {
        auto config_path = persist ? (dir / "config.json").string() : std::string();
        core = std::make_unique<HubCore>(std::move(config), config_path, false,
                                         locator, table, credentials);
        REQUIRE(core->init((dir / "history.db").string()));
        return *core;
    }

    ~HubFixture() {
        if (core) core->shutdown();
    }

    void long_running(const std::string& name) {
        write_script(dir.path, name, "exec sleep 30");
    }
};

json run(HubCore& core, const json& cmd) {
    return core.handle_command(cmd.value("cmd", ""), cmd);
}

} // namespace

TEST_CASE("HubCore", "[hub]") {
    HubFixture fx;

    SECTION("UnknownCommand") {
        auto& core = fx.make();
        auto resp = run(core, {{"cmd", "reboot"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "unknown_command");
    }

    SECTION("UnknownTool") {
        auto& core = fx.make();
        auto resp = run(core, {{"cmd", "start"}, {"tool", "notepad"}});
        REQUIRE(resp["kind"] == "unknown_tool");
        REQUIRE(run(core, {{"cmd", "stop"}})["kind"] == "bad_request");
    }

    SECTION("ToolsListing") {
        fx.long_running("ocrp");
        auto& core = fx.make();

        auto resp = run(core, {{"cmd", "tools"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["tools"].size() == 6);
        for (auto& t : resp["tools"]) {
            REQUIRE(t["state"] == "Stopped");
            if (t["tool"] == "ocr-paste") {
                REQUIRE(t["path"] == (fx.dir / "ocrp").string());
                REQUIRE(t["requires_key"] == true);
            } else {
                REQUIRE(t["path"].is_null());
            }
        }
    }

    SECTION("StartStopThroughCommands") {
        fx.long_running("strflatten");
        auto& core = fx.make();

        auto started = run(core, {{"cmd", "start"}, {"tool", "flatten-string"}});
        REQUIRE(started["status"] == "ok");
        REQUIRE(started["state"] == "Running");
        REQUIRE(started["external"] == false);

        auto stopped = run(core, {{"cmd", "stop"}, {"tool", "flatten-string"}});
        REQUIRE(stopped["status"] == "ok");
        REQUIRE(run(core, {{"cmd", "status"}, {"tool", "flatten-string"}})["state"] == "Stopped");

        auto history = run(core, {{"cmd", "history"}, {"limit", 5}});
        REQUIRE(history["events"].size() == 2);
        REQUIRE(history["events"][0]["event"] == "stopped");
        REQUIRE(history["events"][1]["event"] == "started");
    }

    SECTION("StartFailureReported") {
        write_script(fx.dir.path, "strflatten", "echo boom >&2\nexit 1");
        auto& core = fx.make();

        auto resp = run(core, {{"cmd", "start"}, {"tool", "flatten-string"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "spawn_failed");
        REQUIRE(resp["message"].get<std::string>().find("boom") != std::string::npos);

        auto st = run(core, {{"cmd", "status"}, {"tool", "flatten-string"}});
        REQUIRE(st["state"] == "Error");

        auto missing = run(core, {{"cmd", "start"}, {"tool", "typo-fix"}});
        REQUIRE(missing["kind"] == "binary_not_found");
    }

    SECTION("HotkeyConflictBlocksStart") {
        fx.long_running("strflatten");
        HubConfig cfg;
        ToolConfig flatten;
        flatten.hotkey = "F13";
        cfg.set_tool(ToolId::FlattenString, flatten);
        cfg.hotkeys.push_back({ToolId::SpeakSelected, "Push to talk", NamedKey::F13, {}});

        auto& core = fx.make(cfg);
        auto resp = run(core, {{"cmd", "start"}, {"tool", "flatten-string"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "hotkey_conflict");
        REQUIRE(resp["message"].get<std::string>().find("Speak Selected") != std::string::npos);
        REQUIRE(core.supervisor().record_kind(ToolId::FlattenString) == RecordKind::Unmanaged);
    }

    SECTION("DisabledToolRefusesStart") {
        fx.long_running("typo-fix");
        HubConfig cfg;
        ToolConfig off;
        off.enabled = false;
        cfg.set_tool(ToolId::TypoFix, off);

        auto& core = fx.make(cfg);
        auto resp = run(core, {{"cmd", "start"}, {"tool", "typo-fix"}});
        REQUIRE(resp["kind"] == "disabled");

        REQUIRE(run(core, {{"cmd", "enable"}, {"tool", "typo-fix"}})["status"] == "ok");
        REQUIRE(run(core, {{"cmd", "start"}, {"tool", "typo-fix"}})["status"] == "ok");

        // Disabling a running tool stops it.
        REQUIRE(run(core, {{"cmd", "disable"}, {"tool", "typo-fix"}})["status"] == "ok");
        REQUIRE(core.supervisor().record_kind(ToolId::TypoFix) == RecordKind::Unmanaged);
        REQUIRE_FALSE(core.config().tool(ToolId::TypoFix).enabled);
    }

    SECTION("RegisterCheckUnregister") {
        auto& core = fx.make();
        json combo = {{"key", "F20"}, {"modifiers", {"Shift", "Ctrl"}}};

        auto reg = run(core, {{"cmd", "register-hotkey"}, {"tool", "ocr-paste"},
                              {"key", "F20"}, {"modifiers", {"Shift", "Ctrl"}}});
        REQUIRE(reg["status"] == "ok");
        REQUIRE(reg["combo"] == "Ctrl+Shift+F20");
        REQUIRE(core.config().hotkeys.size() == 1);

        auto check = run(core, {{"cmd", "check-hotkey"}, {"key", "F20"}, {"modifiers", {"Ctrl", "Shift"}}});
        REQUIRE(check["available"] == false);
        REQUIRE(check["conflict"]["tool_id"] == "ocr-paste");

        auto clash = run(core, {{"cmd", "register-hotkey"}, {"tool", "typo-fix"},
                                {"key", "F20"}, {"modifiers", {"Ctrl", "Shift"}}});
        REQUIRE(clash["kind"] == "hotkey_conflict");

        auto grouped = run(core, {{"cmd", "hotkeys"}});
        REQUIRE(grouped["hotkeys"]["ocr-paste"].size() == 1);
        REQUIRE_FALSE(grouped["hotkeys"].contains("typo-fix"));

        auto unreg = run(core, {{"cmd", "unregister-hotkey"}, {"key", "F20"}, {"modifiers", {"Ctrl", "Shift"}}});
        REQUIRE(unreg["removed"] == true);
        REQUIRE(core.config().hotkeys.empty());
        REQUIRE(run(core, {{"cmd", "check-hotkey"}, {"key", "F20"}, {"modifiers", {"Ctrl", "Shift"}}})
                    ["available"] == true);
    }

    SECTION("BadHotkeyArguments") {
        auto& core = fx.make();
        REQUIRE(run(core, {{"cmd", "check-hotkey"}})["kind"] == "bad_request");
        REQUIRE(run(core, {{"cmd", "check-hotkey"}, {"key", "Hyper"}})["kind"] == "bad_request");
        REQUIRE(run(core, {{"cmd", "check-hotkey"}, {"key", "F1"}, {"modifiers", {"Fn"}}})["kind"] ==
                "bad_request");
    }

    SECTION("SetHotkey") {
        auto& core = fx.make();

        auto resp = run(core, {{"cmd", "set-hotkey"}, {"tool", "speak-selected"}, {"key", "F15"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(core.config().tool(ToolId::SpeakSelected).hotkey == "F15");
        REQUIRE(core.hotkeys().find_conflict(NamedKey::F15, {})->owner == ToolId::SpeakSelected);

        auto clash = run(core, {{"cmd", "set-hotkey"}, {"tool", "quick-assistant"}, {"key", "F15"}});
        REQUIRE(clash["kind"] == "hotkey_conflict");

        // Moving to a scan code frees the old key.
        REQUIRE(run(core, {{"cmd", "set-hotkey"}, {"tool", "speak-selected"}, {"special", 124}})
                    ["status"] == "ok");
        auto tc = core.config().tool(ToolId::SpeakSelected);
        REQUIRE_FALSE(tc.hotkey.has_value());
        REQUIRE(tc.special_hotkey == 124u);
        REQUIRE_FALSE(core.hotkeys().find_conflict(NamedKey::F15, {}).has_value());
        REQUIRE(core.hotkeys().find_conflict(ScanCode{124}, {}).has_value());
    }

    SECTION("DisableReleasesHotkeys") {
        HubConfig cfg;
        ToolConfig ss;
        ss.hotkey = "F15";
        cfg.set_tool(ToolId::SpeakSelected, ss);
        auto& core = fx.make(cfg);

        REQUIRE(core.hotkeys().find_conflict(NamedKey::F15, {}).has_value());
        REQUIRE(run(core, {{"cmd", "disable"}, {"tool", "speak-selected"}})["status"] == "ok");
        REQUIRE_FALSE(core.hotkeys().find_conflict(NamedKey::F15, {}).has_value());

        REQUIRE(run(core, {{"cmd", "enable"}, {"tool", "speak-selected"}})["status"] == "ok");
        REQUIRE(core.hotkeys().find_conflict(NamedKey::F15, {}).has_value());
    }

    SECTION("ScanAdoptsExternal") {
        auto& core = fx.make();
        fx.table.processes = {{"ocrp", 4321}};

        auto resp = run(core, {{"cmd", "scan"}});
        REQUIRE(resp["adopted"] == json::array({"ocr-paste"}));

        auto st = run(core, {{"cmd", "status"}, {"tool", "ocr-paste"}});
        REQUIRE(st["state"] == "Running");
        REQUIRE(st["external"] == true);
        REQUIRE(st["pid"] == 4321);

        // stop-all leaves external processes alone.
        REQUIRE(run(core, {{"cmd", "stop-all"}})["stopped"].empty());
        REQUIRE(fx.table.terminated.empty());

        auto history = run(core, {{"cmd", "history"}});
        REQUIRE(history["events"][0]["event"] == "adopted");
    }

    SECTION("StartupScanAndAutoStart") {
        fx.long_running("strflatten");
        fx.long_running("ocrp");
        fx.table.processes = {{"typo-fix", 555}};

        HubConfig cfg;
        ToolConfig autostart;
        autostart.auto_start = true;
        cfg.set_tool(ToolId::FlattenString, autostart);
        cfg.set_tool(ToolId::OcrPaste, autostart);  // needs a key, none stored

        auto& core = fx.make(cfg);
        REQUIRE(core.supervisor().record_kind(ToolId::TypoFix) == RecordKind::External);
        REQUIRE(core.supervisor().record_kind(ToolId::FlattenString) == RecordKind::Owned);
        REQUIRE(core.supervisor().record_kind(ToolId::OcrPaste) == RecordKind::Unmanaged);

        core.shutdown();
        REQUIRE(core.supervisor().record_kind(ToolId::FlattenString) == RecordKind::Unmanaged);
        REQUIRE(core.supervisor().record_kind(ToolId::TypoFix) == RecordKind::External);
    }

    SECTION("ReconcileTickRecordsExit") {
        write_script(fx.dir.path, "strflatten", "sleep 1");
        auto& core = fx.make();
        REQUIRE(run(core, {{"cmd", "start"}, {"tool", "flatten-string"}})["status"] == "ok");

        REQUIRE(wait_for([&] {
            core.on_reconcile_tick();
            return core.supervisor().record_kind(ToolId::FlattenString) == RecordKind::Unmanaged;
        }, std::chrono::milliseconds(3000)));
        REQUIRE(run(core, {{"cmd", "history"}})["events"][0]["event"] == "exited");
    }

    SECTION("KeyCommands") {
        auto& core = fx.make();
        REQUIRE(run(core, {{"cmd", "key-status"}})["stored"] == false);

        REQUIRE(run(core, {{"cmd", "set-key"}, {"key", "sk-abcdefghijklmnop"}})["status"] == "ok");
        auto st = run(core, {{"cmd", "key-status"}});
        REQUIRE(st["stored"] == true);
        REQUIRE(st["preview"] == "sk-...mnop");

        REQUIRE(run(core, {{"cmd", "delete-key"}})["status"] == "ok");
        REQUIRE(run(core, {{"cmd", "key-status"}})["stored"] == false);
        REQUIRE(run(core, {{"cmd", "set-key"}})["kind"] == "bad_request");
    }

    SECTION("WrongFieldTypesAreBadRequests") {
        auto& core = fx.make();
        REQUIRE(run(core, {{"cmd", "history"}, {"limit", "5"}})["kind"] == "bad_request");
        REQUIRE(run(core, {{"cmd", "history"}, {"limit", 0}})["kind"] == "bad_request");
        REQUIRE(run(core, {{"cmd", "history"}, {"limit", 2.5}})["kind"] == "bad_request");
        REQUIRE(run(core, {{"cmd", "register-hotkey"}, {"tool", "ocr-paste"}, {"key", "F20"}, {"action", 7}})
                    ["kind"] == "bad_request");
        REQUIRE(core.config().hotkeys.empty());

        REQUIRE(core.handle_request({{"cmd", 42}})["kind"] == "bad_request");
        REQUIRE(core.handle_request({{"tool", "ocr-paste"}})["kind"] == "bad_request");
        REQUIRE(core.handle_request(json::array({"status"}))["kind"] == "bad_request");
        REQUIRE(core.handle_request({{"cmd", "status"}})["status"] == "ok");
    }

    SECTION("SpecialKeyOutOfRange") {
        auto& core = fx.make();
        auto resp = run(core, {{"cmd", "set-hotkey"}, {"tool", "speak-selected"}, {"special", 4294967309ULL}});
        REQUIRE(resp["kind"] == "bad_request");
        REQUIRE(run(core, {{"cmd", "set-hotkey"}, {"tool", "speak-selected"}, {"special", -1}})["kind"] ==
                "bad_request");
        REQUIRE_FALSE(core.config().tool(ToolId::SpeakSelected).special_hotkey.has_value());
        REQUIRE_FALSE(core.hotkeys().find_conflict(ScanCode{13}, {}).has_value());
    }

    SECTION("EnableTwiceKeepsHotkeys") {
        HubConfig cfg;
        ToolConfig ss;
        ss.hotkey = "F15";
        cfg.set_tool(ToolId::SpeakSelected, ss);
        cfg.hotkeys.push_back({ToolId::SpeakSelected, "Replay", NamedKey::F16, {Modifier::Ctrl}});
        auto& core = fx.make(cfg);
        REQUIRE(core.hotkeys().size() == 2);

        auto resp = run(core, {{"cmd", "enable"}, {"tool", "speak-selected"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE_FALSE(resp.contains("warning"));
        REQUIRE(core.hotkeys().size() == 2);
        REQUIRE(core.config().hotkeys.size() == 1);
    }

    SECTION("UptimeReported") {
        fx.long_running("strflatten");
        auto& core = fx.make();
        REQUIRE(run(core, {{"cmd", "start"}, {"tool", "flatten-string"}})["status"] == "ok");

        auto st = run(core, {{"cmd", "status"}, {"tool", "flatten-string"}});
        REQUIRE(st["uptime_s"].is_number_integer());
        REQUIRE(st["uptime_s"].get<int64_t>() >= 0);
        REQUIRE(st["uptime_s"].get<int64_t>() < 60);

        fx.table.processes = {{"ocrp", 4321}};
        core.on_scan_tick();
        REQUIRE(run(core, {{"cmd", "status"}, {"tool", "ocr-paste"}}).contains("uptime_s"));
        REQUIRE_FALSE(run(core, {{"cmd", "status"}, {"tool", "typo-fix"}}).contains("uptime_s"));
    }

    SECTION("OpenSettings") {
        auto& core = fx.make();
        REQUIRE(run(core, {{"cmd", "open-settings"}, {"tool", "ocr-paste"}})["kind"] == "no_settings");
        REQUIRE(run(core, {{"cmd", "open-settings"}, {"tool", "typo-fix"}})["kind"] == "binary_not_found");

        auto runs = fx.dir / "runs";
        write_script(fx.dir.path, "typo-fix",
                     "echo run >> '" + runs.string() + "'\n"
                     "[ \"$(wc -l < '" + runs.string() + "')\" -gt 1 ] && exit 0\n"
                     "exec sleep 30");

        auto first = run(core, {{"cmd", "open-settings"}, {"tool", "typo-fix"}});
        REQUIRE(first["status"] == "ok");
        REQUIRE(first["action"] == "started");
        REQUIRE(core.supervisor().record_kind(ToolId::TypoFix) == RecordKind::Owned);

        auto second = run(core, {{"cmd", "open-settings"}, {"tool", "typo-fix"}});
        REQUIRE(second["action"] == "forwarded");
        REQUIRE(wait_for([&] { return read_file(runs) == "run\nrun\n"; }));

        // The running instance is untouched.
        core.on_reconcile_tick();
        REQUIRE(core.supervisor().record_kind(ToolId::TypoFix) == RecordKind::Owned);
    }

    SECTION("ChangesArePersisted") {
        auto& core = fx.make({}, true);
        REQUIRE(run(core, {{"cmd", "register-hotkey"}, {"tool", "typo-fix"}, {"key", "#77"}})["status"] ==
                "ok");
        REQUIRE(run(core, {{"cmd", "disable"}, {"tool", "desk-talk"}})["status"] == "ok");

        auto saved = HubConfig::load((fx.dir / "config.json").string());
        REQUIRE(saved.hotkeys.size() == 1);
        REQUIRE(saved.hotkeys[0].key == HotkeyKey{ScanCode{77}});
        REQUIRE_FALSE(saved.tool(ToolId::DeskTalk).enabled);
    }
}
