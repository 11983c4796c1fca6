#include <catch2/catch_test_macros.hpp>

#include "platform/linux/env_file_credential_store.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

TEST_CASE("EnvFileCredentialStore", "[credentials]") {
    TmpDir dir;
    EnvFileCredentialStore store((dir / "cfg").string());

    SECTION("EmptyByDefault") {
        REQUIRE_FALSE(store.load().has_value());
        // Removing nothing is fine.
        REQUIRE(store.remove().has_value());
    }

    SECTION("SaveLoadRemove") {
        REQUIRE(store.save("sk-test-123").has_value());
        REQUIRE(store.load() == "sk-test-123");
        REQUIRE(read_file(store.path()) == "OPENAI_API_KEY=sk-test-123\n");

        REQUIRE(store.save("sk-other").has_value());
        REQUIRE(store.load() == "sk-other");

        REQUIRE(store.remove().has_value());
        REQUIRE_FALSE(store.load().has_value());
        REQUIRE_FALSE(fs::exists(store.path()));
    }

    SECTION("OwnerOnlyPermissions") {
        REQUIRE(store.save("sk-test").has_value());
        auto perms = fs::status(store.path()).permissions();
        REQUIRE((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none);
    }

    SECTION("NeverGroupOrWorldReadable") {
        // A permissive umask and a world-readable file from an older version.
        fs::create_directories(dir / "cfg");
        std::ofstream(store.path()) << "FOO=bar\n";
        fs::permissions(store.path(), fs::perms::owner_read | fs::perms::owner_write |
                                          fs::perms::group_read | fs::perms::others_read);
        std::ofstream(store.path() + ".tmp") << "junk";
        fs::permissions(store.path() + ".tmp", fs::perms::all);

        mode_t old_mask = ::umask(0);
        auto saved = store.save("sk-secret");
        ::umask(old_mask);
        REQUIRE(saved.has_value());

        struct stat st{};
        REQUIRE(::stat(store.path().c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);
        REQUIRE_FALSE(fs::exists(store.path() + ".tmp"));
        REQUIRE(read_file(store.path()) == "FOO=bar\nOPENAI_API_KEY=sk-secret\n");
    }

    SECTION("OtherLinesPreserved") {
        fs::create_directories(dir / "cfg");
        std::ofstream(store.path()) << "FOO=bar\nOPENAI_API_KEY=old\n";

        REQUIRE(store.load() == "old");
        REQUIRE(store.save("new").has_value());
        REQUIRE(read_file(store.path()) == "FOO=bar\nOPENAI_API_KEY=new\n");

        REQUIRE(store.remove().has_value());
        REQUIRE(read_file(store.path()) == "FOO=bar\n");
    }

    SECTION("RejectsBadSecrets") {
        REQUIRE_FALSE(store.save("").has_value());
        REQUIRE_FALSE(store.save("a\nb").has_value());
        REQUIRE_FALSE(store.load().has_value());
    }
}
