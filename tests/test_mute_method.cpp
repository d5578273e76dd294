#include <catch2/catch_test_macros.hpp>

#include "admute/mute/AudioSessionController.hpp"
#include "admute/mute/MuteMethod.hpp"

#include <string>

TEST_CASE("MuteMethod - Parsing", "[actuator]")
{
    REQUIRE(admute::ParseMuteMethod("session") == admute::MuteMethod::Session);
    REQUIRE(admute::ParseMuteMethod("Native") == admute::MuteMethod::Session);
    REQUIRE(admute::ParseMuteMethod("CLICK") == admute::MuteMethod::Click);
    REQUIRE(admute::ParseMuteMethod("ui") == admute::MuteMethod::Click);
    REQUIRE_FALSE(admute::ParseMuteMethod("").has_value());
    REQUIRE_FALSE(admute::ParseMuteMethod("pycaw").has_value());

    REQUIRE(std::string(admute::MuteMethodToString(admute::MuteMethod::Session)) == "session");
    REQUIRE(std::string(admute::MuteMethodToString(admute::MuteMethod::Click)) == "click");
}

TEST_CASE("AudioSessionController - Process name matching", "[actuator][session]")
{
    using admute::AudioSessionController;

    REQUIRE(AudioSessionController::BasenameLower("C:\\Users\\me\\AppData\\Roaming\\Spotify\\Spotify.exe") ==
            "spotify.exe");
    REQUIRE(AudioSessionController::BasenameLower("/usr/bin/Spotify") == "spotify");
    REQUIRE(AudioSessionController::BasenameLower("SPOTIFY.EXE") == "spotify.exe");
    REQUIRE(AudioSessionController::BasenameLower("").empty());
}

TEST_CASE("AudioSessionController - Unready controller never mutes", "[actuator][session]")
{
    admute::AudioSessionController sessions;

    REQUIRE_FALSE(sessions.IsReady());
    REQUIRE_FALSE(sessions.SetAppMute("spotify.exe", true));
    REQUIRE_FALSE(sessions.HasSession("spotify.exe"));
}
