#pragma once

#include "config/AppConfig.hpp"

#include <atomic>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>

class SingleInstanceGuard;

namespace admute
{
class AdDetector;
class AudioSessionController;
class IMuteActuator;
class IScreenMatcher;
class MuteController;
} // namespace admute

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    // Process exit code: 0 normal, 1 startup failure, 2 usage error
    int run();

private:
    enum class Mode
    {
        Menu,
        Headless,
        Diagnose
    };

    struct Options
    {
        std::filesystem::path config_path = "config.toml";
        bool no_menu = false;
        bool diagnose = false;
        bool verbose = false;
        bool show_help = false;
        bool show_version = false;
    };

    bool parseCommandLineArgs();
    void printUsage(std::ostream& out) const;

    bool initialize();
    bool initializeLogging();
    bool checkSingleInstance();
    void initializeConfig();
    bool initializeDetection();
    bool initializeActuator();

    int runMenu();
    int runHeadless();
    int runDiagnose();
    void runDiagnosticScan();

    void shutdown();
    void printStartupErrors() const;

    static void EmergencyUnmuteThunk();
    static std::atomic<admute::MuteController*> s_crash_controller;

    Options options_;
    Mode mode_ = Mode::Menu;
    int exit_code_ = 0;

    AppConfig config_;
    std::unique_ptr<SingleInstanceGuard> instance_guard_;
    std::unique_ptr<admute::IScreenMatcher> matcher_;
    std::unique_ptr<admute::AdDetector> detector_;
    std::unique_ptr<admute::AudioSessionController> sessions_;
    std::unique_ptr<admute::IMuteActuator> actuator_;
    std::unique_ptr<admute::MuteController> controller_;

    int argc_ = 0;
    char** argv_ = nullptr;
};
