#include "Application.hpp"
#include "ControlMenu.hpp"
#include "app/Version.hpp"

#include "admute/control/MuteController.hpp"
#include "admute/detect/AdDetector.hpp"
#include "admute/detect/TemplateLibrary.hpp"
#include "admute/diag/DiagnosticScan.hpp"
#include "admute/mute/AudioSessionController.hpp"
#include "admute/mute/IMuteActuator.hpp"
#include "admute/mute/MuteActuatorFactory.hpp"
#include "admute/screen/ScreenCapture.hpp"
#include "admute/screen/TemplateMatcher.hpp"
#include "config/ConfigLoader.hpp"
#include "platform/Console.hpp"
#include "platform/ProcessDetector.hpp"
#include "platform/SignalBridge.hpp"
#include "platform/SingleInstanceGuard.hpp"
#include "utils/CrashHandler.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <chrono>
#include <iostream>
#include <string_view>
#include <thread>

std::atomic<admute::MuteController*> Application::s_crash_controller{ nullptr };

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { shutdown(); }

int Application::run()
{
    if (!parseCommandLineArgs())
        return exit_code_;

    if (!initialize())
    {
        printStartupErrors();
        shutdown();
        return 1;
    }

    switch (mode_)
    {
    case Mode::Diagnose:
        exit_code_ = runDiagnose();
        break;
    case Mode::Headless:
        exit_code_ = runHeadless();
        break;
    case Mode::Menu:
        exit_code_ = runMenu();
        break;
    }

    shutdown();
    utils::LogManager::Shutdown();
    return exit_code_;
}

bool Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        const std::string_view arg = argv_[i];
        if (arg == "--config")
        {
            if (i + 1 >= argc_)
            {
                std::cerr << "admute: --config requires a path\n";
                printUsage(std::cerr);
                exit_code_ = 2;
                return false;
            }
            options_.config_path = argv_[++i];
        }
        else if (arg == "--no-menu")
            options_.no_menu = true;
        else if (arg == "--diagnose")
            options_.diagnose = true;
        else if (arg == "--verbose")
            options_.verbose = true;
        else if (arg == "--version")
            options_.show_version = true;
        else if (arg == "--help" || arg == "-h")
            options_.show_help = true;
        else
        {
            std::cerr << "admute: unknown option '" << arg << "'\n";
            printUsage(std::cerr);
            exit_code_ = 2;
            return false;
        }
    }

    if (options_.show_help)
    {
        printUsage(std::cout);
        exit_code_ = 0;
        return false;
    }
    if (options_.show_version)
    {
        std::cout << "admute " << ADMUTE_VERSION_STRING << "\n";
        exit_code_ = 0;
        return false;
    }
    return true;
}

void Application::printUsage(std::ostream& out) const
{
    out << "Usage: admute [--config <path>] [--no-menu] [--diagnose] [--verbose] [--version] [--help]\n"
        << "  --config <path>  configuration file (default: config.toml)\n"
        << "  --no-menu        start muting immediately, stop with Ctrl+C\n"
        << "  --diagnose       print a one-shot diagnostic scan and exit\n"
        << "  --verbose        debug-level logging\n"
        << "  --version        print the version and exit\n"
        << "  --help           print this help and exit\n";
}

bool Application::initialize()
{
    if (!initializeLogging())
        return false;

    utils::CrashHandler::Initialize();
    utils::CrashHandler::SetContext("startup");
    platform::Console::EnableUtf8();
    platform::SignalBridge::Install();

    PLOG_INFO << "admute " << ADMUTE_VERSION_STRING << " starting";

    initializeConfig();

    if (options_.diagnose)
        mode_ = Mode::Diagnose;
    else if (options_.no_menu || !config_.use_menu)
        mode_ = Mode::Headless;
    else if (!platform::Console::StdinIsInteractive())
    {
        PLOG_INFO << "stdin is not a terminal, running without the menu";
        mode_ = Mode::Headless;
    }
    else
        mode_ = Mode::Menu;

    // The scan never mutes, so it may run beside a live instance
    if (mode_ != Mode::Diagnose && !checkSingleInstance())
        return false;

    if (!initializeDetection())
        return false;

    if (mode_ == Mode::Diagnose)
    {
        sessions_ = std::make_unique<admute::AudioSessionController>();
        if (!sessions_->Init())
            PLOG_WARNING << "Audio session API unavailable: " << sessions_->LastError();
        return true;
    }

    if (!initializeActuator())
        return false;

    controller_ = std::make_unique<admute::MuteController>(config_.controller, *detector_, *actuator_);
    s_crash_controller.store(controller_.get(), std::memory_order_release);
    utils::CrashHandler::RegisterFatalCleanup(&Application::EmergencyUnmuteThunk);

    utils::CrashHandler::SetContext("running");
    return true;
}

bool Application::initializeLogging()
{
    utils::LogManager::Initialize(options_.config_path, options_.verbose);
    if (!utils::LogManager::RegisterLogger({}))
    {
        std::cerr << "admute: failed to initialize logging\n";
        return false;
    }
    return true;
}

bool Application::checkSingleInstance()
{
    instance_guard_ = SingleInstanceGuard::Acquire();
    return instance_guard_ != nullptr;
}

void Application::initializeConfig()
{
    ConfigLoader loader(options_.config_path);
    config_ = loader.load();

    PLOG_INFO << "Configuration: " << loader.path().string() << " (method " << admute::MuteMethodToString(config_.mute.method)
              << ", target " << config_.mute.process_name << ")";
    PLOG_DEBUG << "Polling: ad-active " << config_.controller.ad_active_interval.count() << " ms, idle "
               << config_.controller.idle_interval.count() << " ms, paused "
               << config_.controller.paused_interval.count() << " ms, confidence " << config_.controller.confidence;
}

bool Application::initializeDetection()
{
    if (!admute::ScreenCapture::IsSupported())
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::ScreenCapture, "Screen capture is not supported",
                                          "No desktop grab backend on this platform.");
        return false;
    }

    auto ads = admute::TemplateLibrary::LoadAdTemplates(config_.detection.ads_dir);
    if (!ads)
        return false;

    auto icons = admute::TemplateLibrary::LoadIconPair(config_.detection.muted_icon, config_.detection.unmuted_icon);
    if (!icons.complete())
        PLOG_WARNING << "Mute icon templates incomplete; on-screen mute state may read as unknown";

    matcher_ = std::make_unique<admute::TemplateMatcher>();
    detector_ = std::make_unique<admute::AdDetector>(*matcher_, std::move(*ads), std::move(icons),
                                                     config_.controller.confidence);
    return true;
}

bool Application::initializeActuator()
{
    if (config_.mute.method == admute::MuteMethod::Session)
    {
        sessions_ = std::make_unique<admute::AudioSessionController>();
        if (!sessions_->Init())
            PLOG_ERROR << "Audio session init failed: " << sessions_->LastError();

        if (!ProcessDetector::isProcessRunning(config_.mute.process_name))
            PLOG_INFO << config_.mute.process_name << " is not running yet; muting starts once it plays audio";
    }

    actuator_ = admute::MuteActuatorFactory::Create(config_.mute.method, *detector_, sessions_.get(),
                                                    config_.mute.process_name);
    return actuator_ != nullptr;
}

int Application::runMenu()
{
    controller_->Start();

    ControlMenu menu(std::cin, std::cout);
    while (!platform::SignalBridge::InterruptRequested())
    {
        menu.Render(controller_->IsEnabled());
        const auto choice = menu.Read();
        if (platform::SignalBridge::InterruptRequested())
            break;

        switch (choice)
        {
        case ControlMenu::Choice::ToggleRun:
            controller_->SetEnabled(!controller_->IsEnabled());
            break;
        case ControlMenu::Choice::Diagnose:
            runDiagnosticScan();
            menu.WaitForEnter();
            break;
        case ControlMenu::Choice::Invalid:
            break;
        case ControlMenu::Choice::Stop:
            PLOG_INFO << "Stop requested from menu";
            return 0;
        case ControlMenu::Choice::EndOfInput:
            PLOG_INFO << "Input closed, stopping";
            return 0;
        }
    }

    PLOG_INFO << "Interrupted by user.";
    return 0;
}

int Application::runHeadless()
{
    PLOG_INFO << "Menu disabled. Muter running, press Ctrl+C to stop.";
    controller_->SetEnabled(true);
    controller_->Start();

    while (!platform::SignalBridge::InterruptRequested())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    PLOG_INFO << "Interrupted by user.";
    return 0;
}

int Application::runDiagnose()
{
    runDiagnosticScan();
    return 0;
}

void Application::runDiagnosticScan()
{
    utils::CrashHandler::SetContext("diagnose");
    admute::DiagnosticScan scan(*detector_, sessions_.get(), config_.mute.method, config_.mute.process_name);
    admute::DiagnosticScan::Log(scan.Run());
    utils::CrashHandler::SetContext("running");
}

void Application::shutdown()
{
    if (controller_)
    {
        // Joins the loop thread; the fail-safe unmute runs before it returns
        controller_->Stop();
        utils::CrashHandler::RegisterFatalCleanup(nullptr);
        s_crash_controller.store(nullptr, std::memory_order_release);
        controller_.reset();
        PLOG_INFO << "Muter shut down";
    }

    actuator_.reset();
    if (sessions_)
    {
        sessions_->Shutdown();
        sessions_.reset();
    }
    detector_.reset();
    matcher_.reset();
    instance_guard_.reset();

    platform::SignalBridge::MarkShutdownComplete();
}

void Application::printStartupErrors() const
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        if (report.severity != utils::ErrorSeverity::Error && report.severity != utils::ErrorSeverity::Fatal)
            continue;

        std::cerr << "admute: " << report.user_message;
        if (!report.technical_details.empty())
            std::cerr << " (" << report.technical_details << ")";
        std::cerr << "\n";
    }
}

void Application::EmergencyUnmuteThunk()
{
    if (auto* controller = s_crash_controller.load(std::memory_order_acquire))
        controller->EmergencyUnmute();
}
