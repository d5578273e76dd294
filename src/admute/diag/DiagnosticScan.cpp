#include "DiagnosticScan.hpp"
#include "../mute/AudioSessionController.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace admute
{

bool DiagnosticReport::anyAdMatched() const
{
    return std::any_of(templates.begin(), templates.end(),
                       [](const AdTemplateStatus& t) { return t.position.has_value(); });
}

DiagnosticScan::DiagnosticScan(AdDetector& detector, AudioSessionController* sessions, MuteMethod method,
                               std::string process_name)
    : detector_(detector)
    , sessions_(sessions)
    , method_(method)
    , process_name_(std::move(process_name))
{
}

DiagnosticReport DiagnosticScan::Run()
{
    DiagnosticReport report;
    report.method = method_;
    report.process_name = process_name_;

    // 1. Audio sessions
    if (sessions_ && sessions_->IsReady())
    {
        report.session_api_available = true;
        report.session_processes = sessions_->ListSessionProcesses();
        const std::string wanted = AudioSessionController::BasenameLower(process_name_);
        report.target_session_found = std::find(report.session_processes.begin(), report.session_processes.end(),
                                                wanted) != report.session_processes.end();
    }

    // 2. On-screen mute state
    report.muted_icon_loaded = detector_.icons().muted.has_value();
    report.unmuted_icon_loaded = detector_.icons().unmuted.has_value();
    report.screen_state = detector_.ObserveMuteIconState();

    // 3. Templates on disk, then a scan of each
    auto scans = detector_.ScanAll();
    report.templates.reserve(scans.size());
    for (auto& scan : scans)
    {
        std::error_code ec;
        AdTemplateStatus status;
        status.name = std::move(scan.name);
        status.file_exists = std::filesystem::exists(scan.path, ec);
        status.position = scan.position;
        report.templates.push_back(std::move(status));
    }

    return report;
}

void DiagnosticScan::Log(const DiagnosticReport& report)
{
    PLOG_INFO << "--- DIAGNOSE START ---";
    PLOG_INFO << "Mute method: "
              << (report.method == MuteMethod::Session ? "audio session (WASAPI)" : "UI click (on-screen volume icon)");

    if (report.session_api_available)
    {
        std::ostringstream names;
        for (size_t i = 0; i < report.session_processes.size(); ++i)
        {
            if (i)
                names << ", ";
            names << report.session_processes[i];
        }
        PLOG_INFO << "Active audio sessions: [" << names.str() << "]";
        PLOG_INFO << report.process_name << " audio session found: " << (report.target_session_found ? "yes" : "no");
    }
    else
    {
        PLOG_INFO << "Audio session API unavailable";
    }

    if (!report.muted_icon_loaded || !report.unmuted_icon_loaded)
    {
        PLOG_WARNING << "Mute icons loaded: muted=" << report.muted_icon_loaded
                     << " unmuted=" << report.unmuted_icon_loaded;
    }

    switch (report.screen_state)
    {
    case MuteIconState::Muted:
        PLOG_INFO << "On-screen mute state: MUTED (mute icon visible)";
        break;
    case MuteIconState::Unmuted:
        PLOG_INFO << "On-screen mute state: UNMUTED (volume icon visible)";
        break;
    case MuteIconState::Unknown:
        PLOG_WARNING << "On-screen mute state: UNKNOWN (neither icon found, is the player visible?)";
        break;
    }

    PLOG_INFO << "Ad images loaded: " << report.templates.size();
    for (const auto& t : report.templates)
    {
        PLOG_INFO << "  " << t.name << "  exists=" << (t.file_exists ? "true" : "false");
    }

    PLOG_INFO << "Screen scan for each ad image:";
    for (const auto& t : report.templates)
    {
        if (t.position)
            PLOG_INFO << "  FOUND '" << t.name << "' at (" << t.position->x << ", " << t.position->y << ")";
        else
            PLOG_INFO << "  NOT found: '" << t.name << "'";
    }
    if (!report.anyAdMatched())
    {
        PLOG_INFO << "No ad images matched on screen. Is the player showing an ad right now?";
    }

    PLOG_INFO << "--- DIAGNOSE END ---";
}

} // namespace admute
