#include <chrono>
#include <iostream>
#include <utility>

#include <time.h>
#include <unistd.h>

#include "report_codec.hpp"
#include "report_handler.hpp"

using std::string;
using std::move;

static int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

string ReportHandler::resolve_save_file() const {
    time_t now = time(nullptr);
    struct tm local {};
    localtime_r(&now, &local);
    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H.%M.%S", &local);

    string base = output_directory.empty() ? string(".") : output_directory;
    if (base.back() != '/') {
        base += '/';
    }
    base += string("profile-") + stamp;

    string path = base + ".stackprof";
    for (int suffix = 1; access(path.c_str(), F_OK) == 0; ++suffix) {
        path = base + "-" + std::to_string(suffix) + ".stackprof";
    }
    return path;
}

Result<HandledReport, string> ReportHandler::handle(const Report& report, const string& actor, bool save_to_file, std::ostream& out) {
    HandledReport handled { Activity::Kind::FILE, string(), string() };

    bool save = save_to_file || uploader == nullptr;
    if (!save) {
        auto payload = serialize_report(report);
        auto uploaded = payload.isOk()
            ? uploader->upload(payload.getOkRef(), REPORT_CONTENT_TYPE)
            : Result<string, string>(ResultInit::err(string(payload.getErrRef())));

        if (uploaded.isOk()) {
            handled.kind = Activity::Kind::URL;
            handled.location = uploaded.getOkRef();
            out << "Profiler results:\n" << handled.location << "\n";
            activity_log.add(Activity { actor, now_ms(), "Profiler", Activity::Kind::URL, handled.location });
            return ResultInit::ok(move(handled));
        }

        handled.upload_error = uploaded.getErrRef();
        out << "An error occurred whilst uploading the results. Attempting to save to disk instead.\n";
        std::cerr << "Upload failed: " << handled.upload_error << "\n";
    }

    string path = resolve_save_file();
    Status saved = save_report(report, path);
    if (!saved.isOk()) {
        out << "An error occurred whilst saving the data.\n";
        return ResultInit::err(string(saved.getErrRef()));
    }

    handled.kind = Activity::Kind::FILE;
    handled.location = path;
    out << "Profile written to: " << path << "\n";
    activity_log.add(Activity { actor, now_ms(), "Profiler", Activity::Kind::FILE, path });
    return ResultInit::ok(move(handled));
}
