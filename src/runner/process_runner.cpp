#include "arm_angle/runner/process_runner.hpp"

#include <QProcess>
#include <QString>
#include <QStringList>

#include <chrono>

namespace arm_angle::runner {

ProcessRunner::ProcessRunner(int start_timeout_ms)
    : start_timeout_ms_(start_timeout_ms) {}

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv, int timeout_ms,
                                 const std::string& cwd) const {
    ProcessResult result;
    if (argv.empty()) {
        result.error_message = "empty command";
        return result;
    }

    QProcess proc;
    proc.setProcessChannelMode(QProcess::MergedChannels);
    if (!cwd.empty()) {
        proc.setWorkingDirectory(QString::fromStdString(cwd));
    }

    QStringList qargs;
    for (size_t i = 1; i < argv.size(); ++i) {
        qargs << QString::fromStdString(argv[i]);
    }

    const auto t0 = std::chrono::steady_clock::now();
    auto elapsed_ms = [&t0]() {
        const auto t1 = std::chrono::steady_clock::now();
        return 1e-3 * static_cast<double>(
            std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count());
    };

    proc.start(QString::fromStdString(argv[0]), qargs);
    if (!proc.waitForStarted(start_timeout_ms_)) {
        result.error_message = "failed to start '" + argv[0] + "': " +
                               proc.errorString().toStdString();
        result.duration_ms = elapsed_ms();
        return result;
    }
    result.started = true;
    proc.closeWriteChannel();

    if (!proc.waitForFinished(timeout_ms) && proc.state() != QProcess::NotRunning) {
        proc.kill();
        proc.waitForFinished(3000);
        result.timed_out = true;
        result.output = proc.readAll().toStdString();
        result.duration_ms = elapsed_ms();
        return result;
    }

    result.output = proc.readAll().toStdString();
    result.crashed = proc.exitStatus() == QProcess::CrashExit;
    result.exit_code = proc.exitCode();
    result.duration_ms = elapsed_ms();
    return result;
}

std::string tail_text(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) return text;
    std::string tail = text.substr(text.size() - max_chars);
    const auto nl = tail.find('\n');
    if (nl != std::string::npos && nl + 1 < tail.size()) {
        tail = tail.substr(nl + 1);
    }
    return tail;
}

} // namespace arm_angle::runner
