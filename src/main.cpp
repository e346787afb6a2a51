#include <QApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLabel>
#include <QLoggingCategory>
#include <QSettings>
#include <QStyleFactory>
#include <QVBoxLayout>
#include <QWidget>

#include "core/config/editor_settings.h"
#include "core/edit/edit_session.h"
#include "core/edit/journal_recorder.h"
#include "core/playback/clock_backend.h"
#include "core/playback/playback_sync.h"
#include "core/timeline/frame_scheduler.h"
#include "core/timeline/timeline_engine.h"
#include "cutline/journal/SqliteStore.hpp"
#include "ui/input/keyboard_shortcuts.h"
#include "ui/input/timeline_input_controller.h"
#include "ui/timeline/timeline_renderer.h"
#include "ui/timeline/timeline_view.h"

#include <memory>
#include <optional>

Q_LOGGING_CATEGORY(cutlineMain, "cutline.main")

namespace {

using cutline::Result;
using cutline::Timeline;

Result<Timeline> loadTimelineFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return cutline::Error::not_found(path);
    }
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        return cutline::Error::parse_error(
            QStringLiteral("%1: %2").arg(path, parseError.errorString()));
    }

    const QJsonObject root = document.object();
    auto clips = Timeline::deserializeClips(root.value("clips").toArray());
    if (clips.is_error()) {
        return clips.error();
    }
    return Timeline::deserialize(root, clips.value());
}

struct JournalCloser {
    void operator()(sqlite3* db) const { cutline::journal::close_db(db); }
};

QString timecode(double frame, double fps)
{
    const qint64 rate = qMax<qint64>(1, qRound64(fps));
    const qint64 whole = static_cast<qint64>(frame);
    const qint64 seconds = whole / rate;
    return QStringLiteral("%1:%2.%3")
        .arg(seconds / 60)
        .arg(seconds % 60, 2, 10, QLatin1Char('0'))
        .arg(whole % rate, 2, 10, QLatin1Char('0'));
}

} // namespace

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Application metadata
    app.setApplicationName("Cutline Preview");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Cutline");
    app.setOrganizationDomain("cutline.dev");

    QCommandLineParser parser;
    parser.setApplicationDescription("Frame-accurate timeline preview");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("timeline", "Timeline JSON file (with an optional \"clips\" array).");
    QCommandLineOption journalOption("journal", "Record edits to the SQLite journal at <path>.", "path");
    QCommandLineOption logOption("log", "Mirror journal events to the JSONL file at <path>.", "path");
    QCommandLineOption verboseOption("verbose", "Enable debug logging for all cutline categories.");
    parser.addOption(journalOption);
    parser.addOption(logOption);
    parser.addOption(verboseOption);
    parser.process(app);

    // Initialize logging
    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules("cutline.*=true");
    }

    // Apply dark theme
    app.setStyle(QStyleFactory::create("Fusion"));
    QPalette darkPalette;
    darkPalette.setColor(QPalette::Window, QColor(30, 30, 30));
    darkPalette.setColor(QPalette::WindowText, Qt::white);
    darkPalette.setColor(QPalette::Base, QColor(25, 25, 25));
    darkPalette.setColor(QPalette::Text, Qt::white);
    darkPalette.setColor(QPalette::Highlight, QColor(42, 130, 218));
    app.setPalette(darkPalette);

    QSettings settings;
    const cutline::EditorSettings editorSettings = cutline::EditorSettings::load(settings);

    // Open the journal first: it may hold the last session's timeline
    std::unique_ptr<sqlite3, JournalCloser> journalDb;
    if (parser.isSet(journalOption)) {
        const QString journalPath = parser.value(journalOption);
        try {
            journalDb.reset(cutline::journal::open_db(journalPath.toStdString()));
            cutline::journal::ensure_schema(journalDb.get());
        } catch (const std::exception& e) {
            qCCritical(cutlineMain, "Failed to open journal %s: %s", qPrintable(journalPath), e.what());
            return -1;
        }
        qCInfo(cutlineMain, "Journal: %s", qPrintable(journalPath));
    }

    // Algorithm: Seed from journal → Attach recorder → Load file (journaled as a diff)
    Timeline initial = Timeline::create(timeline_constants::DEFAULT_FPS, {"V1", "V2"});
    bool restoredFromJournal = false;
    if (journalDb) {
        auto restored = cutline::JournalRecorder::restoreTimeline(journalDb.get());
        if (restored.is_ok()) {
            initial = restored.value();
            restoredFromJournal = true;
            qCInfo(cutlineMain, "Restored timeline from journal");
        } else {
            qCInfo(cutlineMain, "Journal holds no timeline yet: %s", qPrintable(restored.error().message));
        }
    }

    std::optional<Timeline> opened;
    const QStringList positional = parser.positionalArguments();
    if (!positional.isEmpty()) {
        const QString timelinePath = QFileInfo(positional.first()).absoluteFilePath();
        auto loaded = loadTimelineFile(timelinePath);
        if (loaded.is_error()) {
            qCCritical(cutlineMain, "Failed to load timeline %s: %s [%s]", qPrintable(timelinePath),
                       qPrintable(loaded.error().message), cutline::error_code_to_string(loaded.error().code));
            return -1;
        }
        opened = loaded.value();
        qCInfo(cutlineMain, "Opened timeline %s", qPrintable(timelinePath));
    }

    // Core: session owns the snapshot, engine owns time
    cutline::EditSession session(restoredFromJournal ? initial : Timeline(), editorSettings.session);
    cutline::TimelineEngine engine;
    engine.setTimeline(session.timeline());
    QObject::connect(&session, &cutline::EditSession::timelineChanged, &engine, &cutline::TimelineEngine::setTimeline);

    cutline::FrameScheduler scheduler(engine, editorSettings.scheduler);
    cutline::PlaybackSync sync(engine, cutline::ClockBackend::factory(), editorSettings.sync);

    std::unique_ptr<cutline::JournalRecorder> recorder;
    if (journalDb) {
        recorder = std::make_unique<cutline::JournalRecorder>(session, journalDb.get());
        if (parser.isSet(logOption) && !recorder->setLogPath(parser.value(logOption))) {
            qCCritical(cutlineMain, "Failed to open journal log %s", qPrintable(parser.value(logOption)));
            return -1;
        }
    }

    if (opened || !restoredFromJournal) {
        auto committed = session.load(opened ? *opened : initial);
        if (committed.is_error()) {
            qCCritical(cutlineMain, "Failed to install timeline: %s", qPrintable(committed.error().message));
            return -1;
        }
    }

    // UI
    cutline::TimelineRenderer renderer(engine, editorSettings.renderer);
    QWidget window;
    window.setWindowTitle(app.applicationName());
    auto* layout = new QVBoxLayout(&window);
    auto* status = new QLabel(&window);
    layout->addWidget(status);

    auto* view = new cutline::TimelineView(renderer, &window);
    layout->addWidget(view, 1);

    cutline::KeyboardShortcuts shortcuts;
    shortcuts.loadShortcuts(settings);
    cutline::TimelineInputController input(engine, session, renderer, shortcuts, editorSettings.input);
    cutline::Disposer inputAttachment = input.attach(view);

    auto refreshStatus = [&]() {
        QString text = timecode(engine.currentFrame(), engine.fps());
        if (sync.isDegraded()) {
            text += QStringLiteral("  (preview degraded)");
        }
        if (!input.lastFeedback().isEmpty()) {
            text += QStringLiteral("  %1").arg(input.lastFeedback());
        }
        status->setText(text);
    };
    QObject::connect(&engine, &cutline::TimelineEngine::frameChanged, status, refreshStatus);
    QObject::connect(&sync, &cutline::PlaybackSync::degradedChanged, status, refreshStatus);
    QObject::connect(&input, &cutline::TimelineInputController::feedback, status, refreshStatus);
    refreshStatus();

    window.resize(1200, 320);
    window.show();
    view->setFocus();

    qCInfo(cutlineMain, "Cutline preview started: %d tracks, %lld frames at %.3f fps",
           session.timeline().trackCount(), static_cast<long long>(session.timeline().totalFrames()),
           session.timeline().fps());

    const int result = app.exec();

    inputAttachment.dispose();
    shortcuts.saveShortcuts(settings);
    editorSettings.save(settings);

    qCInfo(cutlineMain, "Cutline preview shutdown complete");
    return result;
}
