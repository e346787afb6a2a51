#pragma once

#include <QTest>
#include <QTemporaryDir>
#include <QStandardPaths>
#include <QLoggingCategory>
#include <QElapsedTimer>
#include <memory>

#include "core/common/uuid_generator.h"

Q_DECLARE_LOGGING_CATEGORY(cutlineTests)

/**
 * Base class for all Cutline tests providing common setup and utilities
 * Ensures an isolated data directory and deterministic identifiers
 */
class TestBase : public QObject
{
    Q_OBJECT

protected:
    // Test data directory management
    std::unique_ptr<QTemporaryDir> m_testDataDir;
    QString m_testDatabasePath;

    // Test timing and performance validation
    QElapsedTimer m_timer;
    static constexpr int MAX_TIMELINE_REBUILD_MS = 16; // One frame at 60fps

public:
    TestBase(QObject *parent = nullptr) : QObject(parent) {}

protected slots:
    /**
     * Initialize test environment before the first test method
     * Creates isolated journal path and temporary directories
     */
    virtual void initTestCase() {
        // Set up logging for tests
        QLoggingCategory::setFilterRules("cutline.tests=true");
        qCInfo(cutlineTests, "Initializing test case: %s", metaObject()->className());

        // Create temporary directory for test data
        m_testDataDir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_testDataDir->isValid());

        // Set test journal path
        m_testDatabasePath = m_testDataDir->filePath("test_journal.db");

        // Override application data location for tests
        QStandardPaths::setTestModeEnabled(true);

        // Segment ids must be reproducible across runs
        cutline::UuidGenerator::instance().setGenerationMode(cutline::UuidGenerator::TestingMode);
        cutline::UuidGenerator::instance().setSeed(42);
    }

    /**
     * Clean up after the last test method
     */
    virtual void cleanupTestCase() {
        qCInfo(cutlineTests, "Cleaning up test case: %s", metaObject()->className());
        m_testDataDir.reset();
    }

    /**
     * Initialize before each test method
     */
    virtual void init() {
        m_timer.start();
    }

    /**
     * Clean up after each test method
     */
    virtual void cleanup() {
        auto elapsedMs = m_timer.elapsed();
        if (elapsedMs > 1000) { // Log slow tests
            qCWarning(cutlineTests, "Slow test detected: %lldms", elapsedMs);
        }
    }

protected:
    /**
     * Verify performance requirements are met
     */
    void verifyPerformance(const QString& operation, int maxMs = 100) {
        auto elapsed = m_timer.elapsed();
        if (elapsed > maxMs) {
            QFAIL(qPrintable(QString("Performance requirement failed: %1 took %2ms (max: %3ms)")
                           .arg(operation).arg(elapsed).arg(maxMs)));
        }
        qCInfo(cutlineTests, "%s completed in %lldms", operation.toUtf8().constData(), elapsed);
    }

    QString testFilePath(const QString& name) const {
        return m_testDataDir->filePath(name);
    }
};
