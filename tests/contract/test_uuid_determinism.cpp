#include <QtTest>
#include <QObject>
#include <QRegularExpression>
#include <QSet>
#include <QLoggingCategory>

#include "core/common/uuid_generator.h"
#include "core/edit/edit_operations.h"
#include "tests/common/test_base.h"
#include "tests/common/timeline_fixtures.h"

Q_LOGGING_CATEGORY(cutlineTestUuidDeterminism, "cutline.test.uuid.determinism")

using namespace cutline;

/**
 * UUID determinism test for edit replay consistency
 *
 * Segment ids created by split and insert come from UuidGenerator. A
 * journal replay only reproduces the live timeline if the same seed yields
 * the same ids in the same order.
 *
 * Test Scenarios:
 * - Same seed produces identical sequences
 * - Different seeds and entity types produce different identifiers
 * - Production mode produces unique RFC 4122 identifiers
 * - Replaying a split sequence produces identical segment ids
 */
class TestUuidDeterminism : public TestBase
{
    Q_OBJECT

private slots:
    void init() override;

    // Core determinism tests
    void testDeterministicGeneration();
    void testDifferentSeedsProduceDifferentResults();
    void testEntityTypeNamespacing();
    void testModeSwitchResetsCounters();

    // Production mode
    void testProductionModeUniqueness();
    void testUuidFormatCompliance();

    // Edit integration
    void testSplitReplayProducesSameIds();

private:
    static QStringList generate(UuidGenerator::EntityType type, int count);
};

void TestUuidDeterminism::init()
{
    TestBase::init();
    UuidGenerator::instance().setGenerationMode(UuidGenerator::TestingMode);
    UuidGenerator::instance().setSeed(42);
}

QStringList TestUuidDeterminism::generate(UuidGenerator::EntityType type, int count)
{
    QStringList ids;
    for (int i = 0; i < count; ++i) {
        ids << UuidGenerator::instance().generateUuid(type);
    }
    return ids;
}

void TestUuidDeterminism::testDeterministicGeneration()
{
    qCDebug(cutlineTestUuidDeterminism, "Testing deterministic UUID generation");
    UuidGenerator& generator = UuidGenerator::instance();

    generator.setSeed(12345);
    const QStringList first = generate(UuidGenerator::SegmentEntity, 10);
    QCOMPARE(generator.generationCount(UuidGenerator::SegmentEntity), 10);

    generator.setSeed(12345);
    const QStringList second = generate(UuidGenerator::SegmentEntity, 10);

    QCOMPARE(first, second);
    QCOMPARE(QSet<QString>(first.begin(), first.end()).size(), first.size());
}

void TestUuidDeterminism::testDifferentSeedsProduceDifferentResults()
{
    UuidGenerator& generator = UuidGenerator::instance();

    generator.setSeed(1);
    const QString one = generator.generateClipUuid();
    generator.setSeed(2);
    const QString two = generator.generateClipUuid();

    QVERIFY(one != two);
}

void TestUuidDeterminism::testEntityTypeNamespacing()
{
    UuidGenerator& generator = UuidGenerator::instance();
    generator.setSeed(12345);

    const QStringList all = {
        generator.generateUuid(UuidGenerator::ClipEntity),
        generator.generateUuid(UuidGenerator::SegmentEntity),
        generator.generateUuid(UuidGenerator::TrackEntity),
        generator.generateUuid(UuidGenerator::EventEntity),
    };
    QCOMPARE(QSet<QString>(all.begin(), all.end()).size(), all.size());

    // Each namespace keeps its own counter
    QCOMPARE(generator.generationCount(UuidGenerator::SegmentEntity), 1);
    QCOMPARE(generator.generationCount(UuidGenerator::EventEntity), 1);
}

void TestUuidDeterminism::testModeSwitchResetsCounters()
{
    UuidGenerator& generator = UuidGenerator::instance();
    generator.setSeed(54321);
    const QString first = generator.generateSegmentUuid();

    generator.setGenerationMode(UuidGenerator::ProductionMode);
    generator.setGenerationMode(UuidGenerator::TestingMode);
    QCOMPARE(generator.generationCount(UuidGenerator::SegmentEntity), 0);

    // Seed survives the switch; counters do not
    QCOMPARE(generator.generateSegmentUuid(), first);
}

void TestUuidDeterminism::testProductionModeUniqueness()
{
    UuidGenerator& generator = UuidGenerator::instance();
    generator.setGenerationMode(UuidGenerator::ProductionMode);
    QCOMPARE(generator.generationMode(), UuidGenerator::ProductionMode);

    const QStringList ids = generate(UuidGenerator::SegmentEntity, 50);
    QCOMPARE(QSet<QString>(ids.begin(), ids.end()).size(), ids.size());
}

void TestUuidDeterminism::testUuidFormatCompliance()
{
    const QRegularExpression uuidPattern(
        "^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$");

    for (UuidGenerator::GenerationMode mode : {UuidGenerator::ProductionMode, UuidGenerator::TestingMode}) {
        UuidGenerator::instance().setGenerationMode(mode);
        for (UuidGenerator::EntityType type : {UuidGenerator::ClipEntity, UuidGenerator::SegmentEntity,
                                               UuidGenerator::TrackEntity, UuidGenerator::EventEntity}) {
            const QString uuid = UuidGenerator::instance().generateUuid(type);
            QVERIFY2(uuidPattern.match(uuid).hasMatch(), qPrintable(uuid));
        }
    }
}

void TestUuidDeterminism::testSplitReplayProducesSameIds()
{
    qCDebug(cutlineTestUuidDeterminism, "Testing split replay determinism");

    auto runSplits = []() {
        Timeline timeline = fixtures::twoSegments();
        QStringList created;
        for (qint64 frame : {30, 60, 120}) {
            const Segment* target = timeline.segmentAt("V1", static_cast<double>(frame));
            auto result = edit::split(timeline, target->id(), frame);
            if (result.is_error()) {
                return QStringList();
            }
            created << result.value().createdSegmentId;
            timeline = result.value().timeline;
        }
        return created;
    };

    UuidGenerator::instance().setSeed(11111);
    const QStringList first = runSplits();
    UuidGenerator::instance().setSeed(11111);
    const QStringList second = runSplits();

    QCOMPARE(first.size(), 3);
    QCOMPARE(first, second);
}

QTEST_MAIN(TestUuidDeterminism)
#include "test_uuid_determinism.moc"
