#include <QtTest/QtTest>
#include "utils/TestUtils.hpp"
#include "../src/core/download/ChunkPlanner.hpp"

#include <algorithm>
#include <limits>

using namespace Parfetch;
using namespace Parfetch::Test;

namespace {

std::vector<ByteRange> drain(ChunkPlanner& planner) {
    std::vector<ByteRange> ranges;
    while (auto range = planner.next()) {
        ranges.push_back(*range);
    }
    return ranges;
}

} // namespace

class TestChunkPlanner : public QObject {
    Q_OBJECT

private slots:
    void testUnevenSplit() {
        ChunkPlanner planner(1000, 400);
        QCOMPARE(planner.chunkCount(), qint64(3));

        const auto ranges = drain(planner);
        QCOMPARE(ranges.size(), std::size_t(3));
        QCOMPARE(ranges[0], (ByteRange{0, 399}));
        QCOMPARE(ranges[1], (ByteRange{400, 799}));
        QCOMPARE(ranges[2], (ByteRange{800, 999}));
    }

    void testEvenSplit() {
        ChunkPlanner planner(1200, 400);
        const auto ranges = drain(planner);
        QCOMPARE(ranges.size(), std::size_t(3));
        QCOMPARE(ranges.back(), (ByteRange{800, 1199}));
    }

    void testChunkLargerThanObject() {
        ChunkPlanner planner(10, 1024 * 1024);
        const auto ranges = drain(planner);
        QCOMPARE(ranges.size(), std::size_t(1));
        QCOMPARE(ranges[0], (ByteRange{0, 9}));
    }

    void testZeroLengthYieldsNothing() {
        ChunkPlanner planner(0, 400);
        QVERIFY(!planner.hasNext());
        QVERIFY(!planner.next().has_value());
        QCOMPARE(planner.chunkCount(), qint64(0));
    }

    void testSingleByteChunks() {
        ChunkPlanner planner(5, 1);
        const auto ranges = drain(planner);
        QCOMPARE(ranges.size(), std::size_t(5));
        for (int i = 0; i < 5; ++i) {
            QCOMPARE(ranges[static_cast<std::size_t>(i)], (ByteRange{i, i}));
        }
    }

    void testCountBeyondIntRange() {
        const qint64 length = 3000000000LL;
        QCOMPARE(ChunkPlanner::chunkCount(length, 1), length);
        QCOMPARE(ChunkPlanner::chunkCount(length, 2), length / 2);
        QVERIFY(ChunkPlanner::chunkCount(length, 1) > ChunkPlanner::kMaxChunkCount);

        const qint64 beyondInt = qint64(std::numeric_limits<int>::max()) * 4096 + 1;
        QCOMPARE(ChunkPlanner::chunkCount(beyondInt, 4096), qint64(std::numeric_limits<int>::max()) + 1);

        ChunkPlanner planner(length, 1);
        QCOMPARE(planner.chunkCount(), length);
        QCOMPARE(*planner.next(), (ByteRange{0, 0}));
    }

    void testPartitionProperties_data() {
        QTest::addColumn<qint64>("length");
        QTest::addColumn<qint64>("chunkSize");

        QTest::newRow("prime length") << qint64(997) << qint64(64);
        QTest::newRow("one byte") << qint64(1) << qint64(7);
        QTest::newRow("chunk of one") << qint64(33) << qint64(1);
        QTest::newRow("exact multiple") << qint64(4096) << qint64(512);
        QTest::newRow("large object") << qint64(10LL * 1024 * 1024 * 1024 + 3) << qint64(10 * 1024 * 1024);
        QTest::newRow("huge chunk") << qint64(12345) << std::numeric_limits<qint64>::max();
    }

    void testPartitionProperties() {
        QFETCH(qint64, length);
        QFETCH(qint64, chunkSize);

        ChunkPlanner planner(length, chunkSize);
        const qint64 expected = planner.chunkCount();
        QCOMPARE(expected, (length + std::min(chunkSize, length) - 1) / std::min(chunkSize, length));

        qint64 cursor = 0;
        qint64 count = 0;
        while (auto range = planner.next()) {
            QCOMPARE(range->start, cursor);
            QVERIFY(range->stop >= range->start);
            QVERIFY(range->length() <= chunkSize);
            QVERIFY(range->stop <= length - 1);
            cursor = range->stop + 1;
            ++count;
        }

        QCOMPARE(cursor, length);
        QCOMPARE(count, expected);
        QCOMPARE(qint64(planner.nextIndex()), expected);
    }
};

int runTestChunkPlanner(int argc, char** argv) {
    TestChunkPlanner test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_chunk_planner.moc"
