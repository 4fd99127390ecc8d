#include <QtTest/QtTest>
#include "core/embedding/tokenizer.h"
#include "Support/fixture_paths.h"

#include <QFile>
#include <QTemporaryDir>
#include <QTextStream>

namespace {

std::vector<int64_t> ids(std::initializer_list<int64_t> values)
{
    return std::vector<int64_t>(values);
}

} // namespace

class TestTokenizer : public QObject {
    Q_OBJECT

private slots:
    void testLoadVocabNotFound();
    void testSpecialIdsReadFromVocab();
    void testSpecialIdsDefaultWhenMissing();
    void testEmptyInputIsClsSep();
    void testBasicTokenization();
    void testAccentsStripped();
    void testUnknownWordBecomesUnk();
    void testPartialSubwordMatchBecomesUnk();
    void testLongTextTruncated();
    void testMasksMatchLength();
};

void TestTokenizer::testLoadVocabNotFound()
{
    im::WordPieceTokenizer tokenizer(QStringLiteral("/definitely/missing/vocab.txt"));
    QVERIFY(!tokenizer.isLoaded());
    QCOMPARE(tokenizer.tokenize(QStringLiteral("eu gosto")).seqLength, 0);
}

void TestTokenizer::testSpecialIdsReadFromVocab()
{
    im::WordPieceTokenizer tokenizer(im::test::vocabFixturePath());
    QVERIFY(tokenizer.isLoaded());
    QCOMPARE(tokenizer.tokenId(QStringLiteral("[UNK]")), int64_t(1));
    QCOMPARE(tokenizer.tokenId(QStringLiteral("[CLS]")), int64_t(2));
    QCOMPARE(tokenizer.tokenId(QStringLiteral("[SEP]")), int64_t(3));
    QCOMPARE(tokenizer.tokenId(QStringLiteral("not-in-vocab")), int64_t(1));
}

void TestTokenizer::testSpecialIdsDefaultWhenMissing()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("vocab.txt"));
    QFile vocab(path);
    QVERIFY(vocab.open(QIODevice::WriteOnly | QIODevice::Text));
    QTextStream out(&vocab);
    out << "hello\nworld\n";
    out.flush();
    vocab.close();

    im::WordPieceTokenizer tokenizer(path);
    QVERIFY(tokenizer.isLoaded());
    const im::TokenizerOutput output = tokenizer.tokenize(QStringLiteral("hello world"));
    QCOMPARE(output.inputIds, ids({101, 0, 1, 102}));
}

void TestTokenizer::testEmptyInputIsClsSep()
{
    im::WordPieceTokenizer tokenizer(im::test::vocabFixturePath());
    const im::TokenizerOutput output = tokenizer.tokenize(QString());
    QCOMPARE(output.inputIds, ids({2, 3}));
    QCOMPARE(output.seqLength, 2);
}

void TestTokenizer::testBasicTokenization()
{
    im::WordPieceTokenizer tokenizer(im::test::vocabFixturePath());
    const im::TokenizerOutput output = tokenizer.tokenize(QStringLiteral("Eu gosto de programar!"));
    QCOMPARE(output.inputIds, ids({2, 6, 7, 8, 9, 10, 4, 3}));
}

void TestTokenizer::testAccentsStripped()
{
    im::WordPieceTokenizer tokenizer(im::test::vocabFixturePath());
    const im::TokenizerOutput output = tokenizer.tokenize(QStringLiteral("MÚSICA, arte"));
    QCOMPARE(output.inputIds, ids({2, 12, 5, 11, 3}));
}

void TestTokenizer::testUnknownWordBecomesUnk()
{
    im::WordPieceTokenizer tokenizer(im::test::vocabFixturePath());
    const im::TokenizerOutput output = tokenizer.tokenize(QStringLiteral("eu xyz"));
    QCOMPARE(output.inputIds, ids({2, 6, 1, 3}));
}

void TestTokenizer::testPartialSubwordMatchBecomesUnk()
{
    im::WordPieceTokenizer tokenizer(im::test::vocabFixturePath());
    const im::TokenizerOutput output = tokenizer.tokenize(QStringLiteral("programx"));
    QCOMPARE(output.inputIds, ids({2, 1, 3}));
}

void TestTokenizer::testLongTextTruncated()
{
    im::WordPieceTokenizer tokenizer(im::test::vocabFixturePath(), 5);
    QCOMPARE(tokenizer.maxSequenceLength(), 5);
    const im::TokenizerOutput output = tokenizer.tokenize(QStringLiteral("eu gosto de arte e musica"));
    QCOMPARE(output.inputIds, ids({2, 6, 7, 8, 3}));
    QCOMPARE(output.seqLength, 5);
}

void TestTokenizer::testMasksMatchLength()
{
    im::WordPieceTokenizer tokenizer(im::test::vocabFixturePath());
    const im::TokenizerOutput output = tokenizer.tokenize(QStringLiteral("gosto de arte"));
    QCOMPARE(output.attentionMask.size(), output.inputIds.size());
    QCOMPARE(output.tokenTypeIds.size(), output.inputIds.size());
    for (const int64_t value : output.attentionMask) {
        QCOMPARE(value, int64_t(1));
    }
    for (const int64_t value : output.tokenTypeIds) {
        QCOMPARE(value, int64_t(0));
    }
}

QTEST_MAIN(TestTokenizer)
#include "test_tokenizer.moc"
