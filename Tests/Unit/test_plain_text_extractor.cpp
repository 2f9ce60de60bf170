#include <QtTest/QtTest>
#include "core/extraction/plain_text_extractor.h"

class TestPlainTextExtractor : public QObject {
    Q_OBJECT

private slots:
    void testSupportedMediaTypes();
    void testUtf8Text();
    void testBomStripped();
    void testLatin1Fallback();
    void testWhitespaceOnlyFails();
    void testUnsupportedMediaType();
};

void TestPlainTextExtractor::testSupportedMediaTypes()
{
    dq::PlainTextExtractor extractor;
    QVERIFY(extractor.supports(QStringLiteral("text/plain")));
    QVERIFY(extractor.supports(QStringLiteral("text/csv")));
    QVERIFY(extractor.supports(QStringLiteral("text/markdown")));
    QVERIFY(extractor.supports(QStringLiteral("Text/Plain; charset=utf-8")));
    QVERIFY(!extractor.supports(QStringLiteral("application/pdf")));
    QVERIFY(!extractor.supports(QString()));
}

void TestPlainTextExtractor::testUtf8Text()
{
    dq::PlainTextExtractor extractor;
    const QString text = QStringLiteral("Größe: 42 cm. Délai: 3 jours.");
    const dq::ExtractionResult result = extractor.extract(text.toUtf8(), QStringLiteral("text/plain"));
    QCOMPARE(result.status, dq::ExtractionResult::Status::Success);
    QVERIFY(result.content.has_value());
    QCOMPARE(*result.content, text);
    QVERIFY(!result.errorMessage.has_value());
}

void TestPlainTextExtractor::testBomStripped()
{
    dq::PlainTextExtractor extractor;
    const QByteArray bytes = QByteArray("\xEF\xBB\xBF") + QByteArray("item,price\nmug,4");
    const dq::ExtractionResult result = extractor.extract(bytes, QStringLiteral("text/csv"));
    QCOMPARE(result.status, dq::ExtractionResult::Status::Success);
    QCOMPARE(*result.content, QStringLiteral("item,price\nmug,4"));
}

void TestPlainTextExtractor::testLatin1Fallback()
{
    dq::PlainTextExtractor extractor;
    const QByteArray bytes("caf\xE9 au lait");
    const dq::ExtractionResult result = extractor.extract(bytes, QStringLiteral("text/plain"));
    QCOMPARE(result.status, dq::ExtractionResult::Status::Success);
    QCOMPARE(*result.content, QString::fromLatin1(bytes));
}

void TestPlainTextExtractor::testWhitespaceOnlyFails()
{
    dq::PlainTextExtractor extractor;
    const dq::ExtractionResult result = extractor.extract(QByteArray(" \n\t "), QStringLiteral("text/plain"));
    QCOMPARE(result.status, dq::ExtractionResult::Status::ExtractionFailed);
    QVERIFY(!result.content.has_value());
    QVERIFY(result.errorMessage.has_value());
}

void TestPlainTextExtractor::testUnsupportedMediaType()
{
    dq::PlainTextExtractor extractor;
    const dq::ExtractionResult result = extractor.extract(QByteArray("%PDF-1.7"),
                                                         QStringLiteral("application/pdf"));
    QCOMPARE(result.status, dq::ExtractionResult::Status::UnsupportedMediaType);
    QVERIFY(result.errorMessage->contains(QStringLiteral("application/pdf")));
}

QTEST_MAIN(TestPlainTextExtractor)
#include "test_plain_text_extractor.moc"
