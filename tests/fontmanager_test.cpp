#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE fontmanager

#include "fontmanager.h"
#include "testfont.h"

#include <QFile>
#include <QTemporaryDir>

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_SUITE(fontmanager)

BOOST_AUTO_TEST_CASE(reads_font_file)
{
    QTemporaryDir dir;
    BOOST_TEST_REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("TestSans.ttf"));
    const QByteArray fontData = buildTestFont(defaultTestFontSpec());

    {
        QFile file(path);
        BOOST_TEST_REQUIRE(file.open(QIODevice::WriteOnly));
        BOOST_TEST_REQUIRE(file.write(fontData) == fontData.size());
    }

    FontManager manager;
    BOOST_TEST((manager.fontDataFromPath(path) == fontData));

    // Served from the cache once read
    BOOST_TEST_REQUIRE(QFile::remove(path));
    BOOST_TEST((manager.fontDataFromPath(path) == fontData));
}

BOOST_AUTO_TEST_CASE(missing_file)
{
    QTemporaryDir dir;
    BOOST_TEST_REQUIRE(dir.isValid());

    FontManager manager;
    BOOST_TEST(manager.fontDataFromPath(dir.filePath(QStringLiteral("absent.ttf"))).isEmpty());
}

BOOST_AUTO_TEST_CASE(empty_file)
{
    QTemporaryDir dir;
    BOOST_TEST_REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("empty.ttf"));
    {
        QFile file(path);
        BOOST_TEST_REQUIRE(file.open(QIODevice::WriteOnly));
    }

    FontManager manager;
    BOOST_TEST(manager.fontDataFromPath(path).isEmpty());
}

BOOST_AUTO_TEST_CASE(weight_mapping)
{
    // FC_WEIGHT_REGULAR is 80, FC_WEIGHT_BOLD 200
    BOOST_TEST(FontManager::fontconfigWeight(400) == 80);
    BOOST_TEST(FontManager::fontconfigWeight(300) == 80);
    BOOST_TEST(FontManager::fontconfigWeight(700) == 200);
    BOOST_TEST(FontManager::fontconfigWeight(900) == 200);
}

BOOST_AUTO_TEST_SUITE_END()
