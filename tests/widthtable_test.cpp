#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE widthtable

#include "glyphcatalog.h"
#include "widthtable.h"

#include <boost/test/unit_test.hpp>
namespace tt = boost::test_tools;

namespace {

Glyph glyph(uint id, qreal advance, QList<uint> codePoints = {})
{
    Glyph g;
    g.id = id;
    g.advanceWidth = advance;
    g.codePoints = codePoints;
    return g;
}

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(glyph_catalog)

BOOST_AUTO_TEST_CASE(sorted_and_deduplicated)
{
    const QList<Glyph> catalog = buildGlyphCatalog({
        glyph(9, 80, {0x44}),
        glyph(3, 20, {0x41}),
        glyph(5, 1000, {0x43}),
        glyph(5, 999, {0x61}),
        glyph(5, 1000, {0x43}),
    });

    BOOST_TEST_REQUIRE(catalog.size() == 3);
    BOOST_TEST(catalog[0].id == 3u);
    BOOST_TEST(catalog[1].id == 5u);
    BOOST_TEST(catalog[2].id == 9u);

    // First occurrence wins the width; code points are merged once
    BOOST_TEST(catalog[1].advanceWidth == 1000.0);
    const QList<uint> expected = {0x43, 0x61};
    BOOST_TEST(catalog[1].codePoints == expected, tt::per_element());
}

BOOST_AUTO_TEST_CASE(empty)
{
    BOOST_TEST(buildGlyphCatalog({}).isEmpty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(width_runs)

BOOST_AUTO_TEST_CASE(gap_starts_new_run)
{
    const Pdf::WidthTable table = Pdf::computeWidths(
        {glyph(3, 10), glyph(4, 20), glyph(5, 30), glyph(9, 40)}, 1.0);

    BOOST_TEST_REQUIRE(table.size() == 2);
    BOOST_TEST(table[0].firstId == 3u);
    BOOST_TEST(table[0].widths.size() == 3);
    BOOST_TEST(table[1].firstId == 9u);
    BOOST_TEST(table[1].widths.size() == 1);

    BOOST_TEST(Pdf::toWidthArray(table).toStdString() == "[3 [10 20 30] 9 [40]]");
}

BOOST_AUTO_TEST_CASE(single_glyph)
{
    const Pdf::WidthTable table = Pdf::computeWidths({glyph(7, 500)}, 1.0);
    BOOST_TEST(Pdf::toWidthArray(table).toStdString() == "[7 [500]]");
}

BOOST_AUTO_TEST_CASE(contiguous_ids_form_one_run)
{
    QList<Glyph> catalog;
    for (uint id = 10; id < 20; ++id)
        catalog.append(glyph(id, 100));

    const Pdf::WidthTable table = Pdf::computeWidths(catalog, 1.0);
    BOOST_TEST_REQUIRE(table.size() == 1);
    BOOST_TEST(table[0].firstId == 10u);
    BOOST_TEST(table[0].widths.size() == 10);
}

BOOST_AUTO_TEST_CASE(empty_catalog)
{
    const Pdf::WidthTable table = Pdf::computeWidths({}, 1.0);
    BOOST_TEST(table.isEmpty());
    BOOST_TEST(Pdf::toWidthArray(table).toStdString() == "[]");
}

BOOST_AUTO_TEST_CASE(scaled_to_glyph_space)
{
    // 2048 units per em
    const Pdf::WidthTable table = Pdf::computeWidths({glyph(1, 1024), glyph(2, 333)},
                                                     1000.0 / 2048);
    BOOST_TEST_REQUIRE(table.size() == 1);
    BOOST_TEST(table[0].widths[0] == 500.0, tt::tolerance(1e-9));
    BOOST_TEST(Pdf::toWidthArray(table).toStdString() == "[1 [500 162.5977]]");
}

BOOST_AUTO_TEST_CASE(every_glyph_covered_once)
{
    QList<Glyph> catalog;
    for (uint id : {0u, 1u, 2u, 5u, 6u, 40u, 41u, 42u, 43u, 100u, 65535u})
        catalog.append(glyph(id, id % 7 * 100));

    const Pdf::WidthTable table = Pdf::computeWidths(catalog, 0.5);

    int index = 0;
    for (const Pdf::WidthRun &run : table) {
        for (int i = 0; i < run.widths.size(); ++i, ++index) {
            BOOST_TEST_REQUIRE(index < catalog.size());
            BOOST_TEST(run.firstId + uint(i) == catalog[index].id);
            BOOST_TEST(run.widths[i] == catalog[index].advanceWidth * 0.5);
        }
    }
    BOOST_TEST(index == catalog.size());
    BOOST_TEST(table.size() == 5);
}

BOOST_AUTO_TEST_SUITE_END()
