#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE fonthandle

#include "fontflags.h"
#include "fonthandle.h"
#include "glyphcatalog.h"
#include "testfont.h"

#include <boost/test/unit_test.hpp>
namespace tt = boost::test_tools;

namespace {

std::unique_ptr<FontHandle> parse(const TestFontSpec &spec)
{
    QString error;
    std::unique_ptr<FontHandle> font = FontHandle::parse(buildTestFont(spec), 0, &error);
    BOOST_TEST_REQUIRE(font.get() != nullptr, error.toStdString());
    return font;
}

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(parsing)

BOOST_AUTO_TEST_CASE(rejects_empty_data)
{
    QString error;
    BOOST_TEST(!FontHandle::parse(QByteArray(), 0, &error));
    BOOST_TEST(!error.isEmpty());
}

BOOST_AUTO_TEST_CASE(rejects_garbage)
{
    QString error;
    BOOST_TEST(!FontHandle::parse(QByteArray(256, 'x'), 0, &error));
    BOOST_TEST(!error.isEmpty());
}

BOOST_AUTO_TEST_CASE(rejects_bare_cff)
{
    TestFontSpec spec = defaultTestFontSpec();
    spec.cff = true;
    QString error;
    BOOST_TEST(!FontHandle::parse(buildTestCffTable(spec), 0, &error));
    BOOST_TEST(!error.isEmpty());
}

BOOST_AUTO_TEST_CASE(rejects_missing_face)
{
    BOOST_TEST(!FontHandle::parse(buildTestFont(defaultTestFontSpec()), 3));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(metrics)

BOOST_AUTO_TEST_CASE(font_wide)
{
    auto font = parse(defaultTestFontSpec());

    BOOST_TEST(font->unitsPerEm() == 2000);
    BOOST_TEST(font->ascent() == 1800);
    BOOST_TEST(font->descent() == -400);
    BOOST_TEST(font->capHeight() == 1400);
    BOOST_TEST(font->xHeight() == 1000);
    BOOST_TEST(font->italicAngle() == 0.0);
    BOOST_TEST(font->postScriptName().toStdString() == "TestSans-Regular");
    BOOST_TEST(!font->isCff());
    BOOST_TEST((font->outlineFormat() == OutlineFormat::TrueType));

    const FontBBox bbox = font->bbox();
    BOOST_TEST(bbox.xMin == -100.0);
    BOOST_TEST(bbox.yMin == -500.0);
    BOOST_TEST(bbox.xMax == 2000.0);
    BOOST_TEST(bbox.yMax == 1900.0);
}

BOOST_AUTO_TEST_CASE(cff_outlines)
{
    TestFontSpec spec = defaultTestFontSpec();
    spec.cff = true;
    auto font = parse(spec);

    BOOST_TEST(font->isCff());
    BOOST_TEST((font->outlineFormat() == OutlineFormat::Cff));

    // Metrics come from the same SFNT tables as for TrueType outlines
    BOOST_TEST(font->unitsPerEm() == 2000);
    BOOST_TEST(font->ascent() == 1800);
    BOOST_TEST(font->descent() == -400);
    BOOST_TEST(font->bbox().yMin == -500.0);
    BOOST_TEST(font->postScriptName().toStdString() == "TestSans-Regular");
    BOOST_TEST(font->glyphForCodePoint('x').id == 7u);
    BOOST_TEST(font->glyphForCodePoint('x').advanceWidth == 800.0);
}

BOOST_AUTO_TEST_CASE(italic_angle)
{
    TestFontSpec spec = defaultTestFontSpec();
    spec.italicAngle = -12 * 65536 - 32768;
    auto font = parse(spec);
    BOOST_TEST(font->italicAngle() == -12.5, tt::tolerance(1e-9));
}

BOOST_AUTO_TEST_CASE(character_set)
{
    auto font = parse(defaultTestFontSpec());
    const QList<uint> expected = {0x20, 0x41, 0x42, 0x43, 0x44, 0x61, 0x78};
    BOOST_TEST(font->characterSet() == expected, tt::per_element());
}

BOOST_AUTO_TEST_CASE(glyph_lookup)
{
    auto font = parse(defaultTestFontSpec());

    const Glyph a = font->glyphForCodePoint('a');
    BOOST_TEST(a.id == 5u);
    BOOST_TEST(a.advanceWidth == 1000.0);
    BOOST_TEST_REQUIRE(a.codePoints.size() == 1);
    BOOST_TEST(a.codePoints.first() == uint('a'));

    BOOST_TEST(font->glyphForCodePoint(0x4E2D).id == 0u);
}

BOOST_AUTO_TEST_CASE(shaping)
{
    auto font = parse(defaultTestFontSpec());

    const QList<Glyph> glyphs = font->layout(QStringLiteral("AB"));
    BOOST_TEST_REQUIRE(glyphs.size() == 2);
    BOOST_TEST(glyphs[0].id == 3u);
    BOOST_TEST(glyphs[0].advanceWidth == 20.0);
    BOOST_TEST(glyphs[1].id == 4u);
    BOOST_TEST(glyphs[1].advanceWidth == 40.0);

    BOOST_TEST(font->layout(QString()).isEmpty());
}

BOOST_AUTO_TEST_CASE(catalog_of_font)
{
    auto font = parse(defaultTestFontSpec());
    const QList<Glyph> catalog = glyphCatalogOf(*font);

    QList<uint> ids;
    for (const Glyph &g : catalog)
        ids.append(g.id);
    const QList<uint> expected = {1, 3, 4, 5, 7, 9};
    BOOST_TEST(ids == expected, tt::per_element());

    // 'C' and 'a' share glyph 5
    const QList<uint> shared = {0x43, 0x61};
    BOOST_TEST(catalog[3].codePoints == shared, tt::per_element());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(flags)

BOOST_AUTO_TEST_CASE(plain_sans)
{
    auto font = parse(defaultTestFontSpec());
    BOOST_TEST(deriveFontFlags(*font) == FontFlags::Symbolic);
}

BOOST_AUTO_TEST_CASE(serif_class)
{
    TestFontSpec spec = defaultTestFontSpec();
    spec.familyClass = 0x0105;  // class 1, subclass 5
    auto font = parse(spec);
    BOOST_TEST(font->familyClass() == 1);
    BOOST_TEST(deriveFontFlags(*font) == (FontFlags::Serif | FontFlags::Symbolic));
}

BOOST_AUTO_TEST_CASE(script_class)
{
    TestFontSpec spec = defaultTestFontSpec();
    spec.familyClass = 0x0A00;
    auto font = parse(spec);
    BOOST_TEST(deriveFontFlags(*font) == (FontFlags::Script | FontFlags::Symbolic));
}

BOOST_AUTO_TEST_CASE(sans_serif_class_is_not_serif)
{
    TestFontSpec spec = defaultTestFontSpec();
    spec.familyClass = 0x0800;
    auto font = parse(spec);
    BOOST_TEST(deriveFontFlags(*font) == FontFlags::Symbolic);
}

BOOST_AUTO_TEST_CASE(italic_fixed_pitch)
{
    TestFontSpec spec = defaultTestFontSpec();
    spec.macStyle = 0x02;
    spec.isFixedPitch = 1;
    auto font = parse(spec);
    BOOST_TEST(font->isItalic());
    BOOST_TEST(font->isFixedPitch());
    BOOST_TEST(deriveFontFlags(*font) == 69);
}

BOOST_AUTO_TEST_SUITE_END()
