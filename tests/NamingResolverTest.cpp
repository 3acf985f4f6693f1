#include <gtest/gtest.h>

#include "TestUtils.hpp"
#include "core/Errors.hpp"
#include "core/naming/NamingResolver.hpp"

using homestream::Recording;
using homestream::core::NamingResolver;
using homestream::core::TemplateFieldError;
using homestream::test::utcDate;

namespace {

const char* kEpisodeTemplate =
    "{title} - s{season:d}e{episode:02d} - {episode_title} ({date_recorded},{callsign})";
const char* kMovieTemplate = "{title} ({movie_year})";

Recording pilot() {
    Recording rec;
    rec.title = "Show";
    rec.episodeTitle = "Pilot";
    rec.season = 0;
    rec.episode = 0;
    rec.callsign = "ABC";
    rec.dateRecorded = utcDate(2021, 2, 22);
    return rec;
}

} // namespace

TEST(NamingResolverTest, ResolvesEpisodeTemplate) {
    NamingResolver resolver(kMovieTemplate, kEpisodeTemplate);
    EXPECT_EQ(resolver.resolve(pilot()), "Show - s00e00 - Pilot (2021-02-22,ABC)");
}

TEST(NamingResolverTest, MovieYearSelectsMovieTemplate) {
    NamingResolver resolver(kMovieTemplate, kEpisodeTemplate);

    Recording movie = pilot();
    movie.title = "Heat";
    movie.movieYear = 1995;
    EXPECT_EQ(resolver.resolve(movie), "Heat (1995)");
}

TEST(NamingResolverTest, ResolveIsDeterministic) {
    NamingResolver resolver(kMovieTemplate, kEpisodeTemplate);
    Recording rec = pilot();
    EXPECT_EQ(resolver.resolve(rec), resolver.resolve(rec));
}

TEST(NamingResolverTest, UnsetFieldsRenderDefaults) {
    NamingResolver resolver(kMovieTemplate, "{title} s{season}e{episode} {date_recorded}");

    Recording rec;
    rec.title = "News";
    EXPECT_EQ(resolver.resolve(rec), "News s00e00 1900-01-01");
}

TEST(NamingResolverTest, IntegerWidthAndDateFormat) {
    NamingResolver resolver(kMovieTemplate, "{title} {episode:3d} {date_recorded:%Y%m%d}");

    Recording rec = pilot();
    rec.episode = 7;
    EXPECT_EQ(resolver.resolve(rec), "Show   7 20210222");
}

TEST(NamingResolverTest, SubstitutedValuesAreSanitized) {
    NamingResolver resolver(kMovieTemplate, "{title}: {episode_title}");

    Recording rec = pilot();
    rec.title = "Who/What";
    rec.episodeTitle = "Why?";
    // The ':' is template text and survives, field values are cleaned
    EXPECT_EQ(resolver.resolve(rec), "Who-What: Why.");
}

TEST(NamingResolverTest, DoubledBracesAreLiteral) {
    NamingResolver resolver(kMovieTemplate, "{{{title}}}");
    EXPECT_EQ(resolver.resolve(pilot()), "{Show}");
}

TEST(NamingResolverTest, UnknownFieldThrows) {
    try {
        NamingResolver resolver(kMovieTemplate, "{title} {network}");
        FAIL() << "expected TemplateFieldError";
    } catch (const TemplateFieldError& e) {
        EXPECT_EQ(e.field(), "network");
    }
}

TEST(NamingResolverTest, MalformedTemplatesThrow) {
    EXPECT_THROW(NamingResolver(kMovieTemplate, "{title"), TemplateFieldError);
    EXPECT_THROW(NamingResolver(kMovieTemplate, "title}"), TemplateFieldError);
    EXPECT_THROW(NamingResolver(kMovieTemplate, "{season:x}"), TemplateFieldError);
    EXPECT_THROW(NamingResolver(kMovieTemplate, "{title:upper}"), TemplateFieldError);
    EXPECT_THROW(NamingResolver("{movie_year:}x{", kEpisodeTemplate), TemplateFieldError);
}
