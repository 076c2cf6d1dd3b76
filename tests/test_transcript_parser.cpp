#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "transcript/parser.hpp"
#include "tmp_dir.hpp"

#include <string>

using Catch::Matchers::WithinAbs;
using transcript::parse_file;
using transcript::parse_line;

TEST_CASE("Transcript parse_line", "[parser]") {

    SECTION("MicDialect") {
        auto seg = parse_line("[00:00:00.000 → 00:00:18.500] Hello everyone", SourceLabel::Mic);
        REQUIRE(seg);
        REQUIRE_THAT(seg->start, WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(seg->end, WithinAbs(18.5, 1e-9));
        REQUIRE(seg->text == "Hello everyone");
        REQUIRE(seg->label == SourceLabel::Mic);
    }

    SECTION("SpeakerDialect") {
        auto seg = parse_line("[00:06.00 → 00:10.00] Can you hear me?", SourceLabel::Speaker);
        REQUIRE(seg);
        REQUIRE_THAT(seg->start, WithinAbs(6.0, 1e-9));
        REQUIRE_THAT(seg->end, WithinAbs(10.0, 1e-9));
        REQUIRE(seg->text == "Can you hear me?");
        REQUIRE(seg->label == SourceLabel::Speaker);
    }

    SECTION("SurroundingWhitespaceAndCrlf") {
        auto seg = parse_line("   [00:01.00 → 00:02.00]   padded  \r", SourceLabel::Speaker);
        REQUIRE(seg);
        REQUIRE(seg->text == "padded");
    }

    SECTION("EmptyTextAllowed") {
        auto seg = parse_line("[00:01.00 → 00:02.00]", SourceLabel::Mic);
        REQUIRE(seg);
        REQUIRE(seg->text.empty());
    }

    SECTION("EndBeforeStartClamped") {
        auto seg = parse_line("[00:05.00 → 00:03.00] backwards", SourceLabel::Mic);
        REQUIRE(seg);
        REQUIRE(seg->end == seg->start);
    }

    SECTION("NonMatchingLinesSkipped") {
        REQUIRE_FALSE(parse_line("", SourceLabel::Mic));
        REQUIRE_FALSE(parse_line("   ", SourceLabel::Mic));
        REQUIRE_FALSE(parse_line("Full transcript:", SourceLabel::Mic));
        REQUIRE_FALSE(parse_line("=== Speaker transcript ===", SourceLabel::Speaker));
        REQUIRE_FALSE(parse_line("[00:01.00 -> 00:02.00] ascii arrow", SourceLabel::Speaker));
        REQUIRE_FALSE(parse_line("[0:01.00 → 0:02.00] short minutes", SourceLabel::Speaker));
        REQUIRE_FALSE(parse_line("[00:00:01 → 00:00:02] no fraction", SourceLabel::Mic));
    }

    SECTION("VeryLongSegmentText") {
        std::string text(200 * 1024, 'a');
        text.replace(1000, 3, "  b");

        auto mic = parse_line("[00:00:00.000 → 00:00:18.500] " + text, SourceLabel::Mic);
        REQUIRE(mic);
        REQUIRE(mic->text == text);

        auto speaker = parse_line("[00:06.00 → 00:10.00]" + text + "  ", SourceLabel::Speaker);
        REQUIRE(speaker);
        REQUIRE(speaker->text.size() == text.size());
        REQUIRE_THAT(speaker->end, WithinAbs(10.0, 1e-9));
    }
}

TEST_CASE("Transcript parse_file", "[parser]") {
    TmpDir dir("parser");

    SECTION("KeepsFileOrderAndSkipsHeaders") {
        auto path = dir.file("mic.txt");
        write_text(path,
                   "Full transcript:\n"
                   "\n"
                   "[00:00:05.000 → 00:00:06.000] second in time\n"
                   "some stray note\n"
                   "[00:00:01.000 → 00:00:02.000] first in time\n");

        auto segs = parse_file(path, SourceLabel::Mic);
        REQUIRE(segs);
        REQUIRE(segs->size() == 2);
        REQUIRE((*segs)[0].text == "second in time");
        REQUIRE((*segs)[1].text == "first in time");
    }

    SECTION("EmptyFileIsEmptyList") {
        auto path = dir.file("empty.txt");
        write_text(path, "");

        auto segs = parse_file(path, SourceLabel::Speaker);
        REQUIRE(segs);
        REQUIRE(segs->empty());
    }

    SECTION("LongLinesAmongShortOnes") {
        auto path = dir.file("speaker.txt");
        std::string monologue(120 * 1024, 'x');
        write_text(path,
                   "[00:00.00 → 00:01.00] short\n"
                   "[00:01.00 → 03:00.00] " + monologue + "\n"
                   "[03:00.00 → 03:01.00] after\n");

        auto segs = parse_file(path, SourceLabel::Speaker);
        REQUIRE(segs);
        REQUIRE(segs->size() == 3);
        REQUIRE((*segs)[1].text == monologue);
        REQUIRE((*segs)[2].text == "after");
    }

    SECTION("MissingFileIsError") {
        auto segs = parse_file(dir.file("absent.txt"), SourceLabel::Mic);
        REQUIRE_FALSE(segs);
        REQUIRE(segs.error().find("absent.txt") != std::string::npos);
    }
}
