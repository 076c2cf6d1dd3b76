#include "transcript/merge.hpp"
#include "transcript/parser.hpp"
#include "transcript/timestamp.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <print>
#include <tuple>

namespace fs = std::filesystem;

namespace transcript {

void sort_segments(std::vector<Segment>& segments) {
    std::ranges::stable_sort(segments, [](const Segment& a, const Segment& b) {
        return std::tie(a.start, a.end, a.label, a.text) <
               std::tie(b.start, b.end, b.label, b.text);
    });
}

std::vector<Segment> merge_segments(std::vector<Segment> first, std::vector<Segment> second) {
    std::vector<Segment> merged = std::move(first);
    merged.reserve(merged.size() + second.size());
    std::ranges::move(second, std::back_inserter(merged));
    sort_segments(merged);
    return merged;
}

std::string format_segment(const Segment& seg) {
    return std::format("[{} → {}] ({}) {}",
                       timestamp::render(seg.start), timestamp::render(seg.end),
                       label_name(seg.label), seg.text);
}

std::string render_transcript(const std::vector<Segment>& segments) {
    std::string out;
    for (const auto& seg : segments) {
        out += format_segment(seg);
        out += '\n';
    }
    return out;
}

MergeEngine::MergeEngine(ArtifactSet artifacts)
    : artifacts_(std::move(artifacts)) {}

std::expected<std::vector<Segment>, SessionError> MergeEngine::load() const {
    auto missing = artifacts_.missing_inputs();
    if (!missing.empty()) {
        return std::unexpected(missing_inputs_error(std::move(missing)));
    }

    auto mic = parse_file(artifacts_.mic, SourceLabel::Mic);
    if (!mic) {
        return std::unexpected(SessionError{.kind = ErrorKind::FileUnreadable, .message = mic.error(),
                                            .paths = {artifacts_.mic}});
    }

    auto speaker = parse_file(artifacts_.speaker, SourceLabel::Speaker);
    if (!speaker) {
        return std::unexpected(SessionError{.kind = ErrorKind::FileUnreadable, .message = speaker.error(),
                                            .paths = {artifacts_.speaker}});
    }

    return merge_segments(std::move(*mic), std::move(*speaker));
}

std::expected<MergeResult, SessionError>
MergeEngine::commit(const std::vector<Segment>& merged) const {
    auto fail_write = [this](const std::string& why) {
        return std::unexpected(SessionError{.kind = ErrorKind::FileUnreadable,
                                            .message = "cannot write " + artifacts_.combined + ": " + why,
                                            .paths = {artifacts_.combined}});
    };

    auto tmp_path = artifacts_.combined + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) return fail_write(std::strerror(errno));
        out << render_transcript(merged);
        out.flush();
        if (!out) {
            out.close();
            std::error_code ec;
            fs::remove(tmp_path, ec);
            return fail_write("write error");
        }
    }

    // A source may have vanished since load(); leave everything as it was.
    auto missing = artifacts_.missing_inputs();
    if (!missing.empty()) {
        std::error_code ec;
        fs::remove(tmp_path, ec);
        return std::unexpected(missing_inputs_error(std::move(missing)));
    }

    std::error_code ec;
    fs::rename(tmp_path, artifacts_.combined, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp_path, rm_ec);
        return fail_write(ec.message());
    }

    for (const auto& src : {artifacts_.mic, artifacts_.speaker}) {
        if (!fs::remove(src, ec) || ec) {
            std::println(stderr, "merge: could not remove {}: {}", src,
                         ec ? ec.message() : "not found");
        }
    }

    return MergeResult{
        .combined_path = artifacts_.combined,
        .segment_count = merged.size(),
    };
}

std::expected<MergeResult, SessionError> MergeEngine::run() const {
    auto merged = load();
    if (!merged) return std::unexpected(merged.error());
    return commit(*merged);
}

} // namespace transcript
