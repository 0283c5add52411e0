#include <cassert>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <variant>

#include "chunkdrive/crypto.hpp"
#include "chunkdrive/server/errors.hpp"
#include "chunkdrive/server/range_planner.hpp"
#include "chunkdrive/server/range_server.hpp"

using namespace chunkdrive;
using namespace chunkdrive::server;

namespace
{

    bool is_window(const RangePlan &plan, std::uint64_t start, std::uint64_t end)
    {
        const auto *window = std::get_if<RangeWindow>(&plan);
        return window != nullptr && window->start == start && window->end == end;
    }

    bool is_rejected(const RangePlan &plan, RangeRejection kind)
    {
        const auto *rejection = std::get_if<RangeRejection>(&plan);
        return rejection != nullptr && *rejection == kind;
    }

    std::string drain(ArtifactStream &stream, std::size_t max_piece)
    {
        std::string out;
        while (!stream.done())
        {
            const auto piece = stream.next();
            assert(!piece.empty());
            assert(piece.size() <= max_piece);
            out.append(reinterpret_cast<const char *>(piece.data()), piece.size());
        }
        assert(stream.next().empty());
        return out;
    }

    void test_planner_boundary_table()
    {
        constexpr std::uint64_t kLength = 1000;
        assert(is_window(plan_range("bytes=0-499", kLength), 0, 499));
        assert(is_window(plan_range("bytes=500-", kLength), 500, 999));
        assert(is_window(plan_range("bytes=-100", kLength), 900, 999));
        assert(is_rejected(plan_range("bytes=1000-1005", kLength), RangeRejection::Unsatisfiable));
        assert(is_rejected(plan_range("bytes=0-499,600-699", kLength), RangeRejection::Unsupported));
        assert(is_rejected(plan_range("bytes=abc", kLength), RangeRejection::BadSyntax));
    }

    void test_planner_edges()
    {
        constexpr std::uint64_t kLength = 1000;
        assert(std::holds_alternative<FullFile>(plan_range(std::nullopt, kLength)));
        assert(std::holds_alternative<FullFile>(plan_range("", kLength)));

        assert(is_window(plan_range("bytes=0-999", kLength), 0, 999));
        assert(is_window(plan_range("bytes=999-999", kLength), 999, 999));
        assert(is_window(plan_range("bytes=999-", kLength), 999, 999));
        assert(is_window(plan_range("bytes=-1000", kLength), 0, 999));
        assert(is_window(plan_range(" bytes=10-20 ", kLength), 10, 20));

        assert(is_rejected(plan_range("bytes=0-1000", kLength), RangeRejection::Unsatisfiable));
        assert(is_rejected(plan_range("bytes=500-400", kLength), RangeRejection::Unsatisfiable));
        assert(is_rejected(plan_range("bytes=1000-", kLength), RangeRejection::Unsatisfiable));
        assert(is_rejected(plan_range("bytes=-0", kLength), RangeRejection::Unsatisfiable));
        assert(is_rejected(plan_range("bytes=-1001", kLength), RangeRejection::Unsatisfiable));
        assert(is_rejected(plan_range("bytes=0-99999999999999999999999", kLength), RangeRejection::Unsatisfiable));

        assert(is_rejected(plan_range("items=0-10", kLength), RangeRejection::BadSyntax));
        assert(is_rejected(plan_range("bytes 0-10", kLength), RangeRejection::BadSyntax));
        assert(is_rejected(plan_range("bytes=-", kLength), RangeRejection::BadSyntax));
        assert(is_rejected(plan_range("bytes=1-x", kLength), RangeRejection::BadSyntax));
        assert(is_rejected(plan_range("bytes=+1-2", kLength), RangeRejection::BadSyntax));
        assert(is_rejected(plan_range("bytes=1-2-3", kLength), RangeRejection::BadSyntax));
        assert(is_rejected(plan_range("bytes=0-1,abc", kLength), RangeRejection::Unsupported));

        assert(is_rejected(plan_range("bytes=0-0", 0), RangeRejection::Unsatisfiable));
        assert(is_rejected(plan_range("bytes=0-", 0), RangeRejection::Unsatisfiable));
        assert(is_rejected(plan_range("bytes=-1", 0), RangeRejection::Unsatisfiable));

        const RangeWindow window{.start = 10, .end = 19};
        assert(window.length() == 10);
    }

    void test_artifact_stream()
    {
        const auto path = std::filesystem::temp_directory_path() / "chunkdrive_stream_test.bin";
        std::string content;
        for (int i = 0; i < 1000; ++i)
        {
            content.push_back(static_cast<char>('A' + i % 26));
        }
        {
            std::ofstream out(path, std::ios::binary);
            out << content;
        }

        ArtifactStream whole(path, 0, content.size(), 64);
        assert(whole.remaining() == 1000);
        assert(drain(whole, 64) == content);

        ArtifactStream window(path, 900, 100, 32);
        assert(drain(window, 32) == content.substr(900, 100));

        ArtifactStream empty(path, 0, 0, 32);
        assert(empty.done());
        assert(empty.next().empty());

        ArtifactStream overrun(path, 990, 20, 64);
        bool threw = false;
        try
        {
            drain(overrun, 64);
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);

        std::filesystem::remove(path);
        threw = false;
        try
        {
            ArtifactStream gone(path, 0, 10, 32);
        }
        catch (const FilesystemError &ex)
        {
            threw = ex.code() == ErrorCode::NotFound;
        }
        assert(threw);
    }

    void test_range_server_framing()
    {
        const auto path = std::filesystem::temp_directory_path() / "chunkdrive_range_test.txt";
        {
            std::ofstream out(path, std::ios::binary);
            out << "abcdef";
        }
        const RangeServer server(4);
        const auto artifact = server.inspect(path);
        assert(artifact.length == 6);
        assert(artifact.name == "chunkdrive_range_test.txt");
        assert(artifact.content_type == "text/plain");

        const auto head = server.head(artifact, false);
        assert(head.status == 200);
        assert(head.content_length == 6);
        assert(!head.content_range);
        assert(!head.digest);
        assert(head.content_disposition == "attachment; filename=\"chunkdrive_range_test.txt\"");

        auto partial = server.get(artifact, plan_range("bytes=2-4", artifact.length), false);
        assert(partial.framing.status == 206);
        assert(partial.framing.content_length == 3);
        assert(partial.framing.total_length == 6);
        assert(partial.framing.content_range == std::optional<std::string>("bytes 2-4/6"));
        assert(drain(*partial.body, 4) == "cde");

        auto full = server.get(artifact, plan_range(std::nullopt, artifact.length), true);
        assert(full.framing.status == 200);
        assert(full.framing.digest == std::optional<std::string>("sha-256=vvV+x/U6bUC+tkCngKY5yDvCmsipgW8fxsXG3Nk8RyE="));
        assert(drain(*full.body, 4) == "abcdef");

        // Non-overlapping windows reassemble the artifact.
        std::string reassembled;
        for (const auto *value : {"bytes=0-1", "bytes=2-3", "bytes=4-"})
        {
            auto piece = server.get(artifact, plan_range(value, artifact.length), false);
            reassembled += drain(*piece.body, 4);
        }
        assert(reassembled == "abcdef");
        assert(crypto::hash_bytes(std::as_bytes(std::span<const char>(reassembled.data(), reassembled.size()))) ==
               crypto::hash_file(path));

        const auto expect_range_error = [&](const char *value, ErrorCode code)
        {
            try
            {
                server.get(artifact, plan_range(value, artifact.length), false);
            }
            catch (const RangeError &ex)
            {
                return ex.code() == code && ex.artifact_length() == 6;
            }
            return false;
        };
        assert(expect_range_error("bytes=6-", ErrorCode::RangeNotSatisfiable));
        assert(expect_range_error("bytes=0-1,3-4", ErrorCode::RangeUnsupported));
        assert(expect_range_error("bytes=x-", ErrorCode::RangeBadSyntax));

        std::filesystem::remove(path);
        bool threw = false;
        try
        {
            server.inspect(path);
        }
        catch (const FilesystemError &ex)
        {
            threw = ex.code() == ErrorCode::NotFound;
        }
        assert(threw);
    }

    void test_content_headers()
    {
        assert(RangeServer::content_disposition("f.txt") == "attachment; filename=\"f.txt\"");
        assert(RangeServer::content_disposition("my report.pdf") == "attachment; filename=\"my report.pdf\"");
        assert(RangeServer::content_disposition("say \"hi\".txt") ==
               "attachment; filename=\"say _hi_.txt\"; filename*=UTF-8''say%20%22hi%22.txt");
        assert(RangeServer::content_disposition("r\xC3\xA9sum\xC3\xA9.pdf") ==
               "attachment; filename=\"r__sum__.pdf\"; filename*=UTF-8''r%C3%A9sum%C3%A9.pdf");

        assert(RangeServer::guess_content_type("a.PNG") == "image/png");
        assert(RangeServer::guess_content_type("a.json") == "application/json");
        assert(RangeServer::guess_content_type("archive.tar.gz") == "application/gzip");
        assert(RangeServer::guess_content_type("noext") == "application/octet-stream");
        assert(RangeServer::guess_content_type("a.weird") == "application/octet-stream");
    }

} // namespace

void run_range_component_tests()
{
    test_planner_boundary_table();
    test_planner_edges();
    test_artifact_stream();
    test_range_server_framing();
    test_content_headers();
}
