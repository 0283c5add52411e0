#include "chunkdrive/server/range_server.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "chunkdrive/crypto.hpp"
#include "chunkdrive/encoding/base64.hpp"
#include "chunkdrive/encoding/percent.hpp"
#include "chunkdrive/server/errors.hpp"

namespace chunkdrive::server
{

    namespace
    {

        struct MimeEntry
        {
            std::string_view extension;
            std::string_view type;
        };

        constexpr std::array<MimeEntry, 20> kMimeTypes{{
            {".txt", "text/plain"},
            {".htm", "text/html"},
            {".html", "text/html"},
            {".css", "text/css"},
            {".csv", "text/csv"},
            {".js", "application/javascript"},
            {".json", "application/json"},
            {".xml", "application/xml"},
            {".pdf", "application/pdf"},
            {".zip", "application/zip"},
            {".gz", "application/gzip"},
            {".tar", "application/x-tar"},
            {".png", "image/png"},
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".gif", "image/gif"},
            {".svg", "image/svg+xml"},
            {".mp3", "audio/mpeg"},
            {".mp4", "video/mp4"},
            {".webm", "video/webm"},
        }};

        constexpr std::string_view kDefaultContentType = "application/octet-stream";

        bool is_token_safe(const std::string &name)
        {
            return std::all_of(name.begin(), name.end(), [](char ch)
                               {
                                   const auto byte = static_cast<unsigned char>(ch);
                                   return byte >= 0x20 && byte < 0x7F && ch != '"' && ch != '\\' && ch != '%';
                               });
        }

        std::string ascii_fallback(const std::string &name)
        {
            std::string fallback;
            fallback.reserve(name.size());
            for (const char ch : name)
            {
                const auto byte = static_cast<unsigned char>(ch);
                fallback.push_back(byte >= 0x20 && byte < 0x7F && ch != '"' && ch != '\\' ? ch : '_');
            }
            return fallback;
        }

        std::string digest_header(const std::filesystem::path &path)
        {
            const auto digest = crypto::digest_file(path);
            return "sha-256=" + encoding::encode_base64(digest);
        }

    } // namespace

    ArtifactStream::ArtifactStream(const std::filesystem::path &path, std::uint64_t offset, std::uint64_t count,
                                   std::size_t buffer_size)
        : file_(path, std::ios::binary), remaining_(count), buffer_(std::max<std::size_t>(buffer_size, 1))
    {
        if (!file_.is_open())
        {
            throw FilesystemError(chunkdrive::ErrorCode::NotFound, "Artifact not found");
        }
        file_.seekg(static_cast<std::streamoff>(offset));
        if (!file_)
        {
            throw std::runtime_error("Failed to seek artifact");
        }
    }

    std::span<const std::byte> ArtifactStream::next()
    {
        if (remaining_ == 0)
        {
            return {};
        }
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer_.size(), remaining_));
        file_.read(reinterpret_cast<char *>(buffer_.data()), static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(file_.gcount());
        if (got == 0)
        {
            throw std::runtime_error("Artifact shrank while streaming");
        }
        remaining_ -= got;
        return {buffer_.data(), got};
    }

    RangeServer::RangeServer(std::size_t buffer_size) : buffer_size_(buffer_size) {}

    ArtifactMetadata RangeServer::inspect(const std::filesystem::path &path) const
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            throw FilesystemError(chunkdrive::ErrorCode::NotFound, "Artifact not found");
        }
        const auto length = std::filesystem::file_size(path, ec);
        if (ec)
        {
            throw FilesystemError(chunkdrive::ErrorCode::NotFound, "Artifact not found");
        }
        return {
            .path = path,
            .name = path.filename().string(),
            .length = length,
            .content_type = guess_content_type(path),
        };
    }

    ResponseFraming RangeServer::head(const ArtifactMetadata &artifact, bool want_digest) const
    {
        return base_framing(artifact, want_digest);
    }

    DownloadResponse RangeServer::get(const ArtifactMetadata &artifact, const RangePlan &plan, bool want_digest) const
    {
        if (const auto *rejection = std::get_if<RangeRejection>(&plan))
        {
            switch (*rejection)
            {
            case RangeRejection::BadSyntax:
                throw RangeError(chunkdrive::ErrorCode::RangeBadSyntax, "Malformed Range header", artifact.length);
            case RangeRejection::Unsupported:
                throw RangeError(chunkdrive::ErrorCode::RangeUnsupported, "Multiple ranges are not supported",
                                 artifact.length);
            case RangeRejection::Unsatisfiable:
                break;
            }
            throw RangeError(chunkdrive::ErrorCode::RangeNotSatisfiable, "Requested range not satisfiable",
                             artifact.length);
        }

        auto framing = base_framing(artifact, want_digest);
        std::uint64_t offset = 0;
        if (const auto *window = std::get_if<RangeWindow>(&plan))
        {
            offset = window->start;
            framing.status = 206;
            framing.content_length = window->length();
            framing.content_range = "bytes " + std::to_string(window->start) + "-" + std::to_string(window->end) +
                                    "/" + std::to_string(artifact.length);
        }

        auto body = std::make_unique<ArtifactStream>(artifact.path, offset, framing.content_length, buffer_size_);
        return {.framing = std::move(framing), .body = std::move(body)};
    }

    std::string RangeServer::content_disposition(const std::string &name)
    {
        if (is_token_safe(name))
        {
            return "attachment; filename=\"" + name + "\"";
        }
        return "attachment; filename=\"" + ascii_fallback(name) + "\"; filename*=UTF-8''" +
               encoding::percent_encode_attr(name);
    }

    std::string RangeServer::guess_content_type(const std::filesystem::path &path)
    {
        auto extension = path.extension().string();
        std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch)
                       { return static_cast<char>(std::tolower(ch)); });
        for (const auto &entry : kMimeTypes)
        {
            if (entry.extension == extension)
            {
                return std::string(entry.type);
            }
        }
        return std::string(kDefaultContentType);
    }

    ResponseFraming RangeServer::base_framing(const ArtifactMetadata &artifact, bool want_digest) const
    {
        ResponseFraming framing{};
        framing.status = 200;
        framing.content_length = artifact.length;
        framing.total_length = artifact.length;
        framing.content_type = artifact.content_type;
        framing.content_disposition = content_disposition(artifact.name);
        if (want_digest)
        {
            framing.digest = digest_header(artifact.path);
        }
        return framing;
    }

} // namespace chunkdrive::server
