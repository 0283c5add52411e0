#include "chunkdrive/server/filesystem.hpp"

#include <system_error>

#include "chunkdrive/encoding/percent.hpp"

namespace chunkdrive::server
{

    namespace
    {
        constexpr auto kUploadsDir = "uploads";
        constexpr auto kStorageDir = "storage";
        constexpr std::size_t kMaxNameLength = 255;
    } // namespace

    bool is_plain_file_name(std::string_view name) noexcept
    {
        if (name.empty() || name.size() > kMaxNameLength || name == "." || name == "..")
        {
            return false;
        }
        for (const char ch : name)
        {
            if (ch == '/' || ch == '\\' || ch == '\0')
            {
                return false;
            }
        }
        // Names are echoed back in JSON and headers.
        return chunkdrive::encoding::is_valid_utf8(name);
    }

    Filesystem::Filesystem(std::filesystem::path root) : base_(std::move(root))
    {
        std::filesystem::create_directories(base_ / kUploadsDir);
        std::filesystem::create_directories(base_ / kStorageDir);
    }

    std::filesystem::path Filesystem::uploads_root() const
    {
        return base_ / kUploadsDir;
    }

    TenantPaths Filesystem::prepare_tenant_paths(const std::string &tenant) const
    {
        if (!is_plain_file_name(tenant) || tenant.front() == '.')
        {
            throw FilesystemError(chunkdrive::ErrorCode::AuthenticationRequired, "Invalid tenant identifier");
        }
        TenantPaths paths{
            .tenant = tenant,
            .root = base_ / kStorageDir / tenant,
        };
        std::filesystem::create_directories(paths.root);
        return paths;
    }

    std::filesystem::path Filesystem::resolve_artifact(const TenantPaths &tenant, std::string_view requested) const
    {
        const auto path = sanitize(tenant.root, requested);
        std::error_code ec;
        const auto status = std::filesystem::status(path, ec);
        if (ec || !std::filesystem::exists(status))
        {
            throw FilesystemError(chunkdrive::ErrorCode::NotFound, "File not found");
        }
        if (!std::filesystem::is_regular_file(status))
        {
            throw FilesystemError(chunkdrive::ErrorCode::NotFound, "Path is not a file");
        }
        return path;
    }

    std::filesystem::path Filesystem::sanitize(const std::filesystem::path &base, std::string_view requested) const
    {
        if (requested.find('\0') != std::string_view::npos)
        {
            throw FilesystemError(chunkdrive::ErrorCode::InvalidPayload, "Path contains a NUL byte");
        }
        std::filesystem::path relative{std::string(requested)};
        if (!requested.empty() && relative.is_absolute())
        {
            relative = relative.lexically_relative("/");
        }

        std::filesystem::path sanitized = base;
        bool has_component = false;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw FilesystemError(chunkdrive::ErrorCode::InvalidPayload, "Path traversal detected");
            }
            sanitized /= part;
            has_component = true;
        }
        if (!has_component)
        {
            throw FilesystemError(chunkdrive::ErrorCode::NotFound, "File not found");
        }
        return sanitized;
    }

} // namespace chunkdrive::server
